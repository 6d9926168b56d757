/**
 * @file agent_crypto.hpp
 * @brief Cryptographic primitives for AgentAuth
 *
 * AgentAuth - Delegated authorization tokens for autonomous agents
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Provides Ed25519 signatures, CSPRNG access and the byte codecs used by
 * the DID, delegation and token wire formats.
 */

#pragma once

#include <array>
#include <vector>
#include <string>
#include <optional>
#include <sodium.h>

namespace agentauth {

/// Ed25519 public key
using PublicKey = std::array<uint8_t, crypto_sign_PUBLICKEYBYTES>;

/// Ed25519 seed (the private key as exported and stored)
using PrivateKeySeed = std::array<uint8_t, crypto_sign_SEEDBYTES>;

/**
 * @brief Ed25519 signature key pair
 *
 * libsodium's expanded secret key is seed || public key; the seed alone
 * is what AgentAuth treats as "the private key".
 */
struct SignatureKeyPair {
    PrivateKeySeed seed;
    PublicKey public_key;
    std::array<uint8_t, crypto_sign_SECRETKEYBYTES> secret_key;
};

/**
 * @brief AgentCrypto - Cryptographic operations for agents
 *
 * Thread-safe cryptographic primitives using libsodium.
 * All methods are stateless; randomness comes from libsodium's CSPRNG.
 */
class AgentCrypto {
public:
    /**
     * @brief Initialize libsodium (safe to call multiple times)
     * @return true if initialization successful, false otherwise
     */
    static bool initialize();

    /**
     * @brief Initialize libsodium or throw
     * @throws AgentAuthError(ENTROPY_ERROR) if the library cannot start
     */
    static void require_initialized();

    // ========================================================================
    // Key Generation
    // ========================================================================

    /**
     * @brief Generate Ed25519 key pair from a fresh random seed
     * @return SignatureKeyPair with seed, public and secret keys
     * @throws AgentAuthError(ENTROPY_ERROR) if libsodium is unavailable
     */
    static SignatureKeyPair generate_signature_keypair();

    /**
     * @brief Derive Ed25519 key pair deterministically from a seed
     * @param seed 32-byte seed
     * @return SignatureKeyPair
     */
    static SignatureKeyPair keypair_from_seed(const PrivateKeySeed& seed);

    // ========================================================================
    // Digital Signatures (Ed25519)
    // ========================================================================

    /**
     * @brief Sign a message with Ed25519
     * @param message Message to sign
     * @param secret_key Expanded secret signing key
     * @return Signature (64 bytes)
     */
    static std::vector<uint8_t> sign_message(
        const std::vector<uint8_t>& message,
        const std::array<uint8_t, crypto_sign_SECRETKEYBYTES>& secret_key
    );

    /**
     * @brief Verify Ed25519 signature
     * @param message Original message
     * @param signature Signature to verify (64 bytes)
     * @param public_key Public key of signer
     * @return true if signature is valid, false otherwise
     */
    static bool verify_signature(
        const std::vector<uint8_t>& message,
        const std::vector<uint8_t>& signature,
        const PublicKey& public_key
    );

    // ========================================================================
    // Utility Functions
    // ========================================================================

    /**
     * @brief Generate cryptographically secure random bytes
     * @param size Number of random bytes to generate
     * @return Vector of random bytes
     */
    static std::vector<uint8_t> generate_random_bytes(size_t size);

    /**
     * @brief Constant-time comparison of byte arrays (prevents timing attacks)
     */
    static bool constant_time_compare(
        const std::vector<uint8_t>& a,
        const std::vector<uint8_t>& b
    );

    /**
     * @brief Convert bytes to lowercase hexadecimal string
     */
    static std::string bytes_to_hex(const std::vector<uint8_t>& bytes);

    /**
     * @brief Convert hexadecimal string to bytes
     * @return Decoded bytes, or std::nullopt if the string is not strict hex
     */
    static std::optional<std::vector<uint8_t>> hex_to_bytes(const std::string& hex);

    /**
     * @brief Encode bytes as unpadded URL-safe base64 (RFC 4648 §5)
     */
    static std::string bytes_to_base64url(const std::vector<uint8_t>& bytes);

    /**
     * @brief Encode UTF-8 text as unpadded URL-safe base64
     */
    static std::string string_to_base64url(const std::string& text);

    /**
     * @brief Decode unpadded URL-safe base64
     * @return Decoded bytes, or std::nullopt if invalid
     */
    static std::optional<std::vector<uint8_t>> base64url_to_bytes(const std::string& encoded);

    /**
     * @brief Decode unpadded URL-safe base64 into a string
     * @return Decoded text, or std::nullopt if invalid
     */
    static std::optional<std::string> base64url_to_string(const std::string& encoded);

    /**
     * @brief Securely zero memory (prevents compiler optimization from removing)
     */
    static void secure_zero(void* data, size_t size);
};

} // namespace agentauth
