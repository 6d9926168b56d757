/**
 * @file agent_crypto.cpp
 * @brief Implementation of cryptographic primitives for AgentAuth
 *
 * AgentAuth - Delegated authorization tokens for autonomous agents
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * - Ed25519: Digital signatures (128-bit security)
 * - randombytes: Thread-safe CSPRNG
 * - libsodium: Industry-standard implementation
 */

#include "agentauth/agent_crypto.hpp"
#include "agentauth/errors.hpp"

namespace agentauth {

// ============================================================================
// Initialization
// ============================================================================

bool AgentCrypto::initialize() {
    // Returns 0 on first success, 1 if already initialized
    if (sodium_init() < 0) {
        return false;
    }
    return true;
}

void AgentCrypto::require_initialized() {
    if (!initialize()) {
        throw AgentAuthError(ErrorCode::ENTROPY_ERROR, "libsodium initialization failed");
    }
}

// ============================================================================
// Key Generation
// ============================================================================

SignatureKeyPair AgentCrypto::generate_signature_keypair() {
    require_initialized();

    PrivateKeySeed seed;
    randombytes_buf(seed.data(), seed.size());

    SignatureKeyPair keypair = keypair_from_seed(seed);
    secure_zero(seed.data(), seed.size());
    return keypair;
}

SignatureKeyPair AgentCrypto::keypair_from_seed(const PrivateKeySeed& seed) {
    require_initialized();

    SignatureKeyPair keypair;
    keypair.seed = seed;

    // Deterministic Ed25519 key pair from seed
    crypto_sign_seed_keypair(
        keypair.public_key.data(),
        keypair.secret_key.data(),
        seed.data()
    );

    return keypair;
}

// ============================================================================
// Digital Signatures (Ed25519)
// ============================================================================

std::vector<uint8_t> AgentCrypto::sign_message(
    const std::vector<uint8_t>& message,
    const std::array<uint8_t, crypto_sign_SECRETKEYBYTES>& secret_key
) {
    require_initialized();

    std::vector<uint8_t> signature(crypto_sign_BYTES);

    // Sign the message (detached signature)
    unsigned long long signature_len;
    crypto_sign_detached(
        signature.data(),
        &signature_len,
        message.data(),
        message.size(),
        secret_key.data()
    );

    signature.resize(signature_len);

    return signature;
}

bool AgentCrypto::verify_signature(
    const std::vector<uint8_t>& message,
    const std::vector<uint8_t>& signature,
    const PublicKey& public_key
) {
    require_initialized();

    // Signature must be exactly 64 bytes
    if (signature.size() != crypto_sign_BYTES) {
        return false;
    }

    int result = crypto_sign_verify_detached(
        signature.data(),
        message.data(),
        message.size(),
        public_key.data()
    );

    return result == 0;
}

// ============================================================================
// Utility Functions
// ============================================================================

std::vector<uint8_t> AgentCrypto::generate_random_bytes(size_t size) {
    require_initialized();

    std::vector<uint8_t> bytes(size);
    randombytes_buf(bytes.data(), size);
    return bytes;
}

bool AgentCrypto::constant_time_compare(
    const std::vector<uint8_t>& a,
    const std::vector<uint8_t>& b
) {
    if (a.size() != b.size()) {
        return false;
    }

    return sodium_memcmp(a.data(), b.data(), a.size()) == 0;
}

std::string AgentCrypto::bytes_to_hex(const std::vector<uint8_t>& bytes) {
    std::vector<char> hex(bytes.size() * 2 + 1);

    sodium_bin2hex(hex.data(), hex.size(), bytes.data(), bytes.size());

    return std::string(hex.data());
}

std::optional<std::vector<uint8_t>> AgentCrypto::hex_to_bytes(const std::string& hex) {
    // Hex string must have even length
    if (hex.length() % 2 != 0) {
        return std::nullopt;
    }

    std::vector<uint8_t> bytes(hex.length() / 2);
    size_t decoded_len = 0;
    const char* end_ptr = nullptr;

    int result = sodium_hex2bin(
        bytes.data(),
        bytes.size(),
        hex.c_str(),
        hex.length(),
        nullptr,  // No ignore characters
        &decoded_len,
        &end_ptr
    );

    // Reject trailing garbage as well as invalid digits
    if (result != 0 || end_ptr != hex.c_str() + hex.length()) {
        return std::nullopt;
    }

    bytes.resize(decoded_len);
    return bytes;
}

std::string AgentCrypto::bytes_to_base64url(const std::vector<uint8_t>& bytes) {
    size_t encoded_len = sodium_base64_encoded_len(
        bytes.size(),
        sodium_base64_VARIANT_URLSAFE_NO_PADDING
    );

    std::vector<char> encoded(encoded_len);

    sodium_bin2base64(
        encoded.data(),
        encoded.size(),
        bytes.data(),
        bytes.size(),
        sodium_base64_VARIANT_URLSAFE_NO_PADDING
    );

    return std::string(encoded.data());
}

std::string AgentCrypto::string_to_base64url(const std::string& text) {
    return bytes_to_base64url(std::vector<uint8_t>(text.begin(), text.end()));
}

std::optional<std::vector<uint8_t>> AgentCrypto::base64url_to_bytes(const std::string& encoded) {
    // Decoded data is never longer than its encoding
    std::vector<uint8_t> bytes(encoded.length());

    size_t decoded_len = 0;
    const char* end_ptr = nullptr;

    int result = sodium_base642bin(
        bytes.data(),
        bytes.size(),
        encoded.c_str(),
        encoded.length(),
        nullptr,  // No ignore characters
        &decoded_len,
        &end_ptr,
        sodium_base64_VARIANT_URLSAFE_NO_PADDING
    );

    if (result != 0 || end_ptr != encoded.c_str() + encoded.length()) {
        return std::nullopt;
    }

    bytes.resize(decoded_len);
    return bytes;
}

std::optional<std::string> AgentCrypto::base64url_to_string(const std::string& encoded) {
    auto bytes = base64url_to_bytes(encoded);
    if (!bytes) {
        return std::nullopt;
    }
    return std::string(bytes->begin(), bytes->end());
}

void AgentCrypto::secure_zero(void* data, size_t size) {
    sodium_memzero(data, size);
}

} // namespace agentauth
