/**
 * @file agent_identity.hpp
 * @brief Agent identity management with self-certifying DIDs
 *
 * AgentAuth - Delegated authorization tokens for autonomous agents
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Manages agent identity including:
 * - Ed25519 signature keys
 * - DID derivation (did:agentauth:ed25519:<base64url public key>)
 * - Key serialization/deserialization
 * - Persistent key storage
 */

#pragma once

#include "agentauth/agent_crypto.hpp"
#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace agentauth {

/// Free-form identity metadata (name, platform, capabilities...)
using IdentityMetadata = std::map<std::string, std::string>;

/**
 * @brief AgentIdentity - Cryptographic identity for AgentAuth agents
 *
 * Each identity has:
 * - Ed25519 keypair derived from a 32-byte seed
 * - DID that losslessly encodes the public key
 * - Optional metadata and a creation timestamp
 *
 * Immutable after construction; safe to share across threads.
 * The seed is zeroed when the identity is destroyed.
 */
class AgentIdentity {
public:
    /**
     * @brief Create new identity with a freshly generated key
     * @param metadata Optional metadata
     * @throws AgentAuthError(ENTROPY_ERROR) if the random source is unavailable
     */
    static AgentIdentity create(const IdentityMetadata& metadata = {});

    /**
     * @brief Reconstruct identity from a hex-encoded 32-byte seed
     * @throws AgentAuthError(INVALID_KEY_FORMAT) on bad hex or wrong length
     */
    static AgentIdentity from_private_key(
        const std::string& private_key_hex,
        const IdentityMetadata& metadata = {}
    );

    AgentIdentity(const AgentIdentity&) = default;
    AgentIdentity& operator=(const AgentIdentity&) = default;
    AgentIdentity(AgentIdentity&&) = default;
    AgentIdentity& operator=(AgentIdentity&&) = default;
    ~AgentIdentity();

    // ========================================================================
    // DID Encoding
    // ========================================================================

    /**
     * @brief Encode public key as did:agentauth:ed25519:<base64url>
     */
    static std::string public_key_to_did(const PublicKey& public_key);

    /**
     * @brief Recover public key from an agentauth DID
     * @throws AgentAuthError(INVALID_DID_FORMAT) unless the DID has exactly
     *         four segments "did", "agentauth", "ed25519", <32-byte key>
     */
    static PublicKey did_to_public_key(const std::string& did);

    /**
     * @brief Check whether a DID is a well-formed agentauth DID
     */
    static bool is_agentauth_did(const std::string& did);

    // ========================================================================
    // Identity Information
    // ========================================================================

    const std::string& get_did() const { return did_; }

    /**
     * @brief Key identifier used in token headers (<did>#keys-1)
     */
    std::string get_key_id() const;

    const PublicKey& get_public_key() const { return keypair_.public_key; }

    const IdentityMetadata& get_metadata() const { return metadata_; }

    /**
     * @brief Creation time (Unix seconds)
     */
    int64_t get_created_at() const { return created_at_; }

    // ========================================================================
    // Cryptographic Operations
    // ========================================================================

    /**
     * @brief Sign message with the Ed25519 private key
     * @return Signature (64 bytes)
     */
    std::vector<uint8_t> sign(const std::vector<uint8_t>& message) const;

    /**
     * @brief Sign the UTF-8 bytes of a string
     */
    std::vector<uint8_t> sign(const std::string& message) const;

    /**
     * @brief Verify signature against the key encoded in a DID
     * @return true if valid; false on any cryptographic mismatch
     * @throws AgentAuthError(INVALID_DID_FORMAT) if the DID is malformed
     */
    static bool verify(
        const std::vector<uint8_t>& signature,
        const std::vector<uint8_t>& message,
        const std::string& did
    );

    // ========================================================================
    // Serialization
    // ========================================================================

    /**
     * @brief Export the private key seed as lowercase hex (SENSITIVE!)
     */
    std::string export_private_key() const;

    /**
     * @brief Export identity to JSON (includes private key - SENSITIVE!)
     *
     * Fields: did, privateKey, publicKey, metadata, created.
     */
    std::string to_json() const;

    /**
     * @brief Import identity from JSON produced by to_json()
     * @throws AgentAuthError(INVALID_KEY_FORMAT) if the record is malformed
     *         or its did/publicKey do not match the private key
     */
    static AgentIdentity from_json(const std::string& json);

    // ========================================================================
    // Persistent Storage
    // ========================================================================

    /**
     * @brief Save identity to storage_dir with owner-only permissions
     * @return true if successful, false otherwise
     */
    bool save(const std::filesystem::path& storage_dir) const;

    /**
     * @brief Load identity by DID from storage_dir
     * @return AgentIdentity if found and valid, std::nullopt otherwise
     */
    static std::optional<AgentIdentity> load(
        const std::string& did,
        const std::filesystem::path& storage_dir
    );

    /**
     * @brief Delete a stored identity
     * @return true if a file was removed
     */
    static bool remove(
        const std::string& did,
        const std::filesystem::path& storage_dir
    );

private:
    AgentIdentity(
        const SignatureKeyPair& keypair,
        const IdentityMetadata& metadata,
        int64_t created_at
    );

    static std::filesystem::path get_identity_path(
        const std::string& did,
        const std::filesystem::path& storage_dir
    );

    SignatureKeyPair keypair_;
    std::string did_;
    IdentityMetadata metadata_;
    int64_t created_at_;
};

} // namespace agentauth
