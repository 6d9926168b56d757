/**
 * @file config.hpp
 * @brief Protocol constants and environment configuration
 *
 * AgentAuth - Delegated authorization tokens for autonomous agents
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#pragma once

#include <cstdint>
#include <cstddef>
#include <string>
#include <filesystem>

namespace agentauth {
namespace config {

// ============================================================================
// DID Configuration
// ============================================================================

/// DID scheme prefix
constexpr const char* DID_SCHEME = "did";

/// DID method for self-certifying agent identities
constexpr const char* DID_METHOD = "agentauth";

/// Key type segment of an agentauth DID
constexpr const char* DID_KEY_TYPE = "ed25519";

/// Fragment naming the signing key of a DID
constexpr const char* KEY_ID_SUFFIX = "#keys-1";

// ============================================================================
// Token Configuration
// ============================================================================

/// JOSE-style algorithm tag for Ed25519
constexpr const char* TOKEN_ALGORITHM = "EdDSA";

/// Token type tag
constexpr const char* TOKEN_TYPE = "AAT";

/// Default token lifetime
constexpr const char* DEFAULT_TOKEN_LIFETIME = "1h";

/// Random bytes in a token nonce (hex-encoded on the wire)
constexpr size_t NONCE_BYTES = 16;

/// Maximum encoded token length, bounds decode work on hostile input
constexpr size_t MAX_TOKEN_LENGTH = 64 * 1024;

/// Number of dot-separated token segments
constexpr size_t TOKEN_SEGMENTS = 4;

// ============================================================================
// Delegation Configuration
// ============================================================================

/// Delegation object type tag
constexpr const char* DELEGATION_TYPE = "DelegationToken";

/// Delegation proof type
constexpr const char* PROOF_TYPE = "Ed25519Signature2020";

/// Delegation proof purpose
constexpr const char* PROOF_PURPOSE = "assertionMethod";

/// Prefix of delegation identifiers
constexpr const char* DELEGATION_ID_PREFIX = "urn:uuid:";

/// Rolling window for maxUsesPerHour
constexpr int64_t USAGE_RATE_WINDOW_SECONDS = 3600;

// ============================================================================
// Replay Protection
// ============================================================================

/// Cleanup the replay cache every N recorded nonces
constexpr size_t REPLAY_CLEANUP_INTERVAL = 100;

// ============================================================================
// Environment
// ============================================================================

/**
 * @brief Get AgentAuth data directory from AGENTAUTH_DATA_DIR or $HOME/.agentauth
 *
 * The directory is not created here; callers that write create it.
 */
std::filesystem::path get_data_directory();

/**
 * @brief Get identity storage directory (<data>/identities)
 */
std::filesystem::path get_identity_directory();

/**
 * @brief Get time zone database directory
 *
 * AGENTAUTH_ZONEINFO_DIR, then TZDIR, then /usr/share/zoneinfo.
 */
std::filesystem::path get_zoneinfo_directory();

/**
 * @brief Validate a scope string (non-empty, printable ASCII, no whitespace)
 */
bool validate_scope(const std::string& scope);

} // namespace config
} // namespace agentauth
