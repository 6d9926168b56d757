/**
 * @file errors.hpp
 * @brief Error taxonomy for AgentAuth
 *
 * AgentAuth - Delegated authorization tokens for autonomous agents
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Every failing core operation throws AgentAuthError carrying one ErrorCode.
 * Transport layers translate codes into protocol responses.
 */

#pragma once

#include <optional>
#include <stdexcept>
#include <string>

namespace agentauth {

/**
 * @brief Error kinds reported by the core
 */
enum class ErrorCode {
    // Key material and identifiers
    ENTROPY_ERROR,                  ///< Random source unavailable
    INVALID_KEY_FORMAT,             ///< Malformed or wrong-length key material
    INVALID_DID_FORMAT,             ///< DID does not parse to the agentauth method

    // Token-level verification
    MALFORMED_TOKEN,                ///< Wrong segment count, bad base64url or JSON
    INVALID_SIGNATURE,              ///< Token signature does not verify
    TOKEN_EXPIRED,                  ///< exp is in the past
    AUDIENCE_MISMATCH,              ///< aud differs from the expected audience
    INSUFFICIENT_SCOPE,             ///< A required scope is not granted
    INVALID_DURATION_FORMAT,        ///< expires_in is not <count><s|m|h|d>
    TOKEN_REPLAYED,                 ///< Nonce already presented

    // Delegation model
    INVALID_DELEGATION,             ///< Missing delegator, delegate or scopes
    INVALID_CONSTRAINT,             ///< Contradictory or unparsable constraint
    MALFORMED_DELEGATION,           ///< Delegation JSON does not match the schema
    INVALID_DELEGATION_SIGNATURE,   ///< Delegation proof does not verify
    DELEGATION_EXPIRED,             ///< notAfter is in the past
    DELEGATION_NOT_YET_VALID,       ///< notBefore is in the future
    DELEGATION_REVOKED,             ///< Revocation service reports revoked
    NO_DELEGATION,                  ///< Chain empty where one is required
    CHAIN_MISMATCH,                 ///< Chain does not link sub to iss

    // Constraint enforcement
    SCOPE_NOT_DELEGATED,            ///< Token scope outside the delegated scope
    AUDIENCE_NOT_DELEGATED,         ///< Token audience outside the delegated audiences
    MFA_REQUIRED,                   ///< MFA proof missing
    SUBDELEGATION_NOT_ALLOWED,      ///< Chain longer than one hop
    IP_NOT_ALLOWED,                 ///< Request IP outside the allowlist
    OUTSIDE_TIME_WINDOW,            ///< Current time outside every window
    USAGE_LIMIT_EXCEEDED,           ///< maxUses or maxUsesPerHour reached
    VALUE_EXCEEDS_LIMIT,            ///< Declared value above maxValuePerUse
    UNKNOWN_TIME_ZONE               ///< Time zone name cannot be resolved
};

/**
 * @brief Exception thrown by all core operations
 */
class AgentAuthError : public std::runtime_error {
public:
    AgentAuthError(ErrorCode code, const std::string& message);

    /**
     * @brief Error kind
     */
    ErrorCode code() const noexcept { return code_; }

private:
    ErrorCode code_;
};

/**
 * @brief Convert ErrorCode to its stable name (e.g. "TokenExpired")
 */
std::string error_code_to_string(ErrorCode code);

/**
 * @brief Parse a stable error name
 * @return ErrorCode or std::nullopt if unknown
 */
std::optional<ErrorCode> string_to_error_code(const std::string& name);

/**
 * @brief Classify an error for transport layers
 * @return true if the credential itself is unusable (unauthorized),
 *         false if the credential is valid but the action is refused (forbidden)
 */
bool is_authentication_failure(ErrorCode code);

} // namespace agentauth
