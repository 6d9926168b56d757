/**
 * @file errors.cpp
 * @brief Implementation of the AgentAuth error taxonomy
 *
 * AgentAuth - Delegated authorization tokens for autonomous agents
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "agentauth/errors.hpp"

namespace agentauth {

AgentAuthError::AgentAuthError(ErrorCode code, const std::string& message)
    : std::runtime_error(error_code_to_string(code) + ": " + message)
    , code_(code)
{
}

// ============================================================================
// Error Code String Conversion
// ============================================================================

std::string error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::ENTROPY_ERROR: return "EntropyError";
        case ErrorCode::INVALID_KEY_FORMAT: return "InvalidKeyFormat";
        case ErrorCode::INVALID_DID_FORMAT: return "InvalidDIDFormat";
        case ErrorCode::MALFORMED_TOKEN: return "MalformedToken";
        case ErrorCode::INVALID_SIGNATURE: return "InvalidSignature";
        case ErrorCode::TOKEN_EXPIRED: return "TokenExpired";
        case ErrorCode::AUDIENCE_MISMATCH: return "AudienceMismatch";
        case ErrorCode::INSUFFICIENT_SCOPE: return "InsufficientScope";
        case ErrorCode::INVALID_DURATION_FORMAT: return "InvalidDurationFormat";
        case ErrorCode::TOKEN_REPLAYED: return "TokenReplayed";
        case ErrorCode::INVALID_DELEGATION: return "InvalidDelegation";
        case ErrorCode::INVALID_CONSTRAINT: return "InvalidConstraint";
        case ErrorCode::MALFORMED_DELEGATION: return "MalformedDelegation";
        case ErrorCode::INVALID_DELEGATION_SIGNATURE: return "InvalidDelegationSignature";
        case ErrorCode::DELEGATION_EXPIRED: return "DelegationExpired";
        case ErrorCode::DELEGATION_NOT_YET_VALID: return "DelegationNotYetValid";
        case ErrorCode::DELEGATION_REVOKED: return "DelegationRevoked";
        case ErrorCode::NO_DELEGATION: return "NoDelegation";
        case ErrorCode::CHAIN_MISMATCH: return "ChainMismatch";
        case ErrorCode::SCOPE_NOT_DELEGATED: return "ScopeNotDelegated";
        case ErrorCode::AUDIENCE_NOT_DELEGATED: return "AudienceNotDelegated";
        case ErrorCode::MFA_REQUIRED: return "MFARequired";
        case ErrorCode::SUBDELEGATION_NOT_ALLOWED: return "SubdelegationNotAllowed";
        case ErrorCode::IP_NOT_ALLOWED: return "IPNotAllowed";
        case ErrorCode::OUTSIDE_TIME_WINDOW: return "OutsideTimeWindow";
        case ErrorCode::USAGE_LIMIT_EXCEEDED: return "UsageLimitExceeded";
        case ErrorCode::VALUE_EXCEEDS_LIMIT: return "ValueExceedsLimit";
        case ErrorCode::UNKNOWN_TIME_ZONE: return "UnknownTimeZone";
        default: return "Unknown";
    }
}

std::optional<ErrorCode> string_to_error_code(const std::string& name) {
    if (name == "EntropyError") return ErrorCode::ENTROPY_ERROR;
    if (name == "InvalidKeyFormat") return ErrorCode::INVALID_KEY_FORMAT;
    if (name == "InvalidDIDFormat") return ErrorCode::INVALID_DID_FORMAT;
    if (name == "MalformedToken") return ErrorCode::MALFORMED_TOKEN;
    if (name == "InvalidSignature") return ErrorCode::INVALID_SIGNATURE;
    if (name == "TokenExpired") return ErrorCode::TOKEN_EXPIRED;
    if (name == "AudienceMismatch") return ErrorCode::AUDIENCE_MISMATCH;
    if (name == "InsufficientScope") return ErrorCode::INSUFFICIENT_SCOPE;
    if (name == "InvalidDurationFormat") return ErrorCode::INVALID_DURATION_FORMAT;
    if (name == "TokenReplayed") return ErrorCode::TOKEN_REPLAYED;
    if (name == "InvalidDelegation") return ErrorCode::INVALID_DELEGATION;
    if (name == "InvalidConstraint") return ErrorCode::INVALID_CONSTRAINT;
    if (name == "MalformedDelegation") return ErrorCode::MALFORMED_DELEGATION;
    if (name == "InvalidDelegationSignature") return ErrorCode::INVALID_DELEGATION_SIGNATURE;
    if (name == "DelegationExpired") return ErrorCode::DELEGATION_EXPIRED;
    if (name == "DelegationNotYetValid") return ErrorCode::DELEGATION_NOT_YET_VALID;
    if (name == "DelegationRevoked") return ErrorCode::DELEGATION_REVOKED;
    if (name == "NoDelegation") return ErrorCode::NO_DELEGATION;
    if (name == "ChainMismatch") return ErrorCode::CHAIN_MISMATCH;
    if (name == "ScopeNotDelegated") return ErrorCode::SCOPE_NOT_DELEGATED;
    if (name == "AudienceNotDelegated") return ErrorCode::AUDIENCE_NOT_DELEGATED;
    if (name == "MFARequired") return ErrorCode::MFA_REQUIRED;
    if (name == "SubdelegationNotAllowed") return ErrorCode::SUBDELEGATION_NOT_ALLOWED;
    if (name == "IPNotAllowed") return ErrorCode::IP_NOT_ALLOWED;
    if (name == "OutsideTimeWindow") return ErrorCode::OUTSIDE_TIME_WINDOW;
    if (name == "UsageLimitExceeded") return ErrorCode::USAGE_LIMIT_EXCEEDED;
    if (name == "ValueExceedsLimit") return ErrorCode::VALUE_EXCEEDS_LIMIT;
    if (name == "UnknownTimeZone") return ErrorCode::UNKNOWN_TIME_ZONE;
    return std::nullopt;
}

bool is_authentication_failure(ErrorCode code) {
    switch (code) {
        case ErrorCode::INVALID_DID_FORMAT:
        case ErrorCode::MALFORMED_TOKEN:
        case ErrorCode::INVALID_SIGNATURE:
        case ErrorCode::TOKEN_EXPIRED:
        case ErrorCode::AUDIENCE_MISMATCH:
        case ErrorCode::TOKEN_REPLAYED:
        case ErrorCode::MALFORMED_DELEGATION:
        case ErrorCode::INVALID_DELEGATION_SIGNATURE:
        case ErrorCode::CHAIN_MISMATCH:
            return true;
        default:
            return false;
    }
}

} // namespace agentauth
