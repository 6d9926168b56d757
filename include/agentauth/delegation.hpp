/**
 * @file delegation.hpp
 * @brief Delegation grants from a principal to an agent
 *
 * AgentAuth - Delegated authorization tokens for autonomous agents
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * A delegation is created unsigned (DelegationRequest) and becomes a
 * Delegation only when the delegator's signer has signed its canonical
 * bytes. Delegations are immutable; revocation is an external state change
 * consulted at verification time.
 */

#pragma once

#include "agentauth/agent_crypto.hpp"
#include "agentauth/errors.hpp"
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace agentauth {

class AgentIdentity;
class DelegatorKeyResolver;

/**
 * @brief Days of the week, numbered as in struct tm (Sunday = 0)
 */
enum class Weekday {
    SUN = 0,
    MON,
    TUE,
    WED,
    THU,
    FRI,
    SAT
};

/**
 * @brief Local time-of-day range in minutes since midnight
 *
 * start is inclusive, end is exclusive. start > end wraps past midnight.
 */
struct HourRange {
    int start_minute;
    int end_minute;

    /**
     * @brief Parse "HH:MM-HH:MM" (end may be "24:00")
     * @return HourRange or std::nullopt if invalid
     */
    static std::optional<HourRange> parse(const std::string& text);

    std::string to_string() const;
};

/**
 * @brief Window of permitted use; any matching window permits
 */
struct TimeWindow {
    std::vector<Weekday> days;          ///< Empty means every day
    std::optional<HourRange> hours;     ///< Absent means the whole day
    std::optional<std::string> tz;      ///< IANA zone name; absent means UTC
};

/**
 * @brief Constraints narrowing when and how a delegation may be used
 */
struct DelegationConstraints {
    std::optional<int64_t> not_before;          ///< Unix seconds
    std::optional<int64_t> not_after;           ///< Unix seconds
    std::optional<uint64_t> max_uses;           ///< Lifetime cap
    std::optional<uint64_t> max_uses_per_hour;  ///< Rolling one-hour cap
    std::optional<double> max_value_per_use;    ///< Cap on declared request value
    std::optional<bool> require_mfa;
    std::optional<bool> allow_subdelegation;
    std::vector<std::string> ip_allowlist;      ///< IP or CIDR strings
    std::vector<TimeWindow> time_windows;

    bool requires_mfa() const { return require_mfa.value_or(false); }
    bool allows_subdelegation() const { return allow_subdelegation.value_or(true); }
};

struct DelegatorRef {
    std::string id;                     ///< Principal DID
    std::optional<std::string> proof;   ///< Human-comprehensible proof string
};

struct DelegateRef {
    std::string id;                     ///< Agent DID
    std::optional<std::string> platform;
    std::optional<std::string> name;
};

struct DelegationScope {
    std::vector<std::string> include;
    std::vector<std::string> exclude;
    std::vector<std::string> audiences; ///< Empty means unrestricted
};

struct RevocationInfo {
    std::string endpoint;
    std::string method = "GET";         ///< GET or POST
    std::optional<uint64_t> cache_ttl;  ///< Seconds
};

/**
 * @brief Proof metadata; the signature value lives on Delegation
 */
struct DelegationProof {
    std::string type;
    int64_t created;
    std::string verification_method;
    std::string proof_purpose;
};

/**
 * @brief Everything a delegator signs
 */
struct DelegationContent {
    std::string id;
    DelegatorRef delegator;
    DelegateRef delegate;
    DelegationScope scope;
    DelegationConstraints constraints;
    std::optional<RevocationInfo> revocation;
    DelegationProof proof;
};

/// Signing capability: canonical bytes in, Ed25519 signature out
using Signer = std::function<std::vector<uint8_t>(const std::vector<uint8_t>&)>;

/**
 * @brief Build a Signer backed by a copy of an identity
 */
Signer make_signer(const AgentIdentity& identity);

/**
 * @brief Options for create_delegation
 */
struct CreateDelegationOptions {
    std::string delegator_did;
    std::string delegate_did;
    std::vector<std::string> scopes;
    std::vector<std::string> excluded_scopes;
    std::vector<std::string> audiences;
    std::optional<std::string> platform;
    std::optional<std::string> agent_name;
    std::optional<std::string> delegator_proof;
    DelegationConstraints constraints;
    std::optional<RevocationInfo> revocation;
};

class Delegation;

/**
 * @brief Unsigned pre-issuance delegation
 *
 * Cannot be embedded in tokens or verified; sign() it first.
 */
class DelegationRequest {
public:
    const DelegationContent& content() const { return content_; }

    /**
     * @brief Canonical bytes: compact sorted-key JSON without proofValue
     */
    std::vector<uint8_t> canonical_bytes() const;

    /**
     * @brief Sign with the delegator's signer
     * @throws AgentAuthError(INVALID_DELEGATION) if signer is empty
     * @throws AgentAuthError(INVALID_DELEGATION_SIGNATURE) if the signer
     *         returns something that is not an Ed25519 signature
     */
    Delegation sign(const Signer& signer) const;

private:
    friend DelegationRequest create_delegation(const CreateDelegationOptions& options);

    explicit DelegationRequest(DelegationContent content);

    DelegationContent content_;
};

/**
 * @brief Signed, immutable delegation
 */
class Delegation {
public:
    const std::string& id() const { return content_.id; }
    const DelegatorRef& delegator() const { return content_.delegator; }
    const DelegateRef& delegate() const { return content_.delegate; }
    const DelegationScope& scope() const { return content_.scope; }
    const DelegationConstraints& constraints() const { return content_.constraints; }
    const std::optional<RevocationInfo>& revocation() const { return content_.revocation; }
    const DelegationProof& proof() const { return content_.proof; }
    const DelegationContent& content() const { return content_; }

    /**
     * @brief base64url Ed25519 signature over canonical_bytes()
     */
    const std::string& proof_value() const { return proof_value_; }

    /**
     * @brief Canonical bytes the proof signs
     */
    std::vector<uint8_t> canonical_bytes() const;

    /**
     * @brief Serialize to the delegation interchange JSON
     */
    std::string to_json() const;

    /**
     * @brief Parse delegation interchange JSON
     * @throws AgentAuthError(MALFORMED_DELEGATION) on schema violations,
     *         including unknown keys
     */
    static Delegation from_json(const std::string& json);

private:
    friend class DelegationRequest;

    Delegation(DelegationContent content, std::string proof_value);

    DelegationContent content_;
    std::string proof_value_;
};

/**
 * @brief Create an unsigned delegation with a fresh id and proof metadata
 * @throws AgentAuthError(INVALID_DELEGATION) if delegator, delegate or
 *         scopes are missing or a scope is not a valid scope string
 * @throws AgentAuthError(INVALID_CONSTRAINT) if constraints are contradictory
 */
DelegationRequest create_delegation(const CreateDelegationOptions& options);

/**
 * @brief Validate a constraint set
 * @throws AgentAuthError(INVALID_CONSTRAINT) on the first problem found
 */
void validate_constraints(const DelegationConstraints& constraints);

/**
 * @brief Static time-bound check
 * @param now Unix seconds; defaults to the current time
 * @return false if notAfter has passed or notBefore is in the future
 */
bool verify_delegation(const Delegation& delegation, std::optional<int64_t> now = std::nullopt);

/**
 * @brief Static time-bound check with the failure kind
 * @return DELEGATION_EXPIRED, DELEGATION_NOT_YET_VALID, or std::nullopt
 */
std::optional<ErrorCode> check_time_bounds(const Delegation& delegation, int64_t now);

/**
 * @brief Verify the delegation proof with the delegator's resolved key
 * @return false if the key cannot be resolved, the verification method is
 *         not the delegator's key, or the signature does not verify
 */
bool verify_delegation_signature(const Delegation& delegation, const DelegatorKeyResolver& resolver);

/**
 * @brief Weekday name ("mon".."sun") conversion
 */
std::string weekday_to_string(Weekday day);
std::optional<Weekday> string_to_weekday(const std::string& name);

} // namespace agentauth
