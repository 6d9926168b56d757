/**
 * @file verifier.hpp
 * @brief Agent verification: token, delegation chain and constraint enforcement
 *
 * AgentAuth - Delegated authorization tokens for autonomous agents
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * verify_agent() is the entry point a service calls with a raw bearer
 * token. Verification is strictly ordered so nothing in the token is
 * trusted before its signature verifies:
 *
 * 1. Token signature, expiry, audience and required scopes
 * 2. Nonce replay (when a replay cache is supplied)
 * 3. Delegation presence
 * 4. Chain linkage sub -> ... -> iss
 * 5. Delegation proofs (when a key resolver is supplied)
 * 6. Delegation time bounds
 * 7. Revocation (when a revocation checker is supplied)
 * 8. Root delegation constraints
 */

#pragma once

#include "agentauth/delegation.hpp"
#include "agentauth/key_resolver.hpp"
#include "agentauth/replay_protection.hpp"
#include "agentauth/revocation_list.hpp"
#include "agentauth/token.hpp"
#include "agentauth/usage_tracker.hpp"
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace agentauth {

/**
 * @brief Behavior when a usage counter or request value is unavailable
 */
enum class UsagePolicy {
    FAIL_OPEN,      ///< Treat the limit as satisfied
    FAIL_CLOSED     ///< Reject the request
};

/**
 * @brief Facts about the request being authorized
 */
struct RequestContext {
    std::optional<int64_t> current_time;    ///< Unix seconds; defaults to now
    std::optional<double> value;            ///< Declared value of the action
    std::optional<std::string> ip;          ///< Client IP address
    bool mfa_verified = false;              ///< MFA proof presented
};

/**
 * @brief Options for enforce_constraints
 */
struct EnforcementOptions {
    UsagePolicy usage_policy = UsagePolicy::FAIL_OPEN;
    std::shared_ptr<const UsageCounter> usage_counter;
    std::filesystem::path zoneinfo_dir;     ///< Empty selects the configured directory
};

/**
 * @brief Options for verify_agent
 */
struct VerifyAgentOptions {
    std::optional<std::string> audience;
    std::vector<std::string> required_scopes;
    bool enforce_constraints = true;
    bool require_delegation = true;
    UsagePolicy usage_policy = UsagePolicy::FAIL_OPEN;

    std::shared_ptr<const DelegatorKeyResolver> key_resolver;
    std::shared_ptr<const RevocationChecker> revocation_checker;
    std::shared_ptr<const UsageCounter> usage_counter;
    std::shared_ptr<NonceReplayCache> replay_cache;

    std::filesystem::path zoneinfo_dir;     ///< Empty selects the configured directory
};

/**
 * @brief Result of a successful verify_agent
 */
struct VerifiedAgent {
    std::string agent_did;
    std::string delegator_did;
    std::vector<std::string> scopes;
    std::optional<Delegation> delegation;   ///< Root delegation; absent only if not required
    AgentToken token;
};

/**
 * @brief Verify a bearer token and its delegation chain for a request
 * @throws AgentAuthError with the first failing check's code
 */
VerifiedAgent verify_agent(
    const std::string& token,
    const VerifyAgentOptions& options,
    const RequestContext& context = {}
);

/**
 * @brief Enforce the root delegation's constraints for a request
 *
 * Checks scope and audience containment, MFA, subdelegation, IP allowlist,
 * time windows, usage limits and value limit. All must pass.
 *
 * @throws AgentAuthError with the first failing constraint's code
 */
void enforce_constraints(
    const Delegation& delegation,
    const AgentToken& token,
    const RequestContext& context,
    const EnforcementOptions& options = {}
);

/**
 * @brief Extract the token from an "Authorization: Bearer <token>" value
 * @return Token or std::nullopt if the scheme is not Bearer or token is empty
 */
std::optional<std::string> extract_bearer_token(const std::string& authorization_header);

} // namespace agentauth
