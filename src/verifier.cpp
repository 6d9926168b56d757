/**
 * @file verifier.cpp
 * @brief Implementation of agent verification and constraint enforcement
 *
 * AgentAuth - Delegated authorization tokens for autonomous agents
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "agentauth/verifier.hpp"
#include "agentauth/config.hpp"
#include "agentauth/constraints.hpp"
#include "agentauth/errors.hpp"
#include "agentauth/utilities.hpp"

namespace agentauth {

namespace {

[[noreturn]] void deny(ErrorCode code, const std::string& message) {
    utilities::log_warn("Verifier: Denied (" + error_code_to_string(code) + "): " + message);
    throw AgentAuthError(code, message);
}

void check_chain_linkage(const std::vector<Delegation>& chain, const AgentToken& token) {
    if (chain.front().delegator().id != token.get_delegator()) {
        deny(ErrorCode::CHAIN_MISMATCH,
             "root delegator " + chain.front().delegator().id + " is not token subject " + token.get_delegator());
    }

    for (size_t i = 0; i + 1 < chain.size(); ++i) {
        if (chain[i].delegate().id != chain[i + 1].delegator().id) {
            deny(ErrorCode::CHAIN_MISMATCH, "delegation " + chain[i + 1].id() + " does not continue the chain");
        }
    }

    if (chain.back().delegate().id != token.get_agent()) {
        deny(ErrorCode::CHAIN_MISMATCH,
             "last delegate " + chain.back().delegate().id + " is not token issuer " + token.get_agent());
    }
}

void check_usage(
    const Delegation& delegation,
    int64_t now,
    const EnforcementOptions& options
) {
    const auto& c = delegation.constraints();
    if (!c.max_uses && !c.max_uses_per_hour) {
        return;
    }

    if (!options.usage_counter) {
        if (options.usage_policy == UsagePolicy::FAIL_CLOSED) {
            deny(ErrorCode::USAGE_LIMIT_EXCEEDED, "no usage counter available for " + delegation.id());
        }
        utilities::log_debug("Verifier: No usage counter, usage limits of " + delegation.id() + " not enforced");
        return;
    }

    // The request being evaluated counts as one more use
    if (c.max_uses) {
        uint64_t used = options.usage_counter->count_total(delegation.id());
        if (!check_limit(c.max_uses, std::optional<uint64_t>(used + 1))) {
            deny(ErrorCode::USAGE_LIMIT_EXCEEDED,
                 "maxUses " + std::to_string(*c.max_uses) + " reached for " + delegation.id());
        }
    }

    if (c.max_uses_per_hour) {
        uint64_t used = options.usage_counter->count_since(
            delegation.id(), now - config::USAGE_RATE_WINDOW_SECONDS);
        if (!check_limit(c.max_uses_per_hour, std::optional<uint64_t>(used + 1))) {
            deny(ErrorCode::USAGE_LIMIT_EXCEEDED,
                 "maxUsesPerHour " + std::to_string(*c.max_uses_per_hour) + " reached for " + delegation.id());
        }
    }
}

} // anonymous namespace

// ============================================================================
// Constraint Enforcement
// ============================================================================

void enforce_constraints(
    const Delegation& delegation,
    const AgentToken& token,
    const RequestContext& context,
    const EnforcementOptions& options
) {
    const auto& c = delegation.constraints();
    int64_t now = context.current_time.value_or(utilities::current_timestamp());

    for (const auto& scope : token.get_scopes()) {
        if (!scope_delegated(delegation.scope(), scope)) {
            deny(ErrorCode::SCOPE_NOT_DELEGATED, "scope " + scope + " is not delegated by " + delegation.id());
        }
    }

    if (!audience_delegated(delegation.scope(), token.get_audience())) {
        deny(ErrorCode::AUDIENCE_NOT_DELEGATED,
             "audience " + token.get_audience() + " is not delegated by " + delegation.id());
    }

    if (c.requires_mfa() && !context.mfa_verified) {
        deny(ErrorCode::MFA_REQUIRED, "delegation " + delegation.id() + " requires MFA");
    }

    if (!c.allows_subdelegation() && token.get_delegation_chain().size() != 1) {
        deny(ErrorCode::SUBDELEGATION_NOT_ALLOWED,
             "delegation " + delegation.id() + " forbids subdelegation, chain length " +
             std::to_string(token.get_delegation_chain().size()));
    }

    if (!c.ip_allowlist.empty() && !ip_allowed(c.ip_allowlist, context.ip)) {
        deny(ErrorCode::IP_NOT_ALLOWED, "request IP " + context.ip.value_or("(none)") + " is not allowed");
    }

    if (!c.time_windows.empty()) {
        auto zoneinfo_dir = options.zoneinfo_dir.empty() ? config::get_zoneinfo_directory()
                                                         : options.zoneinfo_dir;
        if (!in_any_time_window(c.time_windows, now, zoneinfo_dir)) {
            deny(ErrorCode::OUTSIDE_TIME_WINDOW,
                 utilities::format_timestamp(now) + " is outside every time window of " + delegation.id());
        }
    }

    check_usage(delegation, now, options);

    if (c.max_value_per_use) {
        if (!context.value) {
            if (options.usage_policy == UsagePolicy::FAIL_CLOSED) {
                deny(ErrorCode::VALUE_EXCEEDS_LIMIT, "request value required by " + delegation.id());
            }
        } else if (!check_limit(c.max_value_per_use, context.value)) {
            deny(ErrorCode::VALUE_EXCEEDS_LIMIT,
                 "value " + std::to_string(*context.value) + " exceeds " + std::to_string(*c.max_value_per_use));
        }
    }
}

// ============================================================================
// Agent Verification
// ============================================================================

VerifiedAgent verify_agent(
    const std::string& token_string,
    const VerifyAgentOptions& options,
    const RequestContext& context
) {
    int64_t now = context.current_time.value_or(utilities::current_timestamp());

    // 1. Token-level gates
    VerifyOptions token_options;
    token_options.audience = options.audience;
    token_options.required_scopes = options.required_scopes;
    token_options.current_time = now;
    AgentToken token = AgentToken::verify(token_string, token_options);

    // 2. Replay
    if (options.replay_cache &&
        !options.replay_cache->check_and_record(token.get_agent(), token.get_nonce(), token.get_expires_at(), now)) {
        deny(ErrorCode::TOKEN_REPLAYED, "nonce already presented by " + token.get_agent());
    }

    // 3. Delegation presence
    const auto& chain = token.get_delegation_chain();
    if (chain.empty()) {
        if (options.require_delegation) {
            deny(ErrorCode::NO_DELEGATION, "token from " + token.get_agent() + " carries no delegation");
        }
        utilities::log_debug("Verifier: Accepted " + token.get_agent() + " without delegation");
        return VerifiedAgent{token.get_agent(), token.get_delegator(), token.get_scopes(), std::nullopt, token};
    }

    // 4. Linkage
    check_chain_linkage(chain, token);

    // 5. Proofs
    if (options.key_resolver) {
        for (const auto& delegation : chain) {
            if (!verify_delegation_signature(delegation, *options.key_resolver)) {
                deny(ErrorCode::INVALID_DELEGATION_SIGNATURE, "proof of " + delegation.id() + " does not verify");
            }
        }
    }

    // 6. Time bounds
    for (const auto& delegation : chain) {
        auto failure = check_time_bounds(delegation, now);
        if (failure) {
            deny(*failure, "delegation " + delegation.id() + " is outside its validity period");
        }
    }

    // 7. Revocation
    if (options.revocation_checker) {
        for (const auto& delegation : chain) {
            if (options.revocation_checker->is_revoked(delegation.id())) {
                deny(ErrorCode::DELEGATION_REVOKED, "delegation " + delegation.id() + " is revoked");
            }
        }
    }

    // 8. Root constraints
    const Delegation& root = chain.front();
    if (options.enforce_constraints) {
        EnforcementOptions enforcement;
        enforcement.usage_policy = options.usage_policy;
        enforcement.usage_counter = options.usage_counter;
        enforcement.zoneinfo_dir = options.zoneinfo_dir;

        RequestContext pinned = context;
        pinned.current_time = now;
        enforce_constraints(root, token, pinned, enforcement);
    }

    utilities::log_debug("Verifier: Accepted " + token.get_agent() + " on behalf of " + token.get_delegator());
    return VerifiedAgent{token.get_agent(), token.get_delegator(), token.get_scopes(), root, token};
}

// ============================================================================
// Transport Helpers
// ============================================================================

std::optional<std::string> extract_bearer_token(const std::string& authorization_header) {
    const std::string prefix = "Bearer ";
    if (!utilities::starts_with(authorization_header, prefix)) {
        return std::nullopt;
    }

    std::string token = utilities::trim_string(authorization_header.substr(prefix.length()));
    if (token.empty()) {
        return std::nullopt;
    }
    return token;
}

} // namespace agentauth
