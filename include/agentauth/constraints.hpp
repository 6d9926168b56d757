/**
 * @file constraints.hpp
 * @brief Pure constraint predicates over a delegation and request context
 *
 * AgentAuth - Delegated authorization tokens for autonomous agents
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * No predicate holds state; all are safe to evaluate concurrently.
 */

#pragma once

#include "agentauth/delegation.hpp"
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace agentauth {

/**
 * @brief Limit comparison: current <= limit
 *
 * An absent limit or an absent current value is unconstrained.
 */
bool check_limit(std::optional<uint64_t> limit, std::optional<uint64_t> current);
bool check_limit(std::optional<double> limit, std::optional<double> current);

/**
 * @brief Check a request IP against an allowlist of IPs and CIDR blocks
 * @return false if ip is absent or unparsable, or matches no entry;
 *         unparsable allowlist entries never match
 */
bool ip_allowed(const std::vector<std::string>& allowlist, const std::optional<std::string>& ip);

/**
 * @brief Check whether unix_time falls inside a window in its time zone
 * @throws AgentAuthError(UNKNOWN_TIME_ZONE) if the window's zone cannot be loaded
 */
bool in_time_window(
    const TimeWindow& window,
    int64_t unix_time,
    const std::filesystem::path& zoneinfo_dir
);

/**
 * @brief Check whether unix_time falls inside any window
 * @throws AgentAuthError(UNKNOWN_TIME_ZONE) if a zone cannot be loaded
 */
bool in_any_time_window(
    const std::vector<TimeWindow>& windows,
    int64_t unix_time,
    const std::filesystem::path& zoneinfo_dir
);

/**
 * @brief Scope is in scope.include and not in scope.exclude (exact match)
 */
bool scope_delegated(const DelegationScope& scope, const std::string& requested);

/**
 * @brief Audience is permitted (an empty audience list permits any)
 */
bool audience_delegated(const DelegationScope& scope, const std::string& audience);

} // namespace agentauth
