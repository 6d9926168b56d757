/**
 * @file constraints.cpp
 * @brief Implementation of constraint predicates
 *
 * AgentAuth - Delegated authorization tokens for autonomous agents
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "agentauth/constraints.hpp"
#include "agentauth/ip_address.hpp"
#include "agentauth/time_zone.hpp"
#include <algorithm>

namespace agentauth {

// ============================================================================
// Limits
// ============================================================================

bool check_limit(std::optional<uint64_t> limit, std::optional<uint64_t> current) {
    if (!limit || !current) {
        return true;
    }
    return *current <= *limit;
}

bool check_limit(std::optional<double> limit, std::optional<double> current) {
    if (!limit || !current) {
        return true;
    }
    return *current <= *limit;
}

// ============================================================================
// IP Allowlist
// ============================================================================

bool ip_allowed(const std::vector<std::string>& allowlist, const std::optional<std::string>& ip) {
    if (!ip) {
        return false;
    }

    auto address = parse_ip_address(*ip);
    if (!address) {
        return false;
    }

    for (const auto& entry : allowlist) {
        auto network = parse_ip_network(entry);
        if (network && network_contains(*network, *address)) {
            return true;
        }
    }
    return false;
}

// ============================================================================
// Time Windows
// ============================================================================

bool in_time_window(
    const TimeWindow& window,
    int64_t unix_time,
    const std::filesystem::path& zoneinfo_dir
) {
    TimeZone zone = window.tz ? TimeZone::load(*window.tz, zoneinfo_dir) : TimeZone::utc();
    LocalTime local = zone.to_local(unix_time);

    if (!window.days.empty()) {
        auto today = static_cast<Weekday>(local.weekday);
        if (std::find(window.days.begin(), window.days.end(), today) == window.days.end()) {
            return false;
        }
    }

    if (!window.hours) {
        return true;
    }

    int start = window.hours->start_minute;
    int end = window.hours->end_minute;
    int minute = local.minute_of_day;

    if (start < end) {
        return minute >= start && minute < end;
    }
    // Wraps past midnight, e.g. 22:00-06:00
    return minute >= start || minute < end;
}

bool in_any_time_window(
    const std::vector<TimeWindow>& windows,
    int64_t unix_time,
    const std::filesystem::path& zoneinfo_dir
) {
    for (const auto& window : windows) {
        if (in_time_window(window, unix_time, zoneinfo_dir)) {
            return true;
        }
    }
    return false;
}

// ============================================================================
// Scope and Audience
// ============================================================================

bool scope_delegated(const DelegationScope& scope, const std::string& requested) {
    bool included = std::find(scope.include.begin(), scope.include.end(), requested) != scope.include.end();
    bool excluded = std::find(scope.exclude.begin(), scope.exclude.end(), requested) != scope.exclude.end();
    return included && !excluded;
}

bool audience_delegated(const DelegationScope& scope, const std::string& audience) {
    if (scope.audiences.empty()) {
        return true;
    }
    return std::find(scope.audiences.begin(), scope.audiences.end(), audience) != scope.audiences.end();
}

} // namespace agentauth
