/**
 * @file usage_tracker.cpp
 * @brief Implementation of per-delegation usage counting
 *
 * AgentAuth - Delegated authorization tokens for autonomous agents
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "agentauth/usage_tracker.hpp"
#include <algorithm>
#include <iterator>

namespace agentauth {

// ============================================================================
// Constructor
// ============================================================================

UsageTracker::UsageTracker(int64_t retention_seconds)
    : retention_seconds_(retention_seconds)
{
}

// ============================================================================
// Recording
// ============================================================================

void UsageTracker::record_use(const std::string& delegation_id, int64_t at) {
    std::lock_guard<std::mutex> lock(mutex_);

    UsageRecord& record = records_[delegation_id];
    record.total++;

    // Keep timestamps ordered even if uses are recorded out of order
    auto pos = std::upper_bound(record.recent.begin(), record.recent.end(), at);
    record.recent.insert(pos, at);

    prune(record, record.recent.back());
}

// ============================================================================
// Counting
// ============================================================================

uint64_t UsageTracker::count_total(const std::string& delegation_id) const {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = records_.find(delegation_id);
    if (it == records_.end()) {
        return 0;
    }
    return it->second.total;
}

uint64_t UsageTracker::count_since(const std::string& delegation_id, int64_t since) const {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = records_.find(delegation_id);
    if (it == records_.end()) {
        return 0;
    }

    const auto& recent = it->second.recent;
    auto first = std::lower_bound(recent.begin(), recent.end(), since);
    return static_cast<uint64_t>(std::distance(first, recent.end()));
}

// ============================================================================
// Management Functions
// ============================================================================

size_t UsageTracker::prune(UsageRecord& record, int64_t now) const {
    size_t removed = 0;
    while (!record.recent.empty() && record.recent.front() < now - retention_seconds_) {
        record.recent.pop_front();
        removed++;
    }
    return removed;
}

size_t UsageTracker::get_tracked_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_.size();
}

size_t UsageTracker::cleanup_expired(int64_t now) {
    std::lock_guard<std::mutex> lock(mutex_);

    size_t removed = 0;
    for (auto& [id, record] : records_) {
        removed += prune(record, now);
    }
    return removed;
}

void UsageTracker::reset(const std::string& delegation_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    records_.erase(delegation_id);
}

void UsageTracker::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    records_.clear();
}

} // namespace agentauth
