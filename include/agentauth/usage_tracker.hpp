/**
 * @file usage_tracker.hpp
 * @brief Per-delegation usage counting for maxUses / maxUsesPerHour
 *
 * AgentAuth - Delegated authorization tokens for autonomous agents
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * - Lifetime use count per delegation
 * - Rolling-window use count per delegation
 * - Thread-safe implementation
 */

#pragma once

#include <cstdint>
#include <deque>
#include <map>
#include <mutex>
#include <string>

namespace agentauth {

/**
 * @brief Read side of usage counting consulted during enforcement
 *
 * Verification only reads counts. The caller records a use after the
 * request it authorized has been served.
 */
class UsageCounter {
public:
    virtual ~UsageCounter() = default;

    /**
     * @brief Uses recorded for a delegation over its lifetime
     */
    virtual uint64_t count_total(const std::string& delegation_id) const = 0;

    /**
     * @brief Uses recorded at or after since (Unix seconds)
     */
    virtual uint64_t count_since(const std::string& delegation_id, int64_t since) const = 0;
};

/**
 * @brief Usage history of one delegation
 */
struct UsageRecord {
    /// Lifetime count, survives pruning of timestamps
    uint64_t total = 0;

    /// Timestamps (Unix seconds) of recent uses, oldest first
    std::deque<int64_t> recent;
};

/**
 * @brief UsageTracker - In-memory usage counter
 *
 * Thread-safe counting per delegation id:
 * 1. record_use() increments the lifetime total and logs a timestamp
 * 2. Timestamps older than the retention window are pruned
 * 3. No atomicity between reading a count and recording a use
 *
 */
class UsageTracker : public UsageCounter {
public:
    /**
     * @brief Construct usage tracker
     * @param retention_seconds How long use timestamps are kept (default: 1 hour)
     */
    explicit UsageTracker(int64_t retention_seconds = 3600);

    ~UsageTracker() override = default;

    UsageTracker(const UsageTracker&) = delete;
    UsageTracker& operator=(const UsageTracker&) = delete;
    UsageTracker(UsageTracker&&) = delete;
    UsageTracker& operator=(UsageTracker&&) = delete;

    /**
     * @brief Record one use of a delegation
     * @param delegation_id Delegation id
     * @param at Time of use (Unix seconds)
     */
    void record_use(const std::string& delegation_id, int64_t at);

    uint64_t count_total(const std::string& delegation_id) const override;

    uint64_t count_since(const std::string& delegation_id, int64_t since) const override;

    /**
     * @brief Number of delegations with recorded usage
     */
    size_t get_tracked_count() const;

    /**
     * @brief Drop timestamps older than the retention window
     * @param now Reference time (Unix seconds)
     * @return Number of timestamps removed
     */
    size_t cleanup_expired(int64_t now);

    /**
     * @brief Forget all usage of one delegation
     */
    void reset(const std::string& delegation_id);

    /**
     * @brief Forget all usage
     */
    void clear();

private:
    /// Retention window for timestamps
    int64_t retention_seconds_;

    /// Usage per delegation id
    std::map<std::string, UsageRecord> records_;

    /// Mutex for thread-safe access
    mutable std::mutex mutex_;

    /**
     * @brief Prune expired timestamps of one record (caller holds mutex_)
     */
    size_t prune(UsageRecord& record, int64_t now) const;
};

} // namespace agentauth
