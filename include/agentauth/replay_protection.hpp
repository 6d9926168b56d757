/**
 * @file replay_protection.hpp
 * @brief Token replay protection keyed by issuer and nonce
 *
 * AgentAuth - Delegated authorization tokens for autonomous agents
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * - Nonce cache entries expire with the token that carried them
 * - Automatic cleanup of expired entries
 * - Thread-safe implementation
 */

#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <string>

namespace agentauth {

/**
 * @brief Records token nonces so a token is accepted once
 */
class NonceReplayCache {
public:
    virtual ~NonceReplayCache() = default;

    /**
     * @brief Record a nonce if unseen
     * @param issuer Token issuer DID
     * @param nonce Token nonce
     * @param expires_at Token expiry (Unix seconds); entry may be dropped after
     * @param now Current time (Unix seconds)
     * @return true if the nonce was new, false if it is a replay
     */
    virtual bool check_and_record(
        const std::string& issuer,
        const std::string& nonce,
        int64_t expires_at,
        int64_t now
    ) = 0;
};

/**
 * @brief ReplayCache - In-memory nonce cache
 *
 * Thread-safe replay protection using:
 * 1. Cache key = issuer + nonce
 * 2. Entry kept until its token expires
 * 3. Opportunistic cleanup every REPLAY_CLEANUP_INTERVAL insertions
 *
 */
class ReplayCache : public NonceReplayCache {
public:
    ReplayCache() = default;
    ~ReplayCache() override = default;

    ReplayCache(const ReplayCache&) = delete;
    ReplayCache& operator=(const ReplayCache&) = delete;
    ReplayCache(ReplayCache&&) = delete;
    ReplayCache& operator=(ReplayCache&&) = delete;

    bool check_and_record(
        const std::string& issuer,
        const std::string& nonce,
        int64_t expires_at,
        int64_t now
    ) override;

    /**
     * @brief Check if a nonce has been seen (without recording it)
     */
    bool has_seen(const std::string& issuer, const std::string& nonce) const;

    /**
     * @brief Number of cached nonces
     */
    size_t get_cache_size() const;

    /**
     * @brief Remove entries whose token expired before now
     * @return Number of entries removed
     */
    size_t cleanup_expired(int64_t now);

    /**
     * @brief Clear all cached nonces (use with caution)
     */
    void clear();

private:
    static std::string make_key(const std::string& issuer, const std::string& nonce);

    /**
     * @brief Remove expired entries (caller holds mutex_)
     */
    size_t cleanup_locked(int64_t now);

    /// Seen nonces with expiration times
    std::map<std::string, int64_t> nonce_cache_;

    /// Insertions since last cleanup
    size_t insertions_ = 0;

    /// Mutex for thread-safe access
    mutable std::mutex mutex_;
};

} // namespace agentauth
