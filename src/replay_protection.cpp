/**
 * @file replay_protection.cpp
 * @brief Implementation of token replay protection
 *
 * AgentAuth - Delegated authorization tokens for autonomous agents
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "agentauth/replay_protection.hpp"
#include "agentauth/config.hpp"
#include "agentauth/utilities.hpp"

namespace agentauth {

// ============================================================================
// Nonce Validation
// ============================================================================

std::string ReplayCache::make_key(const std::string& issuer, const std::string& nonce) {
    // DIDs never contain a space
    return issuer + " " + nonce;
}

bool ReplayCache::check_and_record(
    const std::string& issuer,
    const std::string& nonce,
    int64_t expires_at,
    int64_t now
) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::string key = make_key(issuer, nonce);
    auto it = nonce_cache_.find(key);
    if (it != nonce_cache_.end() && it->second >= now) {
        utilities::log_warn("Replay: Nonce reused by " + issuer);
        return false;
    }

    nonce_cache_[key] = expires_at;

    if (++insertions_ % config::REPLAY_CLEANUP_INTERVAL == 0) {
        cleanup_locked(now);
    }

    return true;
}

bool ReplayCache::has_seen(const std::string& issuer, const std::string& nonce) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return nonce_cache_.find(make_key(issuer, nonce)) != nonce_cache_.end();
}

// ============================================================================
// Cache Management
// ============================================================================

size_t ReplayCache::get_cache_size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return nonce_cache_.size();
}

size_t ReplayCache::cleanup_expired(int64_t now) {
    std::lock_guard<std::mutex> lock(mutex_);
    return cleanup_locked(now);
}

size_t ReplayCache::cleanup_locked(int64_t now) {
    size_t removed = 0;

    for (auto it = nonce_cache_.begin(); it != nonce_cache_.end(); ) {
        if (it->second < now) {
            it = nonce_cache_.erase(it);
            removed++;
        } else {
            ++it;
        }
    }

    return removed;
}

void ReplayCache::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    nonce_cache_.clear();
}

} // namespace agentauth
