/**
 * @file key_resolver.hpp
 * @brief Resolution of delegator DIDs to Ed25519 public keys
 *
 * AgentAuth - Delegated authorization tokens for autonomous agents
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#pragma once

#include "agentauth/agent_crypto.hpp"
#include <map>
#include <mutex>
#include <optional>
#include <string>

namespace agentauth {

/**
 * @brief Maps a delegator DID to the key that signs its delegations
 */
class DelegatorKeyResolver {
public:
    virtual ~DelegatorKeyResolver() = default;

    /**
     * @brief Resolve a DID to its public key
     * @return Public key or std::nullopt if the DID is unknown
     */
    virtual std::optional<PublicKey> resolve(const std::string& did) const = 0;
};

/**
 * @brief Resolves self-certifying did:agentauth DIDs only
 */
class SelfCertifyingKeyResolver : public DelegatorKeyResolver {
public:
    std::optional<PublicKey> resolve(const std::string& did) const override;
};

/**
 * @brief KeyRegistry - Explicit DID to key bindings
 *
 * For principals whose DIDs are not self-certifying (did:web, wallet
 * DIDs). agentauth DIDs always resolve to the key they encode and
 * cannot be bound. Thread-safe.
 */
class KeyRegistry : public DelegatorKeyResolver {
public:
    KeyRegistry() = default;
    ~KeyRegistry() override = default;

    KeyRegistry(const KeyRegistry&) = delete;
    KeyRegistry& operator=(const KeyRegistry&) = delete;
    KeyRegistry(KeyRegistry&&) = delete;
    KeyRegistry& operator=(KeyRegistry&&) = delete;

    /**
     * @brief Bind a DID to a public key, replacing any previous binding
     * @throws AgentAuthError (INVALID_DID_FORMAT) for agentauth DIDs
     */
    void register_key(const std::string& did, const PublicKey& public_key);

    /**
     * @brief Remove a binding
     * @return true if a binding existed
     */
    bool unregister_key(const std::string& did);

    std::optional<PublicKey> resolve(const std::string& did) const override;

    size_t size() const;

private:
    std::map<std::string, PublicKey> keys_;
    mutable std::mutex mutex_;
};

} // namespace agentauth
