/**
 * @file key_resolver.cpp
 * @brief Implementation of delegator key resolution
 *
 * AgentAuth - Delegated authorization tokens for autonomous agents
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "agentauth/key_resolver.hpp"
#include "agentauth/agent_identity.hpp"
#include "agentauth/errors.hpp"
#include "agentauth/utilities.hpp"

namespace agentauth {

namespace {

bool is_agentauth_did(const std::string& did) {
    return utilities::starts_with(did, "did:agentauth:");
}

} // anonymous namespace

// ============================================================================
// SelfCertifyingKeyResolver
// ============================================================================

std::optional<PublicKey> SelfCertifyingKeyResolver::resolve(const std::string& did) const {
    try {
        return AgentIdentity::did_to_public_key(did);
    } catch (const AgentAuthError&) {
        return std::nullopt;
    }
}

// ============================================================================
// KeyRegistry
// ============================================================================

void KeyRegistry::register_key(const std::string& did, const PublicKey& public_key) {
    if (is_agentauth_did(did)) {
        throw AgentAuthError(ErrorCode::INVALID_DID_FORMAT, "agentauth DIDs are self-certifying: " + did);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    keys_[did] = public_key;
    utilities::log_debug("KeyRegistry: Registered key for " + did);
}

bool KeyRegistry::unregister_key(const std::string& did) {
    std::lock_guard<std::mutex> lock(mutex_);
    return keys_.erase(did) > 0;
}

std::optional<PublicKey> KeyRegistry::resolve(const std::string& did) const {
    if (is_agentauth_did(did)) {
        return SelfCertifyingKeyResolver().resolve(did);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = keys_.find(did);
    if (it != keys_.end()) {
        return it->second;
    }
    return std::nullopt;
}

size_t KeyRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return keys_.size();
}

} // namespace agentauth
