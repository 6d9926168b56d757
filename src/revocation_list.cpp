/**
 * @file revocation_list.cpp
 * @brief Implementation of the in-memory revocation registry
 *
 * AgentAuth - Delegated authorization tokens for autonomous agents
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "agentauth/revocation_list.hpp"
#include "agentauth/utilities.hpp"

namespace agentauth {

bool RevocationList::revoke(const std::string& delegation_id, const std::string& reason) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (entries_.count(delegation_id) > 0) {
        return false;
    }

    entries_[delegation_id] = RevocationEntry{delegation_id, utilities::current_timestamp(), reason};
    utilities::log_info("Revocation: Revoked " + delegation_id +
                        (reason.empty() ? "" : " (" + reason + ")"));
    return true;
}

bool RevocationList::is_revoked(const std::string& delegation_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.count(delegation_id) > 0;
}

std::optional<RevocationEntry> RevocationList::get_entry(const std::string& delegation_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(delegation_id);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<RevocationEntry> RevocationList::get_entries() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<RevocationEntry> result;
    result.reserve(entries_.size());
    for (const auto& [id, entry] : entries_) {
        result.push_back(entry);
    }
    return result;
}

size_t RevocationList::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

void RevocationList::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
}

} // namespace agentauth
