/**
 * @file revocation_list.hpp
 * @brief Delegation revocation status
 *
 * AgentAuth - Delegated authorization tokens for autonomous agents
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace agentauth {

/**
 * @brief Answers whether a delegation id has been revoked
 *
 * Implementations backed by a revocation endpoint or database are supplied
 * by the caller; verification only consults this interface.
 */
class RevocationChecker {
public:
    virtual ~RevocationChecker() = default;

    virtual bool is_revoked(const std::string& delegation_id) const = 0;
};

/**
 * @brief Record of a revocation
 */
struct RevocationEntry {
    std::string delegation_id;
    int64_t revoked_at;         ///< Unix seconds
    std::string reason;
};

/**
 * @brief RevocationList - In-memory revocation registry
 *
 * Thread-safe. Revocation is permanent for the lifetime of the list.
 */
class RevocationList : public RevocationChecker {
public:
    RevocationList() = default;
    ~RevocationList() override = default;

    RevocationList(const RevocationList&) = delete;
    RevocationList& operator=(const RevocationList&) = delete;
    RevocationList(RevocationList&&) = delete;
    RevocationList& operator=(RevocationList&&) = delete;

    /**
     * @brief Revoke a delegation
     * @param delegation_id Delegation id (urn:uuid:...)
     * @param reason Free-form reason for audit logs
     * @return true if newly revoked, false if already revoked
     */
    bool revoke(const std::string& delegation_id, const std::string& reason = "");

    bool is_revoked(const std::string& delegation_id) const override;

    /**
     * @brief Look up a revocation record
     */
    std::optional<RevocationEntry> get_entry(const std::string& delegation_id) const;

    /**
     * @brief All revocations, ordered by delegation id
     */
    std::vector<RevocationEntry> get_entries() const;

    size_t size() const;

    void clear();

private:
    std::map<std::string, RevocationEntry> entries_;
    mutable std::mutex mutex_;
};

} // namespace agentauth
