/**
 * @file config.cpp
 * @brief Implementation of environment configuration
 *
 * AgentAuth - Delegated authorization tokens for autonomous agents
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "agentauth/config.hpp"
#include "agentauth/utilities.hpp"
#include <cctype>

namespace agentauth {
namespace config {

// ============================================================================
// Directories
// ============================================================================

std::filesystem::path get_data_directory() {
    std::string env_data_dir = utilities::get_env("AGENTAUTH_DATA_DIR");
    if (!env_data_dir.empty()) {
        return std::filesystem::path(env_data_dir);
    }

    std::string home = utilities::get_env("HOME");
    if (!home.empty()) {
        return std::filesystem::path(home) / ".agentauth";
    }

    return std::filesystem::temp_directory_path() / "agentauth";
}

std::filesystem::path get_identity_directory() {
    return get_data_directory() / "identities";
}

std::filesystem::path get_zoneinfo_directory() {
    std::string dir = utilities::get_env("AGENTAUTH_ZONEINFO_DIR");
    if (dir.empty()) {
        dir = utilities::get_env("TZDIR", "/usr/share/zoneinfo");
    }
    return std::filesystem::path(dir);
}

// ============================================================================
// Validation
// ============================================================================

bool validate_scope(const std::string& scope) {
    if (scope.empty()) {
        return false;
    }

    for (char c : scope) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (uc <= 0x20 || uc >= 0x7f) {
            return false;
        }
    }

    return true;
}

} // namespace config
} // namespace agentauth
