/**
 * @file agent_identity.cpp
 * @brief Implementation of agent identity management
 *
 * AgentAuth - Delegated authorization tokens for autonomous agents
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Secure identity management with persistent key storage
 */

#include "agentauth/agent_identity.hpp"
#include "agentauth/config.hpp"
#include "agentauth/errors.hpp"
#include "agentauth/utilities.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cerrno>
#include <cstdio>

#ifndef _WIN32
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>
#endif

using json = nlohmann::json;

namespace agentauth {

namespace {

#ifndef _WIN32
// Key material is never visible with wider permissions: the file is born
// 0600 under a temporary name and renamed over the target.
bool write_private_file(const std::filesystem::path& path, const std::string& content) {
    std::string temp = path.string() + ".tmp";
    ::unlink(temp.c_str());

    int fd = ::open(temp.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_NOFOLLOW, S_IRUSR | S_IWUSR);
    if (fd < 0) {
        utilities::log_error("Identity: Cannot create " + temp);
        return false;
    }

    size_t written = 0;
    while (written < content.size()) {
        ssize_t n = ::write(fd, content.data() + written, content.size() - written);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            break;
        }
        written += static_cast<size_t>(n);
    }

    bool ok = written == content.size() && ::fsync(fd) == 0;
    if (::close(fd) != 0) {
        ok = false;
    }
    if (ok && std::rename(temp.c_str(), path.c_str()) != 0) {
        ok = false;
    }
    if (!ok) {
        ::unlink(temp.c_str());
        utilities::log_error("Identity: Failed to write " + path.string());
    }
    return ok;
}
#endif

} // anonymous namespace

// ============================================================================
// Constructors
// ============================================================================

AgentIdentity::AgentIdentity(
    const SignatureKeyPair& keypair,
    const IdentityMetadata& metadata,
    int64_t created_at
)
    : keypair_(keypair)
    , did_(public_key_to_did(keypair.public_key))
    , metadata_(metadata)
    , created_at_(created_at)
{
}

AgentIdentity::~AgentIdentity() {
    AgentCrypto::secure_zero(keypair_.seed.data(), keypair_.seed.size());
    AgentCrypto::secure_zero(keypair_.secret_key.data(), keypair_.secret_key.size());
}

AgentIdentity AgentIdentity::create(const IdentityMetadata& metadata) {
    AgentIdentity identity(
        AgentCrypto::generate_signature_keypair(),
        metadata,
        utilities::current_timestamp()
    );
    utilities::log_debug("Identity: Created " + identity.get_did());
    return identity;
}

AgentIdentity AgentIdentity::from_private_key(
    const std::string& private_key_hex,
    const IdentityMetadata& metadata
) {
    auto bytes = AgentCrypto::hex_to_bytes(private_key_hex);
    if (!bytes) {
        throw AgentAuthError(ErrorCode::INVALID_KEY_FORMAT, "private key is not valid hex");
    }

    if (bytes->size() != crypto_sign_SEEDBYTES) {
        size_t actual = bytes->size();
        AgentCrypto::secure_zero(bytes->data(), bytes->size());
        throw AgentAuthError(
            ErrorCode::INVALID_KEY_FORMAT,
            "private key must be " + std::to_string(crypto_sign_SEEDBYTES) +
            " bytes, got " + std::to_string(actual)
        );
    }

    PrivateKeySeed seed;
    std::copy(bytes->begin(), bytes->end(), seed.begin());
    AgentCrypto::secure_zero(bytes->data(), bytes->size());

    AgentIdentity identity(
        AgentCrypto::keypair_from_seed(seed),
        metadata,
        utilities::current_timestamp()
    );
    AgentCrypto::secure_zero(seed.data(), seed.size());
    return identity;
}

// ============================================================================
// DID Encoding
// ============================================================================

std::string AgentIdentity::public_key_to_did(const PublicKey& public_key) {
    std::vector<uint8_t> key_vec(public_key.begin(), public_key.end());
    return std::string(config::DID_SCHEME) + ":" + config::DID_METHOD + ":" +
           config::DID_KEY_TYPE + ":" + AgentCrypto::bytes_to_base64url(key_vec);
}

PublicKey AgentIdentity::did_to_public_key(const std::string& did) {
    auto parts = utilities::split_string(did, ':');
    if (parts.size() != 4 ||
        parts[0] != config::DID_SCHEME ||
        parts[1] != config::DID_METHOD ||
        parts[2] != config::DID_KEY_TYPE) {
        throw AgentAuthError(ErrorCode::INVALID_DID_FORMAT, "not an agentauth DID: " + did);
    }

    auto key_bytes = AgentCrypto::base64url_to_bytes(parts[3]);
    if (!key_bytes || key_bytes->size() != crypto_sign_PUBLICKEYBYTES) {
        throw AgentAuthError(ErrorCode::INVALID_DID_FORMAT, "DID does not encode an Ed25519 key: " + did);
    }

    PublicKey public_key;
    std::copy(key_bytes->begin(), key_bytes->end(), public_key.begin());
    return public_key;
}

bool AgentIdentity::is_agentauth_did(const std::string& did) {
    try {
        did_to_public_key(did);
        return true;
    } catch (const AgentAuthError&) {
        return false;
    }
}

// ============================================================================
// Identity Information
// ============================================================================

std::string AgentIdentity::get_key_id() const {
    return did_ + config::KEY_ID_SUFFIX;
}

// ============================================================================
// Cryptographic Operations
// ============================================================================

std::vector<uint8_t> AgentIdentity::sign(const std::vector<uint8_t>& message) const {
    return AgentCrypto::sign_message(message, keypair_.secret_key);
}

std::vector<uint8_t> AgentIdentity::sign(const std::string& message) const {
    return sign(std::vector<uint8_t>(message.begin(), message.end()));
}

bool AgentIdentity::verify(
    const std::vector<uint8_t>& signature,
    const std::vector<uint8_t>& message,
    const std::string& did
) {
    PublicKey public_key = did_to_public_key(did);
    return AgentCrypto::verify_signature(message, signature, public_key);
}

// ============================================================================
// Serialization
// ============================================================================

std::string AgentIdentity::export_private_key() const {
    std::vector<uint8_t> seed(keypair_.seed.begin(), keypair_.seed.end());
    std::string hex = AgentCrypto::bytes_to_hex(seed);
    AgentCrypto::secure_zero(seed.data(), seed.size());
    return hex;
}

std::string AgentIdentity::to_json() const {
    json j;
    j["did"] = did_;
    j["privateKey"] = export_private_key();
    j["publicKey"] = AgentCrypto::bytes_to_hex(
        std::vector<uint8_t>(keypair_.public_key.begin(), keypair_.public_key.end()));
    j["metadata"] = metadata_;
    j["created"] = utilities::format_timestamp(created_at_);
    return j.dump();
}

AgentIdentity AgentIdentity::from_json(const std::string& json_str) {
    json j;
    IdentityMetadata metadata;
    std::string private_key_hex;
    std::string did;
    std::string public_key_hex;
    int64_t created_at = 0;

    try {
        j = json::parse(json_str);
        private_key_hex = j.at("privateKey").get<std::string>();
        did = j.at("did").get<std::string>();
        public_key_hex = j.value("publicKey", std::string());

        if (j.contains("metadata") && !j["metadata"].is_null()) {
            metadata = j["metadata"].get<IdentityMetadata>();
        }

        if (j.contains("created")) {
            auto parsed = utilities::parse_timestamp(j["created"].get<std::string>());
            if (!parsed) {
                throw AgentAuthError(ErrorCode::INVALID_KEY_FORMAT, "invalid created timestamp");
            }
            created_at = *parsed;
        }
    } catch (const json::exception& e) {
        throw AgentAuthError(ErrorCode::INVALID_KEY_FORMAT, std::string("invalid identity JSON: ") + e.what());
    }

    AgentIdentity identity = from_private_key(private_key_hex, metadata);
    if (j.contains("created")) {
        identity.created_at_ = created_at;
    }

    // Stored DID and public key must agree with the private key
    if (identity.did_ != did) {
        throw AgentAuthError(ErrorCode::INVALID_KEY_FORMAT, "stored DID does not match private key");
    }
    if (!public_key_hex.empty()) {
        auto public_key = AgentCrypto::hex_to_bytes(public_key_hex);
        std::vector<uint8_t> expected(identity.keypair_.public_key.begin(), identity.keypair_.public_key.end());
        if (!public_key || !AgentCrypto::constant_time_compare(*public_key, expected)) {
            throw AgentAuthError(ErrorCode::INVALID_KEY_FORMAT, "stored public key does not match private key");
        }
    }

    return identity;
}

// ============================================================================
// Persistent Storage
// ============================================================================

bool AgentIdentity::save(const std::filesystem::path& storage_dir) const {
    try {
        if (!std::filesystem::exists(storage_dir)) {
            std::filesystem::create_directories(storage_dir);
        }

        auto path = get_identity_path(did_, storage_dir);
#ifndef _WIN32
        if (!write_private_file(path, to_json())) {
            return false;
        }
#else
        if (!utilities::write_file(path.string(), to_json())) {
            return false;
        }
#endif

        utilities::log_info("Identity: Saved " + did_ + " to " + storage_dir.string());
        return true;

    } catch (const std::exception& e) {
        utilities::log_error("Identity: Failed to save " + did_ + ": " + e.what());
        return false;
    }
}

std::optional<AgentIdentity> AgentIdentity::load(
    const std::string& did,
    const std::filesystem::path& storage_dir
) {
    if (!is_agentauth_did(did)) {
        return std::nullopt;
    }

    auto path = get_identity_path(did, storage_dir);
    if (!std::filesystem::exists(path)) {
        return std::nullopt;
    }

    auto content = utilities::read_file(path.string());
    if (!content) {
        return std::nullopt;
    }

    try {
        AgentIdentity identity = from_json(*content);
        if (identity.get_did() != did) {
            utilities::log_warn("Identity: Stored record does not match " + did);
            return std::nullopt;
        }
        return identity;
    } catch (const AgentAuthError& e) {
        utilities::log_warn("Identity: Corrupt identity file " + path.string() + ": " + e.what());
        return std::nullopt;
    }
}

bool AgentIdentity::remove(
    const std::string& did,
    const std::filesystem::path& storage_dir
) {
    if (!is_agentauth_did(did)) {
        return false;
    }

    try {
        auto path = get_identity_path(did, storage_dir);
        if (std::filesystem::exists(path)) {
            return std::filesystem::remove(path);
        }
        return false;

    } catch (const std::exception&) {
        return false;
    }
}

// ============================================================================
// Private Helper Functions
// ============================================================================

std::filesystem::path AgentIdentity::get_identity_path(
    const std::string& did,
    const std::filesystem::path& storage_dir
) {
    // ':' is not portable in file names; base64url characters are
    std::string filename = did;
    std::replace(filename.begin(), filename.end(), ':', '_');
    return storage_dir / (filename + ".json");
}

} // namespace agentauth
