/**
 * @file delegation.cpp
 * @brief Implementation of delegation creation, signing and serialization
 *
 * AgentAuth - Delegated authorization tokens for autonomous agents
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "agentauth/delegation.hpp"
#include "agentauth/agent_identity.hpp"
#include "agentauth/config.hpp"
#include "agentauth/ip_address.hpp"
#include "agentauth/key_resolver.hpp"
#include "agentauth/time_zone.hpp"
#include "agentauth/utilities.hpp"
#include <nlohmann/json.hpp>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <memory>
#include <set>

using json = nlohmann::json;

namespace agentauth {

namespace {

// ============================================================================
// JSON helpers
// ============================================================================

[[noreturn]] void malformed(const std::string& message) {
    throw AgentAuthError(ErrorCode::MALFORMED_DELEGATION, message);
}

void reject_unknown_keys(const json& object, const std::set<std::string>& allowed, const std::string& where) {
    if (!object.is_object()) {
        malformed(where + " must be an object");
    }
    for (auto it = object.begin(); it != object.end(); ++it) {
        if (allowed.count(it.key()) == 0) {
            malformed("unknown key '" + it.key() + "' in " + where);
        }
    }
}

std::string require_string(const json& object, const std::string& key, const std::string& where) {
    auto it = object.find(key);
    if (it == object.end() || !it->is_string()) {
        malformed(where + "." + key + " must be a string");
    }
    return it->get<std::string>();
}

std::optional<std::string> optional_string(const json& object, const std::string& key, const std::string& where) {
    auto it = object.find(key);
    if (it == object.end() || it->is_null()) {
        return std::nullopt;
    }
    if (!it->is_string()) {
        malformed(where + "." + key + " must be a string");
    }
    return it->get<std::string>();
}

std::vector<std::string> string_list(const json& object, const std::string& key, const std::string& where) {
    std::vector<std::string> values;
    auto it = object.find(key);
    if (it == object.end() || it->is_null()) {
        return values;
    }
    if (!it->is_array()) {
        malformed(where + "." + key + " must be an array");
    }
    for (const auto& item : *it) {
        if (!item.is_string()) {
            malformed(where + "." + key + " must contain only strings");
        }
        values.push_back(item.get<std::string>());
    }
    return values;
}

std::optional<uint64_t> optional_count(const json& object, const std::string& key, const std::string& where) {
    auto it = object.find(key);
    if (it == object.end() || it->is_null()) {
        return std::nullopt;
    }
    if (!it->is_number_unsigned()) {
        malformed(where + "." + key + " must be a non-negative integer");
    }
    return it->get<uint64_t>();
}

std::optional<bool> optional_bool(const json& object, const std::string& key, const std::string& where) {
    auto it = object.find(key);
    if (it == object.end() || it->is_null()) {
        return std::nullopt;
    }
    if (!it->is_boolean()) {
        malformed(where + "." + key + " must be a boolean");
    }
    return it->get<bool>();
}

std::optional<int64_t> optional_timestamp(const json& object, const std::string& key, const std::string& where) {
    auto text = optional_string(object, key, where);
    if (!text) {
        return std::nullopt;
    }
    auto parsed = utilities::parse_timestamp(*text);
    if (!parsed) {
        malformed(where + "." + key + " is not an ISO 8601 timestamp");
    }
    return parsed;
}

// ============================================================================
// Encoding
// ============================================================================

json time_window_to_json(const TimeWindow& window) {
    json j = json::object();
    if (!window.days.empty()) {
        json days = json::array();
        for (Weekday day : window.days) {
            days.push_back(weekday_to_string(day));
        }
        j["days"] = days;
    }
    if (window.hours) {
        j["hours"] = window.hours->to_string();
    }
    if (window.tz) {
        j["tz"] = *window.tz;
    }
    return j;
}

json constraints_to_json(const DelegationConstraints& c) {
    json j = json::object();
    if (c.not_before) {
        j["notBefore"] = utilities::format_timestamp(*c.not_before);
    }
    if (c.not_after) {
        j["notAfter"] = utilities::format_timestamp(*c.not_after);
    }
    if (c.max_uses) {
        j["maxUses"] = *c.max_uses;
    }
    if (c.max_uses_per_hour) {
        j["maxUsesPerHour"] = *c.max_uses_per_hour;
    }
    if (c.max_value_per_use) {
        j["maxValuePerUse"] = *c.max_value_per_use;
    }
    if (c.require_mfa) {
        j["requireMFA"] = *c.require_mfa;
    }
    if (c.allow_subdelegation) {
        j["allowSubdelegation"] = *c.allow_subdelegation;
    }
    if (!c.ip_allowlist.empty()) {
        j["ipAllowlist"] = c.ip_allowlist;
    }
    if (!c.time_windows.empty()) {
        json windows = json::array();
        for (const auto& window : c.time_windows) {
            windows.push_back(time_window_to_json(window));
        }
        j["timeWindows"] = windows;
    }
    return j;
}

// Everything except proof.proofValue
json content_to_json(const DelegationContent& content) {
    json j;
    j["type"] = config::DELEGATION_TYPE;
    j["id"] = content.id;

    j["delegator"] = {{"id", content.delegator.id}};
    if (content.delegator.proof) {
        j["delegator"]["proof"] = *content.delegator.proof;
    }

    j["delegate"] = {{"id", content.delegate.id}};
    if (content.delegate.platform) {
        j["delegate"]["platform"] = *content.delegate.platform;
    }
    if (content.delegate.name) {
        j["delegate"]["name"] = *content.delegate.name;
    }

    j["scope"] = {{"include", content.scope.include}};
    if (!content.scope.exclude.empty()) {
        j["scope"]["exclude"] = content.scope.exclude;
    }
    if (!content.scope.audiences.empty()) {
        j["scope"]["audiences"] = content.scope.audiences;
    }

    j["constraints"] = constraints_to_json(content.constraints);

    if (content.revocation) {
        j["revocation"] = {
            {"endpoint", content.revocation->endpoint},
            {"method", content.revocation->method}
        };
        if (content.revocation->cache_ttl) {
            j["revocation"]["cacheTTL"] = *content.revocation->cache_ttl;
        }
    }

    j["proof"] = {
        {"type", content.proof.type},
        {"created", utilities::format_timestamp(content.proof.created)},
        {"verificationMethod", content.proof.verification_method},
        {"proofPurpose", content.proof.proof_purpose}
    };

    return j;
}

std::vector<uint8_t> to_canonical_bytes(const DelegationContent& content) {
    // nlohmann::json objects are key-sorted; dump() is compact
    std::string canonical = content_to_json(content).dump();
    return std::vector<uint8_t>(canonical.begin(), canonical.end());
}

// ============================================================================
// Decoding
// ============================================================================

TimeWindow time_window_from_json(const json& j) {
    const std::string where = "constraints.timeWindows[]";
    reject_unknown_keys(j, {"days", "hours", "tz"}, where);

    TimeWindow window;
    for (const auto& name : string_list(j, "days", where)) {
        auto day = string_to_weekday(name);
        if (!day) {
            malformed("unknown weekday '" + name + "'");
        }
        window.days.push_back(*day);
    }

    auto hours = optional_string(j, "hours", where);
    if (hours) {
        window.hours = HourRange::parse(*hours);
        if (!window.hours) {
            malformed("invalid hours '" + *hours + "'");
        }
    }

    window.tz = optional_string(j, "tz", where);
    return window;
}

DelegationConstraints constraints_from_json(const json& j) {
    const std::string where = "constraints";
    reject_unknown_keys(j, {
        "notBefore", "notAfter", "maxUses", "maxUsesPerHour", "maxValuePerUse",
        "requireMFA", "allowSubdelegation", "ipAllowlist", "timeWindows"
    }, where);

    DelegationConstraints c;
    c.not_before = optional_timestamp(j, "notBefore", where);
    c.not_after = optional_timestamp(j, "notAfter", where);
    c.max_uses = optional_count(j, "maxUses", where);
    c.max_uses_per_hour = optional_count(j, "maxUsesPerHour", where);

    auto value = j.find("maxValuePerUse");
    if (value != j.end() && !value->is_null()) {
        if (!value->is_number()) {
            malformed("constraints.maxValuePerUse must be a number");
        }
        c.max_value_per_use = value->get<double>();
    }

    c.require_mfa = optional_bool(j, "requireMFA", where);
    c.allow_subdelegation = optional_bool(j, "allowSubdelegation", where);
    c.ip_allowlist = string_list(j, "ipAllowlist", where);

    auto windows = j.find("timeWindows");
    if (windows != j.end() && !windows->is_null()) {
        if (!windows->is_array()) {
            malformed("constraints.timeWindows must be an array");
        }
        for (const auto& window : *windows) {
            c.time_windows.push_back(time_window_from_json(window));
        }
    }

    return c;
}

DelegationContent content_from_json(const json& j, std::string& proof_value) {
    reject_unknown_keys(j, {
        "type", "id", "delegator", "delegate", "scope", "constraints", "revocation", "proof"
    }, "delegation");

    if (require_string(j, "type", "delegation") != config::DELEGATION_TYPE) {
        malformed("delegation.type must be " + std::string(config::DELEGATION_TYPE));
    }

    DelegationContent content;
    content.id = require_string(j, "id", "delegation");

    if (!j.contains("delegator")) {
        malformed("delegation.delegator is required");
    }
    const json& delegator = j["delegator"];
    reject_unknown_keys(delegator, {"id", "proof"}, "delegator");
    content.delegator.id = require_string(delegator, "id", "delegator");
    content.delegator.proof = optional_string(delegator, "proof", "delegator");

    if (!j.contains("delegate")) {
        malformed("delegation.delegate is required");
    }
    const json& delegate = j["delegate"];
    reject_unknown_keys(delegate, {"id", "platform", "name"}, "delegate");
    content.delegate.id = require_string(delegate, "id", "delegate");
    content.delegate.platform = optional_string(delegate, "platform", "delegate");
    content.delegate.name = optional_string(delegate, "name", "delegate");

    if (!j.contains("scope")) {
        malformed("delegation.scope is required");
    }
    const json& scope = j["scope"];
    reject_unknown_keys(scope, {"include", "exclude", "audiences"}, "scope");
    if (!scope.contains("include")) {
        malformed("scope.include is required");
    }
    content.scope.include = string_list(scope, "include", "scope");
    content.scope.exclude = string_list(scope, "exclude", "scope");
    content.scope.audiences = string_list(scope, "audiences", "scope");

    if (j.contains("constraints") && !j["constraints"].is_null()) {
        content.constraints = constraints_from_json(j["constraints"]);
    }

    if (j.contains("revocation") && !j["revocation"].is_null()) {
        const json& revocation = j["revocation"];
        reject_unknown_keys(revocation, {"endpoint", "method", "cacheTTL"}, "revocation");
        RevocationInfo info;
        info.endpoint = require_string(revocation, "endpoint", "revocation");
        info.method = optional_string(revocation, "method", "revocation").value_or("GET");
        if (info.method != "GET" && info.method != "POST") {
            malformed("revocation.method must be GET or POST");
        }
        info.cache_ttl = optional_count(revocation, "cacheTTL", "revocation");
        content.revocation = info;
    }

    if (!j.contains("proof")) {
        malformed("delegation.proof is required");
    }
    const json& proof = j["proof"];
    reject_unknown_keys(proof, {
        "type", "created", "verificationMethod", "proofPurpose", "proofValue"
    }, "proof");
    content.proof.type = require_string(proof, "type", "proof");
    auto created = utilities::parse_timestamp(require_string(proof, "created", "proof"));
    if (!created) {
        malformed("proof.created is not an ISO 8601 timestamp");
    }
    content.proof.created = *created;
    content.proof.verification_method = require_string(proof, "verificationMethod", "proof");
    content.proof.proof_purpose = require_string(proof, "proofPurpose", "proof");
    proof_value = require_string(proof, "proofValue", "proof");

    return content;
}

} // anonymous namespace

// ============================================================================
// Weekdays and hour ranges
// ============================================================================

std::string weekday_to_string(Weekday day) {
    switch (day) {
        case Weekday::SUN: return "sun";
        case Weekday::MON: return "mon";
        case Weekday::TUE: return "tue";
        case Weekday::WED: return "wed";
        case Weekday::THU: return "thu";
        case Weekday::FRI: return "fri";
        case Weekday::SAT: return "sat";
        default: return "unknown";
    }
}

std::optional<Weekday> string_to_weekday(const std::string& name) {
    std::string lower = utilities::to_lowercase(name);
    if (lower == "sun") return Weekday::SUN;
    if (lower == "mon") return Weekday::MON;
    if (lower == "tue") return Weekday::TUE;
    if (lower == "wed") return Weekday::WED;
    if (lower == "thu") return Weekday::THU;
    if (lower == "fri") return Weekday::FRI;
    if (lower == "sat") return Weekday::SAT;
    return std::nullopt;
}

std::optional<HourRange> HourRange::parse(const std::string& text) {
    // HH:MM-HH:MM
    if (text.length() != 11 || text[2] != ':' || text[5] != '-' || text[8] != ':') {
        return std::nullopt;
    }
    for (size_t i : {0, 1, 3, 4, 6, 7, 9, 10}) {
        if (!std::isdigit(static_cast<unsigned char>(text[i]))) {
            return std::nullopt;
        }
    }

    auto two_digits = [&text](size_t pos) {
        return (text[pos] - '0') * 10 + (text[pos + 1] - '0');
    };

    int start_hour = two_digits(0);
    int start_min = two_digits(3);
    int end_hour = two_digits(6);
    int end_min = two_digits(9);

    if (start_hour > 23 || start_min > 59 || end_min > 59 ||
        end_hour > 24 || (end_hour == 24 && end_min != 0)) {
        return std::nullopt;
    }

    HourRange range{start_hour * 60 + start_min, end_hour * 60 + end_min};
    if (range.start_minute == range.end_minute) {
        return std::nullopt;
    }
    return range;
}

std::string HourRange::to_string() const {
    char buffer[16];
    std::snprintf(buffer, sizeof(buffer), "%02d:%02d-%02d:%02d",
                  start_minute / 60, start_minute % 60, end_minute / 60, end_minute % 60);
    return buffer;
}

// ============================================================================
// Signing
// ============================================================================

Signer make_signer(const AgentIdentity& identity) {
    auto owned = std::make_shared<AgentIdentity>(identity);
    return [owned](const std::vector<uint8_t>& message) {
        return owned->sign(message);
    };
}

DelegationRequest::DelegationRequest(DelegationContent content)
    : content_(std::move(content))
{
}

std::vector<uint8_t> DelegationRequest::canonical_bytes() const {
    return to_canonical_bytes(content_);
}

Delegation DelegationRequest::sign(const Signer& signer) const {
    if (!signer) {
        throw AgentAuthError(ErrorCode::INVALID_DELEGATION, "no signer supplied for " + content_.id);
    }

    auto signature = signer(canonical_bytes());
    if (signature.size() != crypto_sign_BYTES) {
        throw AgentAuthError(
            ErrorCode::INVALID_DELEGATION_SIGNATURE,
            "signer returned " + std::to_string(signature.size()) + " bytes"
        );
    }

    utilities::log_debug("Delegation: Signed " + content_.id + " for " + content_.delegate.id);
    return Delegation(content_, AgentCrypto::bytes_to_base64url(signature));
}

// ============================================================================
// Delegation
// ============================================================================

Delegation::Delegation(DelegationContent content, std::string proof_value)
    : content_(std::move(content))
    , proof_value_(std::move(proof_value))
{
}

std::vector<uint8_t> Delegation::canonical_bytes() const {
    return to_canonical_bytes(content_);
}

std::string Delegation::to_json() const {
    json j = content_to_json(content_);
    j["proof"]["proofValue"] = proof_value_;
    return j.dump();
}

Delegation Delegation::from_json(const std::string& json_str) {
    json j;
    try {
        j = json::parse(json_str);
    } catch (const json::exception& e) {
        throw AgentAuthError(ErrorCode::MALFORMED_DELEGATION, std::string("invalid delegation JSON: ") + e.what());
    }

    try {
        std::string proof_value;
        DelegationContent content = content_from_json(j, proof_value);

        auto signature = AgentCrypto::base64url_to_bytes(proof_value);
        if (!signature || signature->size() != crypto_sign_BYTES) {
            malformed("proof.proofValue is not an Ed25519 signature");
        }

        // Same constraint rules as create_delegation
        try {
            validate_constraints(content.constraints);
        } catch (const AgentAuthError& e) {
            if (e.code() != ErrorCode::INVALID_CONSTRAINT) {
                throw;
            }
            malformed(std::string("constraints: ") + e.what());
        }

        return Delegation(std::move(content), std::move(proof_value));
    } catch (const json::exception& e) {
        throw AgentAuthError(ErrorCode::MALFORMED_DELEGATION, std::string("invalid delegation: ") + e.what());
    }
}

// ============================================================================
// Creation
// ============================================================================

void validate_constraints(const DelegationConstraints& c) {
    if (c.not_before && c.not_after && *c.not_before > *c.not_after) {
        throw AgentAuthError(ErrorCode::INVALID_CONSTRAINT, "notBefore is after notAfter");
    }
    if (c.max_uses && *c.max_uses == 0) {
        throw AgentAuthError(ErrorCode::INVALID_CONSTRAINT, "maxUses must be positive");
    }
    if (c.max_uses_per_hour && *c.max_uses_per_hour == 0) {
        throw AgentAuthError(ErrorCode::INVALID_CONSTRAINT, "maxUsesPerHour must be positive");
    }
    if (c.max_value_per_use &&
        (!std::isfinite(*c.max_value_per_use) || *c.max_value_per_use < 0)) {
        throw AgentAuthError(ErrorCode::INVALID_CONSTRAINT, "maxValuePerUse must be a non-negative number");
    }

    for (const auto& entry : c.ip_allowlist) {
        if (!parse_ip_network(entry)) {
            throw AgentAuthError(ErrorCode::INVALID_CONSTRAINT, "invalid ipAllowlist entry: " + entry);
        }
    }

    for (const auto& window : c.time_windows) {
        if (window.tz && !TimeZone::is_valid_name(*window.tz)) {
            throw AgentAuthError(ErrorCode::INVALID_CONSTRAINT, "invalid time zone: " + *window.tz);
        }
        if (window.hours) {
            const auto& hours = *window.hours;
            if (hours.start_minute < 0 || hours.start_minute >= 24 * 60 ||
                hours.end_minute < 0 || hours.end_minute > 24 * 60 ||
                hours.start_minute == hours.end_minute) {
                throw AgentAuthError(ErrorCode::INVALID_CONSTRAINT, "invalid hour range");
            }
        }
    }
}

DelegationRequest create_delegation(const CreateDelegationOptions& options) {
    if (options.delegator_did.empty()) {
        throw AgentAuthError(ErrorCode::INVALID_DELEGATION, "delegator DID is required");
    }
    if (options.delegate_did.empty()) {
        throw AgentAuthError(ErrorCode::INVALID_DELEGATION, "delegate DID is required");
    }
    if (options.scopes.empty()) {
        throw AgentAuthError(ErrorCode::INVALID_DELEGATION, "at least one scope is required");
    }
    for (const auto& scope : options.scopes) {
        if (!config::validate_scope(scope)) {
            throw AgentAuthError(ErrorCode::INVALID_DELEGATION, "invalid scope: '" + scope + "'");
        }
    }
    for (const auto& scope : options.excluded_scopes) {
        if (!config::validate_scope(scope)) {
            throw AgentAuthError(ErrorCode::INVALID_DELEGATION, "invalid excluded scope: '" + scope + "'");
        }
    }

    validate_constraints(options.constraints);

    if (options.revocation) {
        if (options.revocation->endpoint.empty()) {
            throw AgentAuthError(ErrorCode::INVALID_DELEGATION, "revocation endpoint is required");
        }
        if (options.revocation->method != "GET" && options.revocation->method != "POST") {
            throw AgentAuthError(ErrorCode::INVALID_DELEGATION, "revocation method must be GET or POST");
        }
    }

    DelegationContent content;
    content.id = std::string(config::DELEGATION_ID_PREFIX) + utilities::generate_uuid();
    content.delegator = DelegatorRef{options.delegator_did, options.delegator_proof};
    content.delegate = DelegateRef{options.delegate_did, options.platform, options.agent_name};
    content.scope = DelegationScope{options.scopes, options.excluded_scopes, options.audiences};
    content.constraints = options.constraints;
    content.revocation = options.revocation;
    content.proof = DelegationProof{
        config::PROOF_TYPE,
        utilities::current_timestamp(),
        options.delegator_did + config::KEY_ID_SUFFIX,
        config::PROOF_PURPOSE
    };

    return DelegationRequest(std::move(content));
}

// ============================================================================
// Verification
// ============================================================================

std::optional<ErrorCode> check_time_bounds(const Delegation& delegation, int64_t now) {
    const auto& c = delegation.constraints();
    if (c.not_after && *c.not_after < now) {
        return ErrorCode::DELEGATION_EXPIRED;
    }
    if (c.not_before && *c.not_before > now) {
        return ErrorCode::DELEGATION_NOT_YET_VALID;
    }
    return std::nullopt;
}

bool verify_delegation(const Delegation& delegation, std::optional<int64_t> now) {
    return !check_time_bounds(delegation, now.value_or(utilities::current_timestamp()));
}

bool verify_delegation_signature(const Delegation& delegation, const DelegatorKeyResolver& resolver) {
    const auto& delegator = delegation.delegator().id;

    if (delegation.proof().verification_method != delegator + config::KEY_ID_SUFFIX) {
        utilities::log_debug("Delegation: " + delegation.id() + " verification method is not the delegator's key");
        return false;
    }

    auto public_key = resolver.resolve(delegator);
    if (!public_key) {
        utilities::log_debug("Delegation: Cannot resolve key for " + delegator);
        return false;
    }

    auto signature = AgentCrypto::base64url_to_bytes(delegation.proof_value());
    if (!signature) {
        return false;
    }

    return AgentCrypto::verify_signature(delegation.canonical_bytes(), *signature, *public_key);
}

} // namespace agentauth
