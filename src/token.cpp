/**
 * @file token.cpp
 * @brief Implementation of AAT creation and verification
 *
 * AgentAuth - Delegated authorization tokens for autonomous agents
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "agentauth/token.hpp"
#include "agentauth/agent_identity.hpp"
#include "agentauth/config.hpp"
#include "agentauth/errors.hpp"
#include "agentauth/utilities.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <limits>

using json = nlohmann::json;

namespace agentauth {

namespace {

[[noreturn]] void reject(ErrorCode code, const std::string& message) {
    utilities::log_debug("Token: Rejected (" + error_code_to_string(code) + "): " + message);
    throw AgentAuthError(code, message);
}

json decode_segment(const std::string& segment, const std::string& name) {
    auto decoded = AgentCrypto::base64url_to_string(segment);
    if (!decoded) {
        reject(ErrorCode::MALFORMED_TOKEN, name + " is not base64url");
    }
    try {
        return json::parse(*decoded);
    } catch (const json::exception&) {
        reject(ErrorCode::MALFORMED_TOKEN, name + " is not JSON");
    }
}

std::string claim_string(const json& object, const char* key, const std::string& where) {
    auto it = object.find(key);
    if (it == object.end() || !it->is_string()) {
        reject(ErrorCode::MALFORMED_TOKEN, where + "." + key + " must be a string");
    }
    return it->get<std::string>();
}

int64_t claim_integer(const json& object, const char* key, const std::string& where) {
    auto it = object.find(key);
    if (it == object.end() || !it->is_number_integer()) {
        reject(ErrorCode::MALFORMED_TOKEN, where + "." + key + " must be an integer");
    }
    return it->get<int64_t>();
}

TokenHeader parse_header(const json& j) {
    if (!j.is_object()) {
        reject(ErrorCode::MALFORMED_TOKEN, "header must be an object");
    }

    TokenHeader header;
    header.alg = claim_string(j, "alg", "header");
    header.typ = claim_string(j, "typ", "header");
    header.kid = claim_string(j, "kid", "header");

    if (header.alg != config::TOKEN_ALGORITHM) {
        reject(ErrorCode::MALFORMED_TOKEN, "unsupported algorithm " + header.alg);
    }
    if (header.typ != config::TOKEN_TYPE) {
        reject(ErrorCode::MALFORMED_TOKEN, "unsupported token type " + header.typ);
    }
    return header;
}

TokenPayload parse_payload(const json& j) {
    if (!j.is_object()) {
        reject(ErrorCode::MALFORMED_TOKEN, "payload must be an object");
    }

    TokenPayload payload;
    payload.iss = claim_string(j, "iss", "payload");
    payload.sub = claim_string(j, "sub", "payload");
    payload.aud = claim_string(j, "aud", "payload");
    payload.iat = claim_integer(j, "iat", "payload");
    payload.exp = claim_integer(j, "exp", "payload");
    payload.nonce = claim_string(j, "nonce", "payload");

    auto scope = j.find("scope");
    if (scope == j.end() || !scope->is_array()) {
        reject(ErrorCode::MALFORMED_TOKEN, "payload.scope must be an array");
    }
    for (const auto& item : *scope) {
        if (!item.is_string()) {
            reject(ErrorCode::MALFORMED_TOKEN, "payload.scope must contain only strings");
        }
        payload.scope.push_back(item.get<std::string>());
    }

    auto act = j.find("act");
    if (act == j.end() || !act->is_object()) {
        reject(ErrorCode::MALFORMED_TOKEN, "payload.act must be an object");
    }
    payload.act_sub = claim_string(*act, "sub", "payload.act");

    return payload;
}

std::vector<Delegation> parse_chain(const json& j) {
    if (!j.is_array()) {
        reject(ErrorCode::MALFORMED_TOKEN, "delegation chain must be an array");
    }

    std::vector<Delegation> chain;
    chain.reserve(j.size());
    for (const auto& item : j) {
        try {
            chain.push_back(Delegation::from_json(item.dump()));
        } catch (const AgentAuthError& e) {
            reject(ErrorCode::MALFORMED_TOKEN, std::string("embedded delegation: ") + e.what());
        }
    }
    return chain;
}

} // anonymous namespace

// ============================================================================
// Duration Parsing
// ============================================================================

int64_t parse_duration(const std::string& text) {
    if (text.length() < 2) {
        throw AgentAuthError(ErrorCode::INVALID_DURATION_FORMAT, "invalid duration '" + text + "'");
    }

    int64_t multiplier;
    switch (text.back()) {
        case 's': multiplier = 1; break;
        case 'm': multiplier = 60; break;
        case 'h': multiplier = 3600; break;
        case 'd': multiplier = 86400; break;
        default:
            throw AgentAuthError(ErrorCode::INVALID_DURATION_FORMAT, "invalid duration unit in '" + text + "'");
    }

    const int64_t max_count = std::numeric_limits<int64_t>::max() / multiplier;
    int64_t count = 0;
    for (size_t i = 0; i + 1 < text.length(); ++i) {
        char c = text[i];
        if (c < '0' || c > '9') {
            throw AgentAuthError(ErrorCode::INVALID_DURATION_FORMAT, "invalid duration '" + text + "'");
        }
        if (count > (max_count - (c - '0')) / 10) {
            throw AgentAuthError(ErrorCode::INVALID_DURATION_FORMAT, "duration overflows: '" + text + "'");
        }
        count = count * 10 + (c - '0');
    }

    if (count == 0) {
        throw AgentAuthError(ErrorCode::INVALID_DURATION_FORMAT, "duration must be positive: '" + text + "'");
    }

    return count * multiplier;
}

// ============================================================================
// Construction
// ============================================================================

AgentToken::AgentToken(
    TokenHeader header,
    TokenPayload payload,
    std::vector<Delegation> delegation_chain,
    std::vector<uint8_t> signature
)
    : header_(std::move(header))
    , payload_(std::move(payload))
    , delegation_chain_(std::move(delegation_chain))
    , signature_(std::move(signature))
{
}

std::string AgentToken::create(const AgentIdentity& identity, const CreateTokenOptions& options) {
    int64_t lifetime = parse_duration(options.expires_in);
    int64_t iat = options.issued_at.value_or(utilities::current_timestamp());
    if (iat > std::numeric_limits<int64_t>::max() - lifetime) {
        throw AgentAuthError(ErrorCode::INVALID_DURATION_FORMAT, "expiry overflows: '" + options.expires_in + "'");
    }

    json header = {
        {"alg", config::TOKEN_ALGORITHM},
        {"typ", config::TOKEN_TYPE},
        {"kid", identity.get_key_id()}
    };

    json payload = {
        {"iss", identity.get_did()},
        {"sub", options.delegator},
        {"aud", options.audience},
        {"iat", iat},
        {"exp", iat + lifetime},
        {"nonce", AgentCrypto::bytes_to_hex(AgentCrypto::generate_random_bytes(config::NONCE_BYTES))},
        {"scope", options.scopes},
        {"act", {{"sub", identity.get_did()}}}
    };

    json chain = json::array();
    for (const auto& delegation : options.delegation_chain) {
        chain.push_back(json::parse(delegation.to_json()));
    }

    std::string signing_input =
        AgentCrypto::string_to_base64url(header.dump()) + "." +
        AgentCrypto::string_to_base64url(payload.dump()) + "." +
        AgentCrypto::string_to_base64url(chain.dump());

    auto signature = identity.sign(signing_input);

    utilities::log_debug("Token: Issued for " + identity.get_did() + " to " + options.audience);
    return signing_input + "." + AgentCrypto::bytes_to_base64url(signature);
}

// ============================================================================
// Verification
// ============================================================================

AgentToken AgentToken::verify(const std::string& token, const VerifyOptions& options) {
    // 1. Structure
    if (token.length() > config::MAX_TOKEN_LENGTH) {
        reject(ErrorCode::MALFORMED_TOKEN, "token exceeds " + std::to_string(config::MAX_TOKEN_LENGTH) + " bytes");
    }

    auto segments = utilities::split_string(token, '.');
    if (segments.size() != config::TOKEN_SEGMENTS) {
        reject(ErrorCode::MALFORMED_TOKEN,
               "expected " + std::to_string(config::TOKEN_SEGMENTS) + " segments, got " +
               std::to_string(segments.size()));
    }
    for (const auto& segment : segments) {
        if (segment.empty()) {
            reject(ErrorCode::MALFORMED_TOKEN, "empty token segment");
        }
    }

    // 2. Decode
    TokenHeader header = parse_header(decode_segment(segments[0], "header"));
    TokenPayload payload = parse_payload(decode_segment(segments[1], "payload"));
    std::vector<Delegation> chain = parse_chain(decode_segment(segments[2], "delegation chain"));

    auto signature = AgentCrypto::base64url_to_bytes(segments[3]);
    if (!signature) {
        reject(ErrorCode::MALFORMED_TOKEN, "signature is not base64url");
    }

    if (!AgentIdentity::is_agentauth_did(payload.iss)) {
        reject(ErrorCode::MALFORMED_TOKEN, "issuer is not an agentauth DID");
    }

    // 3. Signature, before any claim is trusted
    std::string signing_input = segments[0] + "." + segments[1] + "." + segments[2];
    std::vector<uint8_t> message(signing_input.begin(), signing_input.end());
    if (!AgentIdentity::verify(*signature, message, payload.iss)) {
        reject(ErrorCode::INVALID_SIGNATURE, "signature does not verify for " + payload.iss);
    }

    if (header.kid != payload.iss + config::KEY_ID_SUFFIX || payload.act_sub != payload.iss) {
        reject(ErrorCode::MALFORMED_TOKEN, "kid and act.sub must name the issuer");
    }
    if (payload.exp <= payload.iat) {
        reject(ErrorCode::MALFORMED_TOKEN, "exp must be after iat");
    }

    // 4. Expiry
    int64_t now = options.current_time.value_or(utilities::current_timestamp());
    if (payload.exp < now) {
        reject(ErrorCode::TOKEN_EXPIRED, "token expired at " + utilities::format_timestamp(payload.exp));
    }

    // 5. Audience
    if (options.audience && payload.aud != *options.audience) {
        reject(ErrorCode::AUDIENCE_MISMATCH,
               "expected audience " + *options.audience + ", got " + payload.aud);
    }

    // 6. Scopes
    for (const auto& required : options.required_scopes) {
        if (std::find(payload.scope.begin(), payload.scope.end(), required) == payload.scope.end()) {
            reject(ErrorCode::INSUFFICIENT_SCOPE, "missing required scope " + required);
        }
    }

    return AgentToken(std::move(header), std::move(payload), std::move(chain), std::move(*signature));
}

bool AgentToken::has_scope(const std::string& scope) const {
    return std::find(payload_.scope.begin(), payload_.scope.end(), scope) != payload_.scope.end();
}

} // namespace agentauth
