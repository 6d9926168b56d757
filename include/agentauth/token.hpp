/**
 * @file token.hpp
 * @brief AgentAuth Token (AAT) creation and verification
 *
 * AgentAuth - Delegated authorization tokens for autonomous agents
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Wire format: four dot-joined base64url segments
 *   base64url(JSON(header)).base64url(JSON(payload)).
 *   base64url(JSON(delegation chain)).base64url(Ed25519 signature)
 * The signature covers the UTF-8 bytes of the first three segments joined
 * with '.'.
 */

#pragma once

#include "agentauth/delegation.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace agentauth {

class AgentIdentity;

/**
 * @brief Token header
 */
struct TokenHeader {
    std::string alg;    ///< "EdDSA"
    std::string typ;    ///< "AAT"
    std::string kid;    ///< <iss>#keys-1
};

/**
 * @brief Token claims
 */
struct TokenPayload {
    std::string iss;                ///< Acting agent DID
    std::string sub;                ///< Delegator DID
    std::string aud;                ///< Target service
    int64_t iat;                    ///< Issued at (Unix seconds)
    int64_t exp;                    ///< Expires (Unix seconds)
    std::string nonce;              ///< Hex replay nonce
    std::vector<std::string> scope;
    std::string act_sub;            ///< act.sub, restates iss
};

/**
 * @brief Parse a token lifetime "<count><s|m|h|d>"
 * @return Lifetime in seconds
 * @throws AgentAuthError(INVALID_DURATION_FORMAT) on any other shape, a
 *         zero count, or overflow
 */
int64_t parse_duration(const std::string& text);

/**
 * @brief Options for AgentToken::create
 */
struct CreateTokenOptions {
    std::string delegator;                      ///< Principal DID (sub)
    std::string audience;                       ///< Target service (aud)
    std::vector<std::string> scopes;
    std::vector<Delegation> delegation_chain;   ///< Root principal first
    std::string expires_in = "1h";
    std::optional<int64_t> issued_at;           ///< Defaults to now
};

/**
 * @brief Options for AgentToken::verify
 */
struct VerifyOptions {
    std::optional<std::string> audience;        ///< Exact match when set
    std::vector<std::string> required_scopes;   ///< All must be granted
    std::optional<int64_t> current_time;        ///< Defaults to now
};

/**
 * @brief AgentToken - Verified AAT
 *
 * Only AgentToken::verify produces instances, so every AgentToken has a
 * valid signature, is unexpired, and passed the audience/scope gates it
 * was verified with. The delegation chain is decoded but not checked;
 * see verify_agent().
 */
class AgentToken {
public:
    /**
     * @brief Create and sign a token
     * @return Encoded token string
     * @throws AgentAuthError(INVALID_DURATION_FORMAT) on a bad expires_in
     */
    static std::string create(const AgentIdentity& identity, const CreateTokenOptions& options);

    /**
     * @brief Decode and verify a token
     *
     * Gates, in order: structure (MALFORMED_TOKEN), signature
     * (INVALID_SIGNATURE), expiry (TOKEN_EXPIRED), audience
     * (AUDIENCE_MISMATCH), scopes (INSUFFICIENT_SCOPE).
     *
     * @throws AgentAuthError on the first failing gate
     */
    static AgentToken verify(const std::string& token, const VerifyOptions& options = {});

    const TokenHeader& get_header() const { return header_; }
    const TokenPayload& get_payload() const { return payload_; }

    /// Acting agent DID (iss)
    const std::string& get_agent() const { return payload_.iss; }

    /// Delegator DID (sub)
    const std::string& get_delegator() const { return payload_.sub; }

    const std::string& get_audience() const { return payload_.aud; }
    const std::vector<std::string>& get_scopes() const { return payload_.scope; }
    const std::string& get_nonce() const { return payload_.nonce; }
    int64_t get_issued_at() const { return payload_.iat; }
    int64_t get_expires_at() const { return payload_.exp; }

    bool has_scope(const std::string& scope) const;

    const std::vector<Delegation>& get_delegation_chain() const { return delegation_chain_; }

    const std::vector<uint8_t>& get_signature() const { return signature_; }

private:
    AgentToken(
        TokenHeader header,
        TokenPayload payload,
        std::vector<Delegation> delegation_chain,
        std::vector<uint8_t> signature
    );

    TokenHeader header_;
    TokenPayload payload_;
    std::vector<Delegation> delegation_chain_;
    std::vector<uint8_t> signature_;
};

} // namespace agentauth
