/**
 * @file test_token.cpp
 * @brief Unit tests for AgentToken
 *
 * Tests agent authorization tokens including:
 * - Creation, encoding and claim round trip
 * - Duration parsing
 * - Signature, expiry, audience and scope gates
 * - Tamper detection and structural rejection
 * - Embedded delegation chains
 */

#include <gtest/gtest.h>
#include "agentauth/token.hpp"
#include "agentauth/agent_identity.hpp"
#include "agentauth/delegation.hpp"
#include "agentauth/utilities.hpp"
#include <nlohmann/json.hpp>
#include <functional>
#include <set>

using namespace agentauth;
using json = nlohmann::json;

// Test fixture for token tests
class TokenTest : public ::testing::Test {
protected:
    void SetUp() override {
        AgentCrypto::initialize();
        agent_ = std::make_unique<AgentIdentity>(AgentIdentity::create({{"name", "mail-bot"}}));
    }

    CreateTokenOptions basic_options() const {
        CreateTokenOptions options;
        options.delegator = "did:web:alice.example.com";
        options.audience = "https://api.example.com";
        options.scopes = {"mail.read"};
        return options;
    }

    static ErrorCode error_of(const std::function<void()>& action) {
        try {
            action();
        } catch (const AgentAuthError& e) {
            return e.code();
        }
        ADD_FAILURE() << "expected AgentAuthError";
        return ErrorCode::ENTROPY_ERROR;
    }

    static std::string encode_json(const json& j) {
        return AgentCrypto::string_to_base64url(j.dump());
    }

    static json decode_segment(const std::string& token, size_t index) {
        auto segments = utilities::split_string(token, '.');
        auto text = AgentCrypto::base64url_to_string(segments.at(index));
        EXPECT_TRUE(text.has_value());
        return json::parse(*text);
    }

    // Re-sign arbitrary header/payload/chain with the agent's key
    std::string sign_segments(const json& header, const json& payload, const json& chain) const {
        std::string input = encode_json(header) + "." + encode_json(payload) + "." + encode_json(chain);
        return input + "." + AgentCrypto::bytes_to_base64url(agent_->sign(input));
    }

    std::unique_ptr<AgentIdentity> agent_;
};

// ============================================================================
// Duration Tests
// ============================================================================

TEST_F(TokenTest, ParseDurationUnits) {
    EXPECT_EQ(parse_duration("1s"), 1);
    EXPECT_EQ(parse_duration("15m"), 900);
    EXPECT_EQ(parse_duration("1h"), 3600);
    EXPECT_EQ(parse_duration("24h"), 86400);
    EXPECT_EQ(parse_duration("7d"), 604800);
    EXPECT_EQ(parse_duration("365d"), 31536000);
}

TEST_F(TokenTest, ParseDurationRejectsOtherShapes) {
    for (const std::string text : {"invalid", "", "1", "h", "1H", "1w", "-1h", "1.5h", " 1h", "1h ", "0s",
                                   "99999999999999999999d"}) {
        EXPECT_EQ(error_of([&] { parse_duration(text); }), ErrorCode::INVALID_DURATION_FORMAT)
            << "duration '" << text << "'";
    }
}

TEST_F(TokenTest, CreateRejectsInvalidDuration) {
    auto options = basic_options();
    options.expires_in = "invalid";
    EXPECT_EQ(error_of([&] { AgentToken::create(*agent_, options); }), ErrorCode::INVALID_DURATION_FORMAT);
}

TEST_F(TokenTest, ExpiryMatchesDuration) {
    for (const auto& [text, seconds] : std::vector<std::pair<std::string, int64_t>>{
             {"1s", 1}, {"1h", 3600}, {"24h", 86400}, {"7d", 604800}, {"365d", 31536000}}) {
        auto options = basic_options();
        options.expires_in = text;
        auto token = AgentToken::verify(AgentToken::create(*agent_, options));
        EXPECT_EQ(token.get_expires_at() - token.get_issued_at(), seconds) << text;
    }
}

// ============================================================================
// Creation Tests
// ============================================================================

TEST_F(TokenTest, CreateProducesFourBase64UrlSegments) {
    auto token = AgentToken::create(*agent_, basic_options());
    auto segments = utilities::split_string(token, '.');

    ASSERT_EQ(segments.size(), 4u);
    for (const auto& segment : segments) {
        EXPECT_FALSE(segment.empty());
        EXPECT_TRUE(AgentCrypto::base64url_to_bytes(segment).has_value());
    }

    auto header = decode_segment(token, 0);
    EXPECT_EQ(header["alg"], "EdDSA");
    EXPECT_EQ(header["typ"], "AAT");
    EXPECT_EQ(header["kid"], agent_->get_did() + "#keys-1");

    auto payload = decode_segment(token, 1);
    EXPECT_EQ(payload["act"]["sub"], agent_->get_did());
    EXPECT_EQ(payload["nonce"].get<std::string>().length(), 32u);

    EXPECT_EQ(decode_segment(token, 2), json::array());
}

TEST_F(TokenTest, VerifyRoundTripsClaims) {
    auto options = basic_options();
    options.scopes = {"mail.read", "mail.send"};
    auto token = AgentToken::verify(AgentToken::create(*agent_, options));

    EXPECT_EQ(token.get_agent(), agent_->get_did());
    EXPECT_EQ(token.get_delegator(), "did:web:alice.example.com");
    EXPECT_EQ(token.get_audience(), "https://api.example.com");
    EXPECT_EQ(token.get_scopes(), (std::vector<std::string>{"mail.read", "mail.send"}));
    EXPECT_TRUE(token.has_scope("mail.send"));
    EXPECT_FALSE(token.has_scope("mail.delete"));
    EXPECT_TRUE(token.get_delegation_chain().empty());
    EXPECT_EQ(token.get_header().typ, "AAT");
    EXPECT_EQ(token.get_signature().size(), crypto_sign_BYTES);
}

TEST_F(TokenTest, NoncesAreUnique) {
    std::set<std::string> nonces;
    for (int i = 0; i < 100; i++) {
        nonces.insert(AgentToken::verify(AgentToken::create(*agent_, basic_options())).get_nonce());
    }
    EXPECT_EQ(nonces.size(), 100u);
}

TEST_F(TokenTest, IssuedAtOverride) {
    auto options = basic_options();
    options.issued_at = 1700000000;
    auto encoded = AgentToken::create(*agent_, options);

    VerifyOptions verify_options;
    verify_options.current_time = 1700000100;
    auto token = AgentToken::verify(encoded, verify_options);
    EXPECT_EQ(token.get_issued_at(), 1700000000);
    EXPECT_EQ(token.get_expires_at(), 1700003600);
}

// ============================================================================
// Gate Tests
// ============================================================================

TEST_F(TokenTest, ExpiredTokenRejected) {
    auto options = basic_options();
    options.issued_at = 1700000000;
    options.expires_in = "1s";
    auto encoded = AgentToken::create(*agent_, options);

    VerifyOptions verify_options;
    verify_options.current_time = 1700000001;
    EXPECT_NO_THROW(AgentToken::verify(encoded, verify_options));

    verify_options.current_time = 1700000002;
    EXPECT_EQ(error_of([&] { AgentToken::verify(encoded, verify_options); }), ErrorCode::TOKEN_EXPIRED);

    EXPECT_EQ(error_of([&] { AgentToken::verify(encoded); }), ErrorCode::TOKEN_EXPIRED);
}

TEST_F(TokenTest, AudienceMustMatchExactly) {
    auto encoded = AgentToken::create(*agent_, basic_options());

    VerifyOptions verify_options;
    verify_options.audience = "https://api.example.com";
    EXPECT_NO_THROW(AgentToken::verify(encoded, verify_options));

    verify_options.audience = "https://other.com";
    EXPECT_EQ(error_of([&] { AgentToken::verify(encoded, verify_options); }), ErrorCode::AUDIENCE_MISMATCH);

    verify_options.audience = "https://api.example.com/";
    EXPECT_EQ(error_of([&] { AgentToken::verify(encoded, verify_options); }), ErrorCode::AUDIENCE_MISMATCH);
}

TEST_F(TokenTest, RequiredScopesMustAllBeGranted) {
    auto options = basic_options();
    options.scopes = {"mail.read", "calendar.read"};
    auto encoded = AgentToken::create(*agent_, options);

    VerifyOptions verify_options;
    verify_options.required_scopes = {"mail.read", "calendar.read"};
    EXPECT_NO_THROW(AgentToken::verify(encoded, verify_options));

    verify_options.required_scopes = {"mail.read", "mail.send"};
    EXPECT_EQ(error_of([&] { AgentToken::verify(encoded, verify_options); }), ErrorCode::INSUFFICIENT_SCOPE);

    // Scopes are exact strings, no wildcard or prefix matching
    verify_options.required_scopes = {"mail"};
    EXPECT_EQ(error_of([&] { AgentToken::verify(encoded, verify_options); }), ErrorCode::INSUFFICIENT_SCOPE);
}

TEST_F(TokenTest, SignatureCheckedBeforeExpiry) {
    auto options = basic_options();
    options.issued_at = 1000;
    auto encoded = AgentToken::create(*agent_, options);

    auto last = encoded.back() == 'A' ? 'B' : 'A';
    std::string tampered = encoded.substr(0, encoded.length() - 2) + last + encoded.back();

    EXPECT_NE(error_of([&] { AgentToken::verify(tampered); }), ErrorCode::TOKEN_EXPIRED);
}

// ============================================================================
// Tamper Tests
// ============================================================================

TEST_F(TokenTest, AnyCharacterChangeIsRejected) {
    auto encoded = AgentToken::create(*agent_, basic_options());

    for (size_t i = 0; i < encoded.length(); i++) {
        if (encoded[i] == '.') {
            continue;
        }
        std::string tampered = encoded;
        tampered[i] = encoded[i] == 'A' ? 'B' : 'A';
        EXPECT_THROW(AgentToken::verify(tampered), AgentAuthError) << "position " << i;
    }
}

TEST_F(TokenTest, ForgedIssuerFailsSignature) {
    auto other = AgentIdentity::create();
    auto encoded = AgentToken::create(*agent_, basic_options());

    auto header = decode_segment(encoded, 0);
    auto payload = decode_segment(encoded, 1);
    header["kid"] = other.get_did() + "#keys-1";
    payload["iss"] = other.get_did();
    payload["act"]["sub"] = other.get_did();

    std::string forged = sign_segments(header, payload, json::array());
    EXPECT_EQ(error_of([&] { AgentToken::verify(forged); }), ErrorCode::INVALID_SIGNATURE);
}

TEST_F(TokenTest, StructuralDefectsAreMalformed) {
    auto encoded = AgentToken::create(*agent_, basic_options());
    auto segments = utilities::split_string(encoded, '.');

    std::vector<std::string> bad = {
        "",
        "abc",
        segments[0] + "." + segments[1] + "." + segments[3],
        encoded + ".extra",
        segments[0] + ".." + segments[2] + "." + segments[3],
        "!!!." + segments[1] + "." + segments[2] + "." + segments[3],
        segments[0] + "." + segments[1] + "." + segments[2] + ".+/+/",
        std::string(70 * 1024, 'A'),
    };

    for (const auto& token : bad) {
        EXPECT_EQ(error_of([&] { AgentToken::verify(token); }), ErrorCode::MALFORMED_TOKEN)
            << token.substr(0, 40);
    }
}

TEST_F(TokenTest, WrongAlgorithmOrTypeIsMalformed) {
    auto encoded = AgentToken::create(*agent_, basic_options());
    auto payload = decode_segment(encoded, 1);

    json header = {{"alg", "none"}, {"typ", "AAT"}, {"kid", agent_->get_key_id()}};
    EXPECT_EQ(error_of([&] { AgentToken::verify(sign_segments(header, payload, json::array())); }),
              ErrorCode::MALFORMED_TOKEN);

    header = {{"alg", "EdDSA"}, {"typ", "JWT"}, {"kid", agent_->get_key_id()}};
    EXPECT_EQ(error_of([&] { AgentToken::verify(sign_segments(header, payload, json::array())); }),
              ErrorCode::MALFORMED_TOKEN);
}

TEST_F(TokenTest, KidAndActorMustNameIssuer) {
    auto encoded = AgentToken::create(*agent_, basic_options());
    auto header = decode_segment(encoded, 0);
    auto payload = decode_segment(encoded, 1);

    json bad_header = header;
    bad_header["kid"] = agent_->get_did() + "#keys-2";
    EXPECT_EQ(error_of([&] { AgentToken::verify(sign_segments(bad_header, payload, json::array())); }),
              ErrorCode::MALFORMED_TOKEN);

    json bad_payload = payload;
    bad_payload["act"]["sub"] = "did:web:someone.example.com";
    EXPECT_EQ(error_of([&] { AgentToken::verify(sign_segments(header, bad_payload, json::array())); }),
              ErrorCode::MALFORMED_TOKEN);
}

TEST_F(TokenTest, NonAgentIssuerIsMalformed) {
    auto encoded = AgentToken::create(*agent_, basic_options());
    auto header = decode_segment(encoded, 0);
    auto payload = decode_segment(encoded, 1);
    payload["iss"] = "did:web:agent.example.com";

    EXPECT_EQ(error_of([&] { AgentToken::verify(sign_segments(header, payload, json::array())); }),
              ErrorCode::MALFORMED_TOKEN);
}

TEST_F(TokenTest, ExpiryNotAfterIssueIsMalformed) {
    auto encoded = AgentToken::create(*agent_, basic_options());
    auto header = decode_segment(encoded, 0);
    auto payload = decode_segment(encoded, 1);
    payload["exp"] = payload["iat"];

    EXPECT_EQ(error_of([&] { AgentToken::verify(sign_segments(header, payload, json::array())); }),
              ErrorCode::MALFORMED_TOKEN);
}

// ============================================================================
// Delegation Chain Tests
// ============================================================================

TEST_F(TokenTest, EmbeddedDelegationRoundTrips) {
    auto principal = AgentIdentity::create();

    CreateDelegationOptions delegation_options;
    delegation_options.delegator_did = principal.get_did();
    delegation_options.delegate_did = agent_->get_did();
    delegation_options.scopes = {"mail.read"};
    delegation_options.constraints.max_uses_per_hour = 100;
    auto delegation = create_delegation(delegation_options).sign(make_signer(principal));

    auto options = basic_options();
    options.delegator = principal.get_did();
    options.delegation_chain = {delegation};
    auto token = AgentToken::verify(AgentToken::create(*agent_, options));

    ASSERT_EQ(token.get_delegation_chain().size(), 1u);
    const auto& embedded = token.get_delegation_chain().front();
    EXPECT_EQ(embedded.id(), delegation.id());
    EXPECT_EQ(embedded.proof_value(), delegation.proof_value());
    EXPECT_EQ(embedded.canonical_bytes(), delegation.canonical_bytes());
    EXPECT_EQ(*embedded.constraints().max_uses_per_hour, 100u);
}

TEST_F(TokenTest, MalformedEmbeddedDelegationIsMalformedToken) {
    auto encoded = AgentToken::create(*agent_, basic_options());
    auto header = decode_segment(encoded, 0);
    auto payload = decode_segment(encoded, 1);

    json chain = json::array({{{"type", "DelegationToken"}, {"id", "urn:uuid:x"}}});
    EXPECT_EQ(error_of([&] { AgentToken::verify(sign_segments(header, payload, chain)); }),
              ErrorCode::MALFORMED_TOKEN);

    EXPECT_EQ(error_of([&] { AgentToken::verify(sign_segments(header, payload, json::object())); }),
              ErrorCode::MALFORMED_TOKEN);
}
