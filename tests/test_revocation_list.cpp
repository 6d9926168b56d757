/**
 * @file test_revocation_list.cpp
 * @brief Unit tests for RevocationList and KeyRegistry
 *
 * Tests the in-memory verifier stores including:
 * - Revocation, lookup and listing
 * - Self-certifying key resolution from DIDs
 * - Registered keys for non-agentauth principals
 */

#include <gtest/gtest.h>
#include "agentauth/revocation_list.hpp"
#include "agentauth/key_resolver.hpp"
#include "agentauth/agent_identity.hpp"
#include "agentauth/utilities.hpp"

using namespace agentauth;

// ============================================================================
// Revocation List Tests
// ============================================================================

TEST(RevocationListTest, RevokeOnce) {
    RevocationList list;

    EXPECT_FALSE(list.is_revoked("urn:uuid:1"));
    EXPECT_TRUE(list.revoke("urn:uuid:1", "compromised"));
    EXPECT_TRUE(list.is_revoked("urn:uuid:1"));

    // Already revoked; original entry kept
    EXPECT_FALSE(list.revoke("urn:uuid:1", "again"));
    EXPECT_EQ(list.get_entry("urn:uuid:1")->reason, "compromised");
    EXPECT_EQ(list.size(), 1u);
}

TEST(RevocationListTest, EntryRecordsTime) {
    RevocationList list;
    int64_t before = utilities::current_timestamp();
    list.revoke("urn:uuid:1");

    auto entry = list.get_entry("urn:uuid:1");
    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(entry->delegation_id, "urn:uuid:1");
    EXPECT_GE(entry->revoked_at, before);
    EXPECT_TRUE(entry->reason.empty());

    EXPECT_FALSE(list.get_entry("urn:uuid:2").has_value());
}

TEST(RevocationListTest, EntriesAndClear) {
    RevocationList list;
    list.revoke("urn:uuid:b");
    list.revoke("urn:uuid:a");

    auto entries = list.get_entries();
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].delegation_id, "urn:uuid:a");

    list.clear();
    EXPECT_EQ(list.size(), 0u);
    EXPECT_FALSE(list.is_revoked("urn:uuid:a"));
}

// ============================================================================
// Key Resolver Tests
// ============================================================================

TEST(KeyResolverTest, SelfCertifyingResolvesAgentDid) {
    AgentCrypto::initialize();
    auto identity = AgentIdentity::create();
    SelfCertifyingKeyResolver resolver;

    auto key = resolver.resolve(identity.get_did());
    ASSERT_TRUE(key.has_value());
    EXPECT_EQ(*key, identity.get_public_key());

    EXPECT_FALSE(resolver.resolve("did:web:alice.example.com").has_value());
    EXPECT_FALSE(resolver.resolve("did:agentauth:ed25519:short").has_value());
}

TEST(KeyResolverTest, RegistryResolvesRegisteredKeys) {
    AgentCrypto::initialize();
    auto alice = AgentIdentity::create();
    auto agent = AgentIdentity::create();
    KeyRegistry registry;

    EXPECT_FALSE(registry.resolve("did:web:alice.example.com").has_value());

    registry.register_key("did:web:alice.example.com", alice.get_public_key());
    EXPECT_EQ(registry.size(), 1u);
    EXPECT_EQ(registry.resolve("did:web:alice.example.com"), std::optional<PublicKey>(alice.get_public_key()));

    // Unregistered agentauth DIDs still resolve from the DID itself
    EXPECT_EQ(registry.resolve(agent.get_did()), std::optional<PublicKey>(agent.get_public_key()));

    EXPECT_TRUE(registry.unregister_key("did:web:alice.example.com"));
    EXPECT_FALSE(registry.unregister_key("did:web:alice.example.com"));
    EXPECT_FALSE(registry.resolve("did:web:alice.example.com").has_value());
}

TEST(KeyResolverTest, RegistryCannotRebindAgentauthDid) {
    AgentCrypto::initialize();
    auto agent = AgentIdentity::create();
    auto impostor = AgentIdentity::create();
    KeyRegistry registry;

    try {
        registry.register_key(agent.get_did(), impostor.get_public_key());
        FAIL() << "Expected AgentAuthError";
    } catch (const AgentAuthError& e) {
        EXPECT_EQ(e.code(), ErrorCode::INVALID_DID_FORMAT);
    }

    EXPECT_EQ(registry.size(), 0u);
    EXPECT_EQ(registry.resolve(agent.get_did()), std::optional<PublicKey>(agent.get_public_key()));
    EXPECT_FALSE(registry.resolve("did:agentauth:ed25519:!!").has_value());
}
