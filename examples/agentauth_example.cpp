/**
 * @file agentauth_example.cpp
 * @brief End-to-end example - Identity, delegation, token and verification
 *
 * AgentAuth - Delegated authorization tokens for autonomous agents
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Demonstrates the full flow:
 * - Create an agent identity
 * - Principal signs a delegation to the agent
 * - Agent issues a token carrying the delegation
 * - Service verifies the token and enforces the delegation
 * - Revocation and audience mismatch are rejected
 */

#include "agentauth/agent_identity.hpp"
#include "agentauth/delegation.hpp"
#include "agentauth/token.hpp"
#include "agentauth/utilities.hpp"
#include "agentauth/verifier.hpp"
#include <iostream>
#include <memory>

using namespace agentauth;

int main(int argc, char** argv) {
    std::string data_dir = argc >= 2 ? argv[1] : "";

    try {
        utilities::initialize_logging_from_env();
        if (!AgentCrypto::initialize()) {
            std::cerr << "Error: libsodium initialization failed\n";
            return 1;
        }

        std::cout << "\n=== AgentAuth Example ===\n\n";

        // 1. Agent identity
        std::cout << "1. Creating agent identity...\n";
        auto agent = AgentIdentity::create({
            {"name", "Email Assistant"},
            {"platform", "openclaw"},
            {"capabilities", "email,calendar"}
        });
        std::cout << "   Agent DID: " << agent.get_did() << "\n\n";

        if (!data_dir.empty()) {
            if (agent.save(data_dir)) {
                std::cout << "   Saved identity to " << data_dir << "\n\n";
            } else {
                std::cerr << "   Could not save identity to " << data_dir << "\n\n";
            }
        }

        // 2. Delegation from a did:web principal whose key the service knows
        std::cout << "2. Creating delegation...\n";
        const std::string principal_did = "did:web:alice.example.com";
        auto principal_key = AgentIdentity::create();

        CreateDelegationOptions delegation_options;
        delegation_options.delegator_did = principal_did;
        delegation_options.delegate_did = agent.get_did();
        delegation_options.scopes = {"mail.read", "mail.send", "calendar.read"};
        delegation_options.audiences = {"https://api.gmail.com"};
        delegation_options.platform = "openclaw";
        delegation_options.agent_name = "Email Assistant";
        delegation_options.constraints.not_after = utilities::current_timestamp() + 30 * 24 * 3600;
        delegation_options.constraints.max_uses_per_hour = 100;

        Delegation delegation = create_delegation(delegation_options).sign(make_signer(principal_key));
        std::cout << "   Id:        " << delegation.id() << "\n";
        std::cout << "   Delegator: " << delegation.delegator().id << "\n";
        std::cout << "   Delegate:  " << delegation.delegate().id << "\n\n";

        // 3. Token
        std::cout << "3. Creating token...\n";
        CreateTokenOptions token_options;
        token_options.delegator = principal_did;
        token_options.audience = "https://api.gmail.com";
        token_options.scopes = {"mail.read"};
        token_options.delegation_chain = {delegation};
        token_options.expires_in = "1h";

        std::string token = AgentToken::create(agent, token_options);
        std::cout << "   Token (truncated): " << token.substr(0, 100) << "...\n\n";

        // 4. Verification on the service side
        std::cout << "4. Verifying token...\n";
        auto keys = std::make_shared<KeyRegistry>();
        keys->register_key(principal_did, principal_key.get_public_key());
        auto revocations = std::make_shared<RevocationList>();
        auto usage = std::make_shared<UsageTracker>();

        VerifyAgentOptions verify_options;
        verify_options.audience = "https://api.gmail.com";
        verify_options.required_scopes = {"mail.read"};
        verify_options.key_resolver = keys;
        verify_options.revocation_checker = revocations;
        verify_options.usage_counter = usage;
        verify_options.replay_cache = std::make_shared<ReplayCache>();

        auto header = "Bearer " + token;
        auto bearer = extract_bearer_token(header);
        if (!bearer) {
            std::cerr << "Error: no bearer token\n";
            return 1;
        }

        VerifiedAgent verified = verify_agent(*bearer, verify_options);
        usage->record_use(verified.delegation->id(), utilities::current_timestamp());

        std::cout << "   Agent:     " << verified.agent_did << "\n";
        std::cout << "   Delegator: " << verified.delegator_did << "\n";
        std::cout << "   Scopes:   ";
        for (const auto& scope : verified.scopes) {
            std::cout << " " << scope;
        }
        std::cout << "\n   Uses this hour: "
                  << usage->count_since(delegation.id(), utilities::current_timestamp() - 3600) << "\n\n";

        // 5. Rejections
        std::cout << "5. Checking rejections...\n";
        verify_options.replay_cache.reset();

        VerifyAgentOptions wrong_audience = verify_options;
        wrong_audience.audience = "https://other.com";
        try {
            verify_agent(token, wrong_audience);
        } catch (const AgentAuthError& e) {
            std::cout << "   Wrong audience: " << error_code_to_string(e.code()) << "\n";
        }

        revocations->revoke(delegation.id(), "user revoked access");
        try {
            verify_agent(token, verify_options);
        } catch (const AgentAuthError& e) {
            std::cout << "   After revocation: " << error_code_to_string(e.code()) << "\n\n";
        }

        // 6. Export
        std::cout << "6. Exporting delegation JSON...\n";
        std::cout << "   " << delegation.to_json().substr(0, 100) << "...\n\n";

        std::cout << "Example completed successfully.\n";
        return 0;

    } catch (const AgentAuthError& e) {
        std::cerr << "Error (" << error_code_to_string(e.code()) << "): " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
