/**
 * @file test_replay_protection.cpp
 * @brief Unit tests for ReplayCache
 *
 * Tests token nonce replay prevention including:
 * - First presentation accepted, repeat rejected
 * - Nonces scoped per issuer
 * - Expired entries no longer block and are cleaned up
 * - Thread safety
 */

#include <gtest/gtest.h>
#include "agentauth/replay_protection.hpp"
#include "agentauth/config.hpp"
#include <atomic>
#include <thread>
#include <vector>

using namespace agentauth;

// Test fixture for replay cache tests
class ReplayProtectionTest : public ::testing::Test {
protected:
    void SetUp() override {
        cache_ = std::make_unique<ReplayCache>();
    }

    void TearDown() override {
        cache_.reset();
    }

    std::unique_ptr<ReplayCache> cache_;

    static constexpr int64_t NOW = 1700000000;
    const std::string issuer_ = "did:agentauth:ed25519:agent";
};

// ============================================================================
// Replay Detection Tests
// ============================================================================

TEST_F(ReplayProtectionTest, FirstPresentationAccepted) {
    EXPECT_TRUE(cache_->check_and_record(issuer_, "nonce1", NOW + 3600, NOW));
    EXPECT_TRUE(cache_->has_seen(issuer_, "nonce1"));
    EXPECT_EQ(cache_->get_cache_size(), 1u);
}

TEST_F(ReplayProtectionTest, RepeatPresentationRejected) {
    EXPECT_TRUE(cache_->check_and_record(issuer_, "nonce1", NOW + 3600, NOW));
    EXPECT_FALSE(cache_->check_and_record(issuer_, "nonce1", NOW + 3600, NOW + 10));
    EXPECT_FALSE(cache_->check_and_record(issuer_, "nonce1", NOW + 3600, NOW + 3600));
}

TEST_F(ReplayProtectionTest, NoncesScopedPerIssuer) {
    EXPECT_TRUE(cache_->check_and_record(issuer_, "nonce1", NOW + 3600, NOW));
    EXPECT_TRUE(cache_->check_and_record("did:agentauth:ed25519:other", "nonce1", NOW + 3600, NOW));
    EXPECT_FALSE(cache_->has_seen("did:agentauth:ed25519:third", "nonce1"));
}

TEST_F(ReplayProtectionTest, ExpiredEntryNoLongerBlocks) {
    EXPECT_TRUE(cache_->check_and_record(issuer_, "nonce1", NOW + 60, NOW));

    // The token itself has expired by now, so the signature check rejects it anyway
    EXPECT_TRUE(cache_->check_and_record(issuer_, "nonce1", NOW + 3600, NOW + 61));
}

// ============================================================================
// Cache Management Tests
// ============================================================================

TEST_F(ReplayProtectionTest, CleanupExpired) {
    cache_->check_and_record(issuer_, "short", NOW + 10, NOW);
    cache_->check_and_record(issuer_, "long", NOW + 3600, NOW);

    EXPECT_EQ(cache_->cleanup_expired(NOW + 11), 1u);
    EXPECT_EQ(cache_->get_cache_size(), 1u);
    EXPECT_FALSE(cache_->has_seen(issuer_, "short"));
    EXPECT_TRUE(cache_->has_seen(issuer_, "long"));
}

TEST_F(ReplayProtectionTest, PeriodicCleanupOnInsert) {
    for (size_t i = 0; i + 1 < config::REPLAY_CLEANUP_INTERVAL; i++) {
        cache_->check_and_record(issuer_, "old" + std::to_string(i), NOW + 10, NOW);
    }
    EXPECT_EQ(cache_->get_cache_size(), config::REPLAY_CLEANUP_INTERVAL - 1);

    // The next insertion triggers cleanup at its own time
    cache_->check_and_record(issuer_, "fresh", NOW + 7200, NOW + 3600);
    EXPECT_EQ(cache_->get_cache_size(), 1u);
}

TEST_F(ReplayProtectionTest, Clear) {
    cache_->check_and_record(issuer_, "nonce1", NOW + 3600, NOW);
    cache_->clear();

    EXPECT_EQ(cache_->get_cache_size(), 0u);
    EXPECT_TRUE(cache_->check_and_record(issuer_, "nonce1", NOW + 3600, NOW));
}

// ============================================================================
// Thread Safety Tests
// ============================================================================

TEST_F(ReplayProtectionTest, ConcurrentPresentationsAcceptOnce) {
    const int num_threads = 8;
    std::atomic<int> accepted{0};
    std::vector<std::thread> threads;

    for (int t = 0; t < num_threads; t++) {
        threads.emplace_back([this, &accepted]() {
            for (int i = 0; i < 100; i++) {
                if (cache_->check_and_record(issuer_, "nonce" + std::to_string(i), NOW + 3600, NOW)) {
                    accepted++;
                }
            }
        });
    }

    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(accepted.load(), 100);
    EXPECT_EQ(cache_->get_cache_size(), 100u);
}
