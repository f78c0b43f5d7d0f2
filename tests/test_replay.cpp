/**
 * @file test_replay.cpp
 * @brief Тесты replay хеш-цепочек
 */

#include <gtest/gtest.h>

#include "chain/replay.hpp"
#include "core/hex.hpp"

#include <utility>
#include <vector>

namespace sealchain::tests {

namespace {

Pubkey filled_key(uint8_t byte) {
    Pubkey key;
    key.fill(byte);
    return key;
}

Digest filled_digest(uint8_t byte) {
    Digest digest;
    digest.fill(byte);
    return digest;
}

} // anonymous namespace

/**
 * @brief Три отзыва: seal 0x11/0x22/0x33, слоты 100-102
 */
class ReplayTest : public ::testing::Test {
protected:
    void SetUp() override {
        const uint8_t seals[] = {0x11, 0x22, 0x33};
        for (uint64_t i = 0; i < 3; ++i) {
            chain::FeedbackEvent event;
            event.asset = filled_key(0xAA);
            event.client = filled_key(0xBB);
            event.feedback_index = i;
            event.seal_hash = filled_digest(seals[i]);
            event.slot = 100 + i;
            feedback.push_back(event);
        }
        
        for (uint64_t i = 0; i < 2; ++i) {
            chain::RevokeEvent event;
            event.asset = filled_key(0xAA);
            event.client = filled_key(0xBB);
            event.feedback_index = i;
            event.feedback_hash = filled_digest(0xDD);
            event.slot = 200 + i;
            revokes.push_back(event);
        }
    }
    
    std::vector<chain::FeedbackEvent> feedback;
    std::vector<chain::RevokeEvent> revokes;
    
    static constexpr std::string_view FEEDBACK_DIGESTS[] = {
        "77212c1f23a3e1617da1fda7efd69a1ed697b1da8a1df36026b5e3528ae0f72d",
        "29778838206c1530d99b6efa83e8230d1f9d379a0a25efbd82dbfdb0891ebfc0",
        "232c38787a48b26487020c3aaf49e4fd83ed6e887b434b2ae040052b40b6e858",
    };
};

TEST_F(ReplayTest, EmptyListKeepsStart) {
    auto result = chain::replay_feedback_chain({});
    EXPECT_TRUE(result.valid);
    EXPECT_EQ(result.count, 0u);
    EXPECT_EQ(result.final_digest, ZERO_DIGEST);
    
    const chain::ChainState start{filled_digest(0x42), 17};
    auto from_checkpoint = chain::replay_revoke_chain({}, start);
    EXPECT_EQ(from_checkpoint.state(), start);
}

TEST_F(ReplayTest, FeedbackReferenceDigests) {
    for (std::size_t n = 1; n <= feedback.size(); ++n) {
        auto result = chain::replay_feedback_chain(std::span(feedback).first(n));
        EXPECT_TRUE(result.valid);
        EXPECT_EQ(result.count, n);
        EXPECT_EQ(hex::to_hex(result.final_digest), FEEDBACK_DIGESTS[n - 1]);
    }
}

TEST_F(ReplayTest, RevokeReferenceDigest) {
    auto result = chain::replay_revoke_chain(revokes);
    EXPECT_TRUE(result.valid);
    EXPECT_EQ(result.count, 2u);
    EXPECT_EQ(hex::to_hex(result.final_digest),
              "23756b0927323d7aea0d8a3cc37970d81c84238d1938f3f49b63682cf06b5f2a");
}

TEST_F(ReplayTest, CorrectStoredDigestsPass) {
    for (std::size_t i = 0; i < feedback.size(); ++i) {
        feedback[i].stored_digest = hex::digest_from_hex(FEEDBACK_DIGESTS[i]).value();
    }
    auto result = chain::replay_feedback_chain(feedback);
    EXPECT_TRUE(result.valid);
    EXPECT_FALSE(result.mismatch_at.has_value());
}

/**
 * @brief Тест: изменение seal hash середины обнаруживается на этой позиции
 */
TEST_F(ReplayTest, TamperedEventDetected) {
    for (std::size_t i = 0; i < feedback.size(); ++i) {
        feedback[i].stored_digest = hex::digest_from_hex(FEEDBACK_DIGESTS[i]).value();
    }
    feedback[1].seal_hash = filled_digest(0x99);
    
    auto result = chain::replay_feedback_chain(feedback);
    EXPECT_FALSE(result.valid);
    ASSERT_TRUE(result.mismatch_at.has_value());
    EXPECT_EQ(*result.mismatch_at, 1u);
    EXPECT_EQ(result.count, 2u);
    ASSERT_TRUE(result.mismatch_expected.has_value());
    EXPECT_EQ(hex::to_hex(*result.mismatch_expected), FEEDBACK_DIGESTS[1]);
    ASSERT_TRUE(result.mismatch_computed.has_value());
    EXPECT_EQ(*result.mismatch_computed, result.final_digest);
    EXPECT_NE(*result.mismatch_computed, *result.mismatch_expected);
}

/**
 * @brief Тест: без сохранённых дайджестов подмена видна только по итогу
 */
TEST_F(ReplayTest, TamperWithoutStoredDigestsChangesFinal) {
    auto honest = chain::replay_feedback_chain(feedback);
    feedback[0].slot += 1;
    auto tampered = chain::replay_feedback_chain(feedback);
    
    EXPECT_TRUE(tampered.valid);
    EXPECT_NE(tampered.final_digest, honest.final_digest);
}

TEST_F(ReplayTest, ReorderingChangesDigest) {
    auto honest = chain::replay_feedback_chain(feedback);
    std::swap(feedback[0], feedback[2]);
    EXPECT_NE(chain::replay_feedback_chain(feedback).final_digest, honest.final_digest);
}

/**
 * @brief Тест: replay(a ++ b) == replay(b, replay(a)) для каждой точки разбиения
 */
TEST_F(ReplayTest, ComposableAtEverySplit) {
    const auto full = chain::replay_feedback_chain(feedback);
    
    for (std::size_t k = 0; k <= feedback.size(); ++k) {
        const std::span<const chain::FeedbackEvent> all(feedback);
        auto head = chain::replay_feedback_chain(all.first(k));
        auto tail = chain::replay_feedback_chain(all.subspan(k), head.state());
        EXPECT_EQ(tail.state(), full.state()) << "k=" << k;
    }
}

TEST_F(ReplayTest, ResponseChainComposable) {
    std::vector<chain::ResponseEvent> responses;
    for (uint64_t i = 0; i < 4; ++i) {
        chain::ResponseEvent event;
        event.asset = filled_key(0xAA);
        event.client = filled_key(0xBB);
        event.feedback_index = i / 2;
        event.responder = filled_key(0xCC);
        event.response_hash = filled_digest(static_cast<uint8_t>(i));
        event.feedback_hash = filled_digest(0xDD);
        event.slot = 300 + i;
        responses.push_back(event);
    }
    
    const auto full = chain::replay_response_chain(responses);
    EXPECT_EQ(full.count, 4u);
    
    for (std::size_t k = 0; k <= responses.size(); ++k) {
        const std::span<const chain::ResponseEvent> all(responses);
        auto head = chain::replay_response_chain(all.first(k));
        auto tail = chain::replay_response_chain(all.subspan(k), head.state());
        EXPECT_EQ(tail.state(), full.state()) << "k=" << k;
    }
}

TEST_F(ReplayTest, FirstResponseDigestMatchesReference) {
    chain::ResponseEvent event;
    event.asset = filled_key(0xAA);
    event.client = filled_key(0xBB);
    event.responder = filled_key(0xCC);
    event.response_hash = filled_digest(0xDD);
    event.feedback_hash = filled_digest(0xDD);
    event.slot = 100;
    
    auto result = chain::replay_response_chain(std::span(&event, 1));
    EXPECT_EQ(hex::to_hex(result.final_digest),
              "3927f0b6f26bb62869da1929554e55f336b47f41c546516aeb0094c110d0a893");
}

TEST_F(ReplayTest, ReplayIsDeterministic) {
    EXPECT_EQ(chain::replay_revoke_chain(revokes).state(),
              chain::replay_revoke_chain(revokes).state());
}

/**
 * @brief Тест: 10 событий, у события 3 изменён один бит seal hash
 */
TEST_F(ReplayTest, FlippedSealHashInTenEventsDetectedAtThree) {
    std::vector<chain::FeedbackEvent> events;
    for (uint64_t i = 0; i < 10; ++i) {
        chain::FeedbackEvent event;
        event.asset = filled_key(0xAA);
        event.client = filled_key(0xBB);
        event.feedback_index = i;
        event.seal_hash = filled_digest(static_cast<uint8_t>(0x10 + i));
        event.slot = 500 + i;
        events.push_back(event);
    }
    for (std::size_t i = 0; i < events.size(); ++i) {
        events[i].stored_digest =
            chain::replay_feedback_chain(std::span(events).first(i + 1)).final_digest;
    }
    ASSERT_TRUE(chain::replay_feedback_chain(events).valid);
    
    events[3].seal_hash[0] ^= 0x01;
    auto result = chain::replay_feedback_chain(events);
    
    EXPECT_FALSE(result.valid);
    ASSERT_TRUE(result.mismatch_at.has_value());
    EXPECT_EQ(*result.mismatch_at, 3u);
    EXPECT_EQ(result.mismatch_expected, events[3].stored_digest);
}

} // namespace sealchain::tests
