/**
 * @file test_hash_chain.cpp
 * @brief Тесты листьев и шага хеш-цепочки
 */

#include <gtest/gtest.h>

#include "chain/hash_chain.hpp"
#include "core/constants.hpp"
#include "core/hex.hpp"

#include <string>

namespace sealchain::tests {

namespace {

Digest digest_of(std::string_view text) {
    auto digest = hex::digest_from_hex(text);
    EXPECT_TRUE(digest.has_value());
    return digest.value_or(Digest{});
}

Pubkey filled(uint8_t byte) {
    Pubkey key;
    key.fill(byte);
    return key;
}

constexpr std::string_view GOLDEN_SEAL =
    "95e4e651a4833ff431d6a290307d37bb3402e4bbad49b0252625b105195b40b6";

} // anonymous namespace

/**
 * @brief Класс тестов хеш-цепочки
 */
class HashChainTest : public ::testing::Test {
protected:
    const Pubkey asset = filled(0xAA);
    const Pubkey client = filled(0xBB);
    const Pubkey responder = filled(0xCC);
    const Digest content = [] { Digest d; d.fill(0xDD); return d; }();
};

// =============================================================================
// Теги доменов
// =============================================================================

TEST_F(HashChainTest, DomainTagsExactBytes) {
    auto text = [](ByteSpan span) {
        return std::string(reinterpret_cast<const char*>(span.data()), span.size());
    };
    
    EXPECT_EQ(text(chain::domain_tag(chain::ChainKind::Feedback)), "8004_FEEDBACK_V1");
    EXPECT_EQ(text(chain::domain_tag(chain::ChainKind::Response)), "8004_RESPONSE_V1");
    
    // Тег отмен короче остальных: 14 байт
    EXPECT_EQ(text(chain::domain_tag(chain::ChainKind::Revoke)), "8004_REVOKE_V1");
    EXPECT_EQ(chain::domain_tag(chain::ChainKind::Revoke).size(), 14u);
}

TEST_F(HashChainTest, ChainKindNames) {
    EXPECT_EQ(chain::to_string(chain::ChainKind::Feedback), "feedback");
    EXPECT_EQ(chain::to_string(chain::ChainKind::Response), "response");
    EXPECT_EQ(chain::to_string(chain::ChainKind::Revoke), "revoke");
}

// =============================================================================
// Листья
// =============================================================================

TEST_F(HashChainTest, FeedbackLeafReferenceValue) {
    auto leaf = chain::feedback_leaf(asset, client, 0, digest_of(GOLDEN_SEAL), 12345);
    EXPECT_EQ(hex::to_hex(leaf),
              "f23e92ed586f8308ea256ecf95772531a89bd75a6782f5ab7cc99bc6c1fb5270");
}

TEST_F(HashChainTest, ResponseLeafReferenceValue) {
    auto leaf = chain::response_leaf(asset, client, 0, responder, content, content, 100);
    EXPECT_EQ(hex::to_hex(leaf),
              "f5ca82ba5bce0e8e81d9be7c9bd17962d3b308d4b9d958e1529138b995928955");
}

TEST_F(HashChainTest, RevokeLeafReferenceValue) {
    auto leaf = chain::revoke_leaf(asset, client, 0, content, 100);
    EXPECT_EQ(hex::to_hex(leaf),
              "5b74cf47880a8e2a169d218524977397c0116f3ddb85d234f7277fe94f082d9b");
}

TEST_F(HashChainTest, LeafDependsOnEveryField) {
    const auto seal = digest_of(GOLDEN_SEAL);
    const auto base = chain::feedback_leaf(asset, client, 0, seal, 12345);
    
    EXPECT_NE(chain::feedback_leaf(client, asset, 0, seal, 12345), base);
    EXPECT_NE(chain::feedback_leaf(asset, client, 1, seal, 12345), base);
    EXPECT_NE(chain::feedback_leaf(asset, client, 0, content, 12345), base);
    EXPECT_NE(chain::feedback_leaf(asset, client, 0, seal, 12346), base);
}

// =============================================================================
// Шаг цепочки
// =============================================================================

TEST_F(HashChainTest, FirstDigestsFromZero) {
    const auto feedback = chain::chain_hash(
        ZERO_DIGEST, chain::domain_tag(chain::ChainKind::Feedback),
        chain::feedback_leaf(asset, client, 0, digest_of(GOLDEN_SEAL), 12345));
    EXPECT_EQ(hex::to_hex(feedback),
              "42aa75dec7905da76c8be4f79d8f67b8fbf6b54387051d87c96593522a7ec6b7");
    
    const auto response = chain::chain_hash(
        ZERO_DIGEST, chain::domain_tag(chain::ChainKind::Response),
        chain::response_leaf(asset, client, 0, responder, content, content, 100));
    EXPECT_EQ(hex::to_hex(response),
              "3927f0b6f26bb62869da1929554e55f336b47f41c546516aeb0094c110d0a893");
    
    const auto revoke = chain::chain_hash(
        ZERO_DIGEST, chain::domain_tag(chain::ChainKind::Revoke),
        chain::revoke_leaf(asset, client, 0, content, 100));
    EXPECT_EQ(hex::to_hex(revoke),
              "60f06cc687242ca119b47f879fa2c5058f30a1ba4a1b283938839f55d30f0689");
}

/**
 * @brief Тест: один и тот же лист в разных цепочках даёт разные дайджесты
 */
TEST_F(HashChainTest, DomainSeparation) {
    const auto leaf = chain::revoke_leaf(asset, client, 0, content, 100);
    
    const auto in_feedback = chain::chain_hash(ZERO_DIGEST, chain::domain_tag(chain::ChainKind::Feedback), leaf);
    const auto in_response = chain::chain_hash(ZERO_DIGEST, chain::domain_tag(chain::ChainKind::Response), leaf);
    const auto in_revoke = chain::chain_hash(ZERO_DIGEST, chain::domain_tag(chain::ChainKind::Revoke), leaf);
    
    EXPECT_NE(in_feedback, in_response);
    EXPECT_NE(in_feedback, in_revoke);
    EXPECT_NE(in_response, in_revoke);
}

TEST_F(HashChainTest, ChainHashIsDeterministic) {
    const auto leaf = chain::revoke_leaf(asset, client, 7, content, 9);
    const auto tag = chain::domain_tag(chain::ChainKind::Revoke);
    EXPECT_EQ(chain::chain_hash(content, tag, leaf), chain::chain_hash(content, tag, leaf));
    EXPECT_NE(chain::chain_hash(content, tag, leaf), chain::chain_hash(ZERO_DIGEST, tag, leaf));
}

} // namespace sealchain::tests
