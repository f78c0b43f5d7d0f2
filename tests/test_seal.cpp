/**
 * @file test_seal.cpp
 * @brief Тесты seal hash отзыва
 * 
 * Эталонные значения совпадают с on-chain программой реестра.
 */

#include <gtest/gtest.h>

#include "seal/seal.hpp"
#include "core/constants.hpp"
#include "core/hex.hpp"

#include <string>

namespace sealchain::tests {

namespace {

std::string seal_hex(const seal::SealParams& params) {
    auto hash = seal::compute_seal_hash(params);
    EXPECT_TRUE(hash.has_value()) << (hash ? "" : hash.error().message);
    return hash ? hex::to_hex(*hash) : std::string{};
}

/// Эталон 1: без оценки и без хеша файла
seal::SealParams uptime_params() {
    seal::SealParams params;
    params.value = 9977;
    params.value_decimals = 2;
    params.tag1 = "uptime";
    params.tag2 = "day";
    params.feedback_uri = "ipfs://QmTest123";
    return params;
}

} // anonymous namespace

/**
 * @brief Класс тестов seal
 */
class SealTest : public ::testing::Test {};

// =============================================================================
// Эталонные значения
// =============================================================================

TEST_F(SealTest, GoldenVectorNoScoreNoFileHash) {
    EXPECT_EQ(seal_hex(uptime_params()),
              "95e4e651a4833ff431d6a290307d37bb3402e4bbad49b0252625b105195b40b6");
}

TEST_F(SealTest, GoldenVectorAllFields) {
    seal::SealParams params;
    params.value = -100;
    params.value_decimals = 0;
    params.score = 85;
    params.tag1 = "x402-resource-delivered";
    params.tag2 = "exact-svm";
    params.endpoint = "https://api.agent.com/mcp";
    params.feedback_uri = "ar://abc123";
    Digest file_hash;
    file_hash.fill(0x01);
    params.feedback_file_hash = file_hash;
    
    EXPECT_EQ(seal_hex(params),
              "12cb1b6d1351b3a79ff15440d6c41e098a4fb69077670ce6b21c636adf98f04a");
}

TEST_F(SealTest, GoldenVectorZeroScoreEmptyStrings) {
    seal::SealParams params;
    params.score = 0;
    
    EXPECT_EQ(seal_hex(params),
              "cc81c864e771056c9b0e5fc4401035f0189142d3d44364acf8e5a6597c469c2e");
}

TEST_F(SealTest, GoldenVectorUtf8) {
    seal::SealParams params;
    params.value = 1000000;
    params.value_decimals = 6;
    params.tag1 = "質量";
    params.tag2 = "émoji🎉";
    params.endpoint = "https://例え.jp/api";
    params.feedback_uri = "ipfs://QmTest";
    
    EXPECT_EQ(seal_hex(params),
              "84be87fdff6ff50a53c30188026d69f28b4888bf4ae9bd93d27cc341520fe6e6");
}

// =============================================================================
// Прообраз
// =============================================================================

TEST_F(SealTest, PreimageLayout) {
    auto preimage = seal::encode_seal_preimage(uptime_params());
    ASSERT_TRUE(preimage.has_value());
    
    const std::string tag = "8004_SEAL_V1____";
    ASSERT_GE(preimage->size(), constants::SEAL_FIXED_SIZE);
    EXPECT_EQ(std::string(preimage->begin(), preimage->begin() + 16), tag);
    
    // value = 9977 (i64 LE)
    EXPECT_EQ((*preimage)[16], 0xF9);
    EXPECT_EQ((*preimage)[17], 0x26);
    EXPECT_EQ((*preimage)[18], 0x00);
    EXPECT_EQ((*preimage)[24], 2);   // decimals
    EXPECT_EQ((*preimage)[25], 0);   // score отсутствует
    EXPECT_EQ((*preimage)[26], 0);
    EXPECT_EQ((*preimage)[27], 0);   // хеша файла нет
    
    // 6 "uptime", 3 "day", 0 "", 16 "ipfs://QmTest123"
    EXPECT_EQ(preimage->size(), constants::SEAL_FIXED_SIZE + 2 + 6 + 2 + 3 + 2 + 0 + 2 + 16);
    EXPECT_EQ((*preimage)[28], 6);
    EXPECT_EQ((*preimage)[29], 0);
}

TEST_F(SealTest, PreimageNegativeValueIsTwosComplement) {
    seal::SealParams params;
    params.value = -1;
    auto preimage = seal::encode_seal_preimage(params);
    ASSERT_TRUE(preimage.has_value());
    for (std::size_t i = 16; i < 24; ++i) {
        EXPECT_EQ((*preimage)[i], 0xFF);
    }
}

// =============================================================================
// Валидация
// =============================================================================

TEST_F(SealTest, RejectsDecimalsAboveSix) {
    auto params = uptime_params();
    params.value_decimals = 7;
    auto hash = seal::compute_seal_hash(params);
    ASSERT_FALSE(hash.has_value());
    EXPECT_EQ(hash.error().code, ErrorCode::SealInvalidDecimals);
}

TEST_F(SealTest, RejectsScoreAbove100) {
    auto params = uptime_params();
    params.score = 101;
    auto hash = seal::compute_seal_hash(params);
    ASSERT_FALSE(hash.has_value());
    EXPECT_EQ(hash.error().code, ErrorCode::SealInvalidScore);
}

TEST_F(SealTest, RejectsOversizedFields) {
    auto tag = uptime_params();
    tag.tag2 = std::string(constants::MAX_TAG_LEN + 1, 't');
    EXPECT_EQ(seal::validate_seal_inputs(tag).error().code, ErrorCode::SealFieldTooLong);
    
    auto endpoint = uptime_params();
    endpoint.endpoint = std::string(constants::MAX_ENDPOINT_LEN + 1, 'e');
    EXPECT_EQ(seal::validate_seal_inputs(endpoint).error().code, ErrorCode::SealFieldTooLong);
    
    auto uri = uptime_params();
    uri.feedback_uri = std::string(constants::MAX_URI_LEN + 1, 'u');
    EXPECT_EQ(seal::validate_seal_inputs(uri).error().code, ErrorCode::SealFieldTooLong);
}

TEST_F(SealTest, AcceptsBoundaryValues) {
    seal::SealParams params;
    params.value_decimals = constants::MAX_VALUE_DECIMALS;
    params.score = constants::MAX_SCORE;
    params.tag1 = std::string(constants::MAX_TAG_LEN, 'a');
    params.tag2 = std::string(constants::MAX_TAG_LEN, 'b');
    params.endpoint = std::string(constants::MAX_ENDPOINT_LEN, 'c');
    params.feedback_uri = std::string(constants::MAX_URI_LEN, 'd');
    
    EXPECT_TRUE(seal::validate_seal_inputs(params).has_value());
    EXPECT_TRUE(seal::compute_seal_hash(params).has_value());
}

/**
 * @brief Тест: длина тега считается в байтах UTF-8, а не в символах
 */
TEST_F(SealTest, TagLengthCountsBytes) {
    auto params = uptime_params();
    // 11 символов по 3 байта = 33 байта
    params.tag1 = "質質質質質質質質質質質";
    auto result = seal::validate_seal_inputs(params);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::SealFieldTooLong);
}

// =============================================================================
// Чувствительность
// =============================================================================

TEST_F(SealTest, AbsentScoreDiffersFromZero) {
    auto absent = uptime_params();
    auto zero = uptime_params();
    zero.score = 0;
    EXPECT_NE(seal_hex(absent), seal_hex(zero));
}

TEST_F(SealTest, EveryFieldAffectsHash) {
    const auto base = seal_hex(uptime_params());
    
    auto value = uptime_params();
    value.value += 1;
    EXPECT_NE(seal_hex(value), base);
    
    auto decimals = uptime_params();
    decimals.value_decimals = 3;
    EXPECT_NE(seal_hex(decimals), base);
    
    auto tag1 = uptime_params();
    tag1.tag1 = "uptimE";
    EXPECT_NE(seal_hex(tag1), base);
    
    auto endpoint = uptime_params();
    endpoint.endpoint = "x";
    EXPECT_NE(seal_hex(endpoint), base);
    
    auto uri = uptime_params();
    uri.feedback_uri = "ipfs://QmTest124";
    EXPECT_NE(seal_hex(uri), base);
    
    auto file = uptime_params();
    file.feedback_file_hash = Digest{};
    EXPECT_NE(seal_hex(file), base);
}

/**
 * @brief Тест: длины строк кодируются, поэтому перенос байтов между полями меняет хеш
 */
TEST_F(SealTest, FieldBoundariesAreUnambiguous) {
    auto a = uptime_params();
    a.tag1 = "upt";
    a.tag2 = "imeday";
    EXPECT_NE(seal_hex(a), seal_hex(uptime_params()));
}

TEST_F(SealTest, VerifySealHash) {
    auto params = uptime_params();
    auto expected = hex::digest_from_hex(
        "95e4e651a4833ff431d6a290307d37bb3402e4bbad49b0252625b105195b40b6");
    ASSERT_TRUE(expected.has_value());
    
    auto ok = seal::verify_seal_hash(params, *expected);
    ASSERT_TRUE(ok.has_value());
    EXPECT_TRUE(*ok);
    
    params.tag2 = "week";
    auto tampered = seal::verify_seal_hash(params, *expected);
    ASSERT_TRUE(tampered.has_value());
    EXPECT_FALSE(*tampered);
    
    params.score = 200;
    EXPECT_FALSE(seal::verify_seal_hash(params, *expected).has_value());
}

} // namespace sealchain::tests
