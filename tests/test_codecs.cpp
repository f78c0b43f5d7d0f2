/**
 * @file test_codecs.cpp
 * @brief Тесты hex, base58 и JSON разбора
 */

#include <gtest/gtest.h>

#include "core/base58.hpp"
#include "core/hex.hpp"
#include "core/json.hpp"
#include "core/serialization/stream.hpp"

#include <string>

namespace sealchain::tests {

// =============================================================================
// Hex
// =============================================================================

TEST(HexTest, EncodeLowercase) {
    const Bytes data = {0x00, 0xAB, 0xff, 0x10};
    EXPECT_EQ(hex::encode(as_bytes(data)), "00abff10");
}

TEST(HexTest, NormalizeStripsPrefixes) {
    EXPECT_EQ(hex::normalize("0xABCD"), "abcd");
    EXPECT_EQ(hex::normalize("\\xABcd"), "abcd");
    EXPECT_EQ(hex::normalize("AbCd"), "abcd");
    EXPECT_EQ(hex::normalize("0x"), "");
}

TEST(HexTest, DecodeAcceptsPrefixAndUppercase) {
    auto bytes = hex::decode("0xDEADbeef");
    ASSERT_TRUE(bytes.has_value());
    EXPECT_EQ(*bytes, (Bytes{0xde, 0xad, 0xbe, 0xef}));
}

TEST(HexTest, DecodeRejectsOddLength) {
    auto bytes = hex::decode("abc");
    ASSERT_FALSE(bytes.has_value());
    EXPECT_EQ(bytes.error().code, ErrorCode::EncodingInvalidHex);
}

TEST(HexTest, DecodeRejectsInvalidCharacter) {
    auto bytes = hex::decode("zz");
    ASSERT_FALSE(bytes.has_value());
    EXPECT_EQ(bytes.error().code, ErrorCode::EncodingInvalidHex);
}

TEST(HexTest, DigestRequires32Bytes) {
    auto short_digest = hex::digest_from_hex("abcd");
    ASSERT_FALSE(short_digest.has_value());
    EXPECT_EQ(short_digest.error().code, ErrorCode::EncodingInvalidLength);
    
    auto digest = hex::digest_from_hex(std::string(64, 'A'));
    ASSERT_TRUE(digest.has_value());
    EXPECT_EQ((*digest)[0], 0xAA);
    EXPECT_EQ(hex::to_hex(*digest), std::string(64, 'a'));
}

// =============================================================================
// Base58
// =============================================================================

TEST(Base58Test, EncodeKnownKeys) {
    Pubkey aa;
    aa.fill(0xAA);
    Pubkey bb;
    bb.fill(0xBB);
    
    EXPECT_EQ(base58::encode_pubkey(aa), "CVDFLCAjXhVWiPXH9nTCTpCgVzmDVoiPzNJYuccr1dqB");
    EXPECT_EQ(base58::encode_pubkey(bb), "DdqGmK5uamYN5vmuZrzpQhKeehLdwtPLVJdhu5P2iJKC");
}

TEST(Base58Test, LeadingZerosBecomeOnes) {
    Pubkey zero{};
    EXPECT_EQ(base58::encode_pubkey(zero), std::string(32, '1'));
    
    Pubkey one{};
    one[31] = 0x01;
    EXPECT_EQ(base58::encode_pubkey(one), std::string(31, '1') + "2");
}

TEST(Base58Test, DecodePubkey) {
    auto key = base58::decode_pubkey("DdqGmK5uamYN5vmuZrzpQhKeehLdwtPLVJdhu5P2iJKC");
    ASSERT_TRUE(key.has_value());
    Pubkey expected;
    expected.fill(0xBB);
    EXPECT_EQ(*key, expected);
    
    auto zero = base58::decode_pubkey(std::string(32, '1'));
    ASSERT_TRUE(zero.has_value());
    EXPECT_EQ(*zero, Pubkey{});
}

TEST(Base58Test, DecodeRejectsInvalidAlphabet) {
    // '0', 'O', 'I', 'l' не входят в алфавит
    for (std::string_view text : {"0abc", "Oabc", "Iabc", "labc"}) {
        auto bytes = base58::decode(text);
        ASSERT_FALSE(bytes.has_value()) << text;
        EXPECT_EQ(bytes.error().code, ErrorCode::EncodingInvalidBase58);
    }
}

TEST(Base58Test, DecodePubkeyRejectsWrongLength) {
    auto key = base58::decode_pubkey("abc");
    ASSERT_FALSE(key.has_value());
    EXPECT_EQ(key.error().code, ErrorCode::EncodingInvalidLength);
}

// =============================================================================
// JSON
// =============================================================================

TEST(JsonTest, FindMemberTopLevelOnly) {
    const std::string object = R"({"inner":{"count":5},"count":7})";
    
    auto count = json::get_uint(object, "count");
    ASSERT_TRUE(count.has_value());
    EXPECT_EQ(*count, 7u);
    
    auto inner = json::find_member(object, "inner");
    ASSERT_TRUE(inner.has_value());
    EXPECT_EQ(*inner, R"({"count":5})");
}

TEST(JsonTest, KeyInsideStringIsIgnored) {
    const std::string object = R"({"note":"\"count\":1","count":2})";
    EXPECT_EQ(json::get_uint(object, "count"), 2u);
    EXPECT_EQ(json::get_string(object, "note"), R"("count":1)");
}

TEST(JsonTest, NumbersAsStrings) {
    const std::string object = R"({"big":"18446744073709551615","neg":"-5","plain":-3})";
    EXPECT_EQ(json::get_uint(object, "big"), UINT64_MAX);
    EXPECT_EQ(json::get_int(object, "neg"), -5);
    EXPECT_EQ(json::get_int(object, "plain"), -3);
    EXPECT_FALSE(json::get_uint(object, "neg").has_value());
}

TEST(JsonTest, NullAndMissing) {
    const std::string object = R"({"a":null,"b":true})";
    EXPECT_FALSE(json::get_string(object, "a").has_value());
    EXPECT_FALSE(json::get_string(object, "missing").has_value());
    ASSERT_TRUE(json::find_member(object, "a").has_value());
    EXPECT_TRUE(json::is_null(*json::find_member(object, "a")));
    EXPECT_EQ(json::get_bool(object, "b"), true);
}

TEST(JsonTest, SplitArray) {
    auto items = json::split_array(R"([{"a":[1,2]}, "x,y", 3 ])");
    ASSERT_TRUE(items.has_value());
    ASSERT_EQ(items->size(), 3u);
    EXPECT_EQ((*items)[0], R"({"a":[1,2]})");
    EXPECT_EQ((*items)[1], R"("x,y")");
    EXPECT_EQ((*items)[2], "3");
    
    auto empty = json::split_array("[]");
    ASSERT_TRUE(empty.has_value());
    EXPECT_TRUE(empty->empty());
    
    EXPECT_FALSE(json::split_array("{}").has_value());
}

TEST(JsonTest, UnescapeUnicode) {
    EXPECT_EQ(json::unescape(R"("a\nb\"c")"), "a\nb\"c");
    EXPECT_EQ(json::unescape(R"("\u00e9")"), "é");
    EXPECT_EQ(json::unescape(R"("\ud83c\udf89")"), "🎉");
    EXPECT_FALSE(json::unescape(R"("\ud83c")").has_value());
}

TEST(JsonTest, EscapeRoundTrip) {
    const std::string text = "line1\n\"quoted\"\\tab\t";
    EXPECT_EQ(json::unescape("\"" + json::escape(text) + "\""), text);
}

// =============================================================================
// WriteStream
// =============================================================================

/**
 * @brief Тест: префикс длины строки - u16 little-endian, затем байты UTF-8
 */
TEST(WriteStreamTest, StringPrefixIsU16LittleEndian) {
    core::serialization::WriteStream stream;
    stream.write_u16_le(0x0102);
    stream.write_string_u16("ab");
    stream.write_string_u16(std::string(300, 'x'));
    
    const Bytes& data = stream.data();
    ASSERT_EQ(data.size(), 2u + 2u + 2u + 2u + 300u);
    EXPECT_EQ(data[0], 0x02);
    EXPECT_EQ(data[1], 0x01);
    EXPECT_EQ(data[2], 0x02);
    EXPECT_EQ(data[3], 0x00);
    EXPECT_EQ(data[4], 'a');
    EXPECT_EQ(data[5], 'b');
    // 300 = 0x012C
    EXPECT_EQ(data[6], 0x2C);
    EXPECT_EQ(data[7], 0x01);
}

TEST(WriteStreamTest, SignedValueIsTwosComplement) {
    core::serialization::WriteStream stream;
    stream.write_i64_le(-2);
    
    const Bytes expected{0xFE, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF};
    EXPECT_EQ(stream.data(), expected);
}

} // namespace sealchain::tests
