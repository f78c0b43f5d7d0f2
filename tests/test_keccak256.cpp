/**
 * @file test_keccak256.cpp
 * @brief Тесты Keccak-256 реализации
 * 
 * Проверяет исходный Keccak (padding 0x01), а не NIST SHA3-256:
 * для пустой строки SHA3-256 дал бы a7ffc6f8..., а Keccak-256 даёт c5d24601...
 */

#include <gtest/gtest.h>
#include <string>

#include "crypto/keccak256.hpp"
#include "core/hex.hpp"
#include "core/types.hpp"

namespace sealchain::tests {

namespace {

std::string keccak_hex(std::string_view text) {
    return hex::to_hex(crypto::keccak256(as_bytes(text)));
}

} // anonymous namespace

/**
 * @brief Класс тестов для Keccak-256
 */
class Keccak256Test : public ::testing::Test {};

/**
 * @brief Тест: пустое сообщение
 */
TEST_F(Keccak256Test, EmptyMessage) {
    EXPECT_EQ(keccak_hex(""),
              "c5d2460186f7233c927e7db2dcc703c0e500b653ca82273b7bfad8045d85a470");
}

/**
 * @brief Тест: "abc"
 */
TEST_F(Keccak256Test, SimpleMessage) {
    EXPECT_EQ(keccak_hex("abc"),
              "4e03657aea45a94fc7d47ba826c8d667c0d1e6e33a64a036ec44f58fa12d6c45");
}

/**
 * @brief Тест: на байт короче rate (padding 0x01 и 0x80 в одном байте)
 */
TEST_F(Keccak256Test, OneByteShortOfRate) {
    EXPECT_EQ(keccak_hex(std::string(135, 'a')),
              "34367dc248bbd832f4e3e69dfaac2f92638bd0bbd18f2912ba4ef454919cf446");
}

/**
 * @brief Тест: ровно один блок rate (padding уходит в отдельный блок)
 */
TEST_F(Keccak256Test, ExactlyOneRateBlock) {
    EXPECT_EQ(keccak_hex(std::string(136, 'a')),
              "a6c4d403279fe3e0af03729caada8374b5ca54d8065329a3ebcaeb4b60aa386e");
}

/**
 * @brief Тест: несколько блоков
 */
TEST_F(Keccak256Test, MultiBlock) {
    EXPECT_EQ(keccak_hex(std::string(200, 'a')),
              "96ea54061def936c4be90b518992fdc6f12f535068a256229aca54267b4d084d");
}

/**
 * @brief Тест: инкрементальное хеширование совпадает с однократным
 */
TEST_F(Keccak256Test, IncrementalMatchesOneShot) {
    const std::string msg(200, 'a');
    
    for (std::size_t split : {0u, 1u, 67u, 135u, 136u, 137u, 199u, 200u}) {
        crypto::Keccak256 hasher;
        hasher.update(as_bytes(std::string_view(msg).substr(0, split)))
              .update(as_bytes(std::string_view(msg).substr(split)));
        EXPECT_EQ(hasher.finalize(), crypto::keccak256(as_bytes(msg))) << "split=" << split;
    }
}

/**
 * @brief Тест: многочастный вариант хеширует конкатенацию
 */
TEST_F(Keccak256Test, MultiPartMatchesConcatenation) {
    const std::string a = "8004_";
    const std::string b(150, 'x');
    const std::string c = "tail";
    
    EXPECT_EQ(crypto::keccak256({as_bytes(a), as_bytes(b), as_bytes(c)}),
              crypto::keccak256(as_bytes(a + b + c)));
}

/**
 * @brief Тест: finalize сбрасывает состояние
 */
TEST_F(Keccak256Test, FinalizeResets) {
    crypto::Keccak256 hasher;
    hasher.update(as_bytes(std::string_view("abc")));
    auto first = hasher.finalize();
    
    hasher.update(as_bytes(std::string_view("abc")));
    EXPECT_EQ(hasher.finalize(), first);
    
    EXPECT_EQ(hex::to_hex(hasher.finalize()),
              "c5d2460186f7233c927e7db2dcc703c0e500b653ca82273b7bfad8045d85a470");
}

} // namespace sealchain::tests
