/**
 * @file base58.cpp
 * @brief Реализация base58 кодирования
 * 
 * Преобразование основания "в столбик": O(n^2), для 32-байтных ключей
 * этого достаточно.
 */

#include "base58.hpp"

#include <algorithm>
#include <array>
#include <format>

namespace sealchain::base58 {

namespace {

constexpr std::string_view ALPHABET =
    "123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz";

/// Обратная таблица: символ -> цифра, -1 для недопустимых символов
constexpr std::array<int8_t, 128> make_reverse_table() {
    std::array<int8_t, 128> table{};
    table.fill(-1);
    for (std::size_t i = 0; i < ALPHABET.size(); ++i) {
        table[static_cast<std::size_t>(ALPHABET[i])] = static_cast<int8_t>(i);
    }
    return table;
}

constexpr auto REVERSE = make_reverse_table();

} // anonymous namespace

std::string encode(ByteSpan data) {
    std::size_t zeros = 0;
    while (zeros < data.size() && data[zeros] == 0) {
        ++zeros;
    }
    
    // Цифры base58 в little-endian порядке
    std::vector<uint8_t> digits;
    digits.reserve(data.size() * 138 / 100 + 1);
    
    for (std::size_t i = zeros; i < data.size(); ++i) {
        uint32_t carry = data[i];
        for (auto& digit : digits) {
            carry += static_cast<uint32_t>(digit) << 8;
            digit = static_cast<uint8_t>(carry % 58);
            carry /= 58;
        }
        while (carry > 0) {
            digits.push_back(static_cast<uint8_t>(carry % 58));
            carry /= 58;
        }
    }
    
    std::string out(zeros, '1');
    out.reserve(zeros + digits.size());
    for (auto it = digits.rbegin(); it != digits.rend(); ++it) {
        out.push_back(ALPHABET[*it]);
    }
    return out;
}

Result<Bytes> decode(std::string_view text) {
    std::size_t ones = 0;
    while (ones < text.size() && text[ones] == '1') {
        ++ones;
    }
    
    // Байты результата в little-endian порядке
    Bytes bytes;
    bytes.reserve(text.size() * 733 / 1000 + 1);
    
    for (std::size_t i = ones; i < text.size(); ++i) {
        auto c = static_cast<unsigned char>(text[i]);
        int value = c < REVERSE.size() ? REVERSE[c] : -1;
        if (value < 0) {
            return Err<Bytes>(
                ErrorCode::EncodingInvalidBase58,
                std::format("Неверный символ base58 на позиции {}", i)
            );
        }
        
        uint32_t carry = static_cast<uint32_t>(value);
        for (auto& byte : bytes) {
            carry += static_cast<uint32_t>(byte) * 58;
            byte = static_cast<uint8_t>(carry & 0xFF);
            carry >>= 8;
        }
        while (carry > 0) {
            bytes.push_back(static_cast<uint8_t>(carry & 0xFF));
            carry >>= 8;
        }
    }
    
    Bytes out(ones, 0);
    out.insert(out.end(), bytes.rbegin(), bytes.rend());
    return out;
}

Result<Pubkey> decode_pubkey(std::string_view text) {
    auto bytes = decode(text);
    if (!bytes) {
        return std::unexpected(bytes.error());
    }
    if (bytes->size() != 32) {
        return Err<Pubkey>(
            ErrorCode::EncodingInvalidLength,
            std::format("Неверная длина публичного ключа: {} байт (ожидается 32)", bytes->size())
        );
    }
    
    Pubkey key{};
    std::copy(bytes->begin(), bytes->end(), key.begin());
    return key;
}

std::string encode_pubkey(const Pubkey& key) {
    return encode(ByteSpan{key.data(), key.size()});
}

} // namespace sealchain::base58
