/**
 * @file hex.cpp
 * @brief Реализация hex кодирования
 */

#include "hex.hpp"

#include <algorithm>
#include <format>

namespace sealchain::hex {

namespace {

int nibble(char c) noexcept {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::string_view strip_prefix(std::string_view text) noexcept {
    if (text.starts_with("0x") || text.starts_with("0X") || text.starts_with("\\x")) {
        text.remove_prefix(2);
    }
    return text;
}

} // anonymous namespace

std::string encode(ByteSpan data) {
    std::string out;
    out.reserve(data.size() * 2);
    for (uint8_t byte : data) {
        out += std::format("{:02x}", byte);
    }
    return out;
}

std::string to_hex(const Digest& digest) {
    return encode(ByteSpan{digest.data(), digest.size()});
}

std::string normalize(std::string_view text) {
    std::string out(strip_prefix(text));
    std::transform(out.begin(), out.end(), out.begin(), [](char c) {
        return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
    });
    return out;
}

Result<Bytes> decode(std::string_view text) {
    text = strip_prefix(text);
    if (text.size() % 2 != 0) {
        return Err<Bytes>(
            ErrorCode::EncodingInvalidHex,
            std::format("Нечётная длина hex строки: {}", text.size())
        );
    }
    
    Bytes out;
    out.reserve(text.size() / 2);
    for (std::size_t i = 0; i < text.size(); i += 2) {
        int hi = nibble(text[i]);
        int lo = nibble(text[i + 1]);
        if (hi < 0 || lo < 0) {
            return Err<Bytes>(
                ErrorCode::EncodingInvalidHex,
                std::format("Неверный символ в hex строке на позиции {}", i)
            );
        }
        out.push_back(static_cast<uint8_t>((hi << 4) | lo));
    }
    return out;
}

Result<Digest> digest_from_hex(std::string_view text) {
    auto bytes = decode(text);
    if (!bytes) {
        return std::unexpected(bytes.error());
    }
    if (bytes->size() != 32) {
        return Err<Digest>(
            ErrorCode::EncodingInvalidLength,
            std::format("Неверная длина дайджеста: {} байт (ожидается 32)", bytes->size())
        );
    }
    
    Digest digest{};
    std::copy(bytes->begin(), bytes->end(), digest.begin());
    return digest;
}

} // namespace sealchain::hex
