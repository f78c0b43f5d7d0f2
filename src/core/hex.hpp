/**
 * @file hex.hpp
 * @brief Hex кодирование дайджестов
 * 
 * Дайджесты отображаются как 64 символа в нижнем регистре, байты в
 * естественном порядке (без разворота, в отличие от Bitcoin хешей).
 * Индексатор может отдавать дайджесты с префиксами "0x" или "\x"
 * (bytea PostgreSQL), поэтому разбор их нормализует.
 */

#pragma once

#include "types.hpp"

#include <string>
#include <string_view>

namespace sealchain::hex {

/**
 * @brief Закодировать байты в hex (нижний регистр)
 */
[[nodiscard]] std::string encode(ByteSpan data);

/**
 * @brief Закодировать дайджест в 64-символьную hex строку
 */
[[nodiscard]] std::string to_hex(const Digest& digest);

/**
 * @brief Нормализовать hex дайджест: убрать префикс "0x" / "\x", привести к нижнему регистру
 */
[[nodiscard]] std::string normalize(std::string_view text);

/**
 * @brief Декодировать hex строку произвольной чётной длины
 */
[[nodiscard]] Result<Bytes> decode(std::string_view text);

/**
 * @brief Декодировать ровно 32 байта
 * 
 * @return Digest или ошибка EncodingInvalidHex / EncodingInvalidLength
 */
[[nodiscard]] Result<Digest> digest_from_hex(std::string_view text);

} // namespace sealchain::hex
