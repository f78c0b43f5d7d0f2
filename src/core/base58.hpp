/**
 * @file base58.hpp
 * @brief Base58 (алфавит Bitcoin) для публичных ключей Solana
 * 
 * Индексатор и снимки on-chain состояния передают asset, client и
 * responder как base58 строки. Кодировщики листьев работают только
 * с фиксированными 32-байтными Pubkey.
 */

#pragma once

#include "types.hpp"

#include <string>
#include <string_view>

namespace sealchain::base58 {

/**
 * @brief Закодировать байты в base58
 * 
 * Ведущие нулевые байты кодируются символом '1'.
 */
[[nodiscard]] std::string encode(ByteSpan data);

/**
 * @brief Декодировать base58 строку
 */
[[nodiscard]] Result<Bytes> decode(std::string_view text);

/**
 * @brief Декодировать публичный ключ Solana (ровно 32 байта)
 */
[[nodiscard]] Result<Pubkey> decode_pubkey(std::string_view text);

/**
 * @brief Закодировать публичный ключ Solana
 */
[[nodiscard]] std::string encode_pubkey(const Pubkey& key);

} // namespace sealchain::base58
