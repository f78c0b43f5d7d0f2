/**
 * @file constants.hpp
 * @brief Константы протокола хеш-цепочек реестра агентов
 * 
 * Содержит доменные теги, предельные размеры полей seal и значения
 * по умолчанию для проверки целостности.
 * 
 * @note Байты доменных тегов должны совпадать с on-chain программой
 *       побайтово, иначе все дайджесты разойдутся.
 */

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>

namespace sealchain::constants {

// =============================================================================
// Размеры
// =============================================================================

/// @brief Размер Keccak-256 дайджеста в байтах
inline constexpr std::size_t DIGEST_SIZE = 32;

/// @brief Размер публичного ключа Solana в байтах
inline constexpr std::size_t PUBKEY_SIZE = 32;

/// @brief Rate Keccak-256 (1600 - 2*256 бит) в байтах
inline constexpr std::size_t KECCAK256_RATE = 136;

// =============================================================================
// Доменные теги
// =============================================================================

/// @brief Тег цепочки отзывов: "8004_FEEDBACK_V1" (16 байт)
inline constexpr std::array<uint8_t, 16> DOMAIN_FEEDBACK = {
    '8', '0', '0', '4', '_', 'F', 'E', 'E', 'D', 'B', 'A', 'C', 'K', '_', 'V', '1'
};

/// @brief Тег цепочки ответов: "8004_RESPONSE_V1" (16 байт)
inline constexpr std::array<uint8_t, 16> DOMAIN_RESPONSE = {
    '8', '0', '0', '4', '_', 'R', 'E', 'S', 'P', 'O', 'N', 'S', 'E', '_', 'V', '1'
};

/// @brief Тег цепочки отзывов-отмен: "8004_REVOKE_V1" (14 байт, без дополнения)
inline constexpr std::array<uint8_t, 14> DOMAIN_REVOKE = {
    '8', '0', '0', '4', '_', 'R', 'E', 'V', 'O', 'K', 'E', '_', 'V', '1'
};

/// @brief Тег прообраза seal: "8004_SEAL_V1____" (16 байт)
inline constexpr std::array<uint8_t, 16> DOMAIN_SEAL_V1 = {
    '8', '0', '0', '4', '_', 'S', 'E', 'A', 'L', '_', 'V', '1', '_', '_', '_', '_'
};

/// @brief Тег листа отзыва: "8004_LEAF_V1____" (16 байт)
inline constexpr std::array<uint8_t, 16> DOMAIN_LEAF_V1 = {
    '8', '0', '0', '4', '_', 'L', 'E', 'A', 'F', '_', 'V', '1', '_', '_', '_', '_'
};

// =============================================================================
// Ограничения полей seal
// =============================================================================

/// @brief Максимальное количество десятичных знаков value
inline constexpr uint8_t MAX_VALUE_DECIMALS = 6;

/// @brief Максимальный score
inline constexpr uint8_t MAX_SCORE = 100;

/// @brief Максимальная длина tag1/tag2 в байтах UTF-8
inline constexpr std::size_t MAX_TAG_LEN = 32;

/// @brief Максимальная длина endpoint в байтах UTF-8
inline constexpr std::size_t MAX_ENDPOINT_LEN = 250;

/// @brief Максимальная длина URI в байтах UTF-8
inline constexpr std::size_t MAX_URI_LEN = 250;

/// @brief Размер фиксированной части прообраза seal
inline constexpr std::size_t SEAL_FIXED_SIZE = 16 + 8 + 1 + 2 + 1;

// =============================================================================
// Проверка целостности
// =============================================================================

/// @brief Количество дополнительных выборочных проверок по умолчанию
inline constexpr uint32_t DEFAULT_SPOT_CHECKS = 10;

/// @brief Размер страницы replay-данных по умолчанию
inline constexpr uint32_t DEFAULT_BATCH_SIZE = 1000;

/// @brief Максимальный размер страницы replay-данных
inline constexpr uint32_t MAX_BATCH_SIZE = 1000;

/// @brief Таймаут HTTP запроса к индексатору (мс)
inline constexpr uint32_t DEFAULT_INDEXER_TIMEOUT_MS = 10000;

/// @brief Количество повторов запроса к индексатору
inline constexpr uint32_t DEFAULT_INDEXER_RETRIES = 2;

/// @brief Базовая задержка экспоненциального повтора (мс)
inline constexpr uint32_t RETRY_BASE_DELAY_MS = 100;

} // namespace sealchain::constants
