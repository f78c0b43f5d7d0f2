/**
 * @file seal.hpp
 * @brief Seal v1: детерминированный хеш содержимого отзыва
 * 
 * Seal hash связывает содержимое отзыва (value, score, теги, endpoint,
 * URI, хеш файла) с листом цепочки отзывов. Кодировка побайтово
 * совпадает с on-chain программой.
 * 
 * Формат прообраза:
 * @code
 * FIXED (28 байт):
 *   DOMAIN_SEAL_V1      16   смещение 0
 *   value (i64 LE)       8   смещение 16
 *   value_decimals       1   смещение 24
 *   score_flag           1   смещение 25  (0 = нет, 1 = есть)
 *   score                1   смещение 26  (0 если нет)
 *   file_hash_flag       1   смещение 27
 * DYNAMIC:
 *   file_hash           32   только если flag = 1
 *   tag1      u16 LE длина + байты UTF-8
 *   tag2      u16 LE длина + байты UTF-8
 *   endpoint  u16 LE длина + байты UTF-8
 *   uri       u16 LE длина + байты UTF-8
 * @endcode
 */

#pragma once

#include "../core/types.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace sealchain::seal {

/**
 * @brief Содержимое отзыва, покрываемое seal hash
 */
struct SealParams {
    /// @brief Значение метрики (знаковое 64-битное)
    int64_t value{0};
    
    /// @brief Количество десятичных знаков value (0-6)
    uint8_t value_decimals{0};
    
    /// @brief Оценка качества (0-100), отсутствует если не задана
    std::optional<uint8_t> score;
    
    /// @brief Категория 1 (до 32 байт UTF-8)
    std::string tag1;
    
    /// @brief Категория 2 (до 32 байт UTF-8)
    std::string tag2;
    
    /// @brief Endpoint агента (до 250 байт UTF-8)
    std::string endpoint;
    
    /// @brief URI отзыва (до 250 байт UTF-8)
    std::string feedback_uri;
    
    /// @brief Хеш файла отзыва
    std::optional<Digest> feedback_file_hash;
    
    bool operator==(const SealParams&) const = default;
};

/**
 * @brief Проверить входные данные seal
 * 
 * Повторяет on-chain валидацию. Значения вне диапазона отклоняются,
 * а не приводятся.
 * 
 * @return Ошибка SealInvalidDecimals, SealInvalidScore или SealFieldTooLong
 */
[[nodiscard]] Result<void> validate_seal_inputs(const SealParams& params);

/**
 * @brief Построить прообраз seal (байты, которые хешируются)
 */
[[nodiscard]] Result<Bytes> encode_seal_preimage(const SealParams& params);

/**
 * @brief Вычислить seal hash = keccak256(прообраз)
 */
[[nodiscard]] Result<Digest> compute_seal_hash(const SealParams& params);

/**
 * @brief Проверить, что содержимое соответствует записанному seal hash
 * 
 * @return true если хеши совпадают; ошибка если параметры невалидны
 */
[[nodiscard]] Result<bool> verify_seal_hash(const SealParams& params, const Digest& expected);

} // namespace sealchain::seal
