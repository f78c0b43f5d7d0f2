/**
 * @file sampling.hpp
 * @brief Выбор позиций для выборочных проверок (deep verification)
 */

#pragma once

#include <cstdint>
#include <random>
#include <vector>

namespace sealchain::integrity {

/**
 * @brief Выбрать позиции цепочки для проверки
 * 
 * При include_boundaries всегда включает 0 и count-1, плюс до extra
 * различных позиций, выбранных равномерно из внутреннего диапазона.
 * Без границ extra позиций выбираются из [0, count).
 * 
 * @param count Количество событий в цепочке
 * @param extra Количество дополнительных позиций
 * @param include_boundaries Включать ли граничные позиции
 * @param rng Генератор случайных чисел
 * @return Отсортированные уникальные позиции, не больше count штук
 */
[[nodiscard]] std::vector<uint64_t> sample_positions(
    uint64_t count,
    uint32_t extra,
    bool include_boundaries,
    std::mt19937_64& rng
);

} // namespace sealchain::integrity
