/**
 * @file byte_order.hpp
 * @brief Функции для работы с порядком байт (endianness)
 * 
 * Все целые числа в прообразах seal и листьев кодируются в little-endian.
 * Состояние Keccak-f[1600] также загружается 64-битными словами LE.
 * 
 * @note Все функции noexcept и не выделяют память.
 */

#pragma once

#include <bit>
#include <concepts>
#include <cstdint>
#include <cstring>

namespace sealchain {

/**
 * @brief Concept для беззнаковых целых фиксированного размера
 */
template<typename T>
concept UnsignedInteger = std::unsigned_integral<T> && 
                          (sizeof(T) == 1 || sizeof(T) == 2 || 
                           sizeof(T) == 4 || sizeof(T) == 8);

/**
 * @brief Поменять порядок байт
 */
template<UnsignedInteger T>
[[nodiscard]] constexpr T byte_swap(T value) noexcept {
    if constexpr (sizeof(T) == 1) {
        return value;
    } else {
        T result = 0;
        for (std::size_t i = 0; i < sizeof(T); ++i) {
            result = static_cast<T>((result << 8) | (value & 0xFF));
            value = static_cast<T>(value >> 8);
        }
        return result;
    }
}

/**
 * @brief Преобразовать из формата хоста в little-endian
 */
template<UnsignedInteger T>
[[nodiscard]] constexpr T to_little_endian(T value) noexcept {
    if constexpr (std::endian::native == std::endian::little) {
        return value;
    } else {
        return byte_swap(value);
    }
}

/// @brief Обратное преобразование (операция симметрична)
template<UnsignedInteger T>
[[nodiscard]] constexpr T from_little_endian(T value) noexcept {
    return to_little_endian(value);
}

/**
 * @brief Записать целое в little-endian формате
 * 
 * @param dest Указатель на буфер (минимум sizeof(T) байт)
 */
template<UnsignedInteger T>
inline void write_le(uint8_t* dest, T value) noexcept {
    value = to_little_endian(value);
    std::memcpy(dest, &value, sizeof(value));
}

/**
 * @brief Прочитать целое из little-endian буфера
 * 
 * @param src Указатель на буфер (минимум sizeof(T) байт)
 */
template<UnsignedInteger T>
[[nodiscard]] inline T read_le(const uint8_t* src) noexcept {
    T value;
    std::memcpy(&value, src, sizeof(value));
    return from_little_endian(value);
}

inline void write_le16(uint8_t* dest, uint16_t value) noexcept { write_le(dest, value); }
inline void write_le64(uint8_t* dest, uint64_t value) noexcept { write_le(dest, value); }

[[nodiscard]] inline uint64_t read_le64(const uint8_t* src) noexcept {
    return read_le<uint64_t>(src);
}

} // namespace sealchain
