/**
 * @file stream.hpp
 * @brief Поток записи для построения бинарных прообразов
 * 
 * Используется кодировщиком seal и кодировщиками листьев.
 * Все числа записываются в little-endian.
 */

#pragma once

#include "../types.hpp"

#include <cstdint>
#include <stdexcept>
#include <string_view>

namespace sealchain::core::serialization {

/**
 * @brief Исключение при ошибке записи
 */
class StreamError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Поток для записи бинарных данных
 */
class WriteStream {
public:
    WriteStream() = default;
    
    /**
     * @brief Создать поток с предварительно выделенной памятью
     */
    explicit WriteStream(std::size_t reserve_size);
    
    // =========================================================================
    // Запись примитивов
    // =========================================================================
    
    void write_u8(uint8_t value);
    
    /// @brief Записать 2 байта (little-endian)
    void write_u16_le(uint16_t value);
    
    /// @brief Записать 8 байт (little-endian)
    void write_u64_le(uint64_t value);
    
    /// @brief Записать знаковое 8-байтное число (дополнительный код, LE)
    void write_i64_le(int64_t value);
    
    /**
     * @brief Записать массив байт без префикса длины
     */
    void write_bytes(ByteSpan data);
    
    /**
     * @brief Записать 32-байтный дайджест или публичный ключ
     */
    void write_hash256(const Hash256& hash);
    
    /**
     * @brief Записать UTF-8 строку с префиксом длины u16 LE
     * 
     * Длина считается в байтах, а не в символах.
     * 
     * @throws StreamError если строка длиннее 65535 байт
     */
    void write_string_u16(std::string_view str);
    
    // =========================================================================
    // Результат
    // =========================================================================
    
    [[nodiscard]] const Bytes& data() const noexcept;
    
    /**
     * @brief Получить записанные данные (перемещение)
     */
    [[nodiscard]] Bytes take_data() noexcept;
    
    [[nodiscard]] std::size_t size() const noexcept;

private:
    Bytes data_;
};

} // namespace sealchain::core::serialization
