/**
 * @file keccak256.hpp
 * @brief Keccak-256 (Ethereum-вариант, padding 0x01)
 * 
 * Единственная хеш-функция протокола хеш-цепочек. Это НЕ NIST SHA3-256:
 * отличается байт дополнения (0x01 вместо 0x06), остальные параметры
 * совпадают (rate 136 байт, capacity 512 бит, выход 32 байта).
 * 
 * @note Результаты должны совпадать с keccak256 on-chain программы.
 */

#pragma once

#include "../core/types.hpp"
#include "../core/constants.hpp"

#include <array>
#include <cstdint>
#include <initializer_list>

namespace sealchain::crypto {

/**
 * @brief Состояние Keccak-f[1600] (25 x 64-bit слов)
 */
using KeccakState = std::array<uint64_t, 25>;

/**
 * @brief Перестановка Keccak-f[1600] (24 раунда)
 * 
 * @param state Состояние, будет модифицировано
 */
void keccak_f1600(KeccakState& state) noexcept;

/**
 * @brief Инкрементальный хешер Keccak-256
 * 
 * Позволяет хешировать конкатенацию нескольких буферов без
 * промежуточного копирования.
 * 
 * @code
 * crypto::Keccak256 hasher;
 * hasher.update(prev_digest);
 * hasher.update(domain);
 * hasher.update(leaf);
 * Digest d = hasher.finalize();
 * @endcode
 */
class Keccak256 {
public:
    Keccak256() noexcept = default;
    
    /**
     * @brief Добавить данные
     */
    Keccak256& update(ByteSpan data) noexcept;
    
    /**
     * @brief Завершить вычисление и получить дайджест
     * 
     * После вызова хешер сбрасывается в начальное состояние.
     */
    [[nodiscard]] Digest finalize() noexcept;
    
    /**
     * @brief Сбросить в начальное состояние
     */
    void reset() noexcept;

private:
    KeccakState state_{};
    std::array<uint8_t, constants::KECCAK256_RATE> buffer_{};
    std::size_t buffered_ = 0;
    
    void absorb_block(const uint8_t* block) noexcept;
};

/**
 * @brief Вычислить Keccak-256 данных произвольной длины
 */
[[nodiscard]] Digest keccak256(ByteSpan data) noexcept;

/**
 * @brief Вычислить Keccak-256 конкатенации нескольких буферов
 * 
 * keccak256({a, b, c}) == keccak256(a || b || c)
 */
[[nodiscard]] Digest keccak256(std::initializer_list<ByteSpan> parts) noexcept;

} // namespace sealchain::crypto
