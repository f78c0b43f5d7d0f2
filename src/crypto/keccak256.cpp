/**
 * @file keccak256.cpp
 * @brief Программная реализация Keccak-256
 * 
 * Компактная реализация Keccak-f[1600] по справочному описанию
 * (theta, rho+pi, chi, iota) с развёрнутыми таблицами смещений.
 */

#include "keccak256.hpp"
#include "../core/byte_order.hpp"

#include <algorithm>
#include <bit>
#include <cstring>

namespace sealchain::crypto {

namespace {

/// Константы раундов (iota)
constexpr std::array<uint64_t, 24> ROUND_CONSTANTS = {
    0x0000000000000001ULL, 0x0000000000008082ULL, 0x800000000000808aULL,
    0x8000000080008000ULL, 0x000000000000808bULL, 0x0000000080000001ULL,
    0x8000000080008081ULL, 0x8000000000008009ULL, 0x000000000000008aULL,
    0x0000000000000088ULL, 0x0000000080008009ULL, 0x000000008000000aULL,
    0x000000008000808bULL, 0x800000000000008bULL, 0x8000000000008089ULL,
    0x8000000000008003ULL, 0x8000000000008002ULL, 0x8000000000000080ULL,
    0x000000000000800aULL, 0x800000008000000aULL, 0x8000000080008081ULL,
    0x8000000000008080ULL, 0x0000000080000001ULL, 0x8000000080008008ULL,
};

/// Смещения вращения (rho) в порядке обхода pi
constexpr std::array<int, 24> RHO_OFFSETS = {
    1, 3, 6, 10, 15, 21, 28, 36, 45, 55, 2, 14,
    27, 41, 56, 8, 25, 43, 62, 18, 39, 61, 20, 44,
};

/// Порядок обхода лейнов (pi)
constexpr std::array<std::size_t, 24> PI_LANES = {
    10, 7, 11, 17, 18, 3, 5, 16, 8, 21, 24, 4,
    15, 23, 19, 13, 12, 2, 20, 14, 22, 9, 6, 1,
};

/// Байт доменного разделения оригинального Keccak
constexpr uint8_t KECCAK_PAD = 0x01;

} // anonymous namespace

// =============================================================================
// Keccak-f[1600]
// =============================================================================

void keccak_f1600(KeccakState& st) noexcept {
    uint64_t bc[5];
    
    for (uint64_t rc : ROUND_CONSTANTS) {
        // Theta
        for (std::size_t i = 0; i < 5; ++i) {
            bc[i] = st[i] ^ st[i + 5] ^ st[i + 10] ^ st[i + 15] ^ st[i + 20];
        }
        for (std::size_t i = 0; i < 5; ++i) {
            uint64_t t = bc[(i + 4) % 5] ^ std::rotl(bc[(i + 1) % 5], 1);
            for (std::size_t j = 0; j < 25; j += 5) {
                st[j + i] ^= t;
            }
        }
        
        // Rho + Pi
        uint64_t t = st[1];
        for (std::size_t i = 0; i < 24; ++i) {
            std::size_t j = PI_LANES[i];
            uint64_t tmp = st[j];
            st[j] = std::rotl(t, RHO_OFFSETS[i]);
            t = tmp;
        }
        
        // Chi
        for (std::size_t j = 0; j < 25; j += 5) {
            for (std::size_t i = 0; i < 5; ++i) {
                bc[i] = st[j + i];
            }
            for (std::size_t i = 0; i < 5; ++i) {
                st[j + i] ^= (~bc[(i + 1) % 5]) & bc[(i + 2) % 5];
            }
        }
        
        // Iota
        st[0] ^= rc;
    }
}

// =============================================================================
// Keccak256
// =============================================================================

void Keccak256::absorb_block(const uint8_t* block) noexcept {
    for (std::size_t i = 0; i < constants::KECCAK256_RATE / 8; ++i) {
        state_[i] ^= read_le64(block + i * 8);
    }
    keccak_f1600(state_);
}

Keccak256& Keccak256::update(ByteSpan data) noexcept {
    const uint8_t* ptr = data.data();
    std::size_t len = data.size();
    
    // Дополняем незавершённый блок
    if (buffered_ > 0 && len > 0) {
        std::size_t take = std::min(len, buffer_.size() - buffered_);
        std::memcpy(buffer_.data() + buffered_, ptr, take);
        buffered_ += take;
        ptr += take;
        len -= take;
        if (buffered_ == buffer_.size()) {
            absorb_block(buffer_.data());
            buffered_ = 0;
        }
    }
    
    // Полные блоки напрямую из входа
    while (len >= constants::KECCAK256_RATE) {
        absorb_block(ptr);
        ptr += constants::KECCAK256_RATE;
        len -= constants::KECCAK256_RATE;
    }
    
    if (len > 0) {
        std::memcpy(buffer_.data(), ptr, len);
        buffered_ = len;
    }
    return *this;
}

Digest Keccak256::finalize() noexcept {
    // Дополнение pad10*1 с доменным байтом 0x01
    std::memset(buffer_.data() + buffered_, 0, buffer_.size() - buffered_);
    buffer_[buffered_] ^= KECCAK_PAD;
    buffer_[buffer_.size() - 1] ^= 0x80;
    absorb_block(buffer_.data());
    
    Digest out{};
    for (std::size_t i = 0; i < out.size() / 8; ++i) {
        write_le64(out.data() + i * 8, state_[i]);
    }
    
    reset();
    return out;
}

void Keccak256::reset() noexcept {
    state_.fill(0);
    buffer_.fill(0);
    buffered_ = 0;
}

// =============================================================================
// Функции-обёртки
// =============================================================================

Digest keccak256(ByteSpan data) noexcept {
    Keccak256 hasher;
    hasher.update(data);
    return hasher.finalize();
}

Digest keccak256(std::initializer_list<ByteSpan> parts) noexcept {
    Keccak256 hasher;
    for (ByteSpan part : parts) {
        hasher.update(part);
    }
    return hasher.finalize();
}

} // namespace sealchain::crypto
