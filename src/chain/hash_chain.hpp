/**
 * @file hash_chain.hpp
 * @brief Листья и звенья хеш-цепочек отзывов, ответов и отмен
 * 
 * Каждое событие агента (отзыв, ответ, отмена) кодируется в 32-байтный
 * лист, который сворачивается в бегущий дайджест:
 * 
 *   digest' = keccak256(digest || domain_tag || leaf)
 * 
 * Цепочки начинаются с нулевого дайджеста. Все функции тотальны:
 * идентификаторы имеют фиксированный размер на уровне типов.
 */

#pragma once

#include "../core/types.hpp"

#include <cstdint>
#include <string_view>

namespace sealchain::chain {

/**
 * @brief Вид хеш-цепочки агента
 */
enum class ChainKind : uint8_t {
    Feedback,   ///< Цепочка отзывов
    Response,   ///< Цепочка ответов на отзывы
    Revoke      ///< Цепочка отмен отзывов
};

/**
 * @brief Название цепочки для отчётов и запросов
 */
[[nodiscard]] constexpr std::string_view to_string(ChainKind kind) noexcept {
    switch (kind) {
        case ChainKind::Feedback: return "feedback";
        case ChainKind::Response: return "response";
        case ChainKind::Revoke:   return "revoke";
        default: return "unknown";
    }
}

/**
 * @brief Доменный тег цепочки
 * 
 * @note Тег цепочки отмен имеет длину 14 байт, а не 16.
 */
[[nodiscard]] ByteSpan domain_tag(ChainKind kind) noexcept;

/**
 * @brief Один шаг цепочки: keccak256(prev || domain || leaf)
 */
[[nodiscard]] Digest chain_hash(const Digest& prev, ByteSpan domain, const Digest& leaf) noexcept;

/**
 * @brief Лист отзыва
 * 
 * keccak256(DOMAIN_LEAF_V1 || asset || client || index u64 LE ||
 *           seal_hash || slot u64 LE)
 */
[[nodiscard]] Digest feedback_leaf(
    const Pubkey& asset,
    const Pubkey& client,
    uint64_t feedback_index,
    const Digest& seal_hash,
    uint64_t slot
) noexcept;

/**
 * @brief Лист ответа (без встроенного доменного тега)
 * 
 * keccak256(asset || client || index u64 LE || responder ||
 *           response_hash || feedback_hash || slot u64 LE)
 */
[[nodiscard]] Digest response_leaf(
    const Pubkey& asset,
    const Pubkey& client,
    uint64_t feedback_index,
    const Pubkey& responder,
    const Digest& response_hash,
    const Digest& feedback_hash,
    uint64_t slot
) noexcept;

/**
 * @brief Лист отмены (без встроенного доменного тега)
 * 
 * keccak256(asset || client || index u64 LE || feedback_hash || slot u64 LE)
 */
[[nodiscard]] Digest revoke_leaf(
    const Pubkey& asset,
    const Pubkey& client,
    uint64_t feedback_index,
    const Digest& feedback_hash,
    uint64_t slot
) noexcept;

} // namespace sealchain::chain
