/**
 * @file replay.hpp
 * @brief Повторное вычисление (replay) хеш-цепочек
 * 
 * Левая свёртка упорядоченной последовательности событий начиная с
 * состояния (digest, count). Если событие несёт сохранённый индексатором
 * дайджест, он сверяется с вычисленным; первое расхождение прекращает
 * свёртку.
 * 
 * Replay композиционен: свёртка событий [k, n) от состояния после
 * первых k событий даёт тот же результат, что и полная свёртка.
 * Это позволяет продолжать проверку от контрольной точки (checkpoint).
 */

#pragma once

#include "hash_chain.hpp"
#include "../core/types.hpp"

#include <cstdint>
#include <optional>
#include <span>

namespace sealchain::chain {

// =============================================================================
// События
// =============================================================================

/**
 * @brief Событие цепочки отзывов
 */
struct FeedbackEvent {
    Pubkey asset{};
    Pubkey client{};
    uint64_t feedback_index{0};
    Digest seal_hash{};
    uint64_t slot{0};
    
    /// @brief Бегущий дайджест после события, как его записал индексатор
    std::optional<Digest> stored_digest;
};

/**
 * @brief Событие цепочки ответов
 */
struct ResponseEvent {
    Pubkey asset{};
    Pubkey client{};
    uint64_t feedback_index{0};
    Pubkey responder{};
    Digest response_hash{};
    Digest feedback_hash{};
    uint64_t slot{0};
    std::optional<Digest> stored_digest;
};

/**
 * @brief Событие цепочки отмен
 */
struct RevokeEvent {
    Pubkey asset{};
    Pubkey client{};
    uint64_t feedback_index{0};
    Digest feedback_hash{};
    uint64_t slot{0};
    std::optional<Digest> stored_digest;
};

// =============================================================================
// Состояние и результат
// =============================================================================

/**
 * @brief Состояние цепочки: дайджест и число событий
 * 
 * Также используется как контрольная точка.
 */
struct ChainState {
    Digest digest{};
    uint64_t count{0};
    
    bool operator==(const ChainState&) const = default;
};

/**
 * @brief Результат replay
 */
struct ReplayResult {
    /// @brief Дайджест после последнего обработанного события
    Digest final_digest{};
    
    /// @brief Начальный count плюс число обработанных событий
    uint64_t count{0};
    
    /// @brief false если найдено расхождение с сохранённым дайджестом
    bool valid{true};
    
    /// @brief Позиция расхождения во входной последовательности (с 0)
    std::optional<std::size_t> mismatch_at;
    
    /// @brief Сохранённый (ожидаемый) дайджест в точке расхождения
    std::optional<Digest> mismatch_expected;
    
    /// @brief Вычисленный дайджест в точке расхождения
    std::optional<Digest> mismatch_computed;
    
    /**
     * @brief Состояние после replay (для продолжения свёртки)
     */
    [[nodiscard]] ChainState state() const noexcept {
        return ChainState{final_digest, count};
    }
};

// =============================================================================
// Replay
// =============================================================================

/**
 * @brief Лист события (для любого вида цепочки)
 */
[[nodiscard]] Digest event_leaf(const FeedbackEvent& event) noexcept;
[[nodiscard]] Digest event_leaf(const ResponseEvent& event) noexcept;
[[nodiscard]] Digest event_leaf(const RevokeEvent& event) noexcept;

/**
 * @brief Replay цепочки отзывов
 * 
 * @param events События в порядке цепочки
 * @param start Начальное состояние (по умолчанию нулевой дайджест, count 0)
 */
[[nodiscard]] ReplayResult replay_feedback_chain(
    std::span<const FeedbackEvent> events,
    const ChainState& start = {}
) noexcept;

/**
 * @brief Replay цепочки ответов
 */
[[nodiscard]] ReplayResult replay_response_chain(
    std::span<const ResponseEvent> events,
    const ChainState& start = {}
) noexcept;

/**
 * @brief Replay цепочки отмен
 */
[[nodiscard]] ReplayResult replay_revoke_chain(
    std::span<const RevokeEvent> events,
    const ChainState& start = {}
) noexcept;

} // namespace sealchain::chain
