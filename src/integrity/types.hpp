/**
 * @file types.hpp
 * @brief Данные, которыми обмениваются оркестратор и внешние источники
 * 
 * On-chain источник отдаёт по паре (digest, count) на цепочку.
 * Индексатор отдаёт быстрые "головы" цепочек, контрольные точки,
 * постраничные события для replay и точечные записи для выборочных проверок.
 */

#pragma once

#include "../chain/hash_chain.hpp"
#include "../chain/replay.hpp"
#include "../core/types.hpp"
#include "../seal/seal.hpp"

#include <array>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace sealchain::integrity {

/// @brief Все виды цепочек в порядке отчёта
inline constexpr std::array<chain::ChainKind, 3> ALL_CHAINS = {
    chain::ChainKind::Feedback,
    chain::ChainKind::Response,
    chain::ChainKind::Revoke,
};

/**
 * @brief Значение для каждой из трёх цепочек агента
 * 
 * Цепочки независимы: значение одной никогда не влияет на другую.
 */
template<typename T>
struct PerChain {
    T feedback{};
    T response{};
    T revoke{};
    
    [[nodiscard]] T& operator[](chain::ChainKind kind) noexcept {
        switch (kind) {
            case chain::ChainKind::Response: return response;
            case chain::ChainKind::Revoke:   return revoke;
            default:                         return feedback;
        }
    }
    
    [[nodiscard]] const T& operator[](chain::ChainKind kind) const noexcept {
        switch (kind) {
            case chain::ChainKind::Response: return response;
            case chain::ChainKind::Revoke:   return revoke;
            default:                         return feedback;
        }
    }
};

// =============================================================================
// Головы цепочек
// =============================================================================

/**
 * @brief Авторитетное on-chain состояние агента
 * 
 * Пустая цепочка имеет нулевой дайджест и count 0.
 */
using OnChainHeads = PerChain<chain::ChainState>;

/**
 * @brief Последнее состояние цепочки по версии индексатора
 */
struct IndexerHead {
    /// @brief Последний бегущий дайджест (нет для пустой цепочки)
    std::optional<Digest> digest;
    
    /// @brief Количество проиндексированных событий
    uint64_t count{0};
};

using IndexerHeads = PerChain<IndexerHead>;

/**
 * @brief Последние контрольные точки индексатора (могут отсутствовать)
 */
using CheckpointSet = PerChain<std::optional<chain::ChainState>>;

// =============================================================================
// Replay данные
// =============================================================================

/**
 * @brief Событие цепочки в том виде, в котором его отдаёт индексатор
 * 
 * Идентификаторы в base58, хеши в hex. Для цепочки отзывов
 * feedback_hash содержит seal hash отзыва.
 */
struct ReplayRecord {
    std::string asset;
    std::string client;
    uint64_t feedback_index{0};
    uint64_t slot{0};
    std::optional<std::string> running_digest;
    std::optional<std::string> feedback_hash;
    std::optional<std::string> responder;
    std::optional<std::string> response_hash;
};

/**
 * @brief Страница replay данных
 */
struct ReplayPage {
    std::vector<ReplayRecord> events;
    bool has_more{false};
    
    /// @brief Позиция, с которой запрашивать следующую страницу
    uint64_t next_from_count{0};
};

// =============================================================================
// Выборочные проверки
// =============================================================================

/**
 * @brief Запись, найденная индексатором на заданной позиции цепочки
 */
struct SpotRecord {
    /// @brief Бегущий дайджест после события
    std::optional<Digest> running_digest;
    
    /// @brief Хеш содержимого (seal hash / response hash / feedback hash)
    std::optional<Digest> content_hash;
    
    /// @brief Проиндексированное содержимое отзыва (только цепочка отзывов)
    std::optional<seal::SealParams> content;
};

/**
 * @brief Результат точечного запроса: позиция -> запись (nullopt = отсутствует)
 */
using SpotRecordMap = std::map<uint64_t, std::optional<SpotRecord>>;

} // namespace sealchain::integrity
