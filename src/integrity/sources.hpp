/**
 * @file sources.hpp
 * @brief Абстрактные источники данных для проверки целостности
 * 
 * Оркестратор зависит только от этих интерфейсов. Реализации:
 * - indexer::GraphqlIndexerClient (HTTP, libcurl)
 * - onchain::SnapshotOnChainSource (TOML снимок on-chain состояния)
 * - тестовые in-memory источники
 * 
 * Реализации должны допускать одновременные вызовы из нескольких потоков:
 * оркестратор выполняет независимые запросы параллельно.
 */

#pragma once

#include "types.hpp"

#include <span>
#include <string_view>

namespace sealchain::integrity {

/**
 * @brief Источник авторитетного on-chain состояния
 */
class IOnChainSource {
public:
    virtual ~IOnChainSource() = default;
    
    /**
     * @brief Получить (digest, count) трёх цепочек агента
     * 
     * @param agent Asset агента (base58)
     * @return nullopt если агент не найден; ошибка при сбое ввода/вывода
     */
    [[nodiscard]] virtual Result<std::optional<OnChainHeads>> get_chain_heads(
        std::string_view agent) = 0;
};

/**
 * @brief Источник данных индексатора
 */
class IIndexerSource {
public:
    virtual ~IIndexerSource() = default;
    
    /**
     * @brief Последний дайджест и количество событий по каждой цепочке
     */
    [[nodiscard]] virtual Result<IndexerHeads> get_chain_heads(std::string_view agent) = 0;
    
    /**
     * @brief Последние контрольные точки индексатора
     */
    [[nodiscard]] virtual Result<CheckpointSet> get_latest_checkpoints(std::string_view agent) = 0;
    
    /**
     * @brief Страница упорядоченных событий цепочки
     * 
     * @param from_count Позиция первого события (с 0)
     * @param to_count Позиция, до которой читать (не включительно)
     * @param limit Максимальный размер страницы
     */
    [[nodiscard]] virtual Result<ReplayPage> get_replay_page(
        std::string_view agent,
        chain::ChainKind kind,
        uint64_t from_count,
        uint64_t to_count,
        uint32_t limit) = 0;
    
    /**
     * @brief Точечные записи на заданных позициях цепочки
     * 
     * @param positions Позиции (с 0)
     * @param with_content Запросить содержимое отзывов для пересчёта seal hash
     * @return Карта, содержащая каждую запрошенную позицию
     */
    [[nodiscard]] virtual Result<SpotRecordMap> get_spot_records(
        std::string_view agent,
        chain::ChainKind kind,
        std::span<const uint64_t> positions,
        bool with_content) = 0;
};

} // namespace sealchain::integrity
