/**
 * @file graphql_client.hpp
 * @brief GraphQL клиент индексатора реестра агентов
 * 
 * Реализует integrity::IIndexerSource поверх HTTP POST запросов
 * {"query": ..., "variables": ...} к <url>/graphql.
 * Использует libcurl для HTTP запросов.
 * 
 * Используемые запросы:
 * - hashChainHeads: последний дайджест и количество событий по цепочкам
 * - hashChainLatestCheckpoints: последние контрольные точки
 * - hashChainReplayData: постраничные события для replay
 * - feedback(id): содержимое отзыва для пересчёта seal hash
 * 
 * Разбор ответов вынесен в свободные функции, чтобы его можно было
 * тестировать без сети.
 */

#pragma once

#include "../core/config.hpp"
#include "../integrity/sources.hpp"

#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace sealchain::indexer {

// =============================================================================
// Разбор ответов
// =============================================================================

/**
 * @brief Значение перечисления HashChainType
 * 
 * @return "FEEDBACK", "RESPONSE" или "REVOKE"
 */
[[nodiscard]] std::string_view chain_type_name(chain::ChainKind kind) noexcept;

/**
 * @brief Тело GraphQL запроса
 * 
 * @param query Текст запроса
 * @param variables_json Готовый JSON объект переменных
 */
[[nodiscard]] std::string build_request_body(std::string_view query, std::string_view variables_json);

/**
 * @brief Извлечь объект data из ответа
 * 
 * Непустой массив errors и отсутствующий data дают IndexerInvalidResponse.
 */
[[nodiscard]] Result<std::string_view> extract_data(std::string_view response);

[[nodiscard]] Result<integrity::IndexerHeads> parse_heads_response(std::string_view data);

[[nodiscard]] Result<integrity::CheckpointSet> parse_checkpoints_response(std::string_view data);

/**
 * @brief Разобрать страницу hashChainReplayData
 * 
 * @param from_count Позиция запроса; без nextFromCount курсор считается
 *        равным from_count + количество событий
 */
[[nodiscard]] Result<integrity::ReplayPage> parse_replay_page_response(
    std::string_view data, uint64_t from_count);

/**
 * @brief Разобрать содержимое отзыва из запроса feedback(id)
 * 
 * @return nullopt если отзыв не найден
 */
[[nodiscard]] Result<std::optional<seal::SealParams>> parse_feedback_content_response(
    std::string_view data);

// =============================================================================
// GraphqlIndexerClient
// =============================================================================

/**
 * @brief Клиент GraphQL индексатора
 * 
 * Каждый запрос использует собственный CURL handle, поэтому методы
 * можно вызывать одновременно из нескольких потоков.
 */
class GraphqlIndexerClient final : public integrity::IIndexerSource {
public:
    explicit GraphqlIndexerClient(const IndexerConfig& config);
    ~GraphqlIndexerClient() override;
    
    GraphqlIndexerClient(const GraphqlIndexerClient&) = delete;
    GraphqlIndexerClient& operator=(const GraphqlIndexerClient&) = delete;
    
    GraphqlIndexerClient(GraphqlIndexerClient&&) noexcept;
    GraphqlIndexerClient& operator=(GraphqlIndexerClient&&) noexcept;
    
    [[nodiscard]] Result<integrity::IndexerHeads> get_chain_heads(std::string_view agent) override;
    
    [[nodiscard]] Result<integrity::CheckpointSet> get_latest_checkpoints(std::string_view agent) override;
    
    [[nodiscard]] Result<integrity::ReplayPage> get_replay_page(
        std::string_view agent,
        chain::ChainKind kind,
        uint64_t from_count,
        uint64_t to_count,
        uint32_t limit) override;
    
    [[nodiscard]] Result<integrity::SpotRecordMap> get_spot_records(
        std::string_view agent,
        chain::ChainKind kind,
        std::span<const uint64_t> positions,
        bool with_content) override;
    
    /**
     * @brief Проверить доступность индексатора (query { __typename })
     */
    [[nodiscard]] Result<void> ping();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace sealchain::indexer
