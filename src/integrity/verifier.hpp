/**
 * @file verifier.hpp
 * @brief Оркестратор проверки целостности индексатора
 * 
 * Два режима:
 * - deep: сравнение голов цепочек и выборочная проверка записей
 *   (дёшево, вероятностно);
 * - full: полный replay всех событий и сравнение с on-chain состоянием
 *   (дорого, авторитетно).
 * 
 * Проверка не имеет побочных эффектов. On-chain и индексаторные сводки
 * запрашиваются параллельно и сравниваются после получения обеих.
 * 
 * @code
 * integrity::IntegrityVerifier verifier(onchain, indexer, config);
 * auto report = verifier.verify_full(asset);
 * if (report.status == integrity::IntegrityStatus::Corrupted) { ... }
 * @endcode
 */

#pragma once

#include "report.hpp"
#include "sources.hpp"
#include "../core/constants.hpp"

#include <functional>
#include <mutex>
#include <optional>
#include <random>
#include <string_view>

namespace sealchain::integrity {

/**
 * @brief Callback прогресса полного replay
 * 
 * @param kind Цепочка
 * @param processed Обработано событий (включая контрольную точку)
 * @param total Количество событий on-chain
 */
using ProgressCallback = std::function<void(chain::ChainKind kind, uint64_t processed, uint64_t total)>;

/**
 * @brief Параметры по умолчанию (из секции [verification])
 */
struct VerifierConfig {
    uint32_t spot_checks{constants::DEFAULT_SPOT_CHECKS};
    bool check_boundaries{true};
    bool verify_content{false};
    bool use_checkpoints{true};
    uint32_t batch_size{constants::DEFAULT_BATCH_SIZE};
    
    /// @brief Зерно генератора выборки (nullopt = случайное)
    std::optional<uint64_t> sample_seed;
};

/**
 * @brief Параметры deep проверки
 */
struct DeepOptions {
    /// @brief Количество дополнительных позиций сверх граничных
    uint32_t spot_checks{constants::DEFAULT_SPOT_CHECKS};
    
    /// @brief Всегда проверять позиции 0 и count-1
    bool check_boundaries{true};
    
    /// @brief Пересчитывать seal hash проиндексированных отзывов
    bool verify_content{false};
    
    /// @brief Ранее наблюдавшееся on-chain состояние (для обнаружения уменьшения счётчиков)
    std::optional<OnChainHeads> previous_heads;
};

/**
 * @brief Параметры full проверки
 */
struct FullOptions {
    /// @brief Продолжать replay с последней контрольной точки индексатора
    bool use_checkpoints{true};
    
    /// @brief Размер страницы replay данных (1-1000)
    uint32_t batch_size{constants::DEFAULT_BATCH_SIZE};
    
    std::optional<OnChainHeads> previous_heads;
    
    ProgressCallback on_progress;
};

/**
 * @brief Оркестратор проверки целостности
 * 
 * Источники передаются по ссылке и должны жить дольше оркестратора.
 */
class IntegrityVerifier {
public:
    IntegrityVerifier(IOnChainSource& onchain, IIndexerSource& indexer, VerifierConfig config = {});
    
    IntegrityVerifier(const IntegrityVerifier&) = delete;
    IntegrityVerifier& operator=(const IntegrityVerifier&) = delete;
    
    /**
     * @brief Параметры deep проверки из конфигурации
     */
    [[nodiscard]] DeepOptions default_deep_options() const;
    
    /**
     * @brief Параметры full проверки из конфигурации
     */
    [[nodiscard]] FullOptions default_full_options() const;
    
    /**
     * @brief Вероятностная проверка агента
     */
    [[nodiscard]] DeepIntegrityReport verify_deep(std::string_view agent);
    [[nodiscard]] DeepIntegrityReport verify_deep(std::string_view agent, const DeepOptions& options);
    
    /**
     * @brief Полная проверка агента replay всех событий
     */
    [[nodiscard]] FullIntegrityReport verify_full(std::string_view agent);
    [[nodiscard]] FullIntegrityReport verify_full(std::string_view agent, const FullOptions& options);

private:
    IOnChainSource& onchain_;
    IIndexerSource& indexer_;
    VerifierConfig config_;
    
    std::mutex rng_mutex_;
    std::mt19937_64 rng_;
    
    /**
     * @brief Replay одной цепочки от контрольной точки до on-chain count
     */
    [[nodiscard]] Result<ChainReplayComparison> replay_chain(
        std::string_view agent,
        chain::ChainKind kind,
        const chain::ChainState& expected,
        const std::optional<chain::ChainState>& checkpoint,
        const FullOptions& options);
    
    /**
     * @brief Проверить записи индексатора на выбранных позициях
     */
    void evaluate_spot_checks(
        chain::ChainKind kind,
        const std::vector<uint64_t>& positions,
        const SpotRecordMap& records,
        const HeadComparison& head,
        bool verify_content,
        DeepIntegrityReport& report) const;
};

/**
 * @brief Проверить, что on-chain счётчики не уменьшились
 * 
 * @return Ошибка IntegrityCountRegression с указанием цепочки
 */
[[nodiscard]] Result<void> check_count_regression(const OnChainHeads& current,
                                                  const OnChainHeads& previous);

} // namespace sealchain::integrity
