/**
 * @file report.hpp
 * @brief Отчёты проверки целостности
 * 
 * Статус отчёта имеет строгий приоритет:
 *   error > corrupted > syncing > valid
 * 
 * - error: проверить не удалось (ввод/вывод, агент не найден,
 *   отрицательный lag, уменьшение on-chain счётчика)
 * - corrupted: доказано расхождение с on-chain состоянием
 * - syncing: индексатор согласован, но отстаёт
 * - valid: индексатор полностью совпадает с on-chain состоянием
 */

#pragma once

#include "types.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace sealchain::integrity {

// =============================================================================
// Статус
// =============================================================================

enum class IntegrityStatus : uint8_t {
    Valid = 0,      ///< Полное совпадение
    Syncing = 1,    ///< Индексатор отстаёт, расхождений нет
    Corrupted = 2,  ///< Обнаружено расхождение
    Error = 3       ///< Проверка не выполнена
};

[[nodiscard]] constexpr std::string_view to_string(IntegrityStatus status) noexcept {
    switch (status) {
        case IntegrityStatus::Valid:     return "valid";
        case IntegrityStatus::Syncing:   return "syncing";
        case IntegrityStatus::Corrupted: return "corrupted";
        case IntegrityStatus::Error:     return "error";
        default: return "unknown";
    }
}

/**
 * @brief Более приоритетный (худший) из двух статусов
 */
[[nodiscard]] constexpr IntegrityStatus worst(IntegrityStatus a, IntegrityStatus b) noexcept {
    return static_cast<uint8_t>(a) >= static_cast<uint8_t>(b) ? a : b;
}

// =============================================================================
// Deep verification
// =============================================================================

/**
 * @brief Сравнение голов цепочки: on-chain против индексатора
 */
struct HeadComparison {
    Digest onchain_digest{};
    uint64_t onchain_count{0};
    std::optional<Digest> indexer_digest;
    uint64_t indexer_count{0};
    
    /// @brief onchain_count - indexer_count (отрицательное значение = ошибка)
    int64_t lag{0};
    
    /// @brief Дайджесты совпадают (проверяется только при равных счётчиках)
    bool digest_match{false};
    bool count_match{false};
};

/**
 * @brief Результат проверки одной позиции
 */
struct SpotCheck {
    uint64_t position{0};
    bool exists{false};
    
    /// @brief Пересчитанный seal hash совпал с записанным (если проверялся)
    std::optional<bool> content_valid;
    
    /// @brief Пояснение (почему содержимое не проверено или не совпало)
    std::string note;
};

/**
 * @brief Отчёт вероятностной проверки
 */
struct DeepIntegrityReport {
    std::string agent;
    IntegrityStatus status{IntegrityStatus::Error};
    bool valid{false};
    
    PerChain<HeadComparison> heads;
    PerChain<std::vector<SpotCheck>> spot_checks;
    
    bool spot_checks_passed{false};
    
    /// @brief Количество отсутствующих записей (-1 при ошибке запроса)
    int64_t missing_items{0};
    
    /// @brief Количество записей с изменённым содержимым
    int64_t modified_items{0};
    
    std::string error_message;
    std::chrono::milliseconds duration{0};
};

// =============================================================================
// Full verification
// =============================================================================

/**
 * @brief Результат полного replay одной цепочки
 */
struct ChainReplayComparison {
    Digest computed_digest{};
    Digest expected_digest{};
    uint64_t computed_count{0};
    uint64_t expected_count{0};
    
    bool digest_match{false};
    bool count_match{false};
    
    /// @brief Все сохранённые индексатором дайджесты совпали с вычисленными
    bool replay_valid{true};
    
    /// @brief Позиция первого расхождения в цепочке (с 0)
    std::optional<uint64_t> mismatch_position;
    std::optional<Digest> mismatch_expected;
    std::optional<Digest> mismatch_computed;
    
    /// @brief Replay начат с контрольной точки индексатора
    bool checkpoint_used{false};
    
    int64_t lag{0};
    IntegrityStatus status{IntegrityStatus::Valid};
};

/**
 * @brief Отчёт полной (детерминированной) проверки
 */
struct FullIntegrityReport {
    std::string agent;
    IntegrityStatus status{IntegrityStatus::Error};
    bool valid{false};
    
    PerChain<ChainReplayComparison> chains;
    
    /// @brief Суммарный lag по трём цепочкам
    int64_t lag{0};
    bool checkpoints_used{false};
    
    std::string error_message;
    std::chrono::milliseconds duration{0};
};

// =============================================================================
// Форматирование
// =============================================================================

/**
 * @brief Человекочитаемый отчёт для консоли
 */
[[nodiscard]] std::string format_text(const DeepIntegrityReport& report);
[[nodiscard]] std::string format_text(const FullIntegrityReport& report);

/**
 * @brief JSON представление отчёта
 */
[[nodiscard]] std::string to_json(const DeepIntegrityReport& report);
[[nodiscard]] std::string to_json(const FullIntegrityReport& report);

} // namespace sealchain::integrity
