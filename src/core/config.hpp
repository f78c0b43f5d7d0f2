/**
 * @file config.hpp
 * @brief Конфигурация sealchain
 * 
 * Загрузка и парсинг конфигурации из TOML файла.
 * 
 * Пример конфигурации (sealchain.toml):
 * @code
 * [indexer]
 * url = "https://indexer.example.org"
 * api_key = ""
 * timeout_ms = 10000
 * retries = 2
 * page_size = 1000
 * 
 * [onchain]
 * snapshot_path = "/var/lib/sealchain/heads.toml"
 * 
 * [verification]
 * spot_checks = 10
 * check_boundaries = true
 * verify_content = false
 * use_checkpoints = true
 * batch_size = 1000
 * # sample_seed = 42
 * 
 * [logging]
 * level = "info"
 * color = true
 * @endcode
 */

#pragma once

#include "types.hpp"
#include "constants.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace sealchain {

// =============================================================================
// Структуры конфигурации
// =============================================================================

/**
 * @brief Подключение к GraphQL индексатору
 */
struct IndexerConfig {
    /// @brief Базовый URL (запросы идут на <url>/graphql)
    std::string url;
    
    /// @brief Ключ API (заголовок x-api-key), пусто = без ключа
    std::string api_key;
    
    /// @brief Таймаут одного HTTP запроса (мс)
    uint32_t timeout_ms = constants::DEFAULT_INDEXER_TIMEOUT_MS;
    
    /// @brief Количество повторов после неудачной попытки
    uint32_t retries = constants::DEFAULT_INDEXER_RETRIES;
    
    /// @brief Размер страницы replay запросов (1-1000)
    uint32_t page_size = constants::MAX_BATCH_SIZE;
    
    /**
     * @brief URL GraphQL endpoint
     */
    [[nodiscard]] std::string get_graphql_url() const;
};

/**
 * @brief Источник on-chain состояния
 */
struct OnChainConfig {
    /// @brief Путь к TOML снимку голов цепочек
    std::string snapshot_path;
};

/**
 * @brief Параметры проверки по умолчанию
 */
struct VerificationConfig {
    uint32_t spot_checks = constants::DEFAULT_SPOT_CHECKS;
    bool check_boundaries = true;
    bool verify_content = false;
    bool use_checkpoints = true;
    uint32_t batch_size = constants::DEFAULT_BATCH_SIZE;
    
    /// @brief Зерно выборки позиций (для воспроизводимых прогонов)
    std::optional<uint64_t> sample_seed;
};

/**
 * @brief Настройки журнала
 */
struct LoggingConfig {
    /// @brief Уровень логирования: "error", "warn", "info", "debug"
    std::string level = "info";
    
    /// @brief Включить ANSI цвета
    bool color = true;
};

/**
 * @brief Полная конфигурация sealchain
 */
struct Config {
    IndexerConfig indexer;
    OnChainConfig onchain;
    VerificationConfig verification;
    LoggingConfig logging;
    
    /**
     * @brief Загрузить конфигурацию из TOML файла
     * 
     * @param path Путь к файлу конфигурации
     * @return Result<Config> Конфигурация или ошибка
     */
    [[nodiscard]] static Result<Config> load(const std::filesystem::path& path);
    
    /**
     * @brief Разобрать конфигурацию из текста TOML
     */
    [[nodiscard]] static Result<Config> parse(std::string_view text);
    
    /**
     * @brief Загрузить конфигурацию с поиском файла
     * 
     * Ищет файл в следующем порядке:
     * 1. Указанный путь
     * 2. ./sealchain.toml
     * 3. /etc/sealchain/sealchain.toml
     * 4. ~/.config/sealchain/sealchain.toml
     */
    [[nodiscard]] static Result<Config> load_with_search(
        const std::optional<std::filesystem::path>& path = std::nullopt
    );
    
    /**
     * @brief Валидация конфигурации
     * 
     * - URL индексатора непустой и http(s)
     * - Путь к снимку on-chain состояния указан
     * - Размеры страниц в диапазоне 1-1000
     * - Известный уровень логирования
     */
    [[nodiscard]] Result<void> validate() const;
};

} // namespace sealchain
