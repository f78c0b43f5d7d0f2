/**
 * @file main.cpp
 * @brief Точка входа sealchain-verify
 * 
 * Проверяет, что история событий агента, отданная индексатором,
 * согласована с on-chain хеш-цепочками.
 * 
 * Использование:
 *   sealchain-verify -a ASSET [options]
 * 
 * Коды возврата:
 *   0  valid
 *   1  syncing
 *   2  corrupted
 *   3  error
 *   64 ошибка аргументов
 */

#include "core/types.hpp"
#include "core/config.hpp"
#include "indexer/graphql_client.hpp"
#include "integrity/verifier.hpp"
#include "log/logger.hpp"
#include "onchain/snapshot_source.hpp"

#include <charconv>
#include <format>
#include <iostream>
#include <optional>
#include <string>

namespace {

/// @brief Версия программы
constexpr std::string_view VERSION = "1.0.0";

constexpr int EXIT_USAGE = 64;

/**
 * @brief Вывести справку
 */
void print_help() {
    std::cout << R"(
sealchain-verify v)" << VERSION << R"(
Проверка целостности данных индексатора по on-chain хеш-цепочкам

ИСПОЛЬЗОВАНИЕ:
    sealchain-verify -a ASSET [ОПЦИИ]

ОПЦИИ:
    -c, --config PATH      Путь к файлу конфигурации (sealchain.toml)
    -a, --agent ASSET      Asset агента (base58)
    --full                 Полный replay всех событий вместо выборочной проверки
    --json                 Вывести отчёт в JSON
    --no-checkpoints       Не использовать контрольные точки индексатора
    --verify-content       Пересчитывать seal hash проиндексированных отзывов
    --spot-checks N        Количество дополнительных выборочных позиций
    --test-config          Проверить конфигурацию и выйти
    --test-indexer         Проверить подключение к индексатору и выйти
    -h, --help             Показать эту справку
    -v, --version          Показать версию программы

КОДЫ ВОЗВРАТА:
    0 valid, 1 syncing, 2 corrupted, 3 error, 64 ошибка аргументов

ПРИМЕРЫ:
    sealchain-verify -a CVDFLCAjXhVWiPXH9nTCTpCgVzmDVoiPzNJYuccr1dqB
    sealchain-verify -c /etc/sealchain/sealchain.toml -a <asset> --full --json

)";
}

/**
 * @brief Вывести версию
 */
void print_version() {
    std::cout << "sealchain-verify v" << VERSION << std::endl;
}

/**
 * @brief Аргументы командной строки
 */
struct Args {
    std::optional<std::string> config_path;
    std::optional<std::string> agent;
    std::optional<uint32_t> spot_checks;
    bool full = false;
    bool json = false;
    bool no_checkpoints = false;
    bool verify_content = false;
    bool test_config = false;
    bool test_indexer = false;
    bool show_help = false;
    bool show_version = false;
    
    /// @brief Описание ошибки разбора (пусто если аргументы корректны)
    std::string error;
};

Args parse_args(int argc, char* argv[]) {
    Args args;
    
    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];
        const bool has_value = i + 1 < argc;
        
        if (arg == "-h" || arg == "--help") {
            args.show_help = true;
        } else if (arg == "-v" || arg == "--version") {
            args.show_version = true;
        } else if (arg == "--full") {
            args.full = true;
        } else if (arg == "--json") {
            args.json = true;
        } else if (arg == "--no-checkpoints") {
            args.no_checkpoints = true;
        } else if (arg == "--verify-content") {
            args.verify_content = true;
        } else if (arg == "--test-config") {
            args.test_config = true;
        } else if (arg == "--test-indexer") {
            args.test_indexer = true;
        } else if ((arg == "-c" || arg == "--config") && has_value) {
            args.config_path = argv[++i];
        } else if ((arg == "-a" || arg == "--agent") && has_value) {
            args.agent = argv[++i];
        } else if (arg == "--spot-checks" && has_value) {
            std::string_view value = argv[++i];
            uint32_t n = 0;
            auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), n);
            if (ec != std::errc{} || ptr != value.data() + value.size()) {
                args.error = std::format("Некорректное значение --spot-checks: {}", value);
                return args;
            }
            args.spot_checks = n;
        } else {
            args.error = std::format("Неизвестный аргумент: {}", arg);
            return args;
        }
    }
    
    return args;
}

int exit_code(sealchain::integrity::IntegrityStatus status) {
    return static_cast<int>(status);
}

} // anonymous namespace

/**
 * @brief Главная функция
 */
int main(int argc, char* argv[]) {
    using namespace sealchain;
    
    auto args = parse_args(argc, argv);
    
    if (!args.error.empty()) {
        std::cerr << "[ERROR] " << args.error << std::endl;
        std::cerr << "Используйте --help для справки" << std::endl;
        return EXIT_USAGE;
    }
    
    if (args.show_help) {
        print_help();
        return 0;
    }
    
    if (args.show_version) {
        print_version();
        return 0;
    }
    
    // Загружаем конфигурацию
    auto config_result = Config::load_with_search(
        args.config_path ? std::optional<std::filesystem::path>(*args.config_path) : std::nullopt);
    
    if (!config_result) {
        std::cerr << "[ERROR] " << config_result.error().message << std::endl;
        return exit_code(integrity::IntegrityStatus::Error);
    }
    
    Config config = *config_result;
    
    auto validation = config.validate();
    if (!validation) {
        std::cerr << "[ERROR] Ошибка валидации конфигурации: "
                  << validation.error().message << std::endl;
        return exit_code(integrity::IntegrityStatus::Error);
    }
    
    log::LoggerConfig log_config;
    log_config.level = log::parse_log_level(config.logging.level).value_or(log::LogLevel::Info);
    log_config.color = config.logging.color;
    log::Logger::instance().configure(log_config);
    
    if (args.test_config) {
        log::info("Конфигурация валидна");
        return 0;
    }
    
    indexer::GraphqlIndexerClient indexer(config.indexer);
    
    if (args.test_indexer) {
        if (auto ping = indexer.ping(); !ping) {
            log::error("Индексатор {} недоступен: {}", config.indexer.get_graphql_url(),
                       ping.error().message);
            return exit_code(integrity::IntegrityStatus::Error);
        }
        log::info("Подключение к индексатору {} успешно", config.indexer.get_graphql_url());
        return 0;
    }
    
    if (!args.agent || args.agent->empty()) {
        std::cerr << "[ERROR] Не указан агент (-a ASSET)" << std::endl;
        return EXIT_USAGE;
    }
    
    // Источники данных
    auto onchain = onchain::SnapshotOnChainSource::load(config.onchain.snapshot_path);
    if (!onchain) {
        log::error("{}", onchain.error().message);
        return exit_code(integrity::IntegrityStatus::Error);
    }
    
    integrity::VerifierConfig verifier_config;
    verifier_config.spot_checks = config.verification.spot_checks;
    verifier_config.check_boundaries = config.verification.check_boundaries;
    verifier_config.verify_content = config.verification.verify_content;
    verifier_config.use_checkpoints = config.verification.use_checkpoints;
    verifier_config.batch_size = config.verification.batch_size;
    verifier_config.sample_seed = config.verification.sample_seed;
    
    integrity::IntegrityVerifier verifier(*onchain, indexer, verifier_config);
    
    integrity::IntegrityStatus status = integrity::IntegrityStatus::Error;
    
    if (args.full) {
        auto options = verifier.default_full_options();
        if (args.no_checkpoints) {
            options.use_checkpoints = false;
        }
        options.on_progress = [](chain::ChainKind kind, uint64_t processed, uint64_t total) {
            log::debug("Replay {}: {}/{}", chain::to_string(kind), processed, total);
        };
        
        auto report = verifier.verify_full(*args.agent, options);
        std::cout << (args.json ? integrity::to_json(report) : integrity::format_text(report))
                  << std::endl;
        status = report.status;
    } else {
        auto options = verifier.default_deep_options();
        if (args.spot_checks) {
            options.spot_checks = *args.spot_checks;
        }
        if (args.verify_content) {
            options.verify_content = true;
        }
        
        auto report = verifier.verify_deep(*args.agent, options);
        std::cout << (args.json ? integrity::to_json(report) : integrity::format_text(report))
                  << std::endl;
        status = report.status;
    }
    
    return exit_code(status);
}
