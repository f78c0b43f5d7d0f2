/**
 * @file config.cpp
 * @brief Реализация загрузки конфигурации
 * 
 * Использует библиотеку toml++ для парсинга TOML файлов.
 */

#include "config.hpp"
#include "../log/logger.hpp"

#include <toml++/toml.hpp>

#include <cstdlib>
#include <format>
#include <vector>

namespace sealchain {

namespace {

/**
 * @brief Прочитать неотрицательное целое в диапазоне uint32
 */
Result<void> read_u32(const toml::table& section, std::string_view section_name,
                      std::string_view key, uint32_t& out) {
    auto val = section[key].value<int64_t>();
    if (!val) {
        return {};
    }
    if (*val < 0 || *val > static_cast<int64_t>(UINT32_MAX)) {
        return Err<void>(
            ErrorCode::ConfigInvalidValue,
            std::format("{}.{}: значение {} вне допустимого диапазона", section_name, key, *val)
        );
    }
    out = static_cast<uint32_t>(*val);
    return {};
}

Result<Config> from_table(const toml::table& table) {
    Config config;
    
    // === Секция [indexer] ===
    if (auto indexer = table["indexer"].as_table()) {
        if (auto val = (*indexer)["url"].value<std::string>()) {
            config.indexer.url = *val;
        }
        if (auto val = (*indexer)["api_key"].value<std::string>()) {
            config.indexer.api_key = *val;
        }
        for (auto [key, field] : {
                 std::pair{"timeout_ms", &config.indexer.timeout_ms},
                 std::pair{"retries", &config.indexer.retries},
                 std::pair{"page_size", &config.indexer.page_size}}) {
            if (auto r = read_u32(*indexer, "indexer", key, *field); !r) {
                return std::unexpected(r.error());
            }
        }
    }
    
    // === Секция [onchain] ===
    if (auto onchain = table["onchain"].as_table()) {
        if (auto val = (*onchain)["snapshot_path"].value<std::string>()) {
            config.onchain.snapshot_path = *val;
        }
    }
    
    // === Секция [verification] ===
    if (auto verification = table["verification"].as_table()) {
        auto& v = config.verification;
        for (auto [key, field] : {
                 std::pair{"spot_checks", &v.spot_checks},
                 std::pair{"batch_size", &v.batch_size}}) {
            if (auto r = read_u32(*verification, "verification", key, *field); !r) {
                return std::unexpected(r.error());
            }
        }
        if (auto val = (*verification)["check_boundaries"].value<bool>()) {
            v.check_boundaries = *val;
        }
        if (auto val = (*verification)["verify_content"].value<bool>()) {
            v.verify_content = *val;
        }
        if (auto val = (*verification)["use_checkpoints"].value<bool>()) {
            v.use_checkpoints = *val;
        }
        if (auto val = (*verification)["sample_seed"].value<int64_t>()) {
            v.sample_seed = static_cast<uint64_t>(*val);
        }
    }
    
    // === Секция [logging] ===
    if (auto logging = table["logging"].as_table()) {
        if (auto val = (*logging)["level"].value<std::string>()) {
            config.logging.level = *val;
        }
        if (auto val = (*logging)["color"].value<bool>()) {
            config.logging.color = *val;
        }
    }
    
    return config;
}

} // anonymous namespace

// =============================================================================
// IndexerConfig
// =============================================================================

std::string IndexerConfig::get_graphql_url() const {
    std::string base = url;
    while (!base.empty() && base.back() == '/') {
        base.pop_back();
    }
    if (base.ends_with("/graphql")) {
        return base;
    }
    return base + "/graphql";
}

// =============================================================================
// Config - Загрузка
// =============================================================================

Result<Config> Config::load(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return Err<Config>(
            ErrorCode::ConfigNotFound,
            std::format("Файл конфигурации не найден: {}", path.string())
        );
    }
    
    try {
        auto table = toml::parse_file(path.string());
        log::debug("Конфигурация загружена из {}", path.string());
        return from_table(table);
    } catch (const toml::parse_error& e) {
        return Err<Config>(
            ErrorCode::ConfigParseError,
            std::format("Ошибка парсинга TOML: {}", e.what())
        );
    }
}

Result<Config> Config::parse(std::string_view text) {
    try {
        auto table = toml::parse(text);
        return from_table(table);
    } catch (const toml::parse_error& e) {
        return Err<Config>(
            ErrorCode::ConfigParseError,
            std::format("Ошибка парсинга TOML: {}", e.what())
        );
    }
}

Result<Config> Config::load_with_search(
    const std::optional<std::filesystem::path>& path
) {
    // Явно указанный путь не подменяется стандартными
    if (path.has_value()) {
        return load(*path);
    }
    
    std::vector<std::filesystem::path> search_paths;
    search_paths.push_back("sealchain.toml");
    search_paths.push_back("/etc/sealchain/sealchain.toml");
    
    if (const char* home = std::getenv("HOME")) {
        search_paths.push_back(
            std::filesystem::path(home) / ".config" / "sealchain" / "sealchain.toml"
        );
    }
    
    for (const auto& search_path : search_paths) {
        if (std::filesystem::exists(search_path)) {
            return load(search_path);
        }
    }
    
    return Err<Config>(
        ErrorCode::ConfigNotFound,
        "Файл конфигурации не найден в стандартных путях"
    );
}

// =============================================================================
// Config - Валидация
// =============================================================================

Result<void> Config::validate() const {
    if (indexer.url.empty()) {
        return Err<void>(ErrorCode::ConfigInvalidValue, "Не указан URL индексатора (indexer.url)");
    }
    
    if (!indexer.url.starts_with("http://") && !indexer.url.starts_with("https://")) {
        return Err<void>(
            ErrorCode::ConfigInvalidValue,
            "indexer.url должен начинаться с http:// или https://"
        );
    }
    
    if (indexer.timeout_ms == 0) {
        return Err<void>(ErrorCode::ConfigInvalidValue, "indexer.timeout_ms не может быть 0");
    }
    
    if (indexer.page_size < 1 || indexer.page_size > constants::MAX_BATCH_SIZE) {
        return Err<void>(
            ErrorCode::ConfigInvalidValue,
            std::format("indexer.page_size должен быть от 1 до {}", constants::MAX_BATCH_SIZE)
        );
    }
    
    if (onchain.snapshot_path.empty()) {
        return Err<void>(
            ErrorCode::ConfigInvalidValue,
            "Не указан источник on-chain состояния (onchain.snapshot_path)"
        );
    }
    
    if (verification.batch_size < 1 || verification.batch_size > constants::MAX_BATCH_SIZE) {
        return Err<void>(
            ErrorCode::ConfigInvalidValue,
            std::format("verification.batch_size должен быть от 1 до {}", constants::MAX_BATCH_SIZE)
        );
    }
    
    if (!log::parse_log_level(logging.level)) {
        return Err<void>(
            ErrorCode::ConfigInvalidValue,
            std::format("Неизвестный уровень логирования: '{}'", logging.level)
        );
    }
    
    return {};
}

} // namespace sealchain
