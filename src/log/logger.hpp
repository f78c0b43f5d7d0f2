/**
 * @file logger.hpp
 * @brief Консольный журнал событий
 * 
 * Формат строки:
 *   [2026-01-01 12:00:00] [INFO] сообщение
 * 
 * Уровни error/warn/info/debug. Все сообщения пишутся в stderr,
 * чтобы stdout оставался чистым для отчётов (--json).
 */

#pragma once

#include <atomic>
#include <format>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace sealchain::log {

// =============================================================================
// Уровни
// =============================================================================

enum class LogLevel {
    Error = 0,
    Warn = 1,
    Info = 2,
    Debug = 3
};

[[nodiscard]] constexpr std::string_view log_level_to_string(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Error: return "ERROR";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Debug: return "DEBUG";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Разобрать уровень из конфигурации ("error", "warn", "info", "debug")
 */
[[nodiscard]] std::optional<LogLevel> parse_log_level(std::string_view name) noexcept;

/**
 * @brief Получатель сообщений (дополнительно к консоли)
 */
using LogSink = std::function<void(LogLevel level, std::string_view message)>;

/**
 * @brief Настройки журнала
 */
struct LoggerConfig {
    LogLevel level{LogLevel::Info};
    bool color{true};
    bool console_output{true};
};

// =============================================================================
// Logger
// =============================================================================

/**
 * @brief Журнал процесса (единственный экземпляр)
 */
class Logger {
public:
    static Logger& instance();
    
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    
    void configure(const LoggerConfig& config);
    
    /**
     * @brief Установить дополнительный получатель (nullptr для отключения)
     */
    void set_sink(LogSink sink);
    
    [[nodiscard]] bool enabled(LogLevel level) const noexcept {
        return static_cast<int>(level) <= level_.load(std::memory_order_relaxed);
    }
    
    void write(LogLevel level, std::string_view message);

private:
    Logger() = default;
    
    void write_console(LogLevel level, std::string_view message);
    
    std::mutex mutex_;
    LoggerConfig config_;
    LogSink sink_;
    std::atomic<int> level_{static_cast<int>(LogLevel::Info)};
};

// =============================================================================
// Удобные функции
// =============================================================================

template<typename... Args>
void error(std::format_string<Args...> fmt, Args&&... args) {
    auto& logger = Logger::instance();
    if (logger.enabled(LogLevel::Error)) {
        logger.write(LogLevel::Error, std::format(fmt, std::forward<Args>(args)...));
    }
}

template<typename... Args>
void warn(std::format_string<Args...> fmt, Args&&... args) {
    auto& logger = Logger::instance();
    if (logger.enabled(LogLevel::Warn)) {
        logger.write(LogLevel::Warn, std::format(fmt, std::forward<Args>(args)...));
    }
}

template<typename... Args>
void info(std::format_string<Args...> fmt, Args&&... args) {
    auto& logger = Logger::instance();
    if (logger.enabled(LogLevel::Info)) {
        logger.write(LogLevel::Info, std::format(fmt, std::forward<Args>(args)...));
    }
}

template<typename... Args>
void debug(std::format_string<Args...> fmt, Args&&... args) {
    auto& logger = Logger::instance();
    if (logger.enabled(LogLevel::Debug)) {
        logger.write(LogLevel::Debug, std::format(fmt, std::forward<Args>(args)...));
    }
}

} // namespace sealchain::log
