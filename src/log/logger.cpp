/**
 * @file logger.cpp
 * @brief Реализация консольного журнала
 */

#include "logger.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace sealchain::log {

std::optional<LogLevel> parse_log_level(std::string_view name) noexcept {
    if (name == "error") return LogLevel::Error;
    if (name == "warn" || name == "warning") return LogLevel::Warn;
    if (name == "info") return LogLevel::Info;
    if (name == "debug") return LogLevel::Debug;
    return std::nullopt;
}

Logger& Logger::instance() {
    static Logger instance;
    return instance;
}

void Logger::configure(const LoggerConfig& config) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_ = config;
    level_.store(static_cast<int>(config.level), std::memory_order_relaxed);
}

void Logger::set_sink(LogSink sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    sink_ = std::move(sink);
}

void Logger::write(LogLevel level, std::string_view message) {
    if (!enabled(level)) {
        return;
    }
    
    std::lock_guard<std::mutex> lock(mutex_);
    if (config_.console_output) {
        write_console(level, message);
    }
    if (sink_) {
        sink_(level, message);
    }
}

void Logger::write_console(LogLevel level, std::string_view message) {
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
    localtime_r(&time, &tm);
    
    std::ostringstream ss;
    ss << "[" << std::put_time(&tm, "%Y-%m-%d %H:%M:%S") << "] ";
    ss << "[" << log_level_to_string(level) << "] ";
    ss << message;
    
    const char* color = "";
    switch (level) {
        case LogLevel::Error: color = "\033[31m"; break;
        case LogLevel::Warn:  color = "\033[33m"; break;
        case LogLevel::Info:  color = "\033[32m"; break;
        case LogLevel::Debug: color = "\033[90m"; break;
    }
    
    std::ostream& out = std::cerr;
    if (config_.color) {
        out << color << ss.str() << "\033[0m" << std::endl;
    } else {
        out << ss.str() << std::endl;
    }
}

} // namespace sealchain::log
