/**
 * @file report.cpp
 * @brief Форматирование отчётов проверки целостности
 */

#include "report.hpp"
#include "../core/hex.hpp"
#include "../core/json.hpp"

#include <format>
#include <sstream>

namespace sealchain::integrity {

namespace {

std::string opt_digest_hex(const std::optional<Digest>& digest) {
    return digest ? hex::to_hex(*digest) : std::string("-");
}

std::string json_opt_digest(const std::optional<Digest>& digest) {
    return digest ? std::format("\"{}\"", hex::to_hex(*digest)) : std::string("null");
}

const char* json_bool(bool value) {
    return value ? "true" : "false";
}

} // anonymous namespace

// =============================================================================
// Текст
// =============================================================================

std::string format_text(const DeepIntegrityReport& report) {
    std::ostringstream ss;
    ss << std::format("Агент:   {}\n", report.agent);
    ss << std::format("Режим:   deep\n");
    ss << std::format("Статус:  {}\n", to_string(report.status));
    if (!report.error_message.empty()) {
        ss << std::format("Ошибка:  {}\n", report.error_message);
    }
    
    for (auto kind : ALL_CHAINS) {
        const auto& head = report.heads[kind];
        ss << std::format("  [{}] on-chain {} @ {} | индексатор {} @ {} | lag {}\n",
                          chain::to_string(kind),
                          head.onchain_count, hex::to_hex(head.onchain_digest),
                          head.indexer_count, opt_digest_hex(head.indexer_digest),
                          head.lag);
        
        for (const auto& check : report.spot_checks[kind]) {
            ss << std::format("      #{}: {}", check.position,
                              check.exists ? "найдена" : "ОТСУТСТВУЕТ");
            if (check.content_valid) {
                ss << (*check.content_valid ? ", содержимое верно" : ", СОДЕРЖИМОЕ ИЗМЕНЕНО");
            }
            if (!check.note.empty()) {
                ss << " (" << check.note << ")";
            }
            ss << "\n";
        }
    }
    
    ss << std::format("Выборочные проверки: {} (отсутствует {}, изменено {})\n",
                      report.spot_checks_passed ? "пройдены" : "НЕ пройдены",
                      report.missing_items, report.modified_items);
    ss << std::format("Время:   {} мс\n", report.duration.count());
    return ss.str();
}

std::string format_text(const FullIntegrityReport& report) {
    std::ostringstream ss;
    ss << std::format("Агент:   {}\n", report.agent);
    ss << std::format("Режим:   full{}\n", report.checkpoints_used ? " (с контрольных точек)" : "");
    ss << std::format("Статус:  {}\n", to_string(report.status));
    if (!report.error_message.empty()) {
        ss << std::format("Ошибка:  {}\n", report.error_message);
    }
    
    for (auto kind : ALL_CHAINS) {
        const auto& c = report.chains[kind];
        ss << std::format("  [{}] {} | вычислено {} @ {} | on-chain {} @ {} | lag {}\n",
                          chain::to_string(kind), to_string(c.status),
                          c.computed_count, hex::to_hex(c.computed_digest),
                          c.expected_count, hex::to_hex(c.expected_digest),
                          c.lag);
        if (c.mismatch_position) {
            ss << std::format("      расхождение на позиции {}: ожидалось {}, вычислено {}\n",
                              *c.mismatch_position,
                              opt_digest_hex(c.mismatch_expected),
                              opt_digest_hex(c.mismatch_computed));
        }
    }
    
    ss << std::format("Lag:     {}\n", report.lag);
    ss << std::format("Время:   {} мс\n", report.duration.count());
    return ss.str();
}

// =============================================================================
// JSON
// =============================================================================

std::string to_json(const DeepIntegrityReport& report) {
    std::ostringstream json;
    json << "{\n";
    json << "  \"mode\": \"deep\",\n";
    json << "  \"agent\": \"" << json::escape(report.agent) << "\",\n";
    json << "  \"status\": \"" << to_string(report.status) << "\",\n";
    json << "  \"valid\": " << json_bool(report.valid) << ",\n";
    json << "  \"spotChecksPassed\": " << json_bool(report.spot_checks_passed) << ",\n";
    json << "  \"missingItems\": " << report.missing_items << ",\n";
    json << "  \"modifiedItems\": " << report.modified_items << ",\n";
    
    for (auto kind : ALL_CHAINS) {
        const auto& head = report.heads[kind];
        json << "  \"" << chain::to_string(kind) << "\": {\n";
        json << "    \"onChainDigest\": \"" << hex::to_hex(head.onchain_digest) << "\",\n";
        json << "    \"onChainCount\": " << head.onchain_count << ",\n";
        json << "    \"indexerDigest\": " << json_opt_digest(head.indexer_digest) << ",\n";
        json << "    \"indexerCount\": " << head.indexer_count << ",\n";
        json << "    \"lag\": " << head.lag << ",\n";
        json << "    \"digestMatch\": " << json_bool(head.digest_match) << ",\n";
        json << "    \"countMatch\": " << json_bool(head.count_match) << ",\n";
        json << "    \"spotChecks\": [";
        const auto& checks = report.spot_checks[kind];
        for (std::size_t i = 0; i < checks.size(); ++i) {
            const auto& check = checks[i];
            json << (i == 0 ? "" : ", ");
            json << "{\"position\": " << check.position
                 << ", \"exists\": " << json_bool(check.exists)
                 << ", \"contentValid\": "
                 << (check.content_valid ? json_bool(*check.content_valid) : "null")
                 << "}";
        }
        json << "]\n";
        json << "  },\n";
    }
    
    if (!report.error_message.empty()) {
        json << "  \"error\": \"" << json::escape(report.error_message) << "\",\n";
    }
    json << "  \"durationMs\": " << report.duration.count() << "\n";
    json << "}\n";
    return json.str();
}

std::string to_json(const FullIntegrityReport& report) {
    std::ostringstream json;
    json << "{\n";
    json << "  \"mode\": \"full\",\n";
    json << "  \"agent\": \"" << json::escape(report.agent) << "\",\n";
    json << "  \"status\": \"" << to_string(report.status) << "\",\n";
    json << "  \"valid\": " << json_bool(report.valid) << ",\n";
    json << "  \"lag\": " << report.lag << ",\n";
    json << "  \"checkpointsUsed\": " << json_bool(report.checkpoints_used) << ",\n";
    
    for (auto kind : ALL_CHAINS) {
        const auto& c = report.chains[kind];
        json << "  \"" << chain::to_string(kind) << "\": {\n";
        json << "    \"status\": \"" << to_string(c.status) << "\",\n";
        json << "    \"valid\": " << json_bool(c.replay_valid) << ",\n";
        json << "    \"computedDigest\": \"" << hex::to_hex(c.computed_digest) << "\",\n";
        json << "    \"expectedDigest\": \"" << hex::to_hex(c.expected_digest) << "\",\n";
        json << "    \"computedCount\": " << c.computed_count << ",\n";
        json << "    \"expectedCount\": " << c.expected_count << ",\n";
        json << "    \"match\": " << json_bool(c.digest_match && c.count_match) << ",\n";
        json << "    \"lag\": " << c.lag << ",\n";
        json << "    \"checkpointUsed\": " << json_bool(c.checkpoint_used) << ",\n";
        json << "    \"mismatchAt\": "
             << (c.mismatch_position ? std::to_string(*c.mismatch_position) : "null") << ",\n";
        json << "    \"mismatchExpected\": " << json_opt_digest(c.mismatch_expected) << ",\n";
        json << "    \"mismatchComputed\": " << json_opt_digest(c.mismatch_computed) << "\n";
        json << "  },\n";
    }
    
    if (!report.error_message.empty()) {
        json << "  \"error\": \"" << json::escape(report.error_message) << "\",\n";
    }
    json << "  \"durationMs\": " << report.duration.count() << "\n";
    json << "}\n";
    return json.str();
}

} // namespace sealchain::integrity
