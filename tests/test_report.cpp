/**
 * @file test_report.cpp
 * @brief Тесты статусов и форматирования отчётов
 */

#include <gtest/gtest.h>

#include "integrity/report.hpp"
#include "core/hex.hpp"

namespace sealchain::tests {

using integrity::IntegrityStatus;

// =============================================================================
// Статусы
// =============================================================================

TEST(ReportTest, StatusNames) {
    EXPECT_EQ(integrity::to_string(IntegrityStatus::Valid), "valid");
    EXPECT_EQ(integrity::to_string(IntegrityStatus::Syncing), "syncing");
    EXPECT_EQ(integrity::to_string(IntegrityStatus::Corrupted), "corrupted");
    EXPECT_EQ(integrity::to_string(IntegrityStatus::Error), "error");
}

/**
 * @brief Тест: приоритет error > corrupted > syncing > valid
 */
TEST(ReportTest, WorstStatusPrecedence) {
    using integrity::worst;
    EXPECT_EQ(worst(IntegrityStatus::Valid, IntegrityStatus::Syncing), IntegrityStatus::Syncing);
    EXPECT_EQ(worst(IntegrityStatus::Corrupted, IntegrityStatus::Syncing), IntegrityStatus::Corrupted);
    EXPECT_EQ(worst(IntegrityStatus::Corrupted, IntegrityStatus::Error), IntegrityStatus::Error);
    EXPECT_EQ(worst(IntegrityStatus::Valid, IntegrityStatus::Valid), IntegrityStatus::Valid);
    
    // Числовое значение статуса используется как код возврата CLI
    EXPECT_EQ(static_cast<int>(IntegrityStatus::Error), 3);
}

// =============================================================================
// Deep
// =============================================================================

TEST(ReportTest, DeepJsonContainsCounters) {
    integrity::DeepIntegrityReport report;
    report.agent = "Agent\"1";
    report.status = IntegrityStatus::Corrupted;
    report.missing_items = 1;
    report.modified_items = 2;
    report.heads.feedback.onchain_count = 3;
    report.heads.feedback.indexer_count = 3;
    report.spot_checks.feedback.push_back({0, true, true, ""});
    report.spot_checks.feedback.push_back({2, false, std::nullopt, ""});
    
    auto json = integrity::to_json(report);
    
    EXPECT_NE(json.find("\"mode\": \"deep\""), std::string::npos);
    EXPECT_NE(json.find("\"agent\": \"Agent\\\"1\""), std::string::npos);
    EXPECT_NE(json.find("\"status\": \"corrupted\""), std::string::npos);
    EXPECT_NE(json.find("\"spotChecksPassed\": false"), std::string::npos);
    EXPECT_NE(json.find("\"missingItems\": 1"), std::string::npos);
    EXPECT_NE(json.find("\"modifiedItems\": 2"), std::string::npos);
    EXPECT_NE(json.find("\"indexerDigest\": null"), std::string::npos);
    EXPECT_NE(json.find("{\"position\": 0, \"exists\": true, \"contentValid\": true}"),
              std::string::npos);
    EXPECT_NE(json.find("{\"position\": 2, \"exists\": false, \"contentValid\": null}"),
              std::string::npos);
    EXPECT_EQ(json.find("\"error\""), std::string::npos);
}

TEST(ReportTest, DeepTextShowsErrorAndMissing) {
    integrity::DeepIntegrityReport report;
    report.agent = "agent";
    report.status = IntegrityStatus::Error;
    report.error_message = "индексатор недоступен";
    report.spot_checks.revoke.push_back({4, false, std::nullopt, ""});
    
    auto text = integrity::format_text(report);
    
    EXPECT_NE(text.find("error"), std::string::npos);
    EXPECT_NE(text.find("индексатор недоступен"), std::string::npos);
    EXPECT_NE(text.find("#4: ОТСУТСТВУЕТ"), std::string::npos);
    EXPECT_NE(text.find("[revoke]"), std::string::npos);
}

// =============================================================================
// Full
// =============================================================================

TEST(ReportTest, FullJsonReportsMismatch) {
    integrity::FullIntegrityReport report;
    report.agent = "agent";
    report.status = IntegrityStatus::Corrupted;
    report.lag = 0;
    
    auto& feedback = report.chains.feedback;
    feedback.computed_digest.fill(0xAB);
    feedback.expected_digest.fill(0xCD);
    feedback.computed_count = 5;
    feedback.expected_count = 5;
    feedback.count_match = true;
    feedback.replay_valid = false;
    feedback.mismatch_position = 2;
    Digest computed;
    computed.fill(0x01);
    feedback.mismatch_computed = computed;
    feedback.status = IntegrityStatus::Corrupted;
    
    auto json = integrity::to_json(report);
    
    EXPECT_NE(json.find("\"mode\": \"full\""), std::string::npos);
    EXPECT_NE(json.find("\"computedDigest\": \"" + hex::to_hex(feedback.computed_digest) + "\""),
              std::string::npos);
    EXPECT_NE(json.find("\"mismatchAt\": 2"), std::string::npos);
    EXPECT_NE(json.find("\"mismatchExpected\": null"), std::string::npos);
    EXPECT_NE(json.find("\"mismatchComputed\": \"" + hex::to_hex(computed) + "\""),
              std::string::npos);
    EXPECT_NE(json.find("\"match\": false"), std::string::npos);
    EXPECT_NE(json.find("\"checkpointsUsed\": false"), std::string::npos);
}

TEST(ReportTest, FullTextShowsCheckpointsAndLag) {
    integrity::FullIntegrityReport report;
    report.agent = "agent";
    report.status = IntegrityStatus::Syncing;
    report.lag = 4;
    report.checkpoints_used = true;
    report.chains.response.lag = 4;
    report.chains.response.status = IntegrityStatus::Syncing;
    
    auto text = integrity::format_text(report);
    
    EXPECT_NE(text.find("full (с контрольных точек)"), std::string::npos);
    EXPECT_NE(text.find("Lag:     4"), std::string::npos);
    EXPECT_NE(text.find("[response] syncing"), std::string::npos);
}

} // namespace sealchain::tests
