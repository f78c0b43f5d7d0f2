/**
 * @file events.hpp
 * @brief Преобразование записей индексатора в типизированные события replay
 */

#pragma once

#include "types.hpp"

#include <string>
#include <string_view>

namespace sealchain::integrity {

/**
 * @brief Канонический идентификатор агента
 * 
 * Обрезает пробелы и префикс "sol:".
 */
[[nodiscard]] std::string normalize_agent(std::string_view asset);

/**
 * @brief Запись цепочки отзывов -> FeedbackEvent
 * 
 * feedback_hash записи используется как seal hash.
 * running_digest (если есть) становится stored_digest.
 */
[[nodiscard]] Result<chain::FeedbackEvent> to_feedback_event(const ReplayRecord& record);

/**
 * @brief Запись цепочки ответов -> ResponseEvent
 */
[[nodiscard]] Result<chain::ResponseEvent> to_response_event(const ReplayRecord& record);

/**
 * @brief Запись цепочки отмен -> RevokeEvent
 */
[[nodiscard]] Result<chain::RevokeEvent> to_revoke_event(const ReplayRecord& record);

} // namespace sealchain::integrity
