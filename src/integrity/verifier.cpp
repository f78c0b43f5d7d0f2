/**
 * @file verifier.cpp
 * @brief Реализация оркестратора проверки целостности
 */

#include "verifier.hpp"
#include "events.hpp"
#include "sampling.hpp"
#include "../core/hex.hpp"
#include "../log/logger.hpp"

#include <algorithm>
#include <chrono>
#include <exception>
#include <format>
#include <future>
#include <limits>
#include <string>

namespace sealchain::integrity {

namespace {

using Clock = std::chrono::steady_clock;

std::chrono::milliseconds elapsed_since(Clock::time_point started) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - started);
}

/**
 * @brief lag = expected - actual для беззнаковых счётчиков
 * 
 * Знак определяется до вычитания, модуль насыщается до INT64_MAX:
 * недоверенный счётчик индексатора не может сменить знак lag.
 */
int64_t count_lag(uint64_t expected, uint64_t actual) noexcept {
    constexpr auto max_lag = static_cast<uint64_t>(std::numeric_limits<int64_t>::max());
    if (expected >= actual) {
        return static_cast<int64_t>(std::min(expected - actual, max_lag));
    }
    return -static_cast<int64_t>(std::min(actual - expected, max_lag));
}

int64_t saturating_add(int64_t a, int64_t b) noexcept {
    constexpr int64_t max = std::numeric_limits<int64_t>::max();
    constexpr int64_t min = std::numeric_limits<int64_t>::min();
    if (b > 0 && a > max - b) return max;
    if (b < 0 && a < min - b) return min;
    return a + b;
}

/**
 * @brief Дождаться результата асинхронного запроса
 * 
 * Исключение из источника превращается в ошибку, а не в вердикт.
 */
template<typename T>
Result<T> join(std::future<Result<T>>& future, std::string_view what) {
    try {
        return future.get();
    } catch (const std::exception& e) {
        return Err<T>(ErrorCode::SystemInternal, std::format("{}: {}", what, e.what()));
    }
}

/**
 * @brief Преобразовать записи страницы в события и выполнить replay
 */
template<typename Event, typename Convert, typename Replay>
Result<chain::ReplayResult> replay_records(
    const std::vector<ReplayRecord>& records,
    const chain::ChainState& start,
    Convert convert,
    Replay replay
) {
    std::vector<Event> events;
    events.reserve(records.size());
    for (const auto& record : records) {
        auto event = convert(record);
        if (!event) {
            return std::unexpected(event.error());
        }
        events.push_back(std::move(*event));
    }
    return replay(std::span<const Event>{events}, start);
}

Result<chain::ReplayResult> replay_page(chain::ChainKind kind,
                                        const std::vector<ReplayRecord>& records,
                                        const chain::ChainState& start) {
    switch (kind) {
        case chain::ChainKind::Feedback:
            return replay_records<chain::FeedbackEvent>(
                records, start, to_feedback_event, chain::replay_feedback_chain);
        case chain::ChainKind::Response:
            return replay_records<chain::ResponseEvent>(
                records, start, to_response_event, chain::replay_response_chain);
        case chain::ChainKind::Revoke:
            return replay_records<chain::RevokeEvent>(
                records, start, to_revoke_event, chain::replay_revoke_chain);
    }
    return Err<chain::ReplayResult>(ErrorCode::SystemInternal, "Неизвестный вид цепочки");
}

} // anonymous namespace

// =============================================================================
// Проверки состояния
// =============================================================================

Result<void> check_count_regression(const OnChainHeads& current, const OnChainHeads& previous) {
    for (auto kind : ALL_CHAINS) {
        if (current[kind].count < previous[kind].count) {
            return Err<void>(
                ErrorCode::IntegrityCountRegression,
                std::format("On-chain счётчик цепочки {} уменьшился: {} -> {}",
                            chain::to_string(kind), previous[kind].count, current[kind].count)
            );
        }
    }
    return {};
}

// =============================================================================
// IntegrityVerifier
// =============================================================================

IntegrityVerifier::IntegrityVerifier(IOnChainSource& onchain, IIndexerSource& indexer,
                                     VerifierConfig config)
    : onchain_(onchain)
    , indexer_(indexer)
    , config_(std::move(config))
    , rng_(config_.sample_seed ? *config_.sample_seed : std::random_device{}())
{
    config_.batch_size = std::clamp<uint32_t>(config_.batch_size, 1, constants::MAX_BATCH_SIZE);
}

DeepOptions IntegrityVerifier::default_deep_options() const {
    DeepOptions options;
    options.spot_checks = config_.spot_checks;
    options.check_boundaries = config_.check_boundaries;
    options.verify_content = config_.verify_content;
    return options;
}

FullOptions IntegrityVerifier::default_full_options() const {
    FullOptions options;
    options.use_checkpoints = config_.use_checkpoints;
    options.batch_size = config_.batch_size;
    return options;
}

// =============================================================================
// Deep
// =============================================================================

DeepIntegrityReport IntegrityVerifier::verify_deep(std::string_view agent) {
    return verify_deep(agent, default_deep_options());
}

DeepIntegrityReport IntegrityVerifier::verify_deep(std::string_view agent, const DeepOptions& options) {
    const auto started = Clock::now();
    
    DeepIntegrityReport report;
    report.agent = std::string(agent);
    
    auto fail = [&](const Error& error) -> DeepIntegrityReport {
        report.status = IntegrityStatus::Error;
        report.valid = false;
        report.spot_checks_passed = false;
        report.error_message = error.message;
        report.duration = elapsed_since(started);
        log::error("Deep проверка {}: {}", report.agent, error.message);
        return report;
    };
    
    log::info("Deep проверка агента {}", report.agent);
    
    // === Сводки: on-chain и индексатор параллельно ===
    Result<std::optional<OnChainHeads>> onchain = Err<std::optional<OnChainHeads>>(ErrorCode::SystemInternal);
    Result<IndexerHeads> indexed = Err<IndexerHeads>(ErrorCode::SystemInternal);
    try {
        const std::string id(agent);
        auto onchain_future = std::async(std::launch::async, [this, id] {
            return onchain_.get_chain_heads(id);
        });
        auto indexer_future = std::async(std::launch::async, [this, id] {
            return indexer_.get_chain_heads(id);
        });
        onchain = join(onchain_future, "on-chain");
        indexed = join(indexer_future, "индексатор");
    } catch (const std::exception& e) {
        return fail(Error{ErrorCode::SystemInternal, e.what()});
    }
    
    if (!onchain) return fail(onchain.error());
    if (!onchain->has_value()) {
        return fail(Error{ErrorCode::IntegrityAgentNotFound,
                          std::format("Агент {} не найден on-chain", report.agent)});
    }
    if (!indexed) return fail(indexed.error());
    
    const OnChainHeads& heads = **onchain;
    if (options.previous_heads) {
        if (auto r = check_count_regression(heads, *options.previous_heads); !r) {
            return fail(r.error());
        }
    }
    
    // === Сравнение голов ===
    bool negative_lag = false;
    for (auto kind : ALL_CHAINS) {
        auto& cmp = report.heads[kind];
        cmp.onchain_digest = heads[kind].digest;
        cmp.onchain_count = heads[kind].count;
        cmp.indexer_digest = (*indexed)[kind].digest;
        cmp.indexer_count = (*indexed)[kind].count;
        cmp.lag = count_lag(cmp.onchain_count, cmp.indexer_count);
        cmp.count_match = cmp.onchain_count == cmp.indexer_count;
        cmp.digest_match = cmp.count_match &&
                           cmp.indexer_digest.value_or(ZERO_DIGEST) == cmp.onchain_digest;
        negative_lag = negative_lag || cmp.indexer_count > cmp.onchain_count;
    }
    if (negative_lag) {
        for (auto kind : ALL_CHAINS) {
            if (report.heads[kind].indexer_count > report.heads[kind].onchain_count) {
                return fail(Error{ErrorCode::IntegrityNegativeLag,
                    std::format("Индексатор опережает on-chain состояние в цепочке {}: {} > {}",
                                chain::to_string(kind), report.heads[kind].indexer_count,
                                report.heads[kind].onchain_count)});
            }
        }
    }
    
    // === Выборочные проверки ===
    PerChain<std::vector<uint64_t>> positions;
    {
        std::lock_guard<std::mutex> lock(rng_mutex_);
        for (auto kind : ALL_CHAINS) {
            positions[kind] = sample_positions(report.heads[kind].indexer_count,
                                               options.spot_checks,
                                               options.check_boundaries, rng_);
        }
    }
    
    PerChain<Result<SpotRecordMap>> lookups{
        SpotRecordMap{}, SpotRecordMap{}, SpotRecordMap{}
    };
    try {
        const std::string id(agent);
        PerChain<std::optional<std::future<Result<SpotRecordMap>>>> futures;
        for (auto kind : ALL_CHAINS) {
            if (positions[kind].empty()) continue;
            const bool with_content = options.verify_content && kind == chain::ChainKind::Feedback;
            futures[kind] = std::async(std::launch::async,
                [this, id, kind, with_content, &positions] {
                    return indexer_.get_spot_records(id, kind, positions[kind], with_content);
                });
        }
        for (auto kind : ALL_CHAINS) {
            if (futures[kind]) {
                lookups[kind] = join(*futures[kind], "выборочная проверка");
            }
        }
    } catch (const std::exception& e) {
        lookups.feedback = Err<SpotRecordMap>(ErrorCode::SystemInternal, e.what());
    }
    
    for (auto kind : ALL_CHAINS) {
        if (!lookups[kind]) {
            report.missing_items = -1;
            return fail(lookups[kind].error());
        }
    }
    
    for (auto kind : ALL_CHAINS) {
        evaluate_spot_checks(kind, positions[kind], *lookups[kind], report.heads[kind],
                             options.verify_content, report);
    }
    report.spot_checks_passed = report.missing_items == 0 && report.modified_items == 0;
    
    // === Итоговый статус ===
    IntegrityStatus status = IntegrityStatus::Valid;
    for (auto kind : ALL_CHAINS) {
        const auto& cmp = report.heads[kind];
        if (cmp.count_match && !cmp.digest_match) {
            status = worst(status, IntegrityStatus::Corrupted);
            log::warn("Цепочка {}: дайджест индексатора расходится с on-chain",
                      chain::to_string(kind));
        } else if (cmp.lag > 0) {
            status = worst(status, IntegrityStatus::Syncing);
        }
    }
    if (!report.spot_checks_passed) {
        status = worst(status, IntegrityStatus::Corrupted);
    }
    
    report.status = status;
    report.valid = status == IntegrityStatus::Valid;
    report.duration = elapsed_since(started);
    log::info("Deep проверка {}: {} ({} мс)", report.agent, to_string(status),
              report.duration.count());
    return report;
}

void IntegrityVerifier::evaluate_spot_checks(
    chain::ChainKind kind,
    const std::vector<uint64_t>& positions,
    const SpotRecordMap& records,
    const HeadComparison& head,
    bool verify_content,
    DeepIntegrityReport& report
) const {
    auto& checks = report.spot_checks[kind];
    checks.reserve(positions.size());
    
    for (uint64_t position : positions) {
        SpotCheck check;
        check.position = position;
        
        auto it = records.find(position);
        if (it == records.end() || !it->second) {
            check.exists = false;
            ++report.missing_items;
            log::warn("Цепочка {}: запись #{} отсутствует в индексаторе",
                      chain::to_string(kind), position);
            checks.push_back(std::move(check));
            continue;
        }
        check.exists = true;
        const SpotRecord& record = *it->second;
        
        // Бегущий дайджест последней записи обязан совпадать с головой,
        // которую сообщает сам индексатор
        const bool is_head = position + 1 == head.indexer_count;
        if (is_head && record.running_digest && head.indexer_digest &&
            *record.running_digest != *head.indexer_digest) {
            ++report.modified_items;
            check.note = "бегущий дайджест расходится с головой индексатора";
            log::warn("Цепочка {}: дайджест записи #{} {} != голова {}",
                      chain::to_string(kind), position,
                      hex::to_hex(*record.running_digest), hex::to_hex(*head.indexer_digest));
        }
        
        if (verify_content && kind == chain::ChainKind::Feedback) {
            if (!record.content || !record.content_hash) {
                if (check.note.empty()) {
                    check.note = "содержимое недоступно";
                }
            } else {
                auto matches = seal::verify_seal_hash(*record.content, *record.content_hash);
                if (!matches) {
                    check.content_valid = false;
                    check.note = matches.error().message;
                    ++report.modified_items;
                } else {
                    check.content_valid = *matches;
                    if (!*matches) {
                        ++report.modified_items;
                        check.note = "seal hash не совпадает с содержимым";
                        log::warn("Отзыв #{}: seal hash не совпадает с содержимым", position);
                    }
                }
            }
        }
        
        checks.push_back(std::move(check));
    }
}

// =============================================================================
// Full
// =============================================================================

FullIntegrityReport IntegrityVerifier::verify_full(std::string_view agent) {
    return verify_full(agent, default_full_options());
}

FullIntegrityReport IntegrityVerifier::verify_full(std::string_view agent, const FullOptions& options) {
    const auto started = Clock::now();
    
    FullIntegrityReport report;
    report.agent = std::string(agent);
    
    auto fail = [&](const Error& error) -> FullIntegrityReport {
        report.status = IntegrityStatus::Error;
        report.valid = false;
        report.error_message = error.message;
        report.duration = elapsed_since(started);
        log::error("Full проверка {}: {}", report.agent, error.message);
        return report;
    };
    
    log::info("Full проверка агента {}", report.agent);
    
    // === On-chain состояние и контрольные точки параллельно ===
    Result<std::optional<OnChainHeads>> onchain = Err<std::optional<OnChainHeads>>(ErrorCode::SystemInternal);
    Result<CheckpointSet> checkpoints = CheckpointSet{};
    try {
        const std::string id(agent);
        auto onchain_future = std::async(std::launch::async, [this, id] {
            return onchain_.get_chain_heads(id);
        });
        if (options.use_checkpoints) {
            auto checkpoint_future = std::async(std::launch::async, [this, id] {
                return indexer_.get_latest_checkpoints(id);
            });
            checkpoints = join(checkpoint_future, "контрольные точки");
        }
        onchain = join(onchain_future, "on-chain");
    } catch (const std::exception& e) {
        return fail(Error{ErrorCode::SystemInternal, e.what()});
    }
    
    if (!onchain) return fail(onchain.error());
    if (!onchain->has_value()) {
        return fail(Error{ErrorCode::IntegrityAgentNotFound,
                          std::format("Агент {} не найден on-chain", report.agent)});
    }
    if (!checkpoints) return fail(checkpoints.error());
    
    const OnChainHeads& heads = **onchain;
    if (options.previous_heads) {
        if (auto r = check_count_regression(heads, *options.previous_heads); !r) {
            return fail(r.error());
        }
    }
    
    // === Replay каждой цепочки ===
    IntegrityStatus status = IntegrityStatus::Valid;
    for (auto kind : ALL_CHAINS) {
        Result<ChainReplayComparison> comparison = Err<ChainReplayComparison>(ErrorCode::SystemInternal);
        try {
            comparison = replay_chain(agent, kind, heads[kind], (*checkpoints)[kind], options);
        } catch (const std::exception& e) {
            comparison = Err<ChainReplayComparison>(
                ErrorCode::SystemInternal,
                std::format("Replay цепочки {}: {}", chain::to_string(kind), e.what()));
        }
        if (!comparison) {
            return fail(comparison.error());
        }
        
        report.chains[kind] = *comparison;
        report.lag = saturating_add(report.lag, comparison->lag);
        report.checkpoints_used = report.checkpoints_used || comparison->checkpoint_used;
        status = worst(status, comparison->status);
        
        if (comparison->lag < 0) {
            report.error_message = std::format(
                "Индексатор вернул больше событий цепочки {}, чем on-chain: {} > {}",
                chain::to_string(kind), comparison->computed_count, comparison->expected_count);
        }
    }
    
    report.status = status;
    report.valid = status == IntegrityStatus::Valid;
    report.duration = elapsed_since(started);
    log::info("Full проверка {}: {} (lag {}, {} мс)", report.agent, to_string(status),
              report.lag, report.duration.count());
    return report;
}

Result<ChainReplayComparison> IntegrityVerifier::replay_chain(
    std::string_view agent,
    chain::ChainKind kind,
    const chain::ChainState& expected,
    const std::optional<chain::ChainState>& checkpoint,
    const FullOptions& options
) {
    ChainReplayComparison cmp;
    cmp.expected_digest = expected.digest;
    cmp.expected_count = expected.count;
    
    chain::ChainState state{};
    if (checkpoint && checkpoint->count > 0) {
        if (checkpoint->count <= expected.count) {
            state = *checkpoint;
            cmp.checkpoint_used = true;
            log::debug("Цепочка {}: replay с контрольной точки {}",
                       chain::to_string(kind), checkpoint->count);
        } else {
            log::warn("Цепочка {}: контрольная точка {} впереди on-chain {}, игнорируется",
                      chain::to_string(kind), checkpoint->count, expected.count);
        }
    }
    
    const uint32_t batch = std::clamp<uint32_t>(options.batch_size, 1, constants::MAX_BATCH_SIZE);
    
    while (state.count < expected.count) {
        auto page = indexer_.get_replay_page(agent, kind, state.count, expected.count, batch);
        if (!page) {
            return std::unexpected(page.error());
        }
        if (page->events.empty()) {
            break;
        }
        
        const uint64_t page_start = state.count;
        auto replay = replay_page(kind, page->events, state);
        if (!replay) {
            return Err<ChainReplayComparison>(
                replay.error().code,
                std::format("Цепочка {}, позиция {}: {}", chain::to_string(kind),
                            page_start, replay.error().message));
        }
        state = replay->state();
        
        if (!replay->valid) {
            cmp.replay_valid = false;
            cmp.mismatch_position = page_start + *replay->mismatch_at;
            cmp.mismatch_expected = replay->mismatch_expected;
            cmp.mismatch_computed = replay->mismatch_computed;
            log::warn("Цепочка {}: расхождение на позиции {}", chain::to_string(kind),
                      *cmp.mismatch_position);
            break;
        }
        
        // Курсор индексатора обязан указывать сразу за последним отданным событием
        if (page->next_from_count != state.count) {
            return Err<ChainReplayComparison>(
                ErrorCode::IndexerInvalidResponse,
                std::format("Цепочка {}: nextFromCount {} после страницы, закончившейся на {}",
                            chain::to_string(kind), page->next_from_count, state.count));
        }
        
        if (options.on_progress) {
            options.on_progress(kind, state.count, expected.count);
        }
        if (!page->has_more) {
            break;
        }
    }
    
    cmp.computed_digest = state.digest;
    cmp.computed_count = state.count;
    cmp.lag = count_lag(expected.count, state.count);
    cmp.count_match = state.count == expected.count;
    cmp.digest_match = state.digest == expected.digest;
    
    if (state.count > expected.count) {
        cmp.status = IntegrityStatus::Error;
    } else if (!cmp.replay_valid) {
        cmp.status = IntegrityStatus::Corrupted;
    } else if (cmp.count_match && !cmp.digest_match) {
        cmp.status = IntegrityStatus::Corrupted;
        log::warn("Цепочка {}: вычисленный дайджест {} != on-chain {}", chain::to_string(kind),
                  hex::to_hex(state.digest), hex::to_hex(expected.digest));
    } else if (state.count < expected.count) {
        cmp.status = IntegrityStatus::Syncing;
    } else {
        cmp.status = IntegrityStatus::Valid;
    }
    return cmp;
}

} // namespace sealchain::integrity
