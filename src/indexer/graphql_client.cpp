/**
 * @file graphql_client.cpp
 * @brief Реализация GraphQL клиента индексатора
 * 
 * Использует libcurl для HTTP POST запросов и собственный
 * минималистичный JSON разбор (core/json).
 */

#include "graphql_client.hpp"
#include "../core/hex.hpp"
#include "../core/json.hpp"
#include "../integrity/events.hpp"
#include "../log/logger.hpp"

#include <curl/curl.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <format>
#include <sstream>
#include <thread>

namespace sealchain::indexer {

// =============================================================================
// Тексты запросов
// =============================================================================

namespace {

constexpr std::string_view HEADS_QUERY =
    "query($agent: ID!) { hashChainHeads(agent: $agent) { "
    "feedback { digest count } response { digest count } revoke { digest count } } }";

constexpr std::string_view CHECKPOINTS_QUERY =
    "query($agent: ID!) { hashChainLatestCheckpoints(agent: $agent) { "
    "feedback { eventCount digest createdAt } "
    "response { eventCount digest createdAt } "
    "revoke { eventCount digest createdAt } } }";

constexpr std::string_view REPLAY_QUERY =
    "query($agent: ID!, $chainType: HashChainType!, $fromCount: BigInt!, $toCount: BigInt, $first: Int!) { "
    "hashChainReplayData(agent: $agent, chainType: $chainType, fromCount: $fromCount, "
    "toCount: $toCount, first: $first) { hasMore nextFromCount events { "
    "asset client feedbackIndex slot runningDigest feedbackHash responder responseHash "
    "responseCount revokeCount } } }";

constexpr std::string_view FEEDBACK_QUERY =
    "query($id: ID!) { feedback(id: $id) { tag1 tag2 endpoint feedbackURI feedbackHash "
    "solana { valueRaw valueDecimals score blockSlot } } }";

constexpr std::string_view PING_QUERY = "query { __typename }";

// =============================================================================
// Вспомогательные функции разбора
// =============================================================================

Error invalid(std::string message) {
    return Error{ErrorCode::IndexerInvalidResponse, std::move(message)};
}

/**
 * @brief Обязательное поле-объект
 */
Result<std::string_view> member_object(std::string_view object, std::string_view key) {
    auto raw = json::find_member(object, key);
    if (!raw || json::is_null(*raw) || raw->empty() || raw->front() != '{') {
        return std::unexpected(invalid(std::format("Ответ индексатора без объекта '{}'", key)));
    }
    return *raw;
}

/**
 * @brief Поле-объект, допускающее null
 */
Result<std::optional<std::string_view>> nullable_object(std::string_view object, std::string_view key) {
    auto raw = json::find_member(object, key);
    if (!raw || json::is_null(*raw)) {
        return std::optional<std::string_view>{};
    }
    if (raw->empty() || raw->front() != '{') {
        return std::unexpected(invalid(std::format("Поле '{}' не является объектом", key)));
    }
    return std::optional<std::string_view>{*raw};
}

/**
 * @brief Строковое hex поле, нормализованное (без префикса, нижний регистр)
 */
std::optional<std::string> normalized_hex(std::string_view object, std::string_view key) {
    auto value = json::get_string(object, key);
    if (!value) {
        return std::nullopt;
    }
    auto normalized = hex::normalize(*value);
    if (normalized.empty()) {
        return std::nullopt;
    }
    return normalized;
}

Result<std::optional<Digest>> optional_digest(std::string_view object, std::string_view key) {
    auto text = normalized_hex(object, key);
    if (!text) {
        return std::optional<Digest>{};
    }
    auto digest = hex::digest_from_hex(*text);
    if (!digest) {
        return std::unexpected(invalid(std::format("{}: {}", key, digest.error().message)));
    }
    return std::optional<Digest>{*digest};
}

std::string_view chain_member_name(chain::ChainKind kind) noexcept {
    return chain::to_string(kind);
}

Result<integrity::IndexerHead> parse_head(std::string_view heads, chain::ChainKind kind) {
    auto entry = nullable_object(heads, chain_member_name(kind));
    if (!entry) return std::unexpected(entry.error());
    
    integrity::IndexerHead head;
    if (!*entry) {
        return head;
    }
    auto digest = optional_digest(**entry, "digest");
    if (!digest) return std::unexpected(digest.error());
    head.digest = *digest;
    head.count = json::get_uint(**entry, "count").value_or(0);
    return head;
}

Result<std::optional<chain::ChainState>> parse_checkpoint(std::string_view set, chain::ChainKind kind) {
    auto entry = nullable_object(set, chain_member_name(kind));
    if (!entry) return std::unexpected(entry.error());
    if (!*entry) {
        return std::optional<chain::ChainState>{};
    }
    
    auto digest = optional_digest(**entry, "digest");
    if (!digest) return std::unexpected(digest.error());
    if (!*digest) {
        return std::unexpected(invalid(std::format(
            "Контрольная точка цепочки {} без дайджеста", chain::to_string(kind))));
    }
    
    chain::ChainState state;
    state.digest = **digest;
    state.count = json::get_uint(**entry, "eventCount").value_or(0);
    return std::optional<chain::ChainState>{state};
}

Result<integrity::ReplayRecord> parse_replay_event(std::string_view event) {
    integrity::ReplayRecord record;
    
    auto asset = json::get_string(event, "asset");
    auto client = json::get_string(event, "client");
    auto index = json::get_uint(event, "feedbackIndex");
    if (!asset || !client || !index) {
        return std::unexpected(invalid("Событие replay без asset, client или feedbackIndex"));
    }
    record.asset = std::move(*asset);
    record.client = std::move(*client);
    record.feedback_index = *index;
    record.slot = json::get_uint(event, "slot").value_or(0);
    record.running_digest = normalized_hex(event, "runningDigest");
    record.feedback_hash = normalized_hex(event, "feedbackHash");
    record.responder = json::get_string(event, "responder");
    record.response_hash = normalized_hex(event, "responseHash");
    return record;
}

Result<std::optional<uint8_t>> optional_small_int(std::string_view object, std::string_view key) {
    auto raw = json::find_member(object, key);
    if (!raw || json::is_null(*raw)) {
        return std::optional<uint8_t>{};
    }
    auto value = json::get_int(object, key);
    if (!value || *value < 0 || *value > 255) {
        return std::unexpected(invalid(std::format("Некорректное значение поля '{}'", key)));
    }
    return std::optional<uint8_t>{static_cast<uint8_t>(*value)};
}

// =============================================================================
// CURL
// =============================================================================

std::size_t write_callback(char* ptr, std::size_t size, std::size_t nmemb, void* userdata) {
    auto* response = static_cast<std::string*>(userdata);
    response->append(ptr, size * nmemb);
    return size * nmemb;
}

// Глобальная инициализация CURL
std::atomic<bool> curl_initialized{false};

void ensure_curl_init() {
    bool expected = false;
    if (curl_initialized.compare_exchange_strong(expected, true)) {
        curl_global_init(CURL_GLOBAL_DEFAULT);
    }
}

/**
 * @brief Ошибка, после которой имеет смысл повторить запрос
 */
bool is_retryable(const Error& error) noexcept {
    switch (error.code) {
        case ErrorCode::NetworkTimeout:
        case ErrorCode::IndexerUnavailable:
        case ErrorCode::IndexerRateLimited:
        case ErrorCode::IndexerHttpError:
            return true;
        default:
            return false;
    }
}

} // anonymous namespace

// =============================================================================
// Свободные функции
// =============================================================================

std::string_view chain_type_name(chain::ChainKind kind) noexcept {
    switch (kind) {
        case chain::ChainKind::Feedback: return "FEEDBACK";
        case chain::ChainKind::Response: return "RESPONSE";
        case chain::ChainKind::Revoke:   return "REVOKE";
        default: return "FEEDBACK";
    }
}

std::string build_request_body(std::string_view query, std::string_view variables_json) {
    std::ostringstream body;
    body << R"({"query":")" << json::escape(query) << R"(","variables":)"
         << (variables_json.empty() ? std::string_view{"{}"} : variables_json) << "}";
    return body.str();
}

Result<std::string_view> extract_data(std::string_view response) {
    if (auto errors = json::find_member(response, "errors"); errors && !json::is_null(*errors)) {
        auto items = json::split_array(*errors);
        if (items && !items->empty()) {
            std::string message;
            for (auto item : *items) {
                if (auto text = json::get_string(item, "message")) {
                    if (!message.empty()) message += "; ";
                    message += *text;
                }
            }
            return std::unexpected(invalid(message.empty() ? "GraphQL error" : message));
        }
    }
    
    auto data = json::find_member(response, "data");
    if (!data || json::is_null(*data)) {
        return std::unexpected(invalid("Ответ GraphQL без data"));
    }
    return *data;
}

Result<integrity::IndexerHeads> parse_heads_response(std::string_view data) {
    auto heads = member_object(data, "hashChainHeads");
    if (!heads) return std::unexpected(heads.error());
    
    integrity::IndexerHeads result;
    for (auto kind : integrity::ALL_CHAINS) {
        auto head = parse_head(*heads, kind);
        if (!head) return std::unexpected(head.error());
        result[kind] = *head;
    }
    return result;
}

Result<integrity::CheckpointSet> parse_checkpoints_response(std::string_view data) {
    auto set = nullable_object(data, "hashChainLatestCheckpoints");
    if (!set) return std::unexpected(set.error());
    
    integrity::CheckpointSet result;
    if (!*set) {
        return result;
    }
    for (auto kind : integrity::ALL_CHAINS) {
        auto checkpoint = parse_checkpoint(**set, kind);
        if (!checkpoint) return std::unexpected(checkpoint.error());
        result[kind] = *checkpoint;
    }
    return result;
}

Result<integrity::ReplayPage> parse_replay_page_response(std::string_view data, uint64_t from_count) {
    auto page = member_object(data, "hashChainReplayData");
    if (!page) return std::unexpected(page.error());
    
    integrity::ReplayPage result;
    result.has_more = json::get_bool(*page, "hasMore").value_or(false);
    
    auto events_raw = json::find_member(*page, "events");
    if (!events_raw) {
        return std::unexpected(invalid("Страница replay без events"));
    }
    auto events = json::split_array(*events_raw);
    if (!events) {
        return std::unexpected(invalid("Поле events не является массивом"));
    }
    
    result.events.reserve(events->size());
    for (auto event : *events) {
        auto record = parse_replay_event(event);
        if (!record) return std::unexpected(record.error());
        result.events.push_back(std::move(*record));
    }
    result.next_from_count = json::get_uint(*page, "nextFromCount")
                                 .value_or(from_count + result.events.size());
    return result;
}

Result<std::optional<seal::SealParams>> parse_feedback_content_response(std::string_view data) {
    auto feedback = nullable_object(data, "feedback");
    if (!feedback) return std::unexpected(feedback.error());
    if (!*feedback) {
        return std::optional<seal::SealParams>{};
    }
    const std::string_view row = **feedback;
    
    seal::SealParams params;
    params.tag1 = json::get_string(row, "tag1").value_or("");
    params.tag2 = json::get_string(row, "tag2").value_or("");
    params.endpoint = json::get_string(row, "endpoint").value_or("");
    params.feedback_uri = json::get_string(row, "feedbackURI").value_or("");
    
    // feedbackHash сущности отзыва - хеш файла по feedbackURI
    auto file_hash = optional_digest(row, "feedbackHash");
    if (!file_hash) return std::unexpected(file_hash.error());
    params.feedback_file_hash = *file_hash;
    
    auto solana = nullable_object(row, "solana");
    if (!solana) return std::unexpected(solana.error());
    if (*solana) {
        if (auto raw = json::find_member(**solana, "valueRaw"); raw && !json::is_null(*raw)) {
            auto value = json::get_int(**solana, "valueRaw");
            if (!value) {
                return std::unexpected(invalid("Некорректное значение valueRaw"));
            }
            params.value = *value;
        }
        
        auto decimals = optional_small_int(**solana, "valueDecimals");
        if (!decimals) return std::unexpected(decimals.error());
        params.value_decimals = decimals->value_or(0);
        
        auto score = optional_small_int(**solana, "score");
        if (!score) return std::unexpected(score.error());
        params.score = *score;
    }
    
    return std::optional<seal::SealParams>{std::move(params)};
}

// =============================================================================
// GraphqlIndexerClient::Impl
// =============================================================================

struct GraphqlIndexerClient::Impl {
    std::string url;
    std::string api_key;
    uint32_t timeout_ms;
    uint32_t retries;
    
    explicit Impl(const IndexerConfig& config)
        : url(config.get_graphql_url())
        , api_key(config.api_key)
        , timeout_ms(config.timeout_ms)
        , retries(config.retries) {
        ensure_curl_init();
    }
    
    /**
     * @brief Одна попытка HTTP POST
     */
    Result<std::string> post(const std::string& body) const {
        std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> curl(curl_easy_init(), &curl_easy_cleanup);
        if (!curl) {
            return Err<std::string>(ErrorCode::IndexerUnavailable, "CURL не инициализирован");
        }
        
        std::string response;
        
        curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
        curl_easy_setopt(curl.get(), CURLOPT_POST, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, body.c_str());
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
        curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_callback);
        curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response);
        curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_ms));
        curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 0L);
        
        // Заголовки
        struct curl_slist* headers = nullptr;
        headers = curl_slist_append(headers, "Content-Type: application/json");
        std::string key_header;
        if (!api_key.empty()) {
            key_header = std::format("x-api-key: {}", api_key);
            headers = curl_slist_append(headers, key_header.c_str());
        }
        curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers);
        
        CURLcode res = curl_easy_perform(curl.get());
        curl_slist_free_all(headers);
        
        if (res == CURLE_OPERATION_TIMEDOUT) {
            return Err<std::string>(
                ErrorCode::NetworkTimeout,
                std::format("Таймаут запроса к индексатору ({} мс)", timeout_ms)
            );
        }
        if (res != CURLE_OK) {
            return Err<std::string>(
                ErrorCode::IndexerUnavailable,
                std::format("CURL ошибка: {}", curl_easy_strerror(res))
            );
        }
        
        long http_code = 0;
        curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &http_code);
        
        if (http_code == 401 || http_code == 403) {
            return Err<std::string>(ErrorCode::IndexerUnauthorized);
        }
        if (http_code == 429) {
            return Err<std::string>(ErrorCode::IndexerRateLimited);
        }
        if (http_code < 200 || http_code >= 300) {
            std::string details;
            if (auto data = json::find_member(response, "errors"); data) {
                if (auto items = json::split_array(*data); items && !items->empty()) {
                    details = json::get_string(items->front(), "message").value_or("");
                }
            }
            return Err<std::string>(
                ErrorCode::IndexerHttpError,
                details.empty() ? std::format("HTTP ошибка: {}", http_code)
                                : std::format("HTTP ошибка: {} ({})", http_code, details)
            );
        }
        
        return response;
    }
    
    /**
     * @brief GraphQL запрос с повторами
     * 
     * @return Текст объекта data
     */
    Result<std::string> query(std::string_view query_text, std::string_view variables_json) const {
        const std::string body = build_request_body(query_text, variables_json);
        
        for (uint32_t attempt = 0;; ++attempt) {
            auto response = post(body);
            if (response) {
                auto data = extract_data(*response);
                if (!data) return std::unexpected(data.error());
                return std::string(*data);
            }
            
            if (!is_retryable(response.error()) || attempt >= retries) {
                return std::unexpected(response.error());
            }
            
            const auto delay = std::chrono::milliseconds(constants::RETRY_BASE_DELAY_MS << attempt);
            log::warn("Индексатор: {} (попытка {}/{}, повтор через {} мс)",
                      response.error().message, attempt + 1, retries + 1, delay.count());
            std::this_thread::sleep_for(delay);
        }
    }
    
    static std::string agent_variables(std::string_view agent) {
        return std::format(R"({{"agent":"{}"}})", json::escape(integrity::normalize_agent(agent)));
    }
};

// =============================================================================
// GraphqlIndexerClient
// =============================================================================

GraphqlIndexerClient::GraphqlIndexerClient(const IndexerConfig& config)
    : impl_(std::make_unique<Impl>(config))
{
}

GraphqlIndexerClient::~GraphqlIndexerClient() = default;

GraphqlIndexerClient::GraphqlIndexerClient(GraphqlIndexerClient&&) noexcept = default;
GraphqlIndexerClient& GraphqlIndexerClient::operator=(GraphqlIndexerClient&&) noexcept = default;

Result<integrity::IndexerHeads> GraphqlIndexerClient::get_chain_heads(std::string_view agent) {
    auto data = impl_->query(HEADS_QUERY, Impl::agent_variables(agent));
    if (!data) return std::unexpected(data.error());
    return parse_heads_response(*data);
}

Result<integrity::CheckpointSet> GraphqlIndexerClient::get_latest_checkpoints(std::string_view agent) {
    auto data = impl_->query(CHECKPOINTS_QUERY, Impl::agent_variables(agent));
    if (!data) return std::unexpected(data.error());
    return parse_checkpoints_response(*data);
}

Result<integrity::ReplayPage> GraphqlIndexerClient::get_replay_page(
    std::string_view agent,
    chain::ChainKind kind,
    uint64_t from_count,
    uint64_t to_count,
    uint32_t limit
) {
    const uint32_t first = std::clamp<uint32_t>(limit, 1, constants::MAX_BATCH_SIZE);
    
    // BigInt передаётся строкой
    const std::string variables = std::format(
        R"({{"agent":"{}","chainType":"{}","fromCount":"{}","toCount":"{}","first":{}}})",
        json::escape(integrity::normalize_agent(agent)), chain_type_name(kind),
        from_count, to_count, first);
    
    auto data = impl_->query(REPLAY_QUERY, variables);
    if (!data) return std::unexpected(data.error());
    
    auto page = parse_replay_page_response(*data, from_count);
    if (page) {
        log::debug("Индексатор: {} событий цепочки {} с позиции {}",
                   page->events.size(), chain::to_string(kind), from_count);
    }
    return page;
}

Result<integrity::SpotRecordMap> GraphqlIndexerClient::get_spot_records(
    std::string_view agent,
    chain::ChainKind kind,
    std::span<const uint64_t> positions,
    bool with_content
) {
    integrity::SpotRecordMap result;
    
    for (uint64_t position : positions) {
        auto page = get_replay_page(agent, kind, position, position + 1, 1);
        if (!page) return std::unexpected(page.error());
        
        if (page->events.empty()) {
            result[position] = std::nullopt;
            continue;
        }
        const auto& event = page->events.front();
        
        integrity::SpotRecord record;
        if (event.running_digest) {
            auto digest = hex::digest_from_hex(*event.running_digest);
            if (!digest) {
                return Err<integrity::SpotRecordMap>(
                    ErrorCode::IndexerInvalidResponse,
                    std::format("runningDigest позиции {}: {}", position, digest.error().message));
            }
            record.running_digest = *digest;
        }
        
        const auto& content_hash = kind == chain::ChainKind::Response ? event.response_hash
                                                                      : event.feedback_hash;
        if (content_hash) {
            auto digest = hex::digest_from_hex(*content_hash);
            if (!digest) {
                return Err<integrity::SpotRecordMap>(
                    ErrorCode::IndexerInvalidResponse,
                    std::format("Хеш содержимого позиции {}: {}", position, digest.error().message));
            }
            record.content_hash = *digest;
        }
        
        if (with_content && kind == chain::ChainKind::Feedback) {
            const std::string id = std::format("{}:{}:{}", integrity::normalize_agent(event.asset),
                                               event.client, event.feedback_index);
            auto data = impl_->query(FEEDBACK_QUERY,
                                     std::format(R"({{"id":"{}"}})", json::escape(id)));
            if (!data) return std::unexpected(data.error());
            
            auto content = parse_feedback_content_response(*data);
            if (!content) return std::unexpected(content.error());
            record.content = std::move(*content);
        }
        
        result[position] = std::move(record);
    }
    
    return result;
}

Result<void> GraphqlIndexerClient::ping() {
    auto data = impl_->query(PING_QUERY, "{}");
    if (!data) return std::unexpected(data.error());
    return {};
}

} // namespace sealchain::indexer
