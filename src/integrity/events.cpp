/**
 * @file events.cpp
 * @brief Декодирование идентификаторов и хешей записей индексатора
 */

#include "events.hpp"
#include "../core/base58.hpp"
#include "../core/hex.hpp"

#include <format>

namespace sealchain::integrity {

namespace {

Result<Pubkey> parse_pubkey(std::string_view field, std::string_view value) {
    auto key = base58::decode_pubkey(value);
    if (!key) {
        return Err<Pubkey>(key.error().code,
                           std::format("{}: {}", field, key.error().message));
    }
    return *key;
}

Result<Digest> parse_required_digest(std::string_view field, const std::optional<std::string>& value) {
    if (!value || value->empty()) {
        return Err<Digest>(ErrorCode::IndexerInvalidResponse,
                           std::format("{}: поле отсутствует", field));
    }
    auto digest = hex::digest_from_hex(*value);
    if (!digest) {
        return Err<Digest>(digest.error().code,
                           std::format("{}: {}", field, digest.error().message));
    }
    return *digest;
}

Result<std::optional<Digest>> parse_optional_digest(std::string_view field,
                                                    const std::optional<std::string>& value) {
    if (!value || value->empty()) {
        return std::optional<Digest>{};
    }
    auto digest = parse_required_digest(field, value);
    if (!digest) {
        return std::unexpected(digest.error());
    }
    return std::optional<Digest>{*digest};
}

} // anonymous namespace

std::string normalize_agent(std::string_view asset) {
    auto first = asset.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos) {
        return {};
    }
    auto last = asset.find_last_not_of(" \t\r\n");
    asset = asset.substr(first, last - first + 1);
    if (asset.starts_with("sol:")) {
        asset.remove_prefix(4);
    }
    return std::string(asset);
}

Result<chain::FeedbackEvent> to_feedback_event(const ReplayRecord& record) {
    chain::FeedbackEvent event;
    
    auto asset = parse_pubkey("asset", record.asset);
    if (!asset) return std::unexpected(asset.error());
    auto client = parse_pubkey("client", record.client);
    if (!client) return std::unexpected(client.error());
    auto seal_hash = parse_required_digest("feedback_hash", record.feedback_hash);
    if (!seal_hash) return std::unexpected(seal_hash.error());
    auto stored = parse_optional_digest("running_digest", record.running_digest);
    if (!stored) return std::unexpected(stored.error());
    
    event.asset = *asset;
    event.client = *client;
    event.feedback_index = record.feedback_index;
    event.seal_hash = *seal_hash;
    event.slot = record.slot;
    event.stored_digest = *stored;
    return event;
}

Result<chain::ResponseEvent> to_response_event(const ReplayRecord& record) {
    chain::ResponseEvent event;
    
    auto asset = parse_pubkey("asset", record.asset);
    if (!asset) return std::unexpected(asset.error());
    auto client = parse_pubkey("client", record.client);
    if (!client) return std::unexpected(client.error());
    if (!record.responder) {
        return Err<chain::ResponseEvent>(ErrorCode::IndexerInvalidResponse,
                                         "responder: поле отсутствует");
    }
    auto responder = parse_pubkey("responder", *record.responder);
    if (!responder) return std::unexpected(responder.error());
    auto response_hash = parse_required_digest("response_hash", record.response_hash);
    if (!response_hash) return std::unexpected(response_hash.error());
    auto feedback_hash = parse_required_digest("feedback_hash", record.feedback_hash);
    if (!feedback_hash) return std::unexpected(feedback_hash.error());
    auto stored = parse_optional_digest("running_digest", record.running_digest);
    if (!stored) return std::unexpected(stored.error());
    
    event.asset = *asset;
    event.client = *client;
    event.feedback_index = record.feedback_index;
    event.responder = *responder;
    event.response_hash = *response_hash;
    event.feedback_hash = *feedback_hash;
    event.slot = record.slot;
    event.stored_digest = *stored;
    return event;
}

Result<chain::RevokeEvent> to_revoke_event(const ReplayRecord& record) {
    chain::RevokeEvent event;
    
    auto asset = parse_pubkey("asset", record.asset);
    if (!asset) return std::unexpected(asset.error());
    auto client = parse_pubkey("client", record.client);
    if (!client) return std::unexpected(client.error());
    auto feedback_hash = parse_required_digest("feedback_hash", record.feedback_hash);
    if (!feedback_hash) return std::unexpected(feedback_hash.error());
    auto stored = parse_optional_digest("running_digest", record.running_digest);
    if (!stored) return std::unexpected(stored.error());
    
    event.asset = *asset;
    event.client = *client;
    event.feedback_index = record.feedback_index;
    event.feedback_hash = *feedback_hash;
    event.slot = record.slot;
    event.stored_digest = *stored;
    return event;
}

} // namespace sealchain::integrity
