/**
 * @file snapshot_source.cpp
 * @brief Разбор TOML снимка on-chain состояния
 */

#include "snapshot_source.hpp"
#include "../core/base58.hpp"
#include "../core/hex.hpp"
#include "../integrity/events.hpp"
#include "../log/logger.hpp"

#include <toml++/toml.hpp>

#include <format>

namespace sealchain::onchain {

namespace {

Result<chain::ChainState> read_chain(const toml::table& agent, std::string_view asset,
                                     chain::ChainKind kind) {
    const std::string prefix(chain::to_string(kind));
    chain::ChainState state;
    
    auto count = agent[prefix + "_count"].value<int64_t>().value_or(0);
    if (count < 0) {
        return Err<chain::ChainState>(
            ErrorCode::OnChainInvalidData,
            std::format("{}: отрицательный {}_count", asset, prefix)
        );
    }
    state.count = static_cast<uint64_t>(count);
    
    auto digest_text = agent[prefix + "_digest"].value<std::string>().value_or("");
    if (hex::normalize(digest_text).empty()) {
        if (state.count > 0) {
            return Err<chain::ChainState>(
                ErrorCode::OnChainInvalidData,
                std::format("{}: {}_count = {} без {}_digest", asset, prefix, state.count, prefix)
            );
        }
        return state;
    }
    
    auto digest = hex::digest_from_hex(digest_text);
    if (!digest) {
        return Err<chain::ChainState>(
            ErrorCode::OnChainInvalidData,
            std::format("{}: {}_digest: {}", asset, prefix, digest.error().message)
        );
    }
    state.digest = *digest;
    return state;
}

} // anonymous namespace

Result<SnapshotOnChainSource> SnapshotOnChainSource::load(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return Err<SnapshotOnChainSource>(
            ErrorCode::OnChainUnavailable,
            std::format("Снимок on-chain состояния не найден: {}", path.string())
        );
    }
    
    try {
        auto table = toml::parse_file(path.string());
        auto source = from_table(table);
        if (source) {
            log::debug("Снимок on-chain состояния: {} агентов из {}", source->size(), path.string());
        }
        return source;
    } catch (const toml::parse_error& e) {
        return Err<SnapshotOnChainSource>(
            ErrorCode::OnChainInvalidData,
            std::format("Ошибка парсинга снимка: {}", e.what())
        );
    }
}

Result<SnapshotOnChainSource> SnapshotOnChainSource::parse(std::string_view text) {
    try {
        auto table = toml::parse(text);
        return from_table(table);
    } catch (const toml::parse_error& e) {
        return Err<SnapshotOnChainSource>(
            ErrorCode::OnChainInvalidData,
            std::format("Ошибка парсинга снимка: {}", e.what())
        );
    }
}

Result<SnapshotOnChainSource> SnapshotOnChainSource::from_table(const toml::table& table) {
    SnapshotOnChainSource source;
    
    auto agents = table["agents"].as_array();
    if (!agents) {
        return source;
    }
    
    for (const auto& node : *agents) {
        auto agent = node.as_table();
        if (!agent) {
            return Err<SnapshotOnChainSource>(ErrorCode::OnChainInvalidData,
                                              "Элемент [[agents]] не является таблицей");
        }
        
        auto asset = (*agent)["asset"].value<std::string>();
        if (!asset || asset->empty()) {
            return Err<SnapshotOnChainSource>(ErrorCode::OnChainInvalidData,
                                              "Агент без поля asset");
        }
        const std::string id = integrity::normalize_agent(*asset);
        if (auto key = base58::decode_pubkey(id); !key) {
            return Err<SnapshotOnChainSource>(
                ErrorCode::OnChainInvalidData,
                std::format("{}: {}", id, key.error().message)
            );
        }
        
        integrity::OnChainHeads heads;
        for (auto kind : integrity::ALL_CHAINS) {
            auto state = read_chain(*agent, id, kind);
            if (!state) return std::unexpected(state.error());
            heads[kind] = *state;
        }
        source.agents_[id] = heads;
    }
    
    return source;
}

Result<std::optional<integrity::OnChainHeads>> SnapshotOnChainSource::get_chain_heads(
    std::string_view agent
) {
    auto it = agents_.find(integrity::normalize_agent(agent));
    if (it == agents_.end()) {
        return std::optional<integrity::OnChainHeads>{};
    }
    return std::optional<integrity::OnChainHeads>{it->second};
}

} // namespace sealchain::onchain
