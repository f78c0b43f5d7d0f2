/**
 * @file snapshot_source.hpp
 * @brief On-chain состояние агентов из TOML снимка
 * 
 * Снимок выгружается внешними RPC утилитами из аккаунтов агентов:
 * @code
 * [[agents]]
 * asset = "CVDFLCAjXhVWiPXH9nTCTpCgVzmDVoiPzNJYuccr1dqB"
 * feedback_digest = "42aa75de..."
 * feedback_count = 1
 * response_digest = ""
 * response_count = 0
 * revoke_digest = ""
 * revoke_count = 0
 * @endcode
 * 
 * Пустая цепочка может не указывать дайджест (подразумевается нулевой).
 */

#pragma once

#include "../integrity/sources.hpp"

#include <toml++/toml.hpp>

#include <filesystem>
#include <string>
#include <string_view>
#include <unordered_map>

namespace sealchain::onchain {

/**
 * @brief Неизменяемый источник on-chain голов цепочек
 * 
 * После загрузки безопасен для одновременного чтения.
 */
class SnapshotOnChainSource final : public integrity::IOnChainSource {
public:
    /**
     * @brief Загрузить снимок из файла
     */
    [[nodiscard]] static Result<SnapshotOnChainSource> load(const std::filesystem::path& path);
    
    /**
     * @brief Разобрать снимок из текста TOML
     */
    [[nodiscard]] static Result<SnapshotOnChainSource> parse(std::string_view text);
    
    [[nodiscard]] Result<std::optional<integrity::OnChainHeads>> get_chain_heads(
        std::string_view agent) override;
    
    [[nodiscard]] std::size_t size() const noexcept { return agents_.size(); }

private:
    SnapshotOnChainSource() = default;
    
    [[nodiscard]] static Result<SnapshotOnChainSource> from_table(const toml::table& table);
    
    std::unordered_map<std::string, integrity::OnChainHeads> agents_;
};

} // namespace sealchain::onchain
