/**
 * @file hash_chain.cpp
 * @brief Реализация кодировщиков листьев
 * 
 * Прообразы имеют фиксированный размер, поэтому хешируются по частям
 * без промежуточного буфера.
 */

#include "hash_chain.hpp"
#include "../core/byte_order.hpp"
#include "../core/constants.hpp"
#include "../crypto/keccak256.hpp"

#include <array>

namespace sealchain::chain {

namespace {

/// u64 в 8 байт little-endian
std::array<uint8_t, 8> le_bytes(uint64_t value) noexcept {
    std::array<uint8_t, 8> out{};
    write_le64(out.data(), value);
    return out;
}

} // anonymous namespace

ByteSpan domain_tag(ChainKind kind) noexcept {
    switch (kind) {
        case ChainKind::Feedback: return constants::DOMAIN_FEEDBACK;
        case ChainKind::Response: return constants::DOMAIN_RESPONSE;
        case ChainKind::Revoke:   return constants::DOMAIN_REVOKE;
    }
    return {};
}

Digest chain_hash(const Digest& prev, ByteSpan domain, const Digest& leaf) noexcept {
    return crypto::keccak256({prev, domain, leaf});
}

Digest feedback_leaf(
    const Pubkey& asset,
    const Pubkey& client,
    uint64_t feedback_index,
    const Digest& seal_hash,
    uint64_t slot
) noexcept {
    const auto index_le = le_bytes(feedback_index);
    const auto slot_le = le_bytes(slot);
    return crypto::keccak256({
        constants::DOMAIN_LEAF_V1, asset, client, index_le, seal_hash, slot_le
    });
}

Digest response_leaf(
    const Pubkey& asset,
    const Pubkey& client,
    uint64_t feedback_index,
    const Pubkey& responder,
    const Digest& response_hash,
    const Digest& feedback_hash,
    uint64_t slot
) noexcept {
    const auto index_le = le_bytes(feedback_index);
    const auto slot_le = le_bytes(slot);
    return crypto::keccak256({
        asset, client, index_le, responder, response_hash, feedback_hash, slot_le
    });
}

Digest revoke_leaf(
    const Pubkey& asset,
    const Pubkey& client,
    uint64_t feedback_index,
    const Digest& feedback_hash,
    uint64_t slot
) noexcept {
    const auto index_le = le_bytes(feedback_index);
    const auto slot_le = le_bytes(slot);
    return crypto::keccak256({asset, client, index_le, feedback_hash, slot_le});
}

} // namespace sealchain::chain
