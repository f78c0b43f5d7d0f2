/**
 * @file replay.cpp
 * @brief Реализация replay хеш-цепочек
 */

#include "replay.hpp"

namespace sealchain::chain {

namespace {

/**
 * @brief Общая свёртка для всех видов цепочек
 * 
 * Count увеличивается и для события с расхождением: результат отражает
 * прогресс до точки остановки включительно.
 */
template<typename Event>
ReplayResult fold_chain(std::span<const Event> events, ByteSpan domain,
                        const ChainState& start) noexcept {
    ReplayResult result;
    result.final_digest = start.digest;
    result.count = start.count;
    
    for (std::size_t i = 0; i < events.size(); ++i) {
        const Event& event = events[i];
        result.final_digest = chain_hash(result.final_digest, domain, event_leaf(event));
        ++result.count;
        
        if (event.stored_digest && *event.stored_digest != result.final_digest) {
            result.valid = false;
            result.mismatch_at = i;
            result.mismatch_expected = *event.stored_digest;
            result.mismatch_computed = result.final_digest;
            return result;
        }
    }
    
    return result;
}

} // anonymous namespace

Digest event_leaf(const FeedbackEvent& e) noexcept {
    return feedback_leaf(e.asset, e.client, e.feedback_index, e.seal_hash, e.slot);
}

Digest event_leaf(const ResponseEvent& e) noexcept {
    return response_leaf(e.asset, e.client, e.feedback_index, e.responder,
                         e.response_hash, e.feedback_hash, e.slot);
}

Digest event_leaf(const RevokeEvent& e) noexcept {
    return revoke_leaf(e.asset, e.client, e.feedback_index, e.feedback_hash, e.slot);
}

ReplayResult replay_feedback_chain(std::span<const FeedbackEvent> events,
                                   const ChainState& start) noexcept {
    return fold_chain(events, domain_tag(ChainKind::Feedback), start);
}

ReplayResult replay_response_chain(std::span<const ResponseEvent> events,
                                   const ChainState& start) noexcept {
    return fold_chain(events, domain_tag(ChainKind::Response), start);
}

ReplayResult replay_revoke_chain(std::span<const RevokeEvent> events,
                                 const ChainState& start) noexcept {
    return fold_chain(events, domain_tag(ChainKind::Revoke), start);
}

} // namespace sealchain::chain
