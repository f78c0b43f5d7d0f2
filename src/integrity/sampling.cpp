/**
 * @file sampling.cpp
 * @brief Выборка без повторений (алгоритм Флойда)
 */

#include "sampling.hpp"

#include <algorithm>
#include <set>

namespace sealchain::integrity {

std::vector<uint64_t> sample_positions(
    uint64_t count,
    uint32_t extra,
    bool include_boundaries,
    std::mt19937_64& rng
) {
    std::set<uint64_t> chosen;
    if (count == 0) {
        return {};
    }
    
    // Диапазон кандидатов [low, low + span)
    uint64_t low = 0;
    uint64_t span = count;
    if (include_boundaries) {
        chosen.insert(0);
        chosen.insert(count - 1);
        low = 1;
        span = count > 2 ? count - 2 : 0;
    }
    
    const uint64_t wanted = std::min<uint64_t>(extra, span);
    if (wanted == span) {
        for (uint64_t i = 0; i < span; ++i) {
            chosen.insert(low + i);
        }
    } else {
        // Floyd: ровно wanted различных значений из [0, span)
        std::set<uint64_t> picked;
        for (uint64_t j = span - wanted; j < span; ++j) {
            std::uniform_int_distribution<uint64_t> dist(0, j);
            uint64_t t = dist(rng);
            if (!picked.insert(t).second) {
                picked.insert(j);
            }
        }
        for (uint64_t p : picked) {
            chosen.insert(low + p);
        }
    }
    
    return {chosen.begin(), chosen.end()};
}

} // namespace sealchain::integrity
