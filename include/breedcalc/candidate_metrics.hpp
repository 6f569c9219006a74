// =============================================================================
// candidate_metrics.hpp — Summary numbers for a single candidate.
//
// These describe a candidate's own inherited stats, not a pairing:
//
//   total_stars            – sum of all ten stat values
//   locked_stat_count      – stats whose both alleles are the maximum
//   max_star_allele_count  – alleles (of ten) equal to the maximum
// =============================================================================
#pragma once

#include "ranking.hpp"
#include "types.hpp"

namespace breedcalc {

[[nodiscard]] inline int total_stars(const Candidate& c) noexcept {
    int total = 0;
    for (const auto& p : c.stats) total += p.sum();
    return total;
}

[[nodiscard]] inline int locked_stat_count(const Candidate& c,
                                           const StatScale& scale = StatScale{}) noexcept {
    return count_locked(c.stats, scale);
}

[[nodiscard]] inline int max_star_allele_count(const Candidate& c,
                                               const StatScale& scale = StatScale{}) noexcept {
    int n = 0;
    for (const auto& p : c.stats) {
        if (p.first  == scale.max) ++n;
        if (p.second == scale.max) ++n;
    }
    return n;
}

}  // namespace breedcalc
