// =============================================================================
// quality_score.hpp — Expected single-offspring quality as a percentage.
//
// Encodes the ranking criteria of ranking.hpp as one number per genotype:
//
//   q = withMax * 1e6 + locked * 1e4 + formula * 100 + tiebreak
//
// where formula and tiebreak use per-stat averages.  The weights keep each
// criterion dominant over the next for every reachable value, and q is
// floored at 0.
//
// expected_quality_percent() averages q over the 1024 equally likely
// offspring and divides by q of the all-maximum genotype.  It answers "how
// good is one random offspring", not "how good is the best of the offspring
// this pair can still produce"; attempts are ignored.  Pairing decisions use
// evaluate_pairing() from pairing_score.hpp.
// =============================================================================
#pragma once

#include "genotype_space.hpp"
#include "ranking.hpp"
#include "types.hpp"

#include <algorithm>

namespace breedcalc {

// ── Criterion weights ───────────────────────────────────────────────────────
inline constexpr double kWeightWithMax  = 1'000'000.0;
inline constexpr double kWeightLocked   = 10'000.0;
inline constexpr double kWeightFormula  = 100.0;
inline constexpr double kWeightTiebreak = 1.0;

/// Weighted quality of one genotype (or of a candidate's own stat pairs).
[[nodiscard]] inline double quality_score(const StatPairs& stats,
                                          RaceMode mode,
                                          const StatScale& scale = StatScale{}) noexcept {
    const double q =
        kWeightWithMax  * count_with_max(stats, scale) +
        kWeightLocked   * count_locked(stats, scale) +
        kWeightFormula  * (racing_formula_sum(stats, mode) / 2.0) +
        kWeightTiebreak * (racing_tiebreak_sum(stats, mode) / 2.0);
    return std::max(q, 0.0);
}

/// Quality of the all-maximum genotype under `mode` and `scale`.
[[nodiscard]] inline double max_quality_score(RaceMode mode,
                                              const StatScale& scale = StatScale{}) noexcept {
    StatPairs perfect;
    perfect.fill(AllelePair{scale.max, scale.max});
    return quality_score(perfect, mode, scale);
}

/// Mean quality over the genotype space, as a percentage of the all-maximum
/// genotype's quality.  100 means every offspring is perfect.
[[nodiscard]] inline double
expected_quality_percent(const Candidate& father, const Candidate& mother,
                         RaceMode mode = RaceMode::Standard,
                         const StatScale& scale = StatScale{}) {
    double total = 0.0;
    for_each_genotype(father, mother, [&](const Genotype& g) {
        total += quality_score(g.stats, mode, scale);
    });
    const double expected = total / static_cast<double>(kGenotypeSpaceSize);
    return expected / max_quality_score(mode, scale) * 100.0;
}

}  // namespace breedcalc
