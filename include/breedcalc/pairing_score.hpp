// =============================================================================
// pairing_score.hpp — Expected best-of-N offspring rank for a pairing.
//
// A pairing may be bred once per attempt both parents still have, up to the
// game's per-pair cap, and only the best offspring is kept.  The score is the
// expected rank (0..1023) of that best offspring within the pairing's own
// genotype space:
//
//   1. enumerate the 1024 genotypes (genotype_space.hpp)
//   2. stable-sort them worst to best (ranking.hpp) and assign ranks; tied
//      genotypes share the lowest rank of their group, except that the
//      all-maximum genotype always ranks 1023
//   3. siblings = min(kMaxSiblings, father.attempts, mother.attempts)
//   4. expected maximum rank of `siblings` uniform draws
//      (order_statistics.hpp)
//
// This is the score used to pick pairings.  For the expected quality of a
// single offspring expressed as a percentage, see quality_score.hpp; the two
// are not interchangeable.
// =============================================================================
#pragma once

#include "genotype_space.hpp"
#include "order_statistics.hpp"
#include "ranking.hpp"
#include "types.hpp"

#include <algorithm>
#include <vector>

namespace breedcalc {

/// Offspring obtainable from this pairing before either parent runs out,
/// capped at kMaxSiblings.  Negative attempt counts count as 0.
[[nodiscard]] constexpr int sibling_count(const Candidate& father,
                                          const Candidate& mother) noexcept {
    const int n = std::min({kMaxSiblings, father.attempts_remaining,
                            mother.attempts_remaining});
    return std::max(n, 0);
}

/// Ranks of the pairing's genotype space in ascending (worst first) order.
[[nodiscard]] inline std::vector<Rank>
rank_genotype_space(const Candidate& father, const Candidate& mother,
                    RaceMode mode, const StatScale& scale = StatScale{}) {
    auto space = enumerate_genotypes(father, mother);
    auto ranks = sort_and_rank(space, GenotypeRanking{mode, scale});
    if (is_fully_locked(space.back().stats, scale)) pin_top_group(ranks);
    return ranks;
}

/// Expected rank of the best of `siblings` offspring.  Attempts on the
/// candidates are ignored; use evaluate_pairing for the usual call.
[[nodiscard]] inline double
expected_best_offspring_rank(const Candidate& father, const Candidate& mother,
                             int siblings, RaceMode mode,
                             const StatScale& scale = StatScale{}) {
    if (siblings <= 0) return 0.0;
    return expected_best_rank(rank_genotype_space(father, mother, mode, scale),
                              std::min(siblings, kMaxSiblings));
}

/// Score a pairing: expected rank of the best offspring the pair can still
/// produce.  Pure and deterministic; 0 when either parent has no attempts.
[[nodiscard]] inline double
evaluate_pairing(const Candidate& father, const Candidate& mother,
                 RaceMode mode = RaceMode::Standard,
                 const StatScale& scale = StatScale{}) {
    return expected_best_offspring_rank(father, mother,
                                        sibling_count(father, mother),
                                        mode, scale);
}

/// The highest score any pairing can reach.
inline constexpr double kPairingScoreCeiling =
    static_cast<double>(kGenotypeSpaceSize - 1);

// ─────────────────────────────────────────────────────────────────────────────
// RankScorer: PairScorer adaptor binding a mode and scale.
// ─────────────────────────────────────────────────────────────────────────────
struct RankScorer {
    RaceMode  mode  = RaceMode::Standard;
    StatScale scale{};

    [[nodiscard]] double operator()(const Candidate& father,
                                    const Candidate& mother) const {
        return evaluate_pairing(father, mother, mode, scale);
    }
};

static_assert(PairScorer<RankScorer>);

}  // namespace breedcalc
