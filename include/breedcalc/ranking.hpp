// =============================================================================
// ranking.hpp — Total ordering of genotypes by breeding quality.
//
// Criteria, applied in order; each only breaks ties left by the previous one:
//
//   1. Stats holding at least one maximum-value allele (more is better).
//      A stat without one can never become locked in later generations.
//   2. Locked stats, i.e. both alleles at the maximum (more is better).
//   3. Racing formula over the per-stat averages (father + mother) / 2:
//        Standard:     maxSpeed + stamina - cunning - acceleration,
//                      then higher endurance
//        SuperSprint:  stamina + endurance - cunning - acceleration,
//                      then higher maxSpeed
//
// Averages share the divisor 2, so the formula is evaluated on allele sums
// and the comparison stays in exact integer arithmetic.
// =============================================================================
#pragma once

#include "concepts.hpp"
#include "types.hpp"

#include <compare>

namespace breedcalc {

/// Number of stats with at least one allele equal to `scale.max`.
[[nodiscard]] inline int count_with_max(const StatPairs& stats,
                                        const StatScale& scale) noexcept {
    int n = 0;
    for (const auto& p : stats)
        if (p.first == scale.max || p.second == scale.max) ++n;
    return n;
}

/// Number of stats whose both alleles equal `scale.max`.
[[nodiscard]] inline int count_locked(const StatPairs& stats,
                                      const StatScale& scale) noexcept {
    int n = 0;
    for (const auto& p : stats)
        if (p.first == scale.max && p.second == scale.max) ++n;
    return n;
}

/// True for the all-maximum genotype, the best one the ordering can rank.
[[nodiscard]] inline bool is_fully_locked(const StatPairs& stats,
                                          const StatScale& scale) noexcept {
    return count_locked(stats, scale) == static_cast<int>(kNumStats);
}

/// Racing formula on allele sums (twice the average-based value).
[[nodiscard]] inline int racing_formula_sum(const StatPairs& stats,
                                            RaceMode mode) noexcept {
    auto sum = [&](Stat s) { return stats[stat_index(s)].sum(); };
    if (mode == RaceMode::SuperSprint)
        return sum(Stat::Stamina) + sum(Stat::Endurance)
             - sum(Stat::Cunning) - sum(Stat::Acceleration);
    return sum(Stat::MaxSpeed) + sum(Stat::Stamina)
         - sum(Stat::Cunning) - sum(Stat::Acceleration);
}

/// Final tie-breaker on allele sums: endurance (Standard) or max speed
/// (SuperSprint).
[[nodiscard]] inline int racing_tiebreak_sum(const StatPairs& stats,
                                             RaceMode mode) noexcept {
    const Stat s = (mode == RaceMode::SuperSprint) ? Stat::MaxSpeed
                                                   : Stat::Endurance;
    return stats[stat_index(s)].sum();
}

// ─────────────────────────────────────────────────────────────────────────────
// GenotypeRanking
// ─────────────────────────────────────────────────────────────────────────────
// Three-way comparator; `greater` means `a` is the better genotype.  Also
// usable as a sort predicate through less(), which orders worst to best.
struct GenotypeRanking {
    RaceMode  mode  = RaceMode::Standard;
    StatScale scale{};

    [[nodiscard]] std::weak_ordering
    operator()(const Genotype& a, const Genotype& b) const noexcept {
        if (auto c = count_with_max(a.stats, scale) <=>
                     count_with_max(b.stats, scale); c != 0)
            return c;
        if (auto c = count_locked(a.stats, scale) <=>
                     count_locked(b.stats, scale); c != 0)
            return c;
        if (auto c = racing_formula_sum(a.stats, mode) <=>
                     racing_formula_sum(b.stats, mode); c != 0)
            return c;
        return racing_tiebreak_sum(a.stats, mode) <=>
               racing_tiebreak_sum(b.stats, mode);
    }

    [[nodiscard]] bool less(const Genotype& a, const Genotype& b) const noexcept {
        return (*this)(a, b) < 0;
    }
};

static_assert(GenotypeOrdering<GenotypeRanking>);

/// Convenience wrapper around GenotypeRanking.
[[nodiscard]] inline std::weak_ordering
compare_genotypes(const Genotype& a, const Genotype& b,
                  RaceMode mode = RaceMode::Standard,
                  const StatScale& scale = StatScale{}) noexcept {
    return GenotypeRanking{mode, scale}(a, b);
}

}  // namespace breedcalc
