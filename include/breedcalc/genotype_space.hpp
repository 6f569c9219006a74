// =============================================================================
// genotype_space.hpp — Enumeration of every offspring a pairing can produce.
//
// An offspring inherits, per stat, one allele from the father's pair and one
// from the mother's pair.  That gives 4 combinations per stat and 4^5 = 1024
// genotypes overall, independent of the actual stat values.
//
// Ordering is lexicographic over the per-stat choice, MaxSpeed most
// significant.  Within a stat the choices are:
//
//   0: (father.first,  mother.first)
//   1: (father.first,  mother.second)
//   2: (father.second, mother.first)
//   3: (father.second, mother.second)
//
// Both an eager form (enumerate_genotypes) and a visitor form
// (for_each_genotype) are provided; they produce the same sequence.
// =============================================================================
#pragma once

#include "types.hpp"

#include <array>
#include <cstddef>
#include <vector>

namespace breedcalc {

using StatOptions = std::array<AllelePair, kChoicesPerStat>;

/// The four (fatherAllele, motherAllele) combinations for one stat.
[[nodiscard]] constexpr StatOptions
stat_options(const AllelePair& father, const AllelePair& mother) noexcept {
    return {{
        {father.first,  mother.first},
        {father.first,  mother.second},
        {father.second, mother.first},
        {father.second, mother.second},
    }};
}

/// Per-stat options for a whole pairing.
[[nodiscard]] inline std::array<StatOptions, kNumStats>
pairing_options(const Candidate& father, const Candidate& mother) noexcept {
    std::array<StatOptions, kNumStats> opts{};
    for (std::size_t s = 0; s < kNumStats; ++s)
        opts[s] = stat_options(father.stats[s], mother.stats[s]);
    return opts;
}

/// The genotype at position `k` (0 <= k < 1024) of the enumeration order.
[[nodiscard]] inline Genotype
genotype_at(const std::array<StatOptions, kNumStats>& opts,
            std::size_t k) noexcept {
    Genotype g;
    for (std::size_t s = 0; s < kNumStats; ++s) {
        // Two bits per stat; stat 0 owns the highest pair of bits.
        const std::size_t shift  = 2 * (kNumStats - 1 - s);
        const std::size_t choice = (k >> shift) & (kChoicesPerStat - 1);
        g.stats[s] = opts[s][choice];
    }
    return g;
}

/// Call `fn(genotype)` for each of the 1024 genotypes, in enumeration order.
template <typename Fn>
void for_each_genotype(const Candidate& father, const Candidate& mother,
                       Fn&& fn) {
    const auto opts = pairing_options(father, mother);
    for (std::size_t k = 0; k < kGenotypeSpaceSize; ++k)
        fn(genotype_at(opts, k));
}

/// Materialise the full genotype space (exactly kGenotypeSpaceSize entries).
[[nodiscard]] inline std::vector<Genotype>
enumerate_genotypes(const Candidate& father, const Candidate& mother) {
    std::vector<Genotype> space;
    space.reserve(kGenotypeSpaceSize);
    for_each_genotype(father, mother,
                      [&](const Genotype& g) { space.push_back(g); });
    return space;
}

}  // namespace breedcalc
