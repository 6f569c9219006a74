// =============================================================================
// order_statistics.hpp — Ranks and best-of-N expectations over a finite space.
//
// A space of N equally likely outcomes is sorted worst to best.  Each outcome
// gets a rank in [0, N-1]; outcomes the ordering cannot tell apart share the
// lowest index of their tie group, so a space that is one big tie group sits
// at rank 0.  With no ties the ranks are simply 0..N-1.  A caller that knows
// the best group is the best possible outcome can lift it to N-1 with
// pin_top_group().
//
// With F(i) = #{ outcomes with rank <= i } / N, the expected rank of the best
// of n independent uniform draws is
//
//     E[max] = sum_i  i * ( F(i)^n - F(i-1)^n ),   F(-1) = 0.
//
// n = 0 means nothing is drawn and the expectation is 0.
// =============================================================================
#pragma once

#include "concepts.hpp"
#include "types.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <vector>

namespace breedcalc {

using Rank = std::size_t;

/// Ranks of an already ascending-sorted sequence.  `ord(a, b) == 0` marks a
/// tie; tied neighbours receive the index of the first member of their group.
template <typename T, typename Ordering>
[[nodiscard]] std::vector<Rank>
tie_group_ranks(const std::vector<T>& sorted, const Ordering& ord) {
    const std::size_t N = sorted.size();
    std::vector<Rank> ranks(N, 0);

    std::size_t begin = 0;
    while (begin < N) {
        std::size_t end = begin + 1;
        while (end < N && ord(sorted[begin], sorted[end]) == 0) ++end;
        for (std::size_t i = begin; i < end; ++i) ranks[i] = begin;
        begin = end;
    }
    return ranks;
}

/// Move the last tie group of ascending `ranks` (as produced by
/// tie_group_ranks) to the top rank N-1.
inline void pin_top_group(std::vector<Rank>& ranks) {
    if (ranks.empty()) return;
    const Rank group = ranks.back();
    const Rank top   = ranks.size() - 1;
    for (auto it = ranks.rbegin(); it != ranks.rend() && *it == group; ++it)
        *it = top;
}

/// Stable-sort `space` ascending (worst first) under `ord` and return the
/// rank of each sorted element.  `space` is reordered in place.
template <GenotypeOrdering Ordering>
[[nodiscard]] std::vector<Rank>
sort_and_rank(std::vector<Genotype>& space, const Ordering& ord) {
    std::stable_sort(space.begin(), space.end(),
        [&](const Genotype& a, const Genotype& b) { return ord(a, b) < 0; });
    return tie_group_ranks(space, ord);
}

/// Expected maximum rank among `draws` independent uniform picks from a space
/// whose ranks are given (any order; every rank must be < ranks.size()).
[[nodiscard]] inline double
expected_best_rank(const std::vector<Rank>& ranks, int draws) {
    const std::size_t N = ranks.size();
    if (draws <= 0 || N == 0) return 0.0;

    // counts[i] = how many outcomes hold rank i.
    std::vector<std::size_t> counts(N, 0);
    for (Rank r : ranks) ++counts[r];

    const double inv_n = 1.0 / static_cast<double>(N);
    std::size_t at_or_below = 0;
    double prev_cdf_pow = 0.0;
    double expectation  = 0.0;

    for (std::size_t i = 0; i < N; ++i) {
        at_or_below += counts[i];
        if (counts[i] == 0) continue;  // F(i) == F(i-1): no mass at i
        const double cdf     = static_cast<double>(at_or_below) * inv_n;
        const double cdf_pow = std::pow(cdf, draws);
        expectation += static_cast<double>(i) * (cdf_pow - prev_cdf_pow);
        prev_cdf_pow = cdf_pow;
    }
    return expectation;
}

/// Probability that the best of `draws` picks has rank exactly `i`.
[[nodiscard]] inline std::vector<double>
best_rank_distribution(const std::vector<Rank>& ranks, int draws) {
    const std::size_t N = ranks.size();
    std::vector<double> pmf(N, 0.0);
    if (draws <= 0 || N == 0) return pmf;

    std::vector<std::size_t> counts(N, 0);
    for (Rank r : ranks) ++counts[r];

    std::size_t at_or_below = 0;
    double prev = 0.0;
    for (std::size_t i = 0; i < N; ++i) {
        at_or_below += counts[i];
        const double cur = std::pow(
            static_cast<double>(at_or_below) / static_cast<double>(N), draws);
        pmf[i] = cur - prev;
        prev   = cur;
    }
    return pmf;
}

}  // namespace breedcalc
