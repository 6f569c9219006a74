// =============================================================================
// concepts.hpp — C++20 concepts for the pluggable pieces of the evaluator.
//
// Concepts defined:
//   GenotypeOrdering : three-way comparison of two genotypes
//   PairScorer       : scores a (father, mother) pairing
//   CandidateRange   : any forward range of Candidate records
// =============================================================================
#pragma once

#include "types.hpp"

#include <compare>
#include <concepts>
#include <iterator>
#include <ranges>
#include <type_traits>

namespace breedcalc {

// ─────────────────────────────────────────────────────────────────────────────
// GenotypeOrdering: `greater` means the first genotype is the better one.
// Must be a strict weak ordering so genotype spaces can be fully sorted.
// ─────────────────────────────────────────────────────────────────────────────
template <typename O>
concept GenotypeOrdering = requires(const O o, const Genotype& a,
                                     const Genotype& b) {
    { o(a, b) } -> std::convertible_to<std::weak_ordering>;
};

// ─────────────────────────────────────────────────────────────────────────────
// PairScorer: higher is better.  Must be deterministic for reproducible
// searches.
// ─────────────────────────────────────────────────────────────────────────────
template <typename P>
concept PairScorer = requires(const P p, const Candidate& father,
                               const Candidate& mother) {
    { p(father, mother) } -> std::convertible_to<double>;
};

// ─────────────────────────────────────────────────────────────────────────────
// CandidateRange: what the pair search accepts.
// ─────────────────────────────────────────────────────────────────────────────
template <typename R>
concept CandidateRange =
    std::ranges::forward_range<R> &&
    std::same_as<std::remove_cvref_t<std::ranges::range_reference_t<R>>,
                 Candidate>;

}  // namespace breedcalc
