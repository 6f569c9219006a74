// =============================================================================
// pair_search.hpp — Exhaustive search for the best (male, female) pairing.
//
// Candidates are partitioned by sex, keeping their input order.  Every male
// is scored against every female, males in the outer loop, and the first
// pairing with the highest score wins.  An empty partition is a normal
// outcome and yields std::nullopt.
//
// Provided searches:
//
//   find_best_pairing           – single-threaded, any PairScorer
//   find_best_pairing_parallel  – scores the cross product on OpenMP worker
//                                 threads, then reduces in the same order as
//                                 the sequential search, so both return the
//                                 identical result
//
// Inputs are never modified; the result holds copies of the two parents.
// =============================================================================
#pragma once

#include "concepts.hpp"
#include "pairing_score.hpp"
#include "types.hpp"

#include <cstddef>
#include <optional>
#include <vector>

namespace breedcalc {

// ── Search result ───────────────────────────────────────────────────────────
struct PairingResult {
    Candidate father;
    Candidate mother;
    double    score = 0.0;
};

// ── Sex partition ───────────────────────────────────────────────────────────
struct SexPartition {
    std::vector<const Candidate*> males;
    std::vector<const Candidate*> females;

    [[nodiscard]] bool can_pair() const noexcept {
        return !males.empty() && !females.empty();
    }
    [[nodiscard]] std::size_t num_pairings() const noexcept {
        return males.size() * females.size();
    }
};

/// Split `candidates` by sex.  The pointers refer into `candidates`.
template <CandidateRange R>
[[nodiscard]] SexPartition partition_by_sex(const R& candidates) {
    SexPartition part;
    for (const Candidate& c : candidates) {
        if (c.sex == Sex::Male)
            part.males.push_back(&c);
        else
            part.females.push_back(&c);
    }
    return part;
}

namespace detail {

/// Arg-max over a male-major score table; first maximum wins.
inline PairingResult pick_best(const SexPartition& part,
                               const std::vector<double>& scores) {
    const std::size_t F = part.females.size();
    std::size_t best = 0;
    for (std::size_t k = 1; k < scores.size(); ++k)
        if (scores[k] > scores[best]) best = k;
    return PairingResult{*part.males[best / F], *part.females[best % F],
                         scores[best]};
}

}  // namespace detail

// ─────────────────────────────────────────────────────────────────────────────
// find_best_pairing: generic form
// ─────────────────────────────────────────────────────────────────────────────
template <CandidateRange R, PairScorer Scorer>
[[nodiscard]] std::optional<PairingResult>
find_best_pairing(const R& candidates, const Scorer& scorer) {
    const SexPartition part = partition_by_sex(candidates);
    if (!part.can_pair()) return std::nullopt;

    std::vector<double> scores;
    scores.reserve(part.num_pairings());
    for (const Candidate* m : part.males)
        for (const Candidate* f : part.females)
            scores.push_back(static_cast<double>(scorer(*m, *f)));

    return detail::pick_best(part, scores);
}

/// Best pairing by expected best-of-N offspring rank.
template <CandidateRange R>
[[nodiscard]] std::optional<PairingResult>
find_best_pairing(const R& candidates, RaceMode mode = RaceMode::Standard,
                  const StatScale& scale = StatScale{}) {
    return find_best_pairing(candidates, RankScorer{mode, scale});
}

// ─────────────────────────────────────────────────────────────────────────────
// find_best_pairing_parallel
// ─────────────────────────────────────────────────────────────────────────────
// Each pairing is independent, so the table is filled with dynamic
// scheduling; the reduction runs afterwards on the calling thread.
template <CandidateRange R, PairScorer Scorer>
[[nodiscard]] std::optional<PairingResult>
find_best_pairing_parallel(const R& candidates, const Scorer& scorer) {
    const SexPartition part = partition_by_sex(candidates);
    if (!part.can_pair()) return std::nullopt;

    const std::size_t F = part.females.size();
    const auto total = static_cast<long long>(part.num_pairings());
    std::vector<double> scores(part.num_pairings(), 0.0);

#pragma omp parallel for schedule(dynamic)
    for (long long k = 0; k < total; ++k) {
        const auto idx = static_cast<std::size_t>(k);
        scores[idx] = static_cast<double>(
            scorer(*part.males[idx / F], *part.females[idx % F]));
    }

    return detail::pick_best(part, scores);
}

template <CandidateRange R>
[[nodiscard]] std::optional<PairingResult>
find_best_pairing_parallel(const R& candidates,
                           RaceMode mode = RaceMode::Standard,
                           const StatScale& scale = StatScale{}) {
    return find_best_pairing_parallel(candidates, RankScorer{mode, scale});
}

}  // namespace breedcalc
