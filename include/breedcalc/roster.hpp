// =============================================================================
// roster.hpp — In-memory container of breeding candidates.
//
// The Roster owns:
//   • the candidate records, in insertion order (which is also the search
//     order, so results are reproducible),
//   • the stat scale every record is validated against,
//   • the most recent optimal-pair result, if any.
//
// It is an ordinary value that callers construct and pass around; nothing in
// the scoring headers depends on it.  Every write validates its input and
// throws (InvalidStatValue, std::out_of_range) before touching state.
// =============================================================================
#pragma once

#include "candidate_metrics.hpp"
#include "pair_search.hpp"
#include "types.hpp"
#include "validation.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <iterator>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace breedcalc {

class Roster {
public:
    // ── Construction ────────────────────────────────────────────────────────
    explicit Roster(StatScale scale = StatScale{}) : scale_{scale} {}

    // ── Accessors ───────────────────────────────────────────────────────────
    [[nodiscard]] std::size_t                   size()       const noexcept { return candidates_.size(); }
    [[nodiscard]] bool                          empty()      const noexcept { return candidates_.empty(); }
    [[nodiscard]] const StatScale&              scale()      const noexcept { return scale_; }
    [[nodiscard]] const std::vector<Candidate>& candidates() const noexcept { return candidates_; }

    [[nodiscard]] const Candidate* find(std::size_t id) const noexcept {
        auto it = std::find_if(candidates_.begin(), candidates_.end(),
                               [id](const Candidate& c) { return c.id == id; });
        return it == candidates_.end() ? nullptr : &*it;
    }

    [[nodiscard]] std::vector<Candidate> males() const { return of_sex(Sex::Male); }
    [[nodiscard]] std::vector<Candidate> females() const { return of_sex(Sex::Female); }

    // ── Editing ─────────────────────────────────────────────────────────────

    /// Validate and store `c` under a fresh id, which is returned.  Any id
    /// already set on `c` is replaced.
    std::size_t add(Candidate c) {
        validate_candidate(c, scale_);
        c.id = next_id_++;
        spdlog::debug("roster: added {} #{} ({} stars, {} locked)",
                      c.sex == Sex::Male ? "male" : "female", c.id,
                      total_stars(c), locked_stat_count(c, scale_));
        candidates_.push_back(std::move(c));
        return candidates_.back().id;
    }

    /// Remove a candidate.  Drops the cached optimal pair if it involved it.
    bool remove(std::size_t id) {
        auto it = std::find_if(candidates_.begin(), candidates_.end(),
                               [id](const Candidate& c) { return c.id == id; });
        if (it == candidates_.end()) return false;
        candidates_.erase(it);
        if (optimal_ && (optimal_->father.id == id || optimal_->mother.id == id))
            optimal_.reset();
        spdlog::debug("roster: removed #{}", id);
        return true;
    }

    void update_stat(std::size_t id, Stat stat, AllelePair pair) {
        validate_pair(stat, pair, scale_);
        at(id)[stat] = pair;
    }

    void set_attempts(std::size_t id, int attempts) {
        validate_attempts(attempts);
        at(id).attempts_remaining = attempts;
    }

    void rename(std::size_t id, std::string name) {
        at(id).name = std::move(name);
    }

    // ── Breeding ────────────────────────────────────────────────────────────

    /// Search every male × female pairing and cache the best one.
    const std::optional<PairingResult>& find_optimal_pair(RaceMode mode) {
        const SexPartition part = partition_by_sex(candidates_);
        spdlog::info("roster: {} males, {} females, {} pairings ({} mode)",
                     part.males.size(), part.females.size(),
                     part.num_pairings(),
                     mode == RaceMode::SuperSprint ? "super sprint" : "standard");

        const RankScorer rank{mode, scale_};
        optimal_ = find_best_pairing(candidates_,
            [&](const Candidate& father, const Candidate& mother) {
                const double score = rank(father, mother);
                spdlog::debug("roster: {} x {} -> {:.3f}",
                              label(father), label(mother), score);
                return score;
            });

        if (optimal_) {
            spdlog::info("roster: best pair {} x {} with expected rank {:.3f}",
                         label(optimal_->father), label(optimal_->mother),
                         optimal_->score);
        } else {
            spdlog::warn("roster: no pairing possible, need at least one male "
                         "and one female");
        }
        return optimal_;
    }

    [[nodiscard]] const std::optional<PairingResult>& optimal_pair() const noexcept {
        return optimal_;
    }

    void clear_optimal_pair() noexcept { optimal_.reset(); }

    /// Record one breeding of the cached optimal pair: each parent loses an
    /// attempt (never below zero).  The cached result keeps its score but
    /// carries the updated parents.  Returns false if no pair is cached.
    bool breed_optimal_pair() {
        if (!optimal_) return false;

        for (Candidate* parent : {&at(optimal_->father.id), &at(optimal_->mother.id)})
            parent->attempts_remaining = std::max(0, parent->attempts_remaining - 1);

        optimal_->father = at(optimal_->father.id);
        optimal_->mother = at(optimal_->mother.id);
        spdlog::info("roster: bred {} x {}, attempts left {} / {}",
                     label(optimal_->father), label(optimal_->mother),
                     optimal_->father.attempts_remaining,
                     optimal_->mother.attempts_remaining);
        return true;
    }

private:
    Candidate& at(std::size_t id) {
        auto it = std::find_if(candidates_.begin(), candidates_.end(),
                               [id](const Candidate& c) { return c.id == id; });
        if (it == candidates_.end())
            throw std::out_of_range("No candidate with id " + std::to_string(id));
        return *it;
    }

    std::vector<Candidate> of_sex(Sex sex) const {
        std::vector<Candidate> out;
        std::copy_if(candidates_.begin(), candidates_.end(),
                     std::back_inserter(out),
                     [sex](const Candidate& c) { return c.sex == sex; });
        return out;
    }

    static std::string label(const Candidate& c) {
        return c.name.empty() ? "#" + std::to_string(c.id) : c.name;
    }

    StatScale                    scale_;
    std::vector<Candidate>       candidates_;
    std::optional<PairingResult> optimal_;
    std::size_t                  next_id_ = 1;
};

}  // namespace breedcalc
