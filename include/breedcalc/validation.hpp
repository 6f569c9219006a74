// =============================================================================
// validation.hpp — Defensive range checks for candidate records.
//
// Candidates normally arrive already validated by whatever loaded them.  The
// scoring functions therefore never re-check; these helpers exist for the
// places that accept raw records (the Roster, the demo driver, tests).
// =============================================================================
#pragma once

#include "types.hpp"

#include <stdexcept>
#include <string>

namespace breedcalc {

// ─────────────────────────────────────────────────────────────────────────────
// InvalidStatValue
// ─────────────────────────────────────────────────────────────────────────────
// Raised when a stat lies outside the active StatScale.  Carries the offending
// stat and value so callers can report them without parsing the message.
class InvalidStatValue : public std::invalid_argument {
public:
    InvalidStatValue(Stat stat, StatValue value, const StatScale& scale)
        : std::invalid_argument(
              std::string("Stat value ") + std::to_string(value) + " for " +
              stat_name(stat) + " is outside [" + std::to_string(scale.min) +
              ", " + std::to_string(scale.max) + "]"),
          stat_(stat),
          value_(value) {}

    [[nodiscard]] Stat stat() const noexcept { return stat_; }
    [[nodiscard]] StatValue value() const noexcept { return value_; }

private:
    Stat      stat_;
    StatValue value_;
};

/// Throws InvalidStatValue if either allele of `pair` is outside `scale`.
inline void validate_pair(Stat stat, const AllelePair& pair,
                          const StatScale& scale) {
    if (!scale.contains(pair.first))
        throw InvalidStatValue(stat, pair.first, scale);
    if (!scale.contains(pair.second))
        throw InvalidStatValue(stat, pair.second, scale);
}

/// Throws std::out_of_range unless 0 <= attempts <= kMaxAttempts.
inline void validate_attempts(int attempts) {
    if (attempts < 0 || attempts > kMaxAttempts)
        throw std::out_of_range(
            "attemptsRemaining " + std::to_string(attempts) +
            " is outside [0, " + std::to_string(kMaxAttempts) + "]");
}

/// Full check of a candidate record against `scale`.
inline void validate_candidate(const Candidate& c,
                               const StatScale& scale = StatScale{}) {
    for (Stat s : kAllStats) validate_pair(s, c[s], scale);
    validate_attempts(c.attempts_remaining);
}

/// Non-throwing variant for filters and assertions.
[[nodiscard]] inline bool is_valid_candidate(
    const Candidate& c, const StatScale& scale = StatScale{}) noexcept {
    for (Stat s : kAllStats) {
        if (!scale.contains(c[s].first) || !scale.contains(c[s].second))
            return false;
    }
    return c.attempts_remaining >= 0 && c.attempts_remaining <= kMaxAttempts;
}

}  // namespace breedcalc
