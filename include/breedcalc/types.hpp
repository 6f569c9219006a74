// =============================================================================
// types.hpp — Core type aliases and constants for the breeding evaluator.
//
// Centralises every fundamental type so that a change of stat scale (e.g.
// moving from 4-star to 5-star stats) propagates automatically.
// =============================================================================
#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace breedcalc {

// ── Stat value ──────────────────────────────────────────────────────────────
// Star rating of one inherited stat.  Always within the active StatScale.
using StatValue = int;

// ── Stat identifiers ────────────────────────────────────────────────────────
// The order is fixed: genotype enumeration and the racing formula rely on it.
enum class Stat : std::uint8_t {
    MaxSpeed     = 0,
    Acceleration = 1,
    Endurance    = 2,
    Stamina      = 3,
    Cunning      = 4
};

inline constexpr std::size_t kNumStats = 5;

inline constexpr std::array<Stat, kNumStats> kAllStats = {
    Stat::MaxSpeed, Stat::Acceleration, Stat::Endurance,
    Stat::Stamina,  Stat::Cunning
};

constexpr std::size_t stat_index(Stat s) noexcept {
    return static_cast<std::size_t>(s);
}

inline const char* stat_name(Stat s) noexcept {
    switch (s) {
        case Stat::MaxSpeed:     return "max speed";
        case Stat::Acceleration: return "acceleration";
        case Stat::Endurance:    return "endurance";
        case Stat::Stamina:      return "stamina";
        case Stat::Cunning:      return "cunning";
    }
    return "unknown";
}

// ── Sex ─────────────────────────────────────────────────────────────────────
enum class Sex : std::uint8_t {
    Female = 0,
    Male   = 1
};

// ── Race mode ───────────────────────────────────────────────────────────────
// Selects the racing formula used as the third ranking criterion.  Fixed for
// a whole comparison, ranking or search.
enum class RaceMode : std::uint8_t {
    Standard    = 0,
    SuperSprint = 1
};

// ── Stat scale ──────────────────────────────────────────────────────────────
// The closed range of a StatValue.  The maximum is a versioned constant of
// the domain: 4 for the current game rules, 5 for legacy data.
struct StatScale {
    StatValue min = 1;
    StatValue max = 4;

    /// Build a scale with the given maximum.  Only 4 and 5 are known.
    static StatScale with_max(StatValue max_value) {
        if (max_value != 4 && max_value != 5)
            throw std::invalid_argument(
                "Unsupported stat maximum " + std::to_string(max_value) +
                " (expected 4 or 5)");
        return StatScale{1, max_value};
    }

    [[nodiscard]] constexpr bool contains(StatValue v) const noexcept {
        return v >= min && v <= max;
    }
};

// ── Breeding limits ─────────────────────────────────────────────────────────

/// Highest attemptsRemaining a candidate may carry.
inline constexpr int kMaxAttempts = 10;

/// Most offspring a single pairing can produce before the game stops it.
inline constexpr int kMaxSiblings = 9;

/// Four allele combinations per stat, five stats: 4^5.
inline constexpr std::size_t kChoicesPerStat   = 4;
inline constexpr std::size_t kGenotypeSpaceSize = 1024;

// ── Allele pair ─────────────────────────────────────────────────────────────
// For a candidate: (fromGrandfather, fromGrandmother).
// For a genotype:  (fatherAllele, motherAllele).
struct AllelePair {
    StatValue first  = 1;
    StatValue second = 1;

    [[nodiscard]] constexpr int sum() const noexcept { return first + second; }

    friend constexpr bool operator==(const AllelePair&, const AllelePair&) = default;
};

using StatPairs = std::array<AllelePair, kNumStats>;

// ── Candidate ───────────────────────────────────────────────────────────────
/// A potential parent.  Only `sex`, `stats` and `attempts_remaining` take
/// part in scoring; `id` and `name` belong to whoever owns the record.
struct Candidate {
    std::size_t id   = 0;
    std::string name;
    Sex         sex  = Sex::Female;
    StatPairs   stats{};
    int         attempts_remaining = kMaxSiblings;

    [[nodiscard]] const AllelePair& operator[](Stat s) const noexcept {
        return stats[stat_index(s)];
    }
    [[nodiscard]] AllelePair& operator[](Stat s) noexcept {
        return stats[stat_index(s)];
    }

    friend bool operator==(const Candidate&, const Candidate&) = default;
};

// ── Genotype ────────────────────────────────────────────────────────────────
/// One hypothetical offspring.  Transient; created during evaluation only.
struct Genotype {
    StatPairs stats{};

    [[nodiscard]] const AllelePair& operator[](Stat s) const noexcept {
        return stats[stat_index(s)];
    }

    friend constexpr bool operator==(const Genotype&, const Genotype&) = default;
};

}  // namespace breedcalc
