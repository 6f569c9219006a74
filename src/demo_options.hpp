// =============================================================================
// demo_options.hpp — Positional command-line options of the demo driver.
//
//   breedcalc [per_sex] [seed] [stat_max 4|5] [super_sprint 0|1]
//
// Every argument is optional; a malformed one throws std::invalid_argument.
// =============================================================================
#pragma once

#include "breedcalc/types.hpp"

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace breedcalc::demo {

struct DemoOptions {
    std::size_t   per_sex = 4;
    std::uint64_t seed    = 42;
    StatScale     scale{};
    RaceMode      mode    = RaceMode::Standard;
};

/// Parse a whole argument as a non-negative integer.
inline std::uint64_t parse_unsigned(const std::string& name,
                                    const std::string& text) {
    const auto bad = [&] {
        return std::invalid_argument(
            name + " must be a non-negative integer, got '" + text + "'");
    };
    if (text.empty() || text.front() < '0' || text.front() > '9') throw bad();

    std::size_t used = 0;
    unsigned long long value = 0;
    try {
        value = std::stoull(text, &used);
    } catch (const std::out_of_range&) {
        throw bad();
    }
    if (used != text.size()) throw bad();
    return static_cast<std::uint64_t>(value);
}

inline DemoOptions parse_options(int argc, const char* const argv[]) {
    DemoOptions opt;
    if (argc >= 2) {
        opt.per_sex = static_cast<std::size_t>(parse_unsigned("per_sex", argv[1]));
        if (opt.per_sex == 0)
            throw std::invalid_argument("per_sex must be positive, got '" +
                                        std::string(argv[1]) + "'");
    }
    if (argc >= 3) opt.seed = parse_unsigned("seed", argv[2]);
    if (argc >= 4) {
        const std::uint64_t max = parse_unsigned("stat_max", argv[3]);
        if (max > 5)
            throw std::invalid_argument("stat_max must be 4 or 5, got '" +
                                        std::string(argv[3]) + "'");
        opt.scale = StatScale::with_max(static_cast<StatValue>(max));
    }
    if (argc >= 5 && parse_unsigned("super_sprint", argv[4]) != 0)
        opt.mode = RaceMode::SuperSprint;
    return opt;
}

}  // namespace breedcalc::demo
