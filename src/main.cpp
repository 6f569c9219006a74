// =============================================================================
// main.cpp — Runnable example for the breeding evaluator.
//
// Builds a random roster, prints every pairing under both scoring
// conventions, then breeds the optimal pair over and over until no pairing
// can produce offspring any more.
//
// Run:
//   ./breedcalc                       # defaults
//   ./breedcalc 4 42 4 0              # per_sex seed stat_max super_sprint
//
// Logging verbosity follows SPDLOG_LEVEL (e.g. SPDLOG_LEVEL=debug).
// =============================================================================

#include "breedcalc/breedcalc.hpp"
#include "demo_options.hpp"

#include <spdlog/cfg/env.h>
#include <spdlog/spdlog.h>

#include <cstdint>
#include <cstdlib>
#include <exception>
#include <iomanip>
#include <iostream>
#include <random>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

breedcalc::Candidate random_candidate(breedcalc::Sex sex,
                                      const breedcalc::StatScale& scale,
                                      std::mt19937_64& rng)
{
    std::uniform_int_distribution<int> star(scale.min, scale.max);
    std::uniform_int_distribution<int> attempts(1, breedcalc::kMaxAttempts);

    breedcalc::Candidate c;
    c.sex = sex;
    for (auto& p : c.stats) p = {star(rng), star(rng)};
    c.attempts_remaining = attempts(rng);
    return c;
}

// =====================================================================
// 1. Roster summary
// =====================================================================
void print_roster(const breedcalc::Roster& roster)
{
    using namespace breedcalc;
    std::cout << "============================================================\n"
              << " [1] Roster | " << roster.size() << " candidates, stats 1.."
              << roster.scale().max << "\n"
              << "============================================================\n";
    std::cout << "  name  sex  stats (ms ac en st cu)        stars locked max  att\n";
    for (const auto& c : roster.candidates()) {
        std::cout << "  " << std::setw(4) << std::left << c.name << std::right
                  << "  " << (c.sex == Sex::Male ? " M " : " F ") << " ";
        for (Stat s : kAllStats)
            std::cout << " " << c[s].first << "/" << c[s].second;
        std::cout << "  " << std::setw(5) << total_stars(c)
                  << std::setw(7) << locked_stat_count(c, roster.scale())
                  << std::setw(4) << max_star_allele_count(c, roster.scale())
                  << std::setw(5) << c.attempts_remaining << "\n";
    }
    std::cout << "\n";
}

// =====================================================================
// 2. Every pairing under both conventions
// =====================================================================
void print_pairings(const breedcalc::Roster& roster, breedcalc::RaceMode mode)
{
    using namespace breedcalc;
    std::cout << "============================================================\n"
              << " [2] Pairings | "
              << (mode == RaceMode::SuperSprint ? "super sprint" : "standard")
              << " mode\n"
              << "============================================================\n"
              << "  father mother  sibs  best-of-N rank  single-offspring %\n";

    const auto males   = roster.males();
    const auto females = roster.females();
    for (const auto& m : males) {
        for (const auto& f : females) {
            std::cout << "  " << std::setw(6) << m.name
                      << " " << std::setw(6) << f.name
                      << std::setw(6) << sibling_count(m, f)
                      << std::fixed << std::setprecision(3)
                      << std::setw(16) << evaluate_pairing(m, f, mode, roster.scale())
                      << std::setprecision(2)
                      << std::setw(20) << expected_quality_percent(m, f, mode, roster.scale())
                      << "\n";
        }
    }
    std::cout << "\n";
}

// =====================================================================
// 3. Breed the optimal pair until nothing can breed
// =====================================================================
void run_breeding_rounds(breedcalc::Roster& roster, breedcalc::RaceMode mode)
{
    using namespace breedcalc;
    std::cout << "============================================================\n"
              << " [3] Breeding rounds\n"
              << "============================================================\n";

    std::size_t round = 0;
    for (;;) {
        const auto& best = roster.find_optimal_pair(mode);
        if (!best || best->score <= 0.0) break;

        std::cout << "round " << std::setw(3) << ++round
                  << "  " << best->father.name << " x " << best->mother.name
                  << "  rank=" << std::fixed << std::setprecision(3) << best->score;
        if (!roster.breed_optimal_pair()) break;
        std::cout << "  left=" << best->father.attempts_remaining
                  << "/" << best->mother.attempts_remaining << "\n";
    }
    std::cout << "  " << round << " offspring bred; no pairing has attempts left.\n\n";
}

}  // namespace

// =====================================================================
// main
// =====================================================================
int main(int argc, char* argv[])
{
    spdlog::cfg::load_env_levels();

    breedcalc::demo::DemoOptions opt;
    try {
        opt = breedcalc::demo::parse_options(argc, argv);
    } catch (const std::exception& e) {
        spdlog::error("{}", e.what());
        std::cerr << "usage: " << argv[0]
                  << " [per_sex] [seed] [stat_max 4|5] [super_sprint 0|1]\n";
        return EXIT_FAILURE;
    }

    std::cout << "+----------------------------------------------------------+\n"
              << "|  Breeding Pair Evaluator  --  Demo                       |\n"
              << "+----------------------------------------------------------+\n\n";

    std::mt19937_64 rng(opt.seed);
    breedcalc::Roster roster(opt.scale);
    for (std::size_t i = 0; i < opt.per_sex; ++i) {
        auto id = roster.add(random_candidate(breedcalc::Sex::Male, opt.scale, rng));
        roster.rename(id, "M" + std::to_string(i + 1));
        id = roster.add(random_candidate(breedcalc::Sex::Female, opt.scale, rng));
        roster.rename(id, "F" + std::to_string(i + 1));
    }

    print_roster(roster);
    print_pairings(roster, opt.mode);
    run_breeding_rounds(roster, opt.mode);

    std::cout << "+----------------------------------------------------------+\n"
              << "|  Demo completed.                                         |\n"
              << "+----------------------------------------------------------+\n";
    return EXIT_SUCCESS;
}
