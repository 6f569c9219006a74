#include "breedcalc/ranking.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <compare>
#include <vector>

#include "breedcalc/genotype_space.hpp"
#include "test_helpers.hpp"

namespace breedcalc {
namespace {

using test_support::genotype;
using test_support::mixed_father;
using test_support::mixed_mother;

int sign(std::weak_ordering o) { return o < 0 ? -1 : (o > 0 ? 1 : 0); }

TEST(RankingCountsTest, WithMaxAndLocked) {
    const auto g = genotype({{4, 4}, {4, 1}, {1, 4}, {3, 3}, {2, 1}});
    EXPECT_EQ(count_with_max(g.stats, StatScale{}), 3);
    EXPECT_EQ(count_locked(g.stats, StatScale{}), 1);
}

TEST(RankingCountsTest, DependsOnScale) {
    const auto g = genotype({{4, 4}, {5, 1}, {1, 1}, {1, 1}, {1, 1}});
    const auto five = StatScale::with_max(5);
    EXPECT_EQ(count_with_max(g.stats, five), 1);
    EXPECT_EQ(count_locked(g.stats, five), 0);
}

TEST(RankingTest, MoreMaxStatsBeatsMoreLocked) {
    // Two stats touching the maximum outrank one locked stat.
    const auto a = genotype({{4, 1}, {4, 1}, {1, 1}, {1, 1}, {1, 1}});
    const auto b = genotype({{4, 4}, {1, 1}, {1, 1}, {1, 1}, {1, 1}});
    EXPECT_GT(sign(compare_genotypes(a, b)), 0);
    EXPECT_LT(sign(compare_genotypes(b, a)), 0);
}

TEST(RankingTest, LockedBreaksMaxTie) {
    const auto a = genotype({{4, 4}, {4, 1}, {1, 1}, {1, 1}, {1, 1}});
    const auto b = genotype({{4, 1}, {4, 1}, {1, 1}, {1, 1}, {1, 1}});
    EXPECT_GT(sign(compare_genotypes(a, b)), 0);
}

TEST(RankingTest, FormulaDependsOnMode) {
    const auto fast  = genotype({{3, 3}, {1, 1}, {1, 1}, {1, 1}, {1, 1}});
    const auto tough = genotype({{1, 1}, {1, 1}, {3, 3}, {1, 1}, {1, 1}});

    // Standard: maxSpeed + stamina - cunning - acceleration.
    EXPECT_GT(sign(compare_genotypes(fast, tough, RaceMode::Standard)), 0);
    // Super sprint: stamina + endurance - cunning - acceleration.
    EXPECT_LT(sign(compare_genotypes(fast, tough, RaceMode::SuperSprint)), 0);
}

TEST(RankingTest, CunningAndAccelerationCountAgainst) {
    const auto plain   = genotype({{1, 1}, {1, 1}, {1, 1}, {1, 1}, {1, 1}});
    const auto cunning = genotype({{1, 1}, {1, 1}, {1, 1}, {1, 1}, {3, 2}});
    const auto accel   = genotype({{1, 1}, {2, 2}, {1, 1}, {1, 1}, {1, 1}});
    for (RaceMode mode : {RaceMode::Standard, RaceMode::SuperSprint}) {
        EXPECT_GT(sign(compare_genotypes(plain, cunning, mode)), 0);
        EXPECT_GT(sign(compare_genotypes(plain, accel, mode)), 0);
    }
}

TEST(RankingTest, TiebreakEnduranceInStandard) {
    const auto a = genotype({{1, 1}, {1, 1}, {3, 3}, {1, 1}, {1, 1}});
    const auto b = genotype({{1, 1}, {1, 1}, {1, 1}, {1, 1}, {1, 1}});
    EXPECT_EQ(racing_formula_sum(a.stats, RaceMode::Standard),
              racing_formula_sum(b.stats, RaceMode::Standard));
    EXPECT_GT(sign(compare_genotypes(a, b, RaceMode::Standard)), 0);
}

TEST(RankingTest, TiebreakMaxSpeedInSuperSprint) {
    const auto a = genotype({{3, 3}, {1, 1}, {1, 1}, {1, 1}, {1, 1}});
    const auto b = genotype({{1, 1}, {1, 1}, {1, 1}, {1, 1}, {1, 1}});
    EXPECT_EQ(racing_formula_sum(a.stats, RaceMode::SuperSprint),
              racing_formula_sum(b.stats, RaceMode::SuperSprint));
    EXPECT_GT(sign(compare_genotypes(a, b, RaceMode::SuperSprint)), 0);
}

TEST(RankingTest, AlleleOrderWithinStatDoesNotMatter) {
    const auto a = genotype({{1, 3}, {2, 4}, {4, 1}, {3, 2}, {1, 2}});
    const auto b = genotype({{3, 1}, {4, 2}, {1, 4}, {2, 3}, {2, 1}});
    EXPECT_EQ(sign(compare_genotypes(a, b)), 0);
    EXPECT_EQ(sign(compare_genotypes(a, b, RaceMode::SuperSprint)), 0);
}

TEST(RankingTest, StrictWeakOrderingOverASpace) {
    const auto space = enumerate_genotypes(mixed_father(), mixed_mother());
    const GenotypeRanking rank{RaceMode::Standard, StatScale{}};

    const std::size_t n = 96;
    for (std::size_t i = 0; i < n; ++i) {
        EXPECT_FALSE(rank.less(space[i], space[i]));
        for (std::size_t j = 0; j < n; ++j) {
            const auto ij = rank(space[i], space[j]);
            const auto ji = rank(space[j], space[i]);
            EXPECT_EQ(ij < 0, ji > 0);
            EXPECT_EQ(ij == 0, ji == 0);
        }
    }

    auto sorted = space;
    std::stable_sort(sorted.begin(), sorted.end(),
        [&](const Genotype& a, const Genotype& b) { return rank.less(a, b); });
    for (std::size_t i = 1; i < sorted.size(); ++i)
        EXPECT_LE(sign(rank(sorted[i - 1], sorted[i])), 0);
}

}  // namespace
}  // namespace breedcalc
