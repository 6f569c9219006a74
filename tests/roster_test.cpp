#include "breedcalc/roster.hpp"

#include <gtest/gtest.h>
#include <spdlog/spdlog.h>

#include <stdexcept>

#include "test_helpers.hpp"

namespace breedcalc {
namespace {

using test_support::candidate;
using test_support::pairs;
using test_support::uniform_pairs;

class RosterTest : public ::testing::Test {
protected:
    void SetUp() override {
        spdlog::set_level(spdlog::level::warn);
        father_ = roster_.add(candidate(Sex::Male,
            pairs({{4, 1}, {2, 3}, {3, 4}, {1, 2}, {4, 2}}), 2));
        mother_ = roster_.add(candidate(Sex::Female,
            pairs({{2, 3}, {1, 4}, {4, 1}, {3, 3}, {1, 2}}), 3));
    }

    Roster      roster_;
    std::size_t father_ = 0;
    std::size_t mother_ = 0;
};

TEST_F(RosterTest, AddAssignsFreshIds) {
    EXPECT_NE(father_, mother_);
    const auto third = roster_.add(candidate(Sex::Male, uniform_pairs(2), 9, 77));
    EXPECT_NE(third, 77u);
    EXPECT_NE(third, father_);
    EXPECT_EQ(roster_.size(), 3u);
    ASSERT_NE(roster_.find(third), nullptr);
    EXPECT_EQ(roster_.find(third)->id, third);
}

TEST_F(RosterTest, AddRejectsInvalidRecordWithoutChangingState) {
    EXPECT_THROW(roster_.add(candidate(Sex::Male, uniform_pairs(5))),
                 InvalidStatValue);
    EXPECT_THROW(roster_.add(candidate(Sex::Male, uniform_pairs(2), 12)),
                 std::out_of_range);
    EXPECT_EQ(roster_.size(), 2u);
}

TEST_F(RosterTest, FiveStarRosterAcceptsFiveStarStats) {
    Roster legacy(StatScale::with_max(5));
    EXPECT_NO_THROW(legacy.add(candidate(Sex::Male, uniform_pairs(5))));
}

TEST_F(RosterTest, PartitionsBySex) {
    roster_.add(candidate(Sex::Female, uniform_pairs(3)));
    EXPECT_EQ(roster_.males().size(), 1u);
    EXPECT_EQ(roster_.females().size(), 2u);
}

TEST_F(RosterTest, UpdatesAreValidated) {
    roster_.update_stat(father_, Stat::Endurance, {4, 4});
    EXPECT_EQ((*roster_.find(father_))[Stat::Endurance], (AllelePair{4, 4}));

    EXPECT_THROW(roster_.update_stat(father_, Stat::Endurance, {0, 4}),
                 InvalidStatValue);
    EXPECT_THROW(roster_.set_attempts(father_, 11), std::out_of_range);
    EXPECT_THROW(roster_.set_attempts(12345, 3), std::out_of_range);

    roster_.set_attempts(father_, 7);
    EXPECT_EQ(roster_.find(father_)->attempts_remaining, 7);
    roster_.rename(mother_, "Clover");
    EXPECT_EQ(roster_.find(mother_)->name, "Clover");
}

TEST_F(RosterTest, FindOptimalPairCachesResult) {
    EXPECT_FALSE(roster_.optimal_pair().has_value());
    const auto& best = roster_.find_optimal_pair(RaceMode::Standard);
    ASSERT_TRUE(best.has_value());
    EXPECT_EQ(best->father.id, father_);
    EXPECT_EQ(best->mother.id, mother_);
    EXPECT_DOUBLE_EQ(best->score,
                     evaluate_pairing(*roster_.find(father_), *roster_.find(mother_)));
    EXPECT_TRUE(roster_.optimal_pair().has_value());

    roster_.clear_optimal_pair();
    EXPECT_FALSE(roster_.optimal_pair().has_value());
}

TEST_F(RosterTest, NoPairWithoutBothSexes) {
    Roster males_only;
    males_only.add(candidate(Sex::Male, uniform_pairs(4)));
    EXPECT_FALSE(males_only.find_optimal_pair(RaceMode::Standard).has_value());
    EXPECT_FALSE(males_only.breed_optimal_pair());
}

TEST_F(RosterTest, BreedingConsumesAttempts) {
    roster_.find_optimal_pair(RaceMode::Standard);
    ASSERT_TRUE(roster_.breed_optimal_pair());
    EXPECT_EQ(roster_.find(father_)->attempts_remaining, 1);
    EXPECT_EQ(roster_.find(mother_)->attempts_remaining, 2);
    EXPECT_EQ(roster_.optimal_pair()->father.attempts_remaining, 1);
    EXPECT_EQ(roster_.optimal_pair()->mother.attempts_remaining, 2);
}

TEST_F(RosterTest, BreedingUntilExhausted) {
    int rounds = 0;
    while (true) {
        const auto& best = roster_.find_optimal_pair(RaceMode::SuperSprint);
        ASSERT_TRUE(best.has_value());
        if (best->score == 0.0) break;
        ASSERT_TRUE(roster_.breed_optimal_pair());
        ++rounds;
        ASSERT_LE(rounds, kMaxAttempts);
    }
    EXPECT_EQ(rounds, 2);
    EXPECT_EQ(roster_.find(father_)->attempts_remaining, 0);
    EXPECT_EQ(roster_.find(mother_)->attempts_remaining, 1);

    // Attempts never go below zero.
    ASSERT_TRUE(roster_.breed_optimal_pair());
    EXPECT_EQ(roster_.find(father_)->attempts_remaining, 0);
}

TEST_F(RosterTest, RemovingAParentClearsOptimalPair) {
    const auto other = roster_.add(candidate(Sex::Female, uniform_pairs(1)));
    roster_.find_optimal_pair(RaceMode::Standard);
    ASSERT_TRUE(roster_.optimal_pair().has_value());

    // Unrelated removal keeps the cached pair.
    if (roster_.optimal_pair()->mother.id != other) {
        EXPECT_TRUE(roster_.remove(other));
        EXPECT_TRUE(roster_.optimal_pair().has_value());
    }

    EXPECT_TRUE(roster_.remove(father_));
    EXPECT_FALSE(roster_.optimal_pair().has_value());
    EXPECT_EQ(roster_.find(father_), nullptr);
    EXPECT_FALSE(roster_.remove(father_));
}

}  // namespace
}  // namespace breedcalc
