#include <gtest/gtest.h>
#include "backup/shard_planner.hpp"
#include <stdexcept>

TEST(ShardPlannerTest, ExplicitSizeWins) {
    ShardPlanner planner;
    EXPECT_EQ(planner.plan(500 * ShardPlanner::kGiB, 3 * ShardPlanner::kMiB), 3 * ShardPlanner::kMiB);
}

TEST(ShardPlannerTest, AimsForHundredShards) {
    ShardPlanner planner;
    EXPECT_EQ(planner.plan(200 * ShardPlanner::kGiB, std::nullopt), 2 * ShardPlanner::kGiB);
}

TEST(ShardPlannerTest, ClampsToBounds) {
    ShardPlanner planner;
    EXPECT_EQ(planner.plan(100 * ShardPlanner::kMiB, std::nullopt), ShardPlanner::kDefaultMinSize);
    EXPECT_EQ(planner.plan(100000 * ShardPlanner::kGiB, std::nullopt), ShardPlanner::kDefaultMaxSize);
    EXPECT_EQ(planner.plan(0, std::nullopt), ShardPlanner::kDefaultMinSize);
}

TEST(ShardPlannerTest, FallsBackWithoutUsage) {
    ShardPlanner planner;
    EXPECT_EQ(planner.plan(std::nullopt, std::nullopt), ShardPlanner::kGiB);
    EXPECT_EQ(planner.plan(std::nullopt, 0), ShardPlanner::kGiB);

    ShardPlanner custom(ShardPlanner::kMiB, 4 * ShardPlanner::kMiB, 2 * ShardPlanner::kMiB);
    EXPECT_EQ(custom.plan(std::nullopt, std::nullopt), 2 * ShardPlanner::kMiB);
}

TEST(ShardPlannerTest, RejectsBadBounds) {
    EXPECT_THROW(ShardPlanner(0, ShardPlanner::kGiB, ShardPlanner::kGiB), std::invalid_argument);
    EXPECT_THROW(ShardPlanner(2 * ShardPlanner::kGiB, ShardPlanner::kGiB, ShardPlanner::kGiB), std::invalid_argument);
}
