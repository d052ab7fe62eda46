#include <gtest/gtest.h>

#include "systems/stats_tracker.hpp"

using namespace vsfield;

// Test fixture for StatsTracker
class StatsTrackerTest : public ::testing::Test {
protected:
  StatsTracker stats;
};

TEST_F(StatsTrackerTest, MissingKeysReadZero) {
  EXPECT_EQ(0, stats.get("construction.fixations"));
  EXPECT_TRUE(stats.to_dict().empty());
}

TEST_F(StatsTrackerTest, IncrementAndAdd) {
  stats.incr("moves.batches");
  stats.incr("moves.batches");
  stats.add("moves.sequences", 5);
  stats.add("moves.sequences", -2);

  EXPECT_EQ(2, stats.get("moves.batches"));
  EXPECT_EQ(3, stats.get("moves.sequences"));
}

// Test merging a scratch tracker from an accepted operation
TEST_F(StatsTrackerTest, MergeAddsCounts) {
  StatsTracker scratch;
  scratch.incr("construction.objects_recognised");
  scratch.add("construction.empty_squares_encoded", 4);
  stats.add("construction.empty_squares_encoded", 1);

  stats.merge(scratch);

  EXPECT_EQ(1, stats.get("construction.objects_recognised"));
  EXPECT_EQ(5, stats.get("construction.empty_squares_encoded"));
  EXPECT_EQ(2u, stats.to_dict().size());
  EXPECT_EQ(4, scratch.get("construction.empty_squares_encoded"));
}

TEST_F(StatsTrackerTest, Reset) {
  stats.incr("moves.left_field");
  stats.reset();

  EXPECT_EQ(0, stats.get("moves.left_field"));
  EXPECT_TRUE(stats.to_dict().empty());
}
