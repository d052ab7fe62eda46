#include <gtest/gtest.h>

#include <stdexcept>

#include "core/attention_clock.hpp"
#include "core/errors.hpp"

using namespace vsfield;

TEST(AttentionClockTest, StartsAtGivenTime) {
  EXPECT_EQ(0, AttentionClock().time());
  EXPECT_EQ(250, AttentionClock(250).time());
}

TEST(AttentionClockTest, FreeFromCurrentTimeOnwards) {
  AttentionClock clock(100);

  EXPECT_FALSE(clock.is_free_at(99));
  EXPECT_TRUE(clock.is_free_at(100));
  EXPECT_TRUE(clock.is_free_at(101));
  EXPECT_NO_THROW(clock.check_free_at(100));
}

TEST(AttentionClockTest, BusyErrorCarriesTimes) {
  AttentionClock clock(100);

  try {
    clock.check_free_at(40);
    FAIL() << "Expected AttentionBusyError";
  } catch (const AttentionBusyError& e) {
    EXPECT_EQ(40, e.requested_time());
    EXPECT_EQ(100, e.clock_time());
  }
  EXPECT_EQ(100, clock.time());
}

TEST(AttentionClockTest, NeverMovesBackwards) {
  AttentionClock clock(100);

  clock.advance_to(100);
  clock.advance_to(180);
  EXPECT_EQ(180, clock.time());
  EXPECT_THROW(clock.advance_to(179), std::logic_error);
  EXPECT_EQ(180, clock.time());
}

// Test busy errors belong to the field error family
TEST(AttentionClockTest, BusyErrorIsFieldError) {
  AttentionClock clock(10);
  EXPECT_THROW(clock.check_free_at(0), FieldError);
}
