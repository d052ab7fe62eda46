#include <gtest/gtest.h>

#include <stdexcept>

#include "env/environment.hpp"

using namespace vsfield;

TEST(EnvironmentTest, SquaresStartBlind) {
  Environment scene("scene", 4, 3);

  EXPECT_EQ(4, scene.width());
  EXPECT_EQ(3, scene.height());
  EXPECT_TRUE(scene.is_blind(3, 2));
  EXPECT_EQ(kBlindSquareToken, scene.square_contents(0, 0).identifier);
  EXPECT_TRUE(scene.is_entirely_blind());
  EXPECT_FALSE(scene.creator_square().has_value());
}

TEST(EnvironmentTest, ItemsReplaceSquareContents) {
  Environment scene("scene", 2, 2);
  scene.add_item_to_square(1, 0, "o1", "A");
  scene.add_empty_square(0, 1);

  EXPECT_EQ("o1", scene.square_contents(1, 0).identifier);
  EXPECT_EQ("A", scene.square_contents(1, 0).object_class);
  EXPECT_TRUE(scene.is_empty(0, 1));
  EXPECT_FALSE(scene.is_entirely_blind());

  scene.add_item_to_square(1, 0, "o2", "B");
  EXPECT_EQ("o2", scene.square_contents(1, 0).identifier);
}

// Test the creator cannot see its own square
TEST(EnvironmentTest, CreatorAloneIsEntirelyBlind) {
  Environment scene("scene", 3, 3);
  scene.add_creator(1, 2, "self");

  EXPECT_TRUE(scene.is_creator(1, 2));
  EXPECT_TRUE(scene.is_entirely_blind());
  ASSERT_TRUE(scene.creator_square().has_value());
  EXPECT_EQ(Square(1, 2), *scene.creator_square());
}

TEST(EnvironmentTest, OnlyOneCreator) {
  Environment scene("scene", 3, 3);
  scene.add_creator(0, 0);

  EXPECT_THROW(scene.add_creator(1, 1), std::invalid_argument);
  EXPECT_NO_THROW(scene.add_creator(0, 0, "renamed"));
}

TEST(EnvironmentTest, OutOfRangeSquaresRejected) {
  Environment scene("scene", 2, 2);

  EXPECT_THROW(scene.square_contents(2, 0), std::out_of_range);
  EXPECT_THROW(scene.square_contents(0, -1), std::out_of_range);
  EXPECT_THROW(scene.add_item_to_square(5, 5, "o1", "A"), std::out_of_range);
}

TEST(EnvironmentTest, EqualityIgnoresName) {
  Environment first("first", 2, 1);
  Environment second("second", 2, 1);
  first.add_item_to_square(0, 0, "o1", "A");

  EXPECT_NE(first, second);
  second.add_item_to_square(0, 0, "o1", "A");
  EXPECT_EQ(first, second);
  EXPECT_NE(first, Environment("third", 1, 2));
}
