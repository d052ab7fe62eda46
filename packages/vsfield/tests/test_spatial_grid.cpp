#include <gtest/gtest.h>

#include <stdexcept>

#include "core/errors.hpp"
#include "core/spatial_grid.hpp"

using namespace vsfield;

class SpatialGridTest : public ::testing::Test {
protected:
  SpatialGrid grid{3, 2};
};

TEST_F(SpatialGridTest, Dimensions) {
  EXPECT_EQ(3, grid.width);
  EXPECT_EQ(2, grid.height);
  EXPECT_TRUE(grid.is_valid_square(2, 1));
  EXPECT_FALSE(grid.is_valid_square(3, 1));
  EXPECT_FALSE(grid.is_valid_square(0, 2));
  EXPECT_FALSE(grid.is_valid_square(-1, 0));
  EXPECT_EQ(0u, grid.object_count());
}

TEST_F(SpatialGridTest, HistoryKeptInInsertionOrder) {
  Square square(1, 1);
  grid.add_object(square, SpatialObject::blind(0));
  grid.add_object(square, SpatialObject("o1", "A", 10, 20, false, false));

  const CellHistory& history = grid.contents(square);
  ASSERT_EQ(2u, history.size());
  EXPECT_TRUE(history[0].is_blind());
  EXPECT_EQ("o1", history[1].identifier());
  EXPECT_TRUE(grid.contents(Square(0, 0)).empty());
  EXPECT_EQ(2u, grid.object_count());
}

TEST_F(SpatialGridTest, InvalidSquareThrows) {
  EXPECT_THROW(grid.contents(Square(3, 0)), std::out_of_range);
  EXPECT_THROW(grid.add_object(Square(0, 5), SpatialObject::blind(0)), std::out_of_range);
}

TEST_F(SpatialGridTest, AliveAtFiltersByTime) {
  Square square(0, 0);
  grid.add_object(square, SpatialObject("o1", "A", 0, 10, false, false));
  grid.add_object(square, SpatialObject("o2", "B", 5, 20, false, false));

  EXPECT_EQ(1u, grid.alive_at(square, 0).size());
  EXPECT_EQ(2u, grid.alive_at(square, 5).size());
  ASSERT_EQ(1u, grid.alive_at(square, 10).size());
  EXPECT_EQ("o2", grid.alive_at(square, 10)[0]->identifier());
  EXPECT_TRUE(grid.alive_at(square, 20).empty());
  EXPECT_TRUE(grid.has_alive_object(square, 19));
  EXPECT_FALSE(grid.has_alive_object(square, 20));
}

TEST_F(SpatialGridTest, FindAliveReturnsLatest) {
  Square square(2, 0);
  grid.add_object(square, SpatialObject("o1", "A", 0, 10, false, false));
  grid.add_object(square, SpatialObject("o1", "A", 10, 30, false, false));

  SpatialObject* found = grid.find_alive(square, "o1", 12);
  ASSERT_NE(nullptr, found);
  EXPECT_EQ(10, found->time_created());
  EXPECT_EQ(nullptr, grid.find_alive(square, "o1", 30));
  EXPECT_EQ(nullptr, grid.find_alive(square, "o2", 12));
}

// Test that overwriting ends placeholders and ghosts but not real objects or the creator
TEST_F(SpatialGridTest, OverwriteEndsPlaceholdersAndGhosts) {
  Square square(1, 0);
  grid.add_object(square, SpatialObject::blind(0));
  grid.add_object(square, SpatialObject("ghost0", "G", 0, 100, true, true));
  grid.add_object(square, SpatialObject("o1", "A", 0, 100, false, false));
  grid.add_object(square, SpatialObject("self", kCreatorToken, 0, std::nullopt, false, false));
  grid.add_object(square, SpatialObject::empty(kEmptySquareToken, 0, 3));

  EXPECT_EQ(2u, grid.overwrite(square, 5));

  const CellHistory& history = grid.contents(square);
  EXPECT_EQ(std::optional<Tick>(5), history[0].terminus());
  EXPECT_EQ(std::optional<Tick>(5), history[1].terminus());
  EXPECT_EQ(std::optional<Tick>(100), history[2].terminus());
  EXPECT_FALSE(history[3].terminus().has_value());
  EXPECT_EQ(std::optional<Tick>(3), history[4].terminus());
}

TEST_F(SpatialGridTest, DuplicateIdentifiersOnTwoSquaresRejected) {
  grid.add_object(Square(0, 0), SpatialObject("o1", "A", 0, 10, false, false));
  grid.add_object(Square(2, 1), SpatialObject("o1", "B", 0, 10, false, false));

  try {
    grid.check_for_duplicate_objects();
    FAIL() << "Expected DuplicateObjectError";
  } catch (const DuplicateObjectError& e) {
    EXPECT_EQ("o1", e.identifier());
  }
}

TEST_F(SpatialGridTest, RepeatedIdentifierOnOneSquareAllowed) {
  grid.add_object(Square(0, 0), SpatialObject("o1", "A", 0, 10, false, false));
  grid.add_object(Square(0, 0), SpatialObject("o1", "A", 10, 20, false, false));
  grid.add_object(Square(1, 0), SpatialObject::empty(kEmptySquareToken, 0, 10));
  grid.add_object(Square(2, 0), SpatialObject::empty(kEmptySquareToken, 0, 10));
  grid.add_object(Square(1, 1), SpatialObject::blind(0));
  grid.add_object(Square(2, 1), SpatialObject::blind(0));

  EXPECT_NO_THROW(grid.check_for_duplicate_objects());
}
