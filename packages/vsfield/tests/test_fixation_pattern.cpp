#include <gtest/gtest.h>

#include <optional>
#include <set>
#include <utility>

#include "env/environment.hpp"
#include "recognition/fixation_pattern.hpp"
#include "recognition/salient_square_fixations.hpp"

using namespace vsfield;

TEST(NormaliseTest, DropsSentinelsAndRepeats) {
  ListPattern pattern = {{"A", 0, 0},
                         {kEmptySquareToken, 1, 0},
                         {kBlindSquareToken, 2, 0},
                         {kCreatorToken, 0, 1},
                         {"A", 0, 0},
                         {"B", 1, 1},
                         {"A", 2, 2}};

  ListPattern expected = {{"A", 0, 0}, {"B", 1, 1}, {"A", 2, 2}};
  EXPECT_EQ(expected, normalise(pattern));
}

class FixationPatternTest : public ::testing::Test {
protected:
  // A B .
  // C S D     (S is the creator; row 1)
  // E - F     (- is blind; row 0)
  Environment scene{"pattern", 3, 3};

  void SetUp() override {
    scene.add_item_to_square(0, 0, "e", "E");
    scene.add_item_to_square(2, 0, "f", "F");
    scene.add_item_to_square(0, 1, "c", "C");
    scene.add_creator(1, 1);
    scene.add_item_to_square(2, 1, "d", "D");
    scene.add_item_to_square(0, 2, "a", "A");
    scene.add_item_to_square(1, 2, "b", "B");
    scene.add_empty_square(2, 2);
  }
};

TEST_F(FixationPatternTest, ZeroFieldOfViewSeesOneSquare) {
  EXPECT_EQ((ListPattern{{"D", 2, 1}}), fixation_pattern(scene, Square(2, 1), 0));
  EXPECT_TRUE(fixation_pattern(scene, Square(1, 1), 0).empty());
  EXPECT_TRUE(fixation_pattern(scene, Square(1, 0), 0).empty());
}

// Test the neighbourhood is clipped at the edges and read south to north, west to east
TEST_F(FixationPatternTest, NeighbourhoodInRasterOrder) {
  ListPattern expected = {{"E", 0, 0}, {"C", 0, 1}};
  EXPECT_EQ(expected, fixation_pattern(scene, Square(0, 0), 1));

  ListPattern everything = {{"E", 0, 0}, {"F", 2, 0}, {"C", 0, 1}, {"D", 2, 1}, {"A", 0, 2}, {"B", 1, 2}};
  EXPECT_EQ(everything, fixation_pattern(scene, Square(1, 1), 1));
  EXPECT_EQ(everything, fixation_pattern(scene, Square(0, 0), 5));
}

TEST_F(FixationPatternTest, SalientFixationsChooseOnlyItems) {
  SalientSquareFixations fixations(42);
  std::set<std::pair<int, int>> chosen;

  for (unsigned int i = 0; i < 200; i++) {
    std::optional<Square> square = fixations.next_fixation(scene, i);
    ASSERT_TRUE(square.has_value());
    const SceneObject& contents = scene.square_contents(square->col, square->row);
    EXPECT_FALSE(is_sentinel_class(contents.object_class));
    chosen.emplace(square->col, square->row);
  }
  EXPECT_EQ(6u, chosen.size());
}

TEST_F(FixationPatternTest, SalientFixationsAreReproducible) {
  SalientSquareFixations first(7);
  SalientSquareFixations second(7);

  for (unsigned int i = 0; i < 20; i++) {
    EXPECT_EQ(first.next_fixation(scene, i), second.next_fixation(scene, i));
  }
}

TEST(SalientSquareFixationsTest, NothingToFixateOn) {
  Environment scene("nothing", 2, 2);
  scene.add_empty_square(0, 0);
  scene.add_creator(1, 1);

  SalientSquareFixations fixations(1);
  EXPECT_FALSE(fixations.next_fixation(scene, 0).has_value());
}
