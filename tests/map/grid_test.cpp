// Tests for map/grid.h -- storage and area primitives.

#include "map/grid.h"

#include <gtest/gtest.h>

namespace cavewalk {
namespace {

TEST(GridTest, ConstructionFillsEveryCell) {
  Grid grid(7, 5, CellType::Hookable, Position(2, 3));
  EXPECT_EQ(grid.width(), 7u);
  EXPECT_EQ(grid.height(), 5u);
  EXPECT_EQ(grid.spawn(), Position(2, 3));
  EXPECT_EQ(grid.cells().size(), 35u);
  EXPECT_EQ(grid.count(CellType::Hookable), 35u);
}

TEST(GridTest, BoundsAndRowMajorIndex) {
  Grid grid(4, 3, CellType::Hookable, Position(0, 0));
  EXPECT_TRUE(grid.inBounds(0, 0));
  EXPECT_TRUE(grid.inBounds(3, 2));
  EXPECT_FALSE(grid.inBounds(4, 0));
  EXPECT_FALSE(grid.inBounds(0, 3));
  EXPECT_FALSE(grid.inBounds(-1, 1));
  EXPECT_EQ(grid.index(1, 2), 9u);
}

TEST(GridTest, TrySetRejectsOutOfBounds) {
  Grid grid(4, 4, CellType::Hookable, Position(0, 0));
  EXPECT_TRUE(grid.trySet(Position(1, 1), CellType::Empty));
  EXPECT_EQ(grid.at(1, 1), CellType::Empty);
  EXPECT_FALSE(grid.trySet(Position(4, 1), CellType::Empty));
  EXPECT_FALSE(grid.trySet(Position(1, -1), CellType::Empty));
  EXPECT_EQ(grid.count(CellType::Empty), 1u);
}

// ---------------------------------------------------------------------------
// setArea
// ---------------------------------------------------------------------------

TEST(GridTest, SetAreaFillsInclusiveRectangle) {
  Grid grid(10, 10, CellType::Hookable, Position(0, 0));
  EXPECT_EQ(grid.setArea(Position(2, 3), Position(4, 5), CellType::Empty, true), 9u);
  EXPECT_EQ(grid.at(2, 3), CellType::Empty);
  EXPECT_EQ(grid.at(4, 5), CellType::Empty);
  EXPECT_EQ(grid.at(5, 5), CellType::Hookable);
  EXPECT_EQ(grid.count(CellType::Empty), 9u);
}

TEST(GridTest, SetAreaNormalisesCorners) {
  Grid grid(10, 10, CellType::Hookable, Position(0, 0));
  EXPECT_EQ(grid.setArea(Position(4, 5), Position(2, 3), CellType::Empty, true), 9u);
  EXPECT_EQ(grid.at(3, 4), CellType::Empty);
}

TEST(GridTest, SetAreaClipsAtEdges) {
  Grid grid(5, 5, CellType::Hookable, Position(0, 0));
  EXPECT_EQ(grid.setArea(Position(-3, -3), Position(1, 1), CellType::Empty, true), 4u);
  EXPECT_EQ(grid.setArea(Position(4, 4), Position(9, 9), CellType::Freeze, true), 1u);
  EXPECT_EQ(grid.setArea(Position(10, 10), Position(12, 12), CellType::Empty, true), 0u);
  EXPECT_EQ(grid.setArea(Position(-5, 0), Position(-1, 4), CellType::Empty, true), 0u);
}

TEST(GridTest, SetAreaWithoutOverwriteOnlyWritesHookable) {
  Grid grid(5, 5, CellType::Hookable, Position(0, 0));
  grid.at(2, 2) = CellType::Empty;
  grid.at(1, 1) = CellType::Start;
  size_t written = grid.setArea(Position(0, 0), Position(4, 4), CellType::Freeze, false);
  EXPECT_EQ(written, 23u);
  EXPECT_EQ(grid.at(2, 2), CellType::Empty);
  EXPECT_EQ(grid.at(1, 1), CellType::Start);
  EXPECT_EQ(grid.at(0, 0), CellType::Freeze);
}

TEST(GridTest, SetAreaCountsOnlyChangedCells) {
  Grid grid(5, 5, CellType::Hookable, Position(0, 0));
  grid.setArea(Position(0, 0), Position(1, 1), CellType::Empty, true);
  EXPECT_EQ(grid.setArea(Position(0, 0), Position(2, 2), CellType::Empty, true), 5u);
}

// ---------------------------------------------------------------------------
// setAreaBorder
// ---------------------------------------------------------------------------

TEST(GridTest, SetAreaBorderWritesOnlyTheRing) {
  Grid grid(9, 9, CellType::Hookable, Position(0, 0));
  EXPECT_EQ(grid.setAreaBorder(Position(2, 2), Position(6, 6), CellType::Finish, true), 16u);
  EXPECT_EQ(grid.at(2, 2), CellType::Finish);
  EXPECT_EQ(grid.at(6, 4), CellType::Finish);
  EXPECT_EQ(grid.at(4, 6), CellType::Finish);
  EXPECT_EQ(grid.at(4, 4), CellType::Hookable);
  EXPECT_EQ(grid.at(3, 3), CellType::Hookable);
}

TEST(GridTest, SetAreaBorderDropsOffGridCells) {
  Grid grid(5, 5, CellType::Hookable, Position(0, 0));
  // Ring from (-1,-1) to (2,2): only the right column and bottom row overlap.
  EXPECT_EQ(grid.setAreaBorder(Position(-1, -1), Position(2, 2), CellType::Start, true), 5u);
  EXPECT_EQ(grid.at(2, 0), CellType::Start);
  EXPECT_EQ(grid.at(0, 2), CellType::Start);
  EXPECT_EQ(grid.at(0, 0), CellType::Hookable);
}

TEST(GridTest, SetAreaBorderDegenerateRectangle) {
  Grid grid(5, 5, CellType::Hookable, Position(0, 0));
  EXPECT_EQ(grid.setAreaBorder(Position(2, 2), Position(2, 2), CellType::Empty, true), 1u);
  EXPECT_EQ(grid.setAreaBorder(Position(0, 4), Position(4, 4), CellType::Empty, true), 5u);
}

TEST(GridTest, Equality) {
  Grid lhs(3, 3, CellType::Hookable, Position(1, 1));
  Grid rhs(3, 3, CellType::Hookable, Position(1, 1));
  EXPECT_EQ(lhs, rhs);
  rhs.at(0, 0) = CellType::Empty;
  EXPECT_NE(lhs, rhs);
  rhs.at(0, 0) = CellType::Hookable;
  rhs.setSpawn(Position(2, 2));
  EXPECT_NE(lhs, rhs);
}

}  // namespace
}  // namespace cavewalk
