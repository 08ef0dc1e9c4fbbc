// Tests for core/position.h -- grid coordinates and shift directions.

#include "core/position.h"

#include <gtest/gtest.h>

#include <algorithm>
#include <string>
#include <vector>

namespace cavewalk {
namespace {

TEST(PositionTest, Arithmetic) {
  Position pos(3, 4);
  EXPECT_EQ(pos + Position(1, -2), Position(4, 2));
  EXPECT_EQ(pos - Position(3, 4), Position(0, 0));
  EXPECT_EQ(pos * 3, Position(9, 12));
  EXPECT_NE(pos, Position(4, 3));
}

TEST(PositionTest, Distances) {
  Position origin(0, 0);
  Position pos(3, 4);
  EXPECT_EQ(origin.distanceSquared(pos), 25);
  EXPECT_FLOAT_EQ(origin.distance(pos), 5.0f);
  EXPECT_EQ(origin.chebyshevDistance(pos), 4);
  EXPECT_EQ(pos.chebyshevDistance(Position(-2, 4)), 5);
}

TEST(PositionTest, DistanceSquaredDoesNotOverflow) {
  Position lhs(-100000, -100000);
  Position rhs(100000, 100000);
  EXPECT_EQ(lhs.distanceSquared(rhs), int64_t{80000000000});
}

TEST(PositionTest, OrderingIsRowMajor) {
  std::vector<Position> points = {Position(5, 1), Position(0, 2), Position(2, 1)};
  std::sort(points.begin(), points.end());
  EXPECT_EQ(points[0], Position(2, 1));
  EXPECT_EQ(points[1], Position(5, 1));
  EXPECT_EQ(points[2], Position(0, 2));
}

TEST(ShiftDirectionTest, DeltasPointYDown) {
  EXPECT_EQ(shiftDelta(ShiftDirection::Up), Position(0, -1));
  EXPECT_EQ(shiftDelta(ShiftDirection::Right), Position(1, 0));
  EXPECT_EQ(shiftDelta(ShiftDirection::Down), Position(0, 1));
  EXPECT_EQ(shiftDelta(ShiftDirection::Left), Position(-1, 0));
  EXPECT_EQ(Position(10, 10).shifted(ShiftDirection::Up), Position(10, 9));
}

TEST(ShiftDirectionTest, OppositeAndNames) {
  for (ShiftDirection dir : kAllShiftDirections) {
    EXPECT_EQ(oppositeDirection(oppositeDirection(dir)), dir);
    EXPECT_EQ(shiftDelta(dir) + shiftDelta(oppositeDirection(dir)), Position(0, 0));
  }
  EXPECT_EQ(std::string(shiftDirectionToString(ShiftDirection::Left)), "left");
}

}  // namespace
}  // namespace cavewalk
