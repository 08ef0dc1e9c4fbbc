// Tests for map/cell_type.h.

#include "map/cell_type.h"

#include <gtest/gtest.h>

#include <string>

namespace cavewalk {
namespace {

constexpr CellType kAllCellTypes[] = {CellType::Empty, CellType::Hookable, CellType::Freeze,
                                      CellType::Spawn, CellType::Start,    CellType::Finish};

TEST(CellTypeTest, CharRoundTrip) {
  for (CellType type : kAllCellTypes) {
    auto parsed = cellTypeFromChar(cellTypeToChar(type));
    ASSERT_TRUE(parsed.has_value()) << cellTypeToString(type);
    EXPECT_EQ(*parsed, type);
  }
  EXPECT_FALSE(cellTypeFromChar('x').has_value());
  EXPECT_FALSE(cellTypeFromChar(' ').has_value());
}

TEST(CellTypeTest, Names) {
  EXPECT_EQ(std::string(cellTypeToString(CellType::Hookable)), "hookable");
  EXPECT_EQ(std::string(cellTypeToString(CellType::Finish)), "finish");
  EXPECT_EQ(cellTypeToChar(CellType::Freeze), '*');
}

TEST(CellTypeTest, PassableCells) {
  EXPECT_TRUE(isPassable(CellType::Empty));
  EXPECT_TRUE(isPassable(CellType::Spawn));
  EXPECT_TRUE(isPassable(CellType::Start));
  EXPECT_TRUE(isPassable(CellType::Finish));
  EXPECT_FALSE(isPassable(CellType::Hookable));
  EXPECT_FALSE(isPassable(CellType::Freeze));
}

}  // namespace
}  // namespace cavewalk
