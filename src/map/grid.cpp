// Grid storage and rectangular fill primitives.

#include "map/grid.h"

#include <algorithm>

namespace cavewalk {

Grid::Grid(size_t width, size_t height, CellType fill, const Position& spawn)
    : width_(width), height_(height), spawn_(spawn), cells_(width * height, fill) {}

bool Grid::trySet(const Position& pos, CellType type) {
  if (!inBounds(pos)) return false;
  at(pos) = type;
  return true;
}

bool Grid::writeCell(int x, int y, CellType type, bool overwrite) {
  CellType& cell = at(x, y);
  if (!overwrite && cell != CellType::Hookable) return false;
  if (cell == type) return false;
  cell = type;
  return true;
}

size_t Grid::setArea(const Position& top_left, const Position& bottom_right, CellType type,
                     bool overwrite) {
  if (width_ == 0 || height_ == 0) return 0;
  int x_min = std::min(top_left.x, bottom_right.x);
  int x_max = std::max(top_left.x, bottom_right.x);
  int y_min = std::min(top_left.y, bottom_right.y);
  int y_max = std::max(top_left.y, bottom_right.y);

  // Fully outside: nothing to clip to.
  if (x_max < 0 || y_max < 0 || x_min >= static_cast<int>(width_) ||
      y_min >= static_cast<int>(height_)) {
    return 0;
  }

  x_min = std::max(x_min, 0);
  y_min = std::max(y_min, 0);
  x_max = std::min(x_max, static_cast<int>(width_) - 1);
  y_max = std::min(y_max, static_cast<int>(height_) - 1);

  size_t written = 0;
  for (int y = y_min; y <= y_max; ++y) {
    for (int x = x_min; x <= x_max; ++x) {
      if (writeCell(x, y, type, overwrite)) ++written;
    }
  }
  return written;
}

size_t Grid::setAreaBorder(const Position& outer_top_left, const Position& outer_bottom_right,
                           CellType type, bool overwrite) {
  int x_min = std::min(outer_top_left.x, outer_bottom_right.x);
  int x_max = std::max(outer_top_left.x, outer_bottom_right.x);
  int y_min = std::min(outer_top_left.y, outer_bottom_right.y);
  int y_max = std::max(outer_top_left.y, outer_bottom_right.y);

  size_t written = 0;
  auto visit = [&](int x, int y) {
    if (inBounds(x, y) && writeCell(x, y, type, overwrite)) ++written;
  };

  for (int x = x_min; x <= x_max; ++x) {
    visit(x, y_min);
    if (y_max != y_min) visit(x, y_max);
  }
  for (int y = y_min + 1; y < y_max; ++y) {
    visit(x_min, y);
    if (x_max != x_min) visit(x_max, y);
  }
  return written;
}

size_t Grid::count(CellType type) const {
  return static_cast<size_t>(std::count(cells_.begin(), cells_.end(), type));
}

}  // namespace cavewalk
