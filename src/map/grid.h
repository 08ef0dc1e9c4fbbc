// 2D cell grid of a generated level plus its spawn metadata.

#ifndef CAVEWALK_MAP_GRID_H
#define CAVEWALK_MAP_GRID_H

#include <cassert>
#include <cstddef>
#include <vector>

#include "core/position.h"
#include "map/cell_type.h"

namespace cavewalk {

/// @brief Fixed-size row-major grid of cells.
///
/// All mutation goes through in-bounds coordinates. at() asserts on
/// out-of-bounds access (a programming error); inBounds() and trySet() are the
/// checked variants. The area primitives clip at the grid edge: rectangles are
/// clamped, never wrapped, and a rectangle fully outside the grid is a no-op.
class Grid {
 public:
  Grid() = default;

  /// @brief Create a grid filled with a single cell type.
  /// @param width Number of columns.
  /// @param height Number of rows.
  /// @param fill Initial cell type (Hookable for a fresh level).
  /// @param spawn Spawn coordinate recorded as metadata.
  Grid(size_t width, size_t height, CellType fill, const Position& spawn);

  size_t width() const { return width_; }
  size_t height() const { return height_; }
  const Position& spawn() const { return spawn_; }
  void setSpawn(const Position& spawn) { spawn_ = spawn; }

  /// @brief True if (x, y) lies inside [0, width) x [0, height).
  bool inBounds(int x, int y) const {
    return x >= 0 && y >= 0 && static_cast<size_t>(x) < width_ &&
           static_cast<size_t>(y) < height_;
  }
  bool inBounds(const Position& pos) const { return inBounds(pos.x, pos.y); }

  /// @brief Row-major index of an in-bounds cell.
  size_t index(int x, int y) const {
    assert(inBounds(x, y) && "grid index out of bounds");
    return static_cast<size_t>(y) * width_ + static_cast<size_t>(x);
  }

  CellType& at(int x, int y) { return cells_[index(x, y)]; }
  const CellType& at(int x, int y) const { return cells_[index(x, y)]; }
  CellType& at(const Position& pos) { return at(pos.x, pos.y); }
  const CellType& at(const Position& pos) const { return at(pos.x, pos.y); }

  /// @brief Write a cell if it is in bounds.
  /// @return False (and no change) when pos is outside the grid.
  bool trySet(const Position& pos, CellType type);

  /// @brief Fill an axis-aligned inclusive rectangle.
  ///
  /// @param top_left One corner (corners are normalised).
  /// @param bottom_right Opposite corner.
  /// @param type Cell type to write.
  /// @param overwrite When false, only cells that are currently Hookable (the
  ///        default fill) are written, so earlier markers survive.
  /// @return Number of cells written.
  size_t setArea(const Position& top_left, const Position& bottom_right, CellType type,
                 bool overwrite);

  /// @brief Fill only the 1-cell ring on the perimeter of a rectangle.
  ///
  /// Ring cells outside the grid are dropped; the ring is not moved inward.
  /// @return Number of cells written.
  size_t setAreaBorder(const Position& outer_top_left, const Position& outer_bottom_right,
                       CellType type, bool overwrite);

  /// @brief Number of cells of the given type.
  size_t count(CellType type) const;

  /// @brief Raw row-major cell storage.
  const std::vector<CellType>& cells() const { return cells_; }

  bool operator==(const Grid& other) const {
    return width_ == other.width_ && height_ == other.height_ && spawn_ == other.spawn_ &&
           cells_ == other.cells_;
  }
  bool operator!=(const Grid& other) const { return !(*this == other); }

 private:
  /// Write one in-bounds cell according to the overwrite rule.
  bool writeCell(int x, int y, CellType type, bool overwrite);

  size_t width_ = 0;
  size_t height_ = 0;
  Position spawn_;
  std::vector<CellType> cells_;
};

}  // namespace cavewalk

#endif  // CAVEWALK_MAP_GRID_H
