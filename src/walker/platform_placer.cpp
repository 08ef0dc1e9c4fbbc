// Platform placement.

#include "walker/platform_placer.h"

#include <algorithm>

#include "config/generation_profile.h"
#include "map/grid.h"

namespace cavewalk {

namespace {

/// Number of candidate rows scanned below the first admissible row.
constexpr int kPlatformSearchDepth = 8;

/// Clearance to the sides and below the platform (buffer + Empty ring + margin).
constexpr int kSideClearance = 3;

/// @brief Check the clearance box of a candidate platform.
bool clearanceFits(const Grid& grid, int x0, int x1, int y_top, int y_bottom,
                   const GenerationProfile& profile) {
  const int above =
      std::max(static_cast<int>(profile.plat_min_empty_height) + 1, kSideClearance);
  const int left = x0 - kSideClearance;
  const int right = x1 + kSideClearance;
  const int top = y_top - above;
  const int bottom = y_bottom + kSideClearance;

  if (!grid.inBounds(left, top) || !grid.inBounds(right, bottom)) return false;

  for (int y = top; y <= bottom; ++y) {
    const bool soft_row = profile.plat_soft_overhang && y == bottom;
    for (int x = left; x <= right; ++x) {
      CellType cell = grid.at(x, y);
      if (cell == CellType::Empty) continue;
      if (soft_row && cell == CellType::Freeze) continue;
      return false;
    }
  }
  return true;
}

}  // namespace

std::optional<PlatformPlacement> findPlatformSpot(const Grid& grid, const Position& pos,
                                                  size_t width, size_t height,
                                                  const GenerationProfile& profile) {
  if (width == 0 || height == 0) return std::nullopt;

  const int plat_w = static_cast<int>(width);
  const int plat_h = static_cast<int>(height);
  const int x0 = pos.x - (plat_w - 1) / 2;
  const int x1 = x0 + plat_w - 1;
  const int first_row = pos.y + static_cast<int>(profile.plat_min_empty_height) + 2;

  std::optional<PlatformPlacement> best;
  for (int y_top = first_row; y_top < first_row + kPlatformSearchDepth; ++y_top) {
    const int y_bottom = y_top + plat_h - 1;
    if (clearanceFits(grid, x0, x1, y_top, y_bottom, profile)) {
      best = PlatformPlacement{Position(x0, y_top), Position(x1, y_bottom)};
    }
  }
  return best;
}

void placePlatform(Grid& grid, const PlatformPlacement& placement) {
  grid.setArea(placement.top_left - Position(1, 1), placement.bottom_right + Position(1, 1),
               CellType::Freeze, true);
  grid.setArea(placement.top_left, placement.bottom_right, CellType::Hookable, true);
}

}  // namespace cavewalk
