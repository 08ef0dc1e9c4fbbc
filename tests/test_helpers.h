#pragma once

#include <cstddef>
#include <cstdlib>
#include <optional>
#include <queue>
#include <vector>

#include "config/generation_profile.h"
#include "map/grid.h"

namespace test_helpers {

/// @brief Profile with every random modifier switched off.
///
/// The walker always takes the best-ranked direction, keeps its kernels and
/// places no platforms, so a run is a straight, predictable corridor.
inline cavewalk::GenerationProfile quietProfile() {
  cavewalk::GenerationProfile profile;
  profile.name = "quiet";
  profile.inner_rad_mut_prob = 0.0f;
  profile.inner_size_mut_prob = 0.0f;
  profile.outer_rad_mut_prob = 0.0f;
  profile.outer_size_mut_prob = 0.0f;
  profile.inner_size_probs = cavewalk::WeightedTable<size_t>({1}, {1.0f});
  profile.outer_margin_probs = cavewalk::WeightedTable<size_t>({0}, {1.0f});
  profile.shift_weights = {1.0f, 0.0f, 0.0f, 0.0f};
  profile.momentum_prob = 0.0f;
  profile.fade_steps = 0;
  profile.enable_platforms = false;
  profile.enable_skips = false;
  return profile;
}

/// @brief 4-connected flood fill over passable cells.
/// @return True if a cell of type target is reachable from start.
inline bool reachesCell(const cavewalk::Grid& grid, const cavewalk::Position& start,
                        cavewalk::CellType target) {
  if (!grid.inBounds(start) || !cavewalk::isPassable(grid.at(start))) return false;
  std::vector<bool> seen(grid.width() * grid.height(), false);
  std::queue<cavewalk::Position> open;
  open.push(start);
  seen[grid.index(start.x, start.y)] = true;
  while (!open.empty()) {
    cavewalk::Position pos = open.front();
    open.pop();
    if (grid.at(pos) == target) return true;
    for (cavewalk::ShiftDirection dir : cavewalk::kAllShiftDirections) {
      cavewalk::Position next = pos.shifted(dir);
      if (!grid.inBounds(next)) continue;
      size_t idx = grid.index(next.x, next.y);
      if (seen[idx] || !cavewalk::isPassable(grid.at(next))) continue;
      seen[idx] = true;
      open.push(next);
    }
  }
  return false;
}

/// @brief Find an Empty cell that touches Hookable terrain (8-neighbourhood).
///
/// Hookable cells on the platform row of a room (center.y, x +- (margin - 2))
/// are part of the room furniture and are ignored.
/// @return The first offending Empty cell in row-major order.
inline std::optional<cavewalk::Position> findBufferViolation(
    const cavewalk::Grid& grid, const std::vector<cavewalk::Position>& room_centers,
    size_t room_margin) {
  const int half_platform = static_cast<int>(room_margin) - 2;
  auto isRoomPlatform = [&](int x, int y) {
    for (const cavewalk::Position& center : room_centers) {
      if (y == center.y && std::abs(x - center.x) <= half_platform) return true;
    }
    return false;
  };

  for (int y = 0; y < static_cast<int>(grid.height()); ++y) {
    for (int x = 0; x < static_cast<int>(grid.width()); ++x) {
      if (grid.at(x, y) != cavewalk::CellType::Empty) continue;
      for (int dy = -1; dy <= 1; ++dy) {
        for (int dx = -1; dx <= 1; ++dx) {
          int nx = x + dx;
          int ny = y + dy;
          if (!grid.inBounds(nx, ny) || grid.at(nx, ny) != cavewalk::CellType::Hookable) {
            continue;
          }
          if (!isRoomPlatform(nx, ny)) return cavewalk::Position(x, y);
        }
      }
    }
  }
  return std::nullopt;
}

}  // namespace test_helpers
