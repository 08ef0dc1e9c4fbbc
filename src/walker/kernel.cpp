// Kernel membership and stamping.

#include "walker/kernel.h"

#include <algorithm>
#include <cmath>
#include <cstdlib>

#include "core/weighted_sampler.h"
#include "map/grid.h"

namespace cavewalk {

namespace {

constexpr uint8_t kOutside = 0;
constexpr uint8_t kInside = 1;
constexpr uint8_t kEdge = 2;

/// Tolerance so that offsets exactly on the radius are contained despite
/// float rounding of the blended distance.
constexpr float kRadiusEpsilon = 1e-4f;

}  // namespace

Kernel::Kernel(size_t radius, float circularity)
    : radius_(radius), circularity_(std::clamp(circularity, 0.0f, 1.0f)) {
  size_t side = diameter();
  mask_.assign(side * side, kOutside);

  const int rad = static_cast<int>(radius_);
  const float limit = static_cast<float>(radius_) + kRadiusEpsilon;
  for (int dy = -rad; dy <= rad; ++dy) {
    for (int dx = -rad; dx <= rad; ++dx) {
      float dist = blendedDistance(dx, dy);
      if (dist > limit) continue;
      bool center = (dx == 0 && dy == 0);
      bool edge = !center && dist > static_cast<float>(radius_) - 1.0f + kRadiusEpsilon;
      mask_[maskIndex(dx, dy)] = edge ? kEdge : kInside;
    }
  }
}

float Kernel::blendedDistance(int dx, int dy) const {
  float euclid = std::sqrt(static_cast<float>(dx * dx + dy * dy));
  float cheb = static_cast<float>(std::max(std::abs(dx), std::abs(dy)));
  return (1.0f - circularity_) * euclid + circularity_ * cheb;
}

size_t Kernel::maskIndex(int dx, int dy) const {
  const int rad = static_cast<int>(radius_);
  return static_cast<size_t>(dy + rad) * diameter() + static_cast<size_t>(dx + rad);
}

bool Kernel::contains(int dx, int dy) const {
  const int rad = static_cast<int>(radius_);
  if (std::abs(dx) > rad || std::abs(dy) > rad) return false;
  return mask_[maskIndex(dx, dy)] != kOutside;
}

bool Kernel::isEdge(int dx, int dy) const {
  const int rad = static_cast<int>(radius_);
  if (std::abs(dx) > rad || std::abs(dy) > rad) return false;
  return mask_[maskIndex(dx, dy)] == kEdge;
}

size_t Kernel::cellCount() const {
  return static_cast<size_t>(
      std::count_if(mask_.begin(), mask_.end(), [](uint8_t val) { return val != kOutside; }));
}

bool isOverwritable(CellType current, OverwritePolicy policy) {
  switch (policy) {
    case OverwritePolicy::All:
      return true;
    case OverwritePolicy::SolidOnly:
      return current == CellType::Hookable || current == CellType::Freeze;
    case OverwritePolicy::HookableOnly:
      return current == CellType::Hookable;
  }
  return false;
}

size_t stampKernel(Grid& grid, const Kernel& kernel, const Position& center,
                   const StampOptions& options, WeightedSampler& sampler) {
  const int rad = static_cast<int>(kernel.radius());
  const bool fuzzy = options.edge_prob < 1.0f;
  size_t written = 0;

  for (int dy = -rad; dy <= rad; ++dy) {
    for (int dx = -rad; dx <= rad; ++dx) {
      if (!kernel.contains(dx, dy)) continue;
      int x = center.x + dx;
      int y = center.y + dy;
      if (!grid.inBounds(x, y)) continue;
      if (options.locked != nullptr && (*options.locked)[grid.index(x, y)]) continue;

      CellType& cell = grid.at(x, y);
      if (cell == options.type || !isOverwritable(cell, options.policy)) continue;
      if (fuzzy && kernel.isEdge(dx, dy) && !sampler.rollProbability(options.edge_prob)) {
        continue;
      }
      cell = options.type;
      ++written;
    }
  }
  return written;
}

}  // namespace cavewalk
