// Circular / elliptical carving stamp and the clipped stamping routine.
//
// Membership metric (used by every kernel): for an offset (dx, dy) with
// Euclidean length e and Chebyshev length c, and circularity k clamped to
// [0, 1], the blended distance is d = (1 - k) * e + k * c. The offset is
// contained iff d <= radius. k = 0 yields a disc, k = 1 a square.

#ifndef CAVEWALK_WALKER_KERNEL_H
#define CAVEWALK_WALKER_KERNEL_H

#include <cstddef>
#include <cstdint>
#include <vector>

#include "core/position.h"
#include "map/cell_type.h"

namespace cavewalk {

class Grid;
class WeightedSampler;

/// @brief Immutable carving stamp.
///
/// The membership mask is precomputed for the (2r + 1)^2 bounding box. A
/// kernel is replaced, never mutated, when the walker's size or shape changes.
class Kernel {
 public:
  Kernel() : Kernel(0, 0.0f) {}

  /// @brief Build a kernel.
  /// @param radius Radius in cells (0 = single cell).
  /// @param circularity 0 = disc, 1 = square (clamped to [0, 1]).
  Kernel(size_t radius, float circularity);

  size_t radius() const { return radius_; }
  float circularity() const { return circularity_; }

  /// @brief Side length of the bounding box (2r + 1).
  size_t diameter() const { return 2 * radius_ + 1; }

  /// @brief Blended distance of an offset under this kernel's circularity.
  float blendedDistance(int dx, int dy) const;

  /// @brief True if the offset from the centre is part of the stamp.
  bool contains(int dx, int dy) const;

  /// @brief True if the offset is contained, is not the centre, and lies in
  /// the outermost one-cell band (d > radius - 1).
  bool isEdge(int dx, int dy) const;

  /// @brief Number of contained offsets.
  size_t cellCount() const;

  bool operator==(const Kernel& other) const {
    return radius_ == other.radius_ && circularity_ == other.circularity_;
  }
  bool operator!=(const Kernel& other) const { return !(*this == other); }

 private:
  size_t maskIndex(int dx, int dy) const;

  size_t radius_;
  float circularity_;
  std::vector<uint8_t> mask_;  ///< 0 = outside, 1 = inside, 2 = edge band.
};

/// @brief Which existing cells a stamp may overwrite.
enum class OverwritePolicy : uint8_t {
  All,          ///< Overwrite anything (inner kernel).
  SolidOnly,    ///< Hookable and Freeze only; never downgrades Empty (outer kernel).
  HookableOnly  ///< Hookable only.
};

/// @brief True if a cell of type current may be overwritten under policy.
bool isOverwritable(CellType current, OverwritePolicy policy);

/// @brief Options for a single stamp.
struct StampOptions {
  CellType type = CellType::Empty;
  OverwritePolicy policy = OverwritePolicy::All;
  float edge_prob = 1.0f;                      ///< Carve chance for edge-band cells.
  const std::vector<bool>* locked = nullptr;   ///< Row-major lock mask, may be null.
};

/// @brief Apply a kernel to the grid around a centre.
///
/// Iterates centre +- radius, tests membership, clips to the grid, skips locked
/// cells and writes only cells eligible under the overwrite policy. Edge-band
/// cells are written with probability edge_prob; the sampler is consulted only
/// when edge_prob < 1.
///
/// @return Number of cells written.
size_t stampKernel(Grid& grid, const Kernel& kernel, const Position& center,
                   const StampOptions& options, WeightedSampler& sampler);

}  // namespace cavewalk

#endif  // CAVEWALK_WALKER_KERNEL_H
