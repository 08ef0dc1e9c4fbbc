// Free-floating platform placement below the walker.

#ifndef CAVEWALK_WALKER_PLATFORM_PLACER_H
#define CAVEWALK_WALKER_PLATFORM_PLACER_H

#include <cstddef>
#include <optional>

#include "core/position.h"

namespace cavewalk {

class Grid;
struct GenerationProfile;

/// @brief Inclusive rectangle of platform cells.
struct PlatformPlacement {
  Position top_left;
  Position bottom_right;
};

/// @brief Find the deepest spot below pos where a platform fits.
///
/// The platform is centred on pos.x and its top row starts at least
/// plat_min_empty_height + 2 rows below pos. A spot is accepted only if the
/// clearance box around it is inside the grid and entirely Empty:
///   - max(plat_min_empty_height + 1, 3) rows above the platform,
///   - 3 columns to either side,
///   - 3 rows below (the lowest of them may be Freeze with plat_soft_overhang).
/// The clearance keeps an Empty ring two cells around the platform, so placing
/// it never disconnects the carved region.
///
/// @param grid Grid to inspect.
/// @param pos Walker position.
/// @param width Platform width in cells (>= 1).
/// @param height Platform height in cells (>= 1).
/// @param profile Profile with the platform parameters.
/// @return Placement, or std::nullopt if nothing fits.
std::optional<PlatformPlacement> findPlatformSpot(const Grid& grid, const Position& pos,
                                                  size_t width, size_t height,
                                                  const GenerationProfile& profile);

/// @brief Stamp a Hookable platform with a one-cell Freeze buffer around it.
void placePlatform(Grid& grid, const PlatformPlacement& placement);

}  // namespace cavewalk

#endif  // CAVEWALK_WALKER_PLATFORM_PLACER_H
