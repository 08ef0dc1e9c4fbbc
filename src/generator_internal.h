// Internal header for testing generator set-up and post-processing functions.
// Not part of the public API. Include only from generator.cpp and tests.

#ifndef CAVEWALK_GENERATOR_INTERNAL_H
#define CAVEWALK_GENERATOR_INTERNAL_H

#include <cstddef>
#include <vector>

#include "core/position.h"
#include "map/cell_type.h"

namespace cavewalk {

class Grid;
class WeightedSampler;
struct GenerationProfile;
struct MapSkeleton;

/// @brief Densify the skeleton's waypoints with shifted subwaypoints.
///
/// Each leg a -> b is split into ceil(|b - a| / max_subwaypoint_dist) segments.
/// Intermediate points are moved by a uniform per-axis offset of at most
/// subwaypoint_max_shift_dist, rounded and clamped into the grid. Skeleton
/// waypoints are kept unshifted.
std::vector<Position> buildWaypoints(const MapSkeleton& skeleton,
                                     const GenerationProfile& profile,
                                     WeightedSampler& sampler);

/// @brief Turn every Empty cell with a Hookable 8-neighbour into Freeze.
/// @return Number of repaired cells.
size_t fixEdgeBugs(Grid& grid);

/// @brief Carve a spawn (marker Start) or finish (marker Finish) room.
///
/// The room is an Empty square of +-margin around center with a Hookable
/// platform through the centre row (x +- (margin - 2)), a Spawn row above it
/// for Start rooms, and a closed marker ring one cell outside the square.
/// Everything is written with overwrite.
void carveRoom(Grid& grid, const Position& center, size_t margin, CellType marker);

}  // namespace cavewalk

#endif  // CAVEWALK_GENERATOR_INTERNAL_H
