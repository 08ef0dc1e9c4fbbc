// Map skeleton: the waypoint layout and dimensions a run is initialised from.

#ifndef CAVEWALK_MAP_MAP_SKELETON_H
#define CAVEWALK_MAP_MAP_SKELETON_H

#include <cstddef>
#include <string>
#include <vector>

#include "core/position.h"

namespace cavewalk {

/// @brief Shape of a level expressed as an ordered waypoint list.
struct MapSkeleton {
  std::string name = "default";
  std::vector<Position> waypoints;  ///< Traversal order = insertion order.
  size_t width = 300;
  size_t height = 300;
  Position spawn{50, 250};

  bool operator==(const MapSkeleton& other) const {
    return name == other.name && waypoints == other.waypoints && width == other.width &&
           height == other.height && spawn == other.spawn;
  }
};

/// @brief Six-waypoint S shape in a 300x300 grid, spawning at (50, 250).
MapSkeleton defaultMapSkeleton();

/// @brief Single straight corridor (50, 250) -> (250, 250) in a 300x300 grid.
MapSkeleton straightMapSkeleton();

/// @brief Result of validating a map skeleton.
struct SkeletonValidation {
  bool valid = true;
  std::string message;
};

/// @brief Check dimensions, waypoint count and that every point is in bounds.
SkeletonValidation validateSkeleton(const MapSkeleton& skeleton);

}  // namespace cavewalk

#endif  // CAVEWALK_MAP_MAP_SKELETON_H
