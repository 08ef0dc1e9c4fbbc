// Built-in map skeletons and skeleton validation.

#include "map/map_skeleton.h"

namespace cavewalk {

namespace {

bool insideDimensions(const Position& pos, size_t width, size_t height) {
  return pos.x >= 0 && pos.y >= 0 && static_cast<size_t>(pos.x) < width &&
         static_cast<size_t>(pos.y) < height;
}

std::string describePosition(const Position& pos) {
  return "(" + std::to_string(pos.x) + ", " + std::to_string(pos.y) + ")";
}

}  // namespace

MapSkeleton defaultMapSkeleton() {
  MapSkeleton skeleton;
  skeleton.name = "default";
  skeleton.width = 300;
  skeleton.height = 300;
  skeleton.spawn = Position(50, 250);
  skeleton.waypoints = {Position(50, 250),  Position(250, 250), Position(250, 150),
                        Position(50, 150),  Position(50, 50),   Position(250, 50)};
  return skeleton;
}

MapSkeleton straightMapSkeleton() {
  MapSkeleton skeleton;
  skeleton.name = "straight";
  skeleton.width = 300;
  skeleton.height = 300;
  skeleton.spawn = Position(50, 250);
  skeleton.waypoints = {Position(50, 250), Position(250, 250)};
  return skeleton;
}

SkeletonValidation validateSkeleton(const MapSkeleton& skeleton) {
  SkeletonValidation result;
  if (skeleton.width == 0 || skeleton.height == 0) {
    result.valid = false;
    result.message = "map dimensions must be non-zero";
    return result;
  }
  if (skeleton.waypoints.empty()) {
    result.valid = false;
    result.message = "map has no waypoints";
    return result;
  }
  if (!insideDimensions(skeleton.spawn, skeleton.width, skeleton.height)) {
    result.valid = false;
    result.message = "spawn " + describePosition(skeleton.spawn) + " outside the map";
    return result;
  }
  for (size_t idx = 0; idx < skeleton.waypoints.size(); ++idx) {
    if (!insideDimensions(skeleton.waypoints[idx], skeleton.width, skeleton.height)) {
      result.valid = false;
      result.message = "waypoint " + std::to_string(idx) + " " +
                       describePosition(skeleton.waypoints[idx]) + " outside the map";
      return result;
    }
  }
  return result;
}

}  // namespace cavewalk
