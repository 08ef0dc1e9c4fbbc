// Position arithmetic and direction helpers.

#include "core/position.h"

#include <algorithm>
#include <cmath>
#include <cstdlib>

namespace cavewalk {

const char* shiftDirectionToString(ShiftDirection dir) {
  switch (dir) {
    case ShiftDirection::Up: return "up";
    case ShiftDirection::Right: return "right";
    case ShiftDirection::Down: return "down";
    case ShiftDirection::Left: return "left";
  }
  return "unknown";
}

ShiftDirection oppositeDirection(ShiftDirection dir) {
  switch (dir) {
    case ShiftDirection::Up: return ShiftDirection::Down;
    case ShiftDirection::Right: return ShiftDirection::Left;
    case ShiftDirection::Down: return ShiftDirection::Up;
    case ShiftDirection::Left: return ShiftDirection::Right;
  }
  return dir;
}

Position shiftDelta(ShiftDirection dir) {
  switch (dir) {
    case ShiftDirection::Up: return Position(0, -1);
    case ShiftDirection::Right: return Position(1, 0);
    case ShiftDirection::Down: return Position(0, 1);
    case ShiftDirection::Left: return Position(-1, 0);
  }
  return Position(0, 0);
}

int64_t Position::distanceSquared(const Position& other) const {
  int64_t dx = static_cast<int64_t>(x) - other.x;
  int64_t dy = static_cast<int64_t>(y) - other.y;
  return dx * dx + dy * dy;
}

float Position::distance(const Position& other) const {
  return std::sqrt(static_cast<float>(distanceSquared(other)));
}

int Position::chebyshevDistance(const Position& other) const {
  return std::max(std::abs(x - other.x), std::abs(y - other.y));
}

Position Position::shifted(ShiftDirection dir) const {
  return *this + shiftDelta(dir);
}

}  // namespace cavewalk
