// Integer grid coordinates and the four cardinal shift directions.

#ifndef CAVEWALK_CORE_POSITION_H
#define CAVEWALK_CORE_POSITION_H

#include <array>
#include <cstdint>

namespace cavewalk {

/// @brief Cardinal direction of a single walker step.
///
/// y grows downward, so Up decreases y.
enum class ShiftDirection : uint8_t {
  Up,
  Right,
  Down,
  Left
};

/// All directions in enum order (used as the tie-break order when ranking).
constexpr std::array<ShiftDirection, 4> kAllShiftDirections = {
    ShiftDirection::Up, ShiftDirection::Right, ShiftDirection::Down, ShiftDirection::Left};

/// @brief Convert a ShiftDirection to a human-readable string.
const char* shiftDirectionToString(ShiftDirection dir);

/// @brief Direction pointing the other way.
ShiftDirection oppositeDirection(ShiftDirection dir);

/// @brief Integer 2D grid coordinate.
///
/// Shared by walker positions, waypoints and area corners. Signed so that
/// offsets and clipped rectangles can extend past the grid edge.
struct Position {
  int x = 0;
  int y = 0;

  constexpr Position() = default;
  constexpr Position(int px, int py) : x(px), y(py) {}

  constexpr Position operator+(const Position& other) const {
    return Position(x + other.x, y + other.y);
  }
  constexpr Position operator-(const Position& other) const {
    return Position(x - other.x, y - other.y);
  }
  constexpr Position operator*(int factor) const { return Position(x * factor, y * factor); }

  constexpr bool operator==(const Position& other) const {
    return x == other.x && y == other.y;
  }
  constexpr bool operator!=(const Position& other) const { return !(*this == other); }

  /// Row-major ordering (y first), so sorted positions read like the grid.
  constexpr bool operator<(const Position& other) const {
    return y != other.y ? y < other.y : x < other.x;
  }

  /// @brief Squared Euclidean distance (exact, no rounding).
  int64_t distanceSquared(const Position& other) const;

  /// @brief Euclidean distance.
  float distance(const Position& other) const;

  /// @brief Chebyshev (king move) distance.
  int chebyshevDistance(const Position& other) const;

  /// @brief Position one cell away in the given direction.
  Position shifted(ShiftDirection dir) const;
};

/// @brief Unit offset for a direction.
Position shiftDelta(ShiftDirection dir);

}  // namespace cavewalk

#endif  // CAVEWALK_CORE_POSITION_H
