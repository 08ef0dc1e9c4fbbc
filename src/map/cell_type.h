// Cell types of a generated level.

#ifndef CAVEWALK_MAP_CELL_TYPE_H
#define CAVEWALK_MAP_CELL_TYPE_H

#include <cstdint>
#include <optional>

namespace cavewalk {

/// @brief Closed set of cell types.
///
/// Every switch over CellType is exhaustive; adding a value is a deliberate
/// format change (grid export, flood fills and overwrite policies all list it).
enum class CellType : uint8_t {
  Empty,     ///< Carved, walkable air.
  Hookable,  ///< Solid terrain (the default fill).
  Freeze,    ///< Hazard buffer between air and solid terrain.
  Spawn,     ///< Player spawn marker.
  Start,     ///< Start trigger line.
  Finish     ///< Finish trigger line.
};

/// @brief Convert CellType to a lowercase name ("empty", "hookable", ...).
const char* cellTypeToString(CellType type);

/// @brief Single-character rendition used by the ASCII export.
///
/// '.' Empty, '#' Hookable, '*' Freeze, 'P' Spawn, 'S' Start, 'F' Finish.
char cellTypeToChar(CellType type);

/// @brief Inverse of cellTypeToChar().
/// @return The cell type, or std::nullopt for an unknown character.
std::optional<CellType> cellTypeFromChar(char chr);

/// @brief True for cells a player can move through without being stopped by
/// terrain (air and trigger markers, not Freeze).
bool isPassable(CellType type);

}  // namespace cavewalk

#endif  // CAVEWALK_MAP_CELL_TYPE_H
