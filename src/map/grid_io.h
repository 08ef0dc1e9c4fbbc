// ASCII export and import of grids.

#ifndef CAVEWALK_MAP_GRID_IO_H
#define CAVEWALK_MAP_GRID_IO_H

#include <string>
#include <string_view>

#include "map/grid.h"

namespace cavewalk {

/// @brief Render a grid as one character per cell, one row per line.
///
/// Every row (the last one included) ends with '\n'. See cellTypeToChar() for
/// the character set.
std::string gridToAscii(const Grid& grid);

/// @brief Result of parsing an ASCII grid.
struct GridParseResult {
  bool success = false;
  Grid grid;
  std::string error_message;
};

/// @brief Parse the output of gridToAscii().
///
/// Rows must all have the same width. A trailing newline is optional and
/// '\r' before a newline is ignored.
///
/// @param text ASCII grid.
/// @param spawn Spawn metadata for the parsed grid (not stored in the text).
/// @return Parsed grid, or an error naming the offending line.
GridParseResult gridFromAscii(std::string_view text, const Position& spawn);

/// @brief Write gridToAscii() output to a file.
/// @return False if the file could not be written.
bool writeAsciiFile(const Grid& grid, const std::string& path);

}  // namespace cavewalk

#endif  // CAVEWALK_MAP_GRID_IO_H
