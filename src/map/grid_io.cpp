// ASCII grid export and import.

#include "map/grid_io.h"

#include <fstream>
#include <optional>
#include <utility>
#include <vector>

namespace cavewalk {

std::string gridToAscii(const Grid& grid) {
  std::string out;
  out.reserve((grid.width() + 1) * grid.height());
  const int width = static_cast<int>(grid.width());
  const int height = static_cast<int>(grid.height());
  for (int y = 0; y < height; ++y) {
    for (int x = 0; x < width; ++x) {
      out += cellTypeToChar(grid.at(x, y));
    }
    out += '\n';
  }
  return out;
}

GridParseResult gridFromAscii(std::string_view text, const Position& spawn) {
  GridParseResult result;

  std::vector<std::string_view> rows;
  size_t start = 0;
  while (start < text.size()) {
    size_t end = text.find('\n', start);
    if (end == std::string_view::npos) end = text.size();
    std::string_view row = text.substr(start, end - start);
    if (!row.empty() && row.back() == '\r') row.remove_suffix(1);
    rows.push_back(row);
    start = end + 1;
  }

  if (rows.empty() || rows.front().empty()) {
    result.error_message = "empty grid";
    return result;
  }

  const size_t width = rows.front().size();
  Grid grid(width, rows.size(), CellType::Hookable, spawn);
  for (size_t y = 0; y < rows.size(); ++y) {
    if (rows[y].size() != width) {
      result.error_message = "line " + std::to_string(y + 1) + ": expected " +
                             std::to_string(width) + " cells, got " +
                             std::to_string(rows[y].size());
      return result;
    }
    for (size_t x = 0; x < width; ++x) {
      std::optional<CellType> type = cellTypeFromChar(rows[y][x]);
      if (!type) {
        result.error_message = "line " + std::to_string(y + 1) + ": unknown cell '" +
                               std::string(1, rows[y][x]) + "'";
        return result;
      }
      grid.at(static_cast<int>(x), static_cast<int>(y)) = *type;
    }
  }

  result.success = true;
  result.grid = std::move(grid);
  return result;
}

bool writeAsciiFile(const Grid& grid, const std::string& path) {
  std::ofstream file(path);
  if (!file.is_open()) return false;
  file << gridToAscii(grid);
  return static_cast<bool>(file);
}

}  // namespace cavewalk
