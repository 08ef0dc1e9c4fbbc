// CellType conversions.

#include "map/cell_type.h"

namespace cavewalk {

const char* cellTypeToString(CellType type) {
  switch (type) {
    case CellType::Empty: return "empty";
    case CellType::Hookable: return "hookable";
    case CellType::Freeze: return "freeze";
    case CellType::Spawn: return "spawn";
    case CellType::Start: return "start";
    case CellType::Finish: return "finish";
  }
  return "unknown";
}

char cellTypeToChar(CellType type) {
  switch (type) {
    case CellType::Empty: return '.';
    case CellType::Hookable: return '#';
    case CellType::Freeze: return '*';
    case CellType::Spawn: return 'P';
    case CellType::Start: return 'S';
    case CellType::Finish: return 'F';
  }
  return '?';
}

std::optional<CellType> cellTypeFromChar(char chr) {
  switch (chr) {
    case '.': return CellType::Empty;
    case '#': return CellType::Hookable;
    case '*': return CellType::Freeze;
    case 'P': return CellType::Spawn;
    case 'S': return CellType::Start;
    case 'F': return CellType::Finish;
    default: return std::nullopt;
  }
}

bool isPassable(CellType type) {
  switch (type) {
    case CellType::Empty:
    case CellType::Spawn:
    case CellType::Start:
    case CellType::Finish:
      return true;
    case CellType::Hookable:
    case CellType::Freeze:
      return false;
  }
  return false;
}

}  // namespace cavewalk
