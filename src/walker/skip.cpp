// Skip search, validation and carving.

#include "walker/skip.h"

#include <cmath>
#include <limits>

#include "config/generation_profile.h"
#include "map/grid.h"

namespace cavewalk {

namespace {

constexpr size_t kNotVisited = std::numeric_limits<size_t>::max();

/// @brief Row-major map of the history index at which each cell was first visited.
std::vector<size_t> buildFirstVisit(const Grid& grid, const std::vector<Position>& history) {
  std::vector<size_t> first_visit(grid.width() * grid.height(), kNotVisited);
  for (size_t idx = 0; idx < history.size(); ++idx) {
    const Position& pos = history[idx];
    if (!grid.inBounds(pos)) continue;
    size_t& slot = first_visit[grid.index(pos.x, pos.y)];
    if (slot == kNotVisited) slot = idx;
  }
  return first_visit;
}

bool lineHasHookable(const Grid& grid, const Position& start, ShiftDirection direction,
                     int length) {
  const Position delta = shiftDelta(direction);
  for (int step = 1; step < length; ++step) {
    if (grid.at(start + delta * step) == CellType::Hookable) return true;
  }
  return false;
}

}  // namespace

const char* skipVerdictToString(SkipVerdict verdict) {
  switch (verdict) {
    case SkipVerdict::Accepted:
      return "accepted";
    case SkipVerdict::TooShort:
      return "too_short";
    case SkipVerdict::TooLong:
      return "too_long";
    case SkipVerdict::LevelSkipExceeded:
      return "level_skip_exceeded";
    case SkipVerdict::TooClose:
      return "too_close";
    case SkipVerdict::BudgetExhausted:
      return "budget_exhausted";
    case SkipVerdict::CrossesOpening:
      return "crosses_opening";
  }
  return "unknown";
}

// ---------------------------------------------------------------------------
// SkipValidator
// ---------------------------------------------------------------------------

SkipValidator::SkipValidator(const GenerationProfile& profile, size_t path_length)
    : profile_(profile),
      budget_(static_cast<size_t>(
          std::floor(static_cast<double>(profile.max_skip_fraction) *
                     static_cast<double>(path_length)))) {}

SkipVerdict SkipValidator::validate(const Skip& skip) const {
  if (exhausted_) return SkipVerdict::BudgetExhausted;
  if (skip.length < profile_.skip_length_bounds.first) return SkipVerdict::TooShort;
  if (skip.length > profile_.skip_length_bounds.second) return SkipVerdict::TooLong;
  if (skip.end_index < skip.start_index || skip.levelSkip() > profile_.max_level_skip) {
    return SkipVerdict::LevelSkipExceeded;
  }
  for (const Skip& other : accepted_) {
    if (skip.start.distanceSquared(other.start) <
        static_cast<int64_t>(profile_.skip_min_spacing_sqr)) {
      return SkipVerdict::TooClose;
    }
  }
  if (total_length_ + skip.length > budget_) return SkipVerdict::BudgetExhausted;
  return SkipVerdict::Accepted;
}

SkipVerdict SkipValidator::tryAccept(const Skip& skip) {
  SkipVerdict verdict = validate(skip);
  if (verdict == SkipVerdict::BudgetExhausted) {
    exhausted_ = true;
  } else if (verdict == SkipVerdict::Accepted) {
    accepted_.push_back(skip);
    total_length_ += skip.length;
  }
  return verdict;
}

// ---------------------------------------------------------------------------
// Search and carving
// ---------------------------------------------------------------------------

bool crossesSingleWall(const Grid& grid, const Position& start, ShiftDirection direction,
                       size_t length) {
  const Position delta = shiftDelta(direction);
  bool in_wall = false;
  bool past_wall = false;
  for (int step = 1; step < static_cast<int>(length); ++step) {
    Position cell = start + delta * step;
    if (!grid.inBounds(cell)) return false;
    if (grid.at(cell) == CellType::Empty) {
      if (in_wall) past_wall = true;
      continue;
    }
    if (past_wall) return false;
    in_wall = true;
  }
  return in_wall;
}

std::vector<Skip> findSkipCandidates(const Grid& grid, const std::vector<Position>& history,
                                     const GenerationProfile& profile) {
  std::vector<Skip> candidates;
  if (history.size() < 2) return candidates;

  const std::vector<size_t> first_visit = buildFirstVisit(grid, history);
  const int max_len = static_cast<int>(profile.skip_length_bounds.second);
  const size_t min_len = profile.skip_length_bounds.first;

  for (size_t start_idx = 0; start_idx < history.size(); ++start_idx) {
    const Position& start = history[start_idx];
    for (ShiftDirection dir : kAllShiftDirections) {
      const Position delta = shiftDelta(dir);
      for (int len = 1; len <= max_len; ++len) {
        Position cell = start + delta * len;
        if (!grid.inBounds(cell)) break;

        // The first visited cell ends the scan; the line may not pass through
        // older parts of the walk.
        size_t visit = first_visit[grid.index(cell.x, cell.y)];
        if (visit == kNotVisited) continue;
        if (visit > start_idx + static_cast<size_t>(len) &&
            static_cast<size_t>(len) >= min_len &&
            lineHasHookable(grid, start, dir, len) &&
            crossesSingleWall(grid, start, dir, static_cast<size_t>(len))) {
          Skip skip;
          skip.start = start;
          skip.end = cell;
          skip.start_index = start_idx;
          skip.end_index = visit;
          skip.length = static_cast<size_t>(len);
          skip.direction = dir;
          candidates.push_back(skip);
        }
        break;
      }
    }
  }
  return candidates;
}

size_t carveSkip(Grid& grid, const Skip& skip) {
  const Position delta = shiftDelta(skip.direction);
  const int len = static_cast<int>(skip.length);

  for (int step = 0; step <= len; ++step) {
    Position cell = skip.start + delta * step;
    grid.setArea(cell - Position(1, 1), cell + Position(1, 1), CellType::Freeze, false);
  }

  size_t opened = 0;
  for (int step = 0; step <= len; ++step) {
    Position cell = skip.start + delta * step;
    if (!grid.inBounds(cell) || grid.at(cell) == CellType::Empty) continue;
    grid.at(cell) = CellType::Empty;
    ++opened;
  }
  return opened;
}

SkipReport generateSkips(Grid& grid, const std::vector<Position>& history,
                         const GenerationProfile& profile) {
  SkipReport report;
  std::vector<Skip> candidates = findSkipCandidates(grid, history, profile);
  report.candidates = candidates.size();

  SkipValidator validator(profile, history.size());
  for (const Skip& candidate : candidates) {
    // Skips carved earlier in this pass may have opened the line.
    SkipVerdict verdict = crossesSingleWall(grid, candidate.start, candidate.direction,
                                            candidate.length)
                              ? validator.tryAccept(candidate)
                              : SkipVerdict::CrossesOpening;
    ++report.verdicts[static_cast<size_t>(verdict)];
    if (verdict == SkipVerdict::Accepted) carveSkip(grid, candidate);
  }
  report.accepted = validator.accepted();
  return report;
}

}  // namespace cavewalk
