// Skips: straight shortcuts between two parts of the walker's path.
//
// A skip starts at history index i and runs axis-aligned to a cell that the
// walk first reached at a later index j. It is carved after the walk, through
// solid terrain, and is only kept if the validator accepts it.

#ifndef CAVEWALK_WALKER_SKIP_H
#define CAVEWALK_WALKER_SKIP_H

#include <array>
#include <cstddef>
#include <cstdint>
#include <vector>

#include "core/position.h"

namespace cavewalk {

class Grid;
struct GenerationProfile;

/// @brief Outcome of validating one skip candidate.
///
/// Everything except Accepted is a rejection. Rejections are a normal part of
/// post-processing and never fail a run.
enum class SkipVerdict : uint8_t {
  Accepted,
  TooShort,
  TooLong,
  LevelSkipExceeded,
  TooClose,
  BudgetExhausted,
  CrossesOpening  ///< An earlier skip of the same pass opened the line.
};

constexpr size_t kSkipVerdictCount = 7;

/// @brief Convert SkipVerdict to string.
const char* skipVerdictToString(SkipVerdict verdict);

/// @brief One straight shortcut.
struct Skip {
  Position start;
  Position end;
  size_t start_index = 0;  ///< History index of start.
  size_t end_index = 0;    ///< First-visit history index of end.
  size_t length = 0;       ///< Cells between start and end along the line.
  ShiftDirection direction = ShiftDirection::Up;

  /// @brief Path steps bypassed by the skip.
  size_t levelSkip() const { return end_index - start_index; }
};

/// @brief Accepts skips against the profile's length, spacing and budget rules.
///
/// Once a candidate would push the cumulative length over the budget, the
/// validator is exhausted and rejects every later candidate.
class SkipValidator {
 public:
  /// @param profile Profile with the skip parameters (borrowed).
  /// @param path_length Number of history entries of the run.
  SkipValidator(const GenerationProfile& profile, size_t path_length);

  /// @brief Verdict for a candidate without recording it.
  SkipVerdict validate(const Skip& skip) const;

  /// @brief Validate and, when accepted, record the skip.
  SkipVerdict tryAccept(const Skip& skip);

  const std::vector<Skip>& accepted() const { return accepted_; }
  size_t totalLength() const { return total_length_; }

  /// @brief Maximum cumulative skip length (floor of fraction * path length).
  size_t budget() const { return budget_; }
  bool exhausted() const { return exhausted_; }

 private:
  const GenerationProfile& profile_;
  size_t budget_;
  size_t total_length_ = 0;
  bool exhausted_ = false;
  std::vector<Skip> accepted_;
};

/// @brief Find skip candidates along a walk.
///
/// For every history index i and every direction, cells are scanned outward at
/// distance 1..max skip length. The scan stops at the first cell the walk
/// visited at all. That cell becomes a candidate only if it was first visited
/// at an index j > i + len, len is within the length bounds, and the line to
/// it crosses a single wall (see crossesSingleWall) containing Hookable cells.
///
/// @param grid Carved grid.
/// @param history Walker path (spawn first).
/// @param profile Profile with skip_length_bounds.
/// @return Candidates ordered by start index, then direction.
std::vector<Skip> findSkipCandidates(const Grid& grid, const std::vector<Position>& history,
                                     const GenerationProfile& profile);

/// @brief True if the cells strictly between start and start + length * direction
/// are open corridor, then one non-empty run of solid terrain, then open
/// corridor again.
///
/// A second solid run means the line passes through another open region.
bool crossesSingleWall(const Grid& grid, const Position& start, ShiftDirection direction,
                       size_t length);

/// @brief Carve a skip: 8-neighbours of the line go Hookable -> Freeze, then
/// the line itself (both ends included) becomes Empty.
/// @return Number of cells opened.
size_t carveSkip(Grid& grid, const Skip& skip);

/// @brief Summary of one skip pass.
struct SkipReport {
  std::vector<Skip> accepted;
  size_t candidates = 0;
  std::array<size_t, kSkipVerdictCount> verdicts{};  ///< Count per SkipVerdict.

  size_t rejected() const { return candidates - accepted.size(); }
};

/// @brief Find, validate and carve skips in one pass.
SkipReport generateSkips(Grid& grid, const std::vector<Position>& history,
                         const GenerationProfile& profile);

}  // namespace cavewalk

#endif  // CAVEWALK_WALKER_SKIP_H
