// Generator: owns one run's grid, walker and sampler and drives them.

#ifndef CAVEWALK_GENERATOR_H
#define CAVEWALK_GENERATOR_H

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

#include "config/generation_profile.h"
#include "core/generation_error.h"
#include "core/weighted_sampler.h"
#include "map/grid.h"
#include "map/map_skeleton.h"
#include "walker/skip.h"
#include "walker/walker.h"

namespace cavewalk {

/// @brief Run-level configuration (everything that is not a profile tunable).
struct GeneratorConfig {
  uint32_t seed = 0;         ///< 0 = auto (random).
  size_t max_steps = 20000;  ///< Walker step budget.
  bool verbose = false;      ///< Print per-run diagnostics to stderr.
};

/// @brief Result of a one-shot generation run.
struct GenerationResult {
  bool success = false;
  Grid grid;                   ///< Final grid (partial grid on failure).
  uint32_t seed_used = 0;
  size_t steps_taken = 0;
  bool finished = false;       ///< Walker reached its last waypoint.
  Position finish_position;    ///< Walker position where the finish room is carved.
  GenerationError error;
  std::string error_message;
  SkipReport skips;
  size_t platforms_placed = 0;
  size_t edge_fixes = 0;       ///< Cells repaired by the edge-bug pass.
};

/// @brief Stateful level generator.
///
/// Construction validates the profile and skeleton. An invalid configuration
/// does not crash: the generator keeps an InvalidConfig error and refuses
/// every step. Errors are sticky; once step() fails the generator stays failed.
///
/// Stepping manually and then calling postProcess() yields exactly the grid
/// generateMap() produces for the same inputs.
class Generator {
 public:
  /// @brief Set up a run.
  /// @param profile Profile (validated here, not retained).
  /// @param skeleton Map layout.
  /// @param seed Sampler seed (used as is; 0 is not special here).
  Generator(const GenerationProfile& profile, const MapSkeleton& skeleton, uint32_t seed);

  bool ok() const { return error_.ok(); }
  const GenerationError& error() const { return error_; }

  const Grid& grid() const { return grid_; }
  uint32_t seed() const { return sampler_.seed(); }

  /// @brief The run's walker, or nullptr when the configuration was rejected.
  const Walker* walker() const { return walker_ ? &*walker_ : nullptr; }

  /// @brief True once the walker has passed its last waypoint.
  bool isFinished() const;

  /// @brief Walker steps taken so far.
  size_t stepsTaken() const { return walker_ ? walker_->steps() : 0; }

  /// @brief Advance the walker by one tick.
  /// @param profile Profile passed at construction.
  /// @return The (sticky) error state after the tick.
  const GenerationError& step(const GenerationProfile& profile);

  /// @brief Post-process the grid once: skips, edge-bug repair, spawn room and
  /// finish room (at the walker's current position).
  /// @return False if the generator is failed or was already post-processed.
  bool postProcess(const GenerationProfile& profile);

  bool postProcessed() const { return post_processed_; }
  const SkipReport& skipReport() const { return skip_report_; }
  size_t edgeFixes() const { return edge_fixes_; }

  /// @brief Run a whole level: construct, step until finished or the step
  /// budget is spent, then post-process.
  ///
  /// Running out of steps is not an error: the level is post-processed as is,
  /// finished is false and a warning is printed.
  ///
  /// @param config Seed (0 = random), step budget and verbosity.
  /// @param profile Generation profile.
  /// @param skeleton Map layout.
  /// @return GenerationResult with the grid and run metadata.
  static GenerationResult generateMap(const GeneratorConfig& config,
                                      const GenerationProfile& profile,
                                      const MapSkeleton& skeleton);

 private:
  GenerationError error_;
  Grid grid_;
  WeightedSampler sampler_;
  std::optional<Walker> walker_;
  bool post_processed_ = false;
  SkipReport skip_report_;
  size_t edge_fixes_ = 0;
};

/// @brief Build the JSON report of a run.
///
/// Contains dimensions, spawn, seed, steps, finish state, per-type cell counts,
/// accepted skips, platform count and the grid rows as ASCII strings.
///
/// @param result Generation result.
/// @param profile Profile used for the run (its name is reported).
/// @param skeleton Map layout used for the run (its name is reported).
/// @return JSON string.
std::string buildReportJson(const GenerationResult& result, const GenerationProfile& profile,
                            const MapSkeleton& skeleton);

}  // namespace cavewalk

#endif  // CAVEWALK_GENERATOR_H
