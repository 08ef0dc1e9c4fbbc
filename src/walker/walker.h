// Random-walk agent that carves the level.
//
// The walker is a two-state machine (Walking -> Finished). Each tick it checks
// its goal, mutates its kernels, takes one goal-biased cardinal step, carves
// around its new position, places platforms and updates stuck detection.

#ifndef CAVEWALK_WALKER_WALKER_H
#define CAVEWALK_WALKER_WALKER_H

#include <array>
#include <cstddef>
#include <optional>
#include <vector>

#include "core/generation_error.h"
#include "core/position.h"
#include "walker/kernel.h"

namespace cavewalk {

class Grid;
class WeightedSampler;
struct GenerationProfile;

/// @brief Walker lifecycle state.
enum class WalkerState : uint8_t {
  Walking,
  Finished
};

/// @brief Stateful random-walk agent.
///
/// Owned by one Generator. Grid and sampler are borrowed per call only.
class Walker {
 public:
  /// @brief Create a walker.
  /// @param spawn Start position (also the first history entry).
  /// @param inner Initial inner kernel.
  /// @param outer_margin Initial outer margin (outer radius = inner + margin + 1).
  /// @param outer_circularity Initial outer circularity.
  /// @param waypoints Ordered goals; empty means the walker starts Finished.
  /// @param grid_width Grid width (sizes the lock mask).
  /// @param grid_height Grid height.
  Walker(const Position& spawn, const Kernel& inner, size_t outer_margin,
         float outer_circularity, std::vector<Position> waypoints, size_t grid_width,
         size_t grid_height);

  // ---------------------------------------------------------------------------
  // State
  // ---------------------------------------------------------------------------

  const Position& position() const { return pos_; }
  WalkerState state() const { return state_; }
  bool isFinished() const { return state_ == WalkerState::Finished; }

  const std::vector<Position>& waypoints() const { return waypoints_; }
  size_t waypointIndex() const { return waypoint_index_; }

  /// @brief Current goal, or std::nullopt once finished.
  std::optional<Position> currentGoal() const;

  const Kernel& innerKernel() const { return inner_; }
  const Kernel& outerKernel() const { return outer_; }
  size_t outerMargin() const { return outer_margin_; }

  /// @brief Number of completed steps.
  size_t steps() const { return steps_; }

  /// @brief Positions after every step, starting with the spawn.
  const std::vector<Position>& history() const { return history_; }

  std::optional<ShiftDirection> lastShift() const { return last_shift_; }

  /// @brief Index of the oldest history entry not yet locked.
  size_t lockIndex() const { return lock_index_; }

  /// @brief History entries not yet locked (the stuck-detection delay).
  size_t lockDelay() const { return history_.size() - lock_index_; }

  /// @brief Row-major lock mask (true = no longer carved by kernels).
  const std::vector<bool>& lockMask() const { return locked_; }

  size_t platformsPlaced() const { return platforms_placed_; }

  // ---------------------------------------------------------------------------
  // Transitions
  // ---------------------------------------------------------------------------

  /// @brief True if the squared distance to the current goal is within
  /// reached_dist_sqr. False once finished.
  bool isGoalReached(size_t reached_dist_sqr) const;

  /// @brief Move the cursor to the next waypoint; Finished if none remain.
  void advanceWaypoint();

  /// @brief Perform one full tick.
  ///
  /// No-op when finished. On error the walker state is left as it was at the
  /// failure point and the caller must stop stepping.
  ///
  /// @param grid Grid to carve (borrowed for this call).
  /// @param sampler Run sampler.
  /// @param profile Validated profile.
  /// @return Error, or an ok() value.
  GenerationError step(Grid& grid, WeightedSampler& sampler, const GenerationProfile& profile);

  // ---------------------------------------------------------------------------
  // Step phases (public for testing)
  // ---------------------------------------------------------------------------

  /// @brief Resample kernel parameters with the profile's mutation probabilities.
  /// @return Error if a distribution cannot be sampled.
  GenerationError mutateKernels(const GenerationProfile& profile, WeightedSampler& sampler);

  /// @brief Directions ordered by remaining squared distance to goal after the
  /// move (best first, ties in enum order).
  std::array<ShiftDirection, 4> rankDirections(const Position& goal) const;

  /// @brief Pick the next direction (momentum override or rank draw).
  /// @return Direction, or std::nullopt if shift_weights cannot be sampled.
  std::optional<ShiftDirection> chooseDirection(const GenerationProfile& profile,
                                                WeightedSampler& sampler) const;

  /// @brief Inner radius dictated by fading at the given step.
  static size_t fadeRadius(size_t step, const GenerationProfile& profile);

 private:
  /// Carve around the current position with the effective kernels.
  void carve(Grid& grid, WeightedSampler& sampler, const GenerationProfile& profile,
             bool pulse);

  /// Try to place a platform once enough steps have passed.
  void updatePlatforms(Grid& grid, WeightedSampler& sampler, const GenerationProfile& profile);

  /// Advance the lock cursor and lock the area around passed positions.
  void updateLocks(const GenerationProfile& profile);

  /// Whether this step pulses; advances the pulse counter.
  bool updatePulse(const GenerationProfile& profile);

  void setInner(size_t radius, float circularity);
  void rebuildOuter();

  Position pos_;
  WalkerState state_ = WalkerState::Walking;
  std::vector<Position> waypoints_;
  size_t waypoint_index_ = 0;

  Kernel inner_;
  Kernel outer_;
  size_t outer_margin_;
  float outer_circularity_;

  size_t steps_ = 0;
  std::optional<ShiftDirection> last_shift_;
  std::optional<ShiftDirection> prev_shift_;
  size_t pulse_counter_ = 0;
  size_t steps_since_platform_ = 0;
  size_t platforms_placed_ = 0;

  std::vector<Position> history_;
  size_t lock_index_ = 0;
  size_t grid_width_;
  size_t grid_height_;
  std::vector<bool> locked_;
};

}  // namespace cavewalk

#endif  // CAVEWALK_WALKER_WALKER_H
