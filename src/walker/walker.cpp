// Walker state machine.

#include "walker/walker.h"

#include <algorithm>
#include <cmath>
#include <string>
#include <utility>

#include "config/generation_profile.h"
#include "core/weighted_sampler.h"
#include "map/grid.h"
#include "walker/platform_placer.h"

namespace cavewalk {

namespace {

std::string describePosition(const Position& pos) {
  return "(" + std::to_string(pos.x) + ", " + std::to_string(pos.y) + ")";
}

}  // namespace

Walker::Walker(const Position& spawn, const Kernel& inner, size_t outer_margin,
               float outer_circularity, std::vector<Position> waypoints, size_t grid_width,
               size_t grid_height)
    : pos_(spawn),
      waypoints_(std::move(waypoints)),
      inner_(inner),
      outer_margin_(outer_margin),
      outer_circularity_(outer_circularity),
      grid_width_(grid_width),
      grid_height_(grid_height),
      locked_(grid_width * grid_height, false) {
  rebuildOuter();
  history_.push_back(spawn);
  if (waypoints_.empty()) state_ = WalkerState::Finished;
}

std::optional<Position> Walker::currentGoal() const {
  if (isFinished() || waypoint_index_ >= waypoints_.size()) return std::nullopt;
  return waypoints_[waypoint_index_];
}

bool Walker::isGoalReached(size_t reached_dist_sqr) const {
  std::optional<Position> goal = currentGoal();
  if (!goal) return false;
  return pos_.distanceSquared(*goal) <= static_cast<int64_t>(reached_dist_sqr);
}

void Walker::advanceWaypoint() {
  if (isFinished()) return;
  ++waypoint_index_;
  if (waypoint_index_ >= waypoints_.size()) state_ = WalkerState::Finished;
}

void Walker::setInner(size_t radius, float circularity) {
  inner_ = Kernel(radius, circularity);
  rebuildOuter();
}

void Walker::rebuildOuter() {
  // The +1 keeps the whole 8-neighbourhood of every inner cell inside the
  // outer stamp, whatever the margin.
  outer_ = Kernel(inner_.radius() + outer_margin_ + 1, outer_circularity_);
}

size_t Walker::fadeRadius(size_t step, const GenerationProfile& profile) {
  if (profile.fade_steps == 0 || step >= profile.fade_steps) return profile.fade_min_size;
  float progress = static_cast<float>(step) / static_cast<float>(profile.fade_steps);
  float max_size = static_cast<float>(profile.fade_max_size);
  float min_size = static_cast<float>(profile.fade_min_size);
  long radius = std::lround(max_size + (min_size - max_size) * progress);
  return static_cast<size_t>(std::max(radius, 1L));
}

GenerationError Walker::mutateKernels(const GenerationProfile& profile,
                                      WeightedSampler& sampler) {
  size_t inner_radius = inner_.radius();
  float inner_circ = inner_.circularity();
  bool inner_changed = false;
  bool outer_changed = false;

  if (sampler.rollProbability(profile.inner_size_mut_prob)) {
    std::optional<size_t> size = sampler.sample(profile.inner_size_probs);
    if (!size) {
      return GenerationError::make(ErrorKind::InvalidConfig, steps_, "inner_size_probs",
                                   "distribution cannot be sampled");
    }
    inner_radius = *size;
    inner_changed = true;
  }
  if (sampler.rollProbability(profile.inner_rad_mut_prob)) {
    std::optional<float> circ = sampler.sample(profile.circ_probs);
    if (!circ) {
      return GenerationError::make(ErrorKind::InvalidConfig, steps_, "circ_probs",
                                   "distribution cannot be sampled");
    }
    inner_circ = *circ;
    inner_changed = true;
  }
  if (sampler.rollProbability(profile.outer_size_mut_prob)) {
    std::optional<size_t> margin = sampler.sample(profile.outer_margin_probs);
    if (!margin) {
      return GenerationError::make(ErrorKind::InvalidConfig, steps_, "outer_margin_probs",
                                   "distribution cannot be sampled");
    }
    outer_margin_ = *margin;
    outer_changed = true;
  }
  if (sampler.rollProbability(profile.outer_rad_mut_prob)) {
    std::optional<float> circ = sampler.sample(profile.circ_probs);
    if (!circ) {
      return GenerationError::make(ErrorKind::InvalidConfig, steps_, "circ_probs",
                                   "distribution cannot be sampled");
    }
    outer_circularity_ = *circ;
    outer_changed = true;
  }

  if (inner_changed) {
    setInner(inner_radius, inner_circ);
  } else if (outer_changed) {
    rebuildOuter();
  }
  return GenerationError();
}

std::array<ShiftDirection, 4> Walker::rankDirections(const Position& goal) const {
  std::array<ShiftDirection, 4> ranking = kAllShiftDirections;
  std::stable_sort(ranking.begin(), ranking.end(),
                   [&](ShiftDirection lhs, ShiftDirection rhs) {
                     return pos_.shifted(lhs).distanceSquared(goal) <
                            pos_.shifted(rhs).distanceSquared(goal);
                   });
  return ranking;
}

std::optional<ShiftDirection> Walker::chooseDirection(const GenerationProfile& profile,
                                                      WeightedSampler& sampler) const {
  std::optional<Position> goal = currentGoal();
  if (!goal) return std::nullopt;

  if (last_shift_ && sampler.rollProbability(profile.momentum_prob)) return *last_shift_;

  std::optional<size_t> rank = sampler.sampleIndex(profile.shift_weights);
  if (!rank || *rank >= kAllShiftDirections.size()) return std::nullopt;
  return rankDirections(*goal)[*rank];
}

bool Walker::updatePulse(const GenerationProfile& profile) {
  if (!profile.enable_pulse) return false;
  ++pulse_counter_;
  bool straight = last_shift_ && prev_shift_ && *last_shift_ == *prev_shift_;
  size_t delay = straight ? profile.pulse_straight_delay : profile.pulse_corner_delay;
  if (pulse_counter_ <= delay) return false;
  pulse_counter_ = 0;
  return true;
}

void Walker::carve(Grid& grid, WeightedSampler& sampler, const GenerationProfile& profile,
                   bool pulse) {
  Kernel inner = inner_;
  Kernel outer = outer_;
  if (pulse) {
    inner = Kernel(profile.pulse_max_kernel_size, 0.0f);
    outer = Kernel(profile.pulse_max_kernel_size + outer_margin_ + 1, 0.0f);
  }

  StampOptions inner_opts;
  inner_opts.type = CellType::Empty;
  inner_opts.policy = OverwritePolicy::All;
  inner_opts.edge_prob = profile.edge_carve_prob;
  inner_opts.locked = &locked_;
  stampKernel(grid, inner, pos_, inner_opts, sampler);

  StampOptions outer_opts;
  outer_opts.type = CellType::Freeze;
  outer_opts.policy = OverwritePolicy::SolidOnly;
  outer_opts.locked = &locked_;
  stampKernel(grid, outer, pos_, outer_opts, sampler);

  // Centre guard: the walker's own cell is always open and never touches
  // solid terrain, even inside locked or fuzzed areas.
  grid.at(pos_) = CellType::Empty;
  for (int dy = -1; dy <= 1; ++dy) {
    for (int dx = -1; dx <= 1; ++dx) {
      int x = pos_.x + dx;
      int y = pos_.y + dy;
      if (grid.inBounds(x, y) && grid.at(x, y) == CellType::Hookable) {
        grid.at(x, y) = CellType::Freeze;
      }
    }
  }
}

void Walker::updatePlatforms(Grid& grid, WeightedSampler& sampler,
                             const GenerationProfile& profile) {
  if (!profile.enable_platforms) return;
  ++steps_since_platform_;
  if (steps_since_platform_ < profile.plat_min_distance) return;

  int width = sampler.uniformInt(static_cast<int>(profile.plat_width_bounds.first),
                                 static_cast<int>(profile.plat_width_bounds.second));
  int height = sampler.uniformInt(static_cast<int>(profile.plat_height_bounds.first),
                                  static_cast<int>(profile.plat_height_bounds.second));
  std::optional<PlatformPlacement> spot =
      findPlatformSpot(grid, pos_, static_cast<size_t>(width), static_cast<size_t>(height),
                       profile);
  if (!spot) return;

  placePlatform(grid, *spot);
  steps_since_platform_ = 0;
  ++platforms_placed_;
}

void Walker::updateLocks(const GenerationProfile& profile) {
  const int half = static_cast<int>(profile.lock_kernel_size / 2);
  while (lock_index_ < history_.size() &&
         history_[lock_index_].distance(pos_) > profile.pos_lock_max_dist) {
    const Position& center = history_[lock_index_];
    for (int y = std::max(center.y - half, 0);
         y <= std::min(center.y + half, static_cast<int>(grid_height_) - 1); ++y) {
      for (int x = std::max(center.x - half, 0);
           x <= std::min(center.x + half, static_cast<int>(grid_width_) - 1); ++x) {
        locked_[static_cast<size_t>(y) * grid_width_ + static_cast<size_t>(x)] = true;
      }
    }
    ++lock_index_;
  }
}

GenerationError Walker::step(Grid& grid, WeightedSampler& sampler,
                             const GenerationProfile& profile) {
  if (isFinished()) return GenerationError();
  const size_t step_index = steps_;

  // 1. Goal check.
  if (isGoalReached(profile.waypoint_reached_dist)) {
    advanceWaypoint();
    if (isFinished()) return GenerationError();
  }

  // 2. Kernel shape: fading overrides mutation for the first fade_steps steps.
  if (step_index < profile.fade_steps) {
    setInner(fadeRadius(step_index, profile), inner_.circularity());
  } else {
    GenerationError error = mutateKernels(profile, sampler);
    if (!error.ok()) return error;
  }

  // 3. Directional step.
  std::optional<ShiftDirection> dir = chooseDirection(profile, sampler);
  if (!dir) {
    return GenerationError::make(ErrorKind::InvalidConfig, step_index, "shift_weights",
                                 "rank weights cannot be sampled");
  }
  Position next = pos_.shifted(*dir);
  if (!grid.inBounds(next)) {
    return GenerationError::make(
        ErrorKind::OutOfBounds, step_index, "",
        "step " + std::string(shiftDirectionToString(*dir)) + " from " +
            describePosition(pos_) + " leaves the " + std::to_string(grid.width()) + "x" +
            std::to_string(grid.height()) + " grid");
  }
  prev_shift_ = last_shift_;
  last_shift_ = *dir;
  pos_ = next;

  // 4. Carve.
  bool pulse = updatePulse(profile);
  carve(grid, sampler, profile, pulse);
  updatePlatforms(grid, sampler, profile);

  // 5. Stuck detection.
  history_.push_back(pos_);
  ++steps_;
  updateLocks(profile);
  if (lockDelay() > profile.pos_lock_max_delay) {
    return GenerationError::make(
        ErrorKind::Stuck, step_index, "pos_lock_max_delay",
        "lock delay " + std::to_string(lockDelay()) + " exceeds " +
            std::to_string(profile.pos_lock_max_delay) + " at " + describePosition(pos_));
  }
  return GenerationError();
}

}  // namespace cavewalk
