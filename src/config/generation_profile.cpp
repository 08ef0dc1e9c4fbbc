// Generation profile validation and built-in presets.

#include "config/generation_profile.h"

#include <cmath>
#include <tuple>

namespace cavewalk {

namespace {

/// Number of ranked shift directions.
constexpr size_t kShiftRankCount = 4;

/// Minimum room margin: the platform spans x +- (margin - 2).
constexpr size_t kMinRoomMargin = 2;

bool isProbability(float value) {
  return std::isfinite(value) && value >= 0.0f && value <= 1.0f;
}

}  // namespace

bool GenerationProfile::operator==(const GenerationProfile& other) const {
  auto head = [](const GenerationProfile& prof) {
    return std::tie(prof.name, prof.description, prof.version, prof.inner_rad_mut_prob,
                    prof.inner_size_mut_prob, prof.outer_rad_mut_prob, prof.outer_size_mut_prob,
                    prof.inner_size_probs, prof.outer_margin_probs, prof.circ_probs,
                    prof.edge_carve_prob, prof.shift_weights, prof.momentum_prob,
                    prof.waypoint_reached_dist, prof.max_subwaypoint_dist,
                    prof.subwaypoint_max_shift_dist);
  };
  auto tail = [](const GenerationProfile& prof) {
    return std::tie(prof.enable_platforms, prof.plat_min_distance, prof.plat_width_bounds,
                    prof.plat_height_bounds, prof.plat_min_empty_height,
                    prof.plat_soft_overhang, prof.enable_skips, prof.skip_length_bounds,
                    prof.skip_min_spacing_sqr, prof.max_level_skip, prof.max_skip_fraction,
                    prof.enable_pulse, prof.pulse_straight_delay, prof.pulse_corner_delay,
                    prof.pulse_max_kernel_size, prof.fade_steps, prof.fade_max_size,
                    prof.fade_min_size, prof.pos_lock_max_dist, prof.pos_lock_max_delay,
                    prof.lock_kernel_size, prof.room_margin);
  };
  return head(*this) == head(other) && tail(*this) == tail(other);
}

ProfileValidation validateProfile(const GenerationProfile& profile) {
  // 1. A zero inner kernel size would carve nothing and seal the walk.
  for (size_t inner_size : profile.inner_size_probs.values) {
    if (inner_size == 0) {
      return ProfileValidation::fail("inner_size_probs", "inner kernel size of 0");
    }
  }

  // 2. Fade bounds.
  if (profile.fade_max_size == 0 || profile.fade_min_size == 0) {
    return ProfileValidation::fail("fade_max_size/fade_min_size",
                                   "fade kernel sizes must be larger than zero");
  }

  // 3. Subwaypoint spacing (divides the waypoint distance).
  if (!(profile.max_subwaypoint_dist > 0.0f)) {
    return ProfileValidation::fail("max_subwaypoint_dist",
                                   "max subwaypoint distance must be > 0");
  }

  // 4. Weighted tables.
  std::string issue = profile.inner_size_probs.validate();
  if (!issue.empty()) return ProfileValidation::fail("inner_size_probs", issue);
  issue = profile.outer_margin_probs.validate();
  if (!issue.empty()) return ProfileValidation::fail("outer_margin_probs", issue);
  issue = profile.circ_probs.validate();
  if (!issue.empty()) return ProfileValidation::fail("circ_probs", issue);
  for (float circ : profile.circ_probs.values) {
    if (!isProbability(circ)) {
      return ProfileValidation::fail("circ_probs", "circularity outside [0, 1]");
    }
  }
  if (profile.shift_weights.size() != kShiftRankCount) {
    return ProfileValidation::fail("shift_weights", "expected exactly 4 rank weights");
  }
  std::vector<size_t> ranks = {0, 1, 2, 3};
  issue = WeightedTable<size_t>(ranks, profile.shift_weights).validate();
  if (!issue.empty()) return ProfileValidation::fail("shift_weights", issue);

  // 5. Probabilities.
  const std::pair<const char*, float> probabilities[] = {
      {"inner_rad_mut_prob", profile.inner_rad_mut_prob},
      {"inner_size_mut_prob", profile.inner_size_mut_prob},
      {"outer_rad_mut_prob", profile.outer_rad_mut_prob},
      {"outer_size_mut_prob", profile.outer_size_mut_prob},
      {"momentum_prob", profile.momentum_prob},
      {"edge_carve_prob", profile.edge_carve_prob},
      {"max_skip_fraction", profile.max_skip_fraction},
  };
  for (const auto& [param, value] : probabilities) {
    if (!isProbability(value)) return ProfileValidation::fail(param, "must be in [0, 1]");
  }

  // 6. Bounds.
  if (profile.skip_length_bounds.first == 0 ||
      profile.skip_length_bounds.first > profile.skip_length_bounds.second) {
    return ProfileValidation::fail("skip_length_bounds", "expected 1 <= min <= max");
  }
  if (profile.plat_width_bounds.first == 0 ||
      profile.plat_width_bounds.first > profile.plat_width_bounds.second) {
    return ProfileValidation::fail("plat_width_bounds", "expected 1 <= min <= max");
  }
  if (profile.plat_height_bounds.first == 0 ||
      profile.plat_height_bounds.first > profile.plat_height_bounds.second) {
    return ProfileValidation::fail("plat_height_bounds", "expected 1 <= min <= max");
  }

  // 7. Remaining scalars.
  if (profile.pos_lock_max_delay == 0) {
    return ProfileValidation::fail("pos_lock_max_delay", "must be > 0");
  }
  if (!(profile.pos_lock_max_dist > 0.0f)) {
    return ProfileValidation::fail("pos_lock_max_dist", "must be > 0");
  }
  if (profile.room_margin < kMinRoomMargin) {
    return ProfileValidation::fail("room_margin", "must be >= 2");
  }
  if (profile.enable_pulse && profile.pulse_max_kernel_size == 0) {
    return ProfileValidation::fail("pulse_max_kernel_size", "must be > 0 when pulse is enabled");
  }
  if (!std::isfinite(profile.subwaypoint_max_shift_dist) ||
      profile.subwaypoint_max_shift_dist < 0.0f) {
    return ProfileValidation::fail("subwaypoint_max_shift_dist", "must be >= 0");
  }

  return ProfileValidation();
}

GenerationProfile easyProfile() {
  GenerationProfile profile;
  profile.name = "easy";
  profile.description = "wide tunnels, strongly goal-directed walk";
  profile.inner_size_probs = WeightedTable<size_t>({2, 3}, {0.5f, 0.5f});
  profile.outer_margin_probs = WeightedTable<size_t>({0, 1}, {0.7f, 0.3f});
  profile.shift_weights = {0.6f, 0.17f, 0.15f, 0.08f};
  profile.momentum_prob = 0.05f;
  profile.fade_max_size = 4;
  profile.fade_min_size = 2;
  profile.plat_min_distance = 60;
  return profile;
}

GenerationProfile hardProfile() {
  GenerationProfile profile;
  profile.name = "hard";
  profile.description = "narrow tunnels, wandering walk, pulsing corridors";
  profile.inner_size_probs = WeightedTable<size_t>({1, 2}, {0.6f, 0.4f});
  profile.outer_margin_probs = WeightedTable<size_t>({0, 1, 2}, {0.3f, 0.4f, 0.3f});
  profile.circ_probs = WeightedTable<float>({0.0f, 0.6f, 0.8f}, {0.5f, 0.3f, 0.2f});
  profile.edge_carve_prob = 0.8f;
  profile.shift_weights = {0.35f, 0.25f, 0.22f, 0.18f};
  profile.momentum_prob = 0.02f;
  profile.enable_pulse = true;
  profile.pulse_max_kernel_size = 3;
  profile.plat_min_distance = 100;
  profile.pos_lock_max_delay = 1500;
  return profile;
}

}  // namespace cavewalk
