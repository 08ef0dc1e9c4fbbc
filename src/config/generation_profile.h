// Generation profile: every tunable of a level generation run.

#ifndef CAVEWALK_CONFIG_GENERATION_PROFILE_H
#define CAVEWALK_CONFIG_GENERATION_PROFILE_H

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

#include "core/weighted_sampler.h"

namespace cavewalk {

/// Inclusive (min, max) pair.
using SizeBounds = std::pair<size_t, size_t>;

/// @brief Tunable parameters of one generation run.
///
/// Read-only input: owned by the caller, borrowed by Generator and Walker for
/// the run's lifetime. Kernel sizes are radii (a radius r kernel spans
/// 2r + 1 cells).
struct GenerationProfile {
  std::string name = "default";
  std::string description;
  std::string version = "1.0";

  // ---------------------------------------------------------------------------
  // Kernel mutation ("rad" mutations resample circularity, "size" mutations
  // resample the inner radius / outer margin)
  // ---------------------------------------------------------------------------

  float inner_rad_mut_prob = 0.25f;
  float inner_size_mut_prob = 0.5f;
  float outer_rad_mut_prob = 0.25f;
  float outer_size_mut_prob = 0.5f;

  WeightedTable<size_t> inner_size_probs{{1, 2}, {0.25f, 0.75f}};    ///< Inner radius.
  WeightedTable<size_t> outer_margin_probs{{0, 1}, {0.5f, 0.5f}};    ///< Extra outer margin.
  WeightedTable<float> circ_probs{{0.0f, 0.6f, 0.8f}, {0.75f, 0.15f, 0.05f}};

  /// Probability that a cell on the inner kernel's edge band is carved.
  float edge_carve_prob = 1.0f;

  // ---------------------------------------------------------------------------
  // Movement
  // ---------------------------------------------------------------------------

  /// Rank weights for the four directions, best (index 0) to worst.
  std::vector<float> shift_weights = {0.4f, 0.22f, 0.2f, 0.18f};

  /// Probability of repeating the previous direction.
  float momentum_prob = 0.01f;

  /// Squared distance at which a waypoint counts as reached.
  size_t waypoint_reached_dist = 250;

  /// Maximum distance between consecutive (sub)waypoints.
  float max_subwaypoint_dist = 50.0f;

  /// Maximum per-axis shift of generated subwaypoints.
  float subwaypoint_max_shift_dist = 5.0f;

  // ---------------------------------------------------------------------------
  // Platforms
  // ---------------------------------------------------------------------------

  bool enable_platforms = true;
  size_t plat_min_distance = 75;       ///< Steps between platform attempts.
  SizeBounds plat_width_bounds{3, 5};
  SizeBounds plat_height_bounds{1, 2};
  size_t plat_min_empty_height = 4;    ///< Free rows required above a platform.
  bool plat_soft_overhang = false;     ///< Allow Freeze in the lowest clearance row.

  // ---------------------------------------------------------------------------
  // Skips
  // ---------------------------------------------------------------------------

  bool enable_skips = true;
  SizeBounds skip_length_bounds{3, 11};
  size_t skip_min_spacing_sqr = 45;    ///< Squared spacing between accepted skips.
  size_t max_level_skip = 90;          ///< Max path steps bypassed by one skip.
  float max_skip_fraction = 0.1f;      ///< Cumulative skip length / path length.

  // ---------------------------------------------------------------------------
  // Stylistic modifiers
  // ---------------------------------------------------------------------------

  bool enable_pulse = false;
  size_t pulse_straight_delay = 10;
  size_t pulse_corner_delay = 5;
  size_t pulse_max_kernel_size = 3;

  size_t fade_steps = 60;
  size_t fade_max_size = 3;
  size_t fade_min_size = 1;

  // ---------------------------------------------------------------------------
  // Locking / stuck detection
  // ---------------------------------------------------------------------------

  float pos_lock_max_dist = 20.0f;
  size_t pos_lock_max_delay = 1000;
  size_t lock_kernel_size = 9;

  // ---------------------------------------------------------------------------
  // Rooms
  // ---------------------------------------------------------------------------

  size_t room_margin = 4;

  bool operator==(const GenerationProfile& other) const;
  bool operator!=(const GenerationProfile& other) const { return !(*this == other); }
};

/// @brief Result of validating a profile.
struct ProfileValidation {
  bool valid = true;
  std::string parameter;  ///< Name of the first offending field.
  std::string message;

  static ProfileValidation fail(std::string param, std::string msg) {
    ProfileValidation result;
    result.valid = false;
    result.parameter = std::move(param);
    result.message = std::move(msg);
    return result;
  }
};

/// @brief Validate a profile before a run starts.
///
/// Rejects zero inner kernel sizes, zero fade sizes, a non-positive subwaypoint
/// distance, malformed weight tables, out-of-range probabilities, inverted bounds
/// and other values that would make a run crash or loop.
///
/// @param profile Profile to check.
/// @return The first failing check, or a valid result.
ProfileValidation validateProfile(const GenerationProfile& profile);

/// @brief Forgiving preset: wide tunnels, strongly goal-directed.
GenerationProfile easyProfile();

/// @brief Demanding preset: narrow tunnels, wandering walk, pulse enabled.
GenerationProfile hardProfile();

}  // namespace cavewalk

#endif  // CAVEWALK_CONFIG_GENERATION_PROFILE_H
