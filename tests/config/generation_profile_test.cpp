// Tests for config/generation_profile.h -- defaults, presets and validation.

#include "config/generation_profile.h"

#include <gtest/gtest.h>

#include <limits>

namespace cavewalk {
namespace {

TEST(GenerationProfileTest, DefaultsAreValid) {
  GenerationProfile profile;
  ProfileValidation result = validateProfile(profile);
  EXPECT_TRUE(result.valid) << result.parameter << ": " << result.message;
  EXPECT_EQ(profile.name, "default");
  EXPECT_EQ(profile.waypoint_reached_dist, 250u);
  EXPECT_EQ(profile.shift_weights.size(), 4u);
  EXPECT_FALSE(profile.enable_pulse);
}

TEST(GenerationProfileTest, PresetsAreValidAndDistinct) {
  GenerationProfile easy = easyProfile();
  GenerationProfile hard = hardProfile();
  EXPECT_TRUE(validateProfile(easy).valid);
  EXPECT_TRUE(validateProfile(hard).valid);
  EXPECT_EQ(easy.name, "easy");
  EXPECT_EQ(hard.name, "hard");
  EXPECT_TRUE(hard.enable_pulse);
  EXPECT_NE(easy, GenerationProfile());
  EXPECT_NE(easy, hard);
  EXPECT_EQ(easyProfile(), easy);
}

// ---------------------------------------------------------------------------
// Validation failures
// ---------------------------------------------------------------------------

TEST(GenerationProfileTest, RejectsZeroInnerSize) {
  GenerationProfile profile;
  profile.inner_size_probs = WeightedTable<size_t>({0, 2}, {0.5f, 0.5f});
  ProfileValidation result = validateProfile(profile);
  EXPECT_FALSE(result.valid);
  EXPECT_EQ(result.parameter, "inner_size_probs");
}

TEST(GenerationProfileTest, RejectsZeroFadeSize) {
  GenerationProfile profile;
  profile.fade_min_size = 0;
  EXPECT_EQ(validateProfile(profile).parameter, "fade_max_size/fade_min_size");
}

TEST(GenerationProfileTest, RejectsNonPositiveSubwaypointDistance) {
  GenerationProfile profile;
  profile.max_subwaypoint_dist = 0.0f;
  EXPECT_EQ(validateProfile(profile).parameter, "max_subwaypoint_dist");
  profile.max_subwaypoint_dist = std::numeric_limits<float>::quiet_NaN();
  EXPECT_EQ(validateProfile(profile).parameter, "max_subwaypoint_dist");
}

TEST(GenerationProfileTest, RejectsMalformedTables) {
  GenerationProfile profile;
  profile.outer_margin_probs = WeightedTable<size_t>({0, 1}, {0.5f});
  EXPECT_EQ(validateProfile(profile).parameter, "outer_margin_probs");

  profile = GenerationProfile();
  profile.circ_probs = WeightedTable<float>({0.0f, 1.5f}, {0.5f, 0.5f});
  EXPECT_EQ(validateProfile(profile).parameter, "circ_probs");

  profile = GenerationProfile();
  profile.shift_weights = {1.0f, 0.0f, 0.0f};
  EXPECT_EQ(validateProfile(profile).parameter, "shift_weights");

  profile.shift_weights = {0.0f, 0.0f, 0.0f, 0.0f};
  EXPECT_EQ(validateProfile(profile).parameter, "shift_weights");
}

TEST(GenerationProfileTest, RejectsOutOfRangeProbabilities) {
  GenerationProfile profile;
  profile.momentum_prob = 1.5f;
  EXPECT_EQ(validateProfile(profile).parameter, "momentum_prob");

  profile = GenerationProfile();
  profile.edge_carve_prob = -0.1f;
  EXPECT_EQ(validateProfile(profile).parameter, "edge_carve_prob");
}

TEST(GenerationProfileTest, RejectsInvertedBounds) {
  GenerationProfile profile;
  profile.skip_length_bounds = {8, 4};
  EXPECT_EQ(validateProfile(profile).parameter, "skip_length_bounds");

  profile = GenerationProfile();
  profile.plat_width_bounds = {0, 3};
  EXPECT_EQ(validateProfile(profile).parameter, "plat_width_bounds");
}

TEST(GenerationProfileTest, RejectsDegenerateScalars) {
  GenerationProfile profile;
  profile.pos_lock_max_delay = 0;
  EXPECT_EQ(validateProfile(profile).parameter, "pos_lock_max_delay");

  profile = GenerationProfile();
  profile.room_margin = 1;
  EXPECT_EQ(validateProfile(profile).parameter, "room_margin");

  profile = GenerationProfile();
  profile.enable_pulse = true;
  profile.pulse_max_kernel_size = 0;
  EXPECT_EQ(validateProfile(profile).parameter, "pulse_max_kernel_size");

  // A zero pulse size is harmless while pulse is off.
  profile.enable_pulse = false;
  EXPECT_TRUE(validateProfile(profile).valid);
}

}  // namespace
}  // namespace cavewalk
