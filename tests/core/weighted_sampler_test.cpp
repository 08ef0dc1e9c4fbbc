// Tests for core/weighted_sampler.h -- seeded sampling and weight tables.

#include "core/weighted_sampler.h"

#include <gtest/gtest.h>

#include <map>
#include <string>
#include <vector>

namespace cavewalk {
namespace {

// ---------------------------------------------------------------------------
// WeightedTable
// ---------------------------------------------------------------------------

TEST(WeightedTableTest, ValidTableHasNoError) {
  WeightedTable<size_t> table({1, 2}, {0.25f, 0.75f});
  EXPECT_TRUE(table.validate().empty());
  EXPECT_EQ(table.maxValue(), 2u);
}

TEST(WeightedTableTest, ValidateReportsProblems) {
  EXPECT_FALSE(WeightedTable<size_t>({}, {}).validate().empty());
  EXPECT_FALSE(WeightedTable<size_t>({1, 2}, {1.0f}).validate().empty());
  EXPECT_FALSE(WeightedTable<size_t>({1, 2}, {1.0f, -1.0f}).validate().empty());
  EXPECT_FALSE(WeightedTable<size_t>({1, 2}, {0.0f, 0.0f}).validate().empty());
}

TEST(WeightedTableTest, MaxValueOfFloatTable) {
  WeightedTable<float> table({0.0f, 0.6f, 0.8f}, {0.75f, 0.15f, 0.05f});
  EXPECT_FLOAT_EQ(table.maxValue(), 0.8f);
}

// ---------------------------------------------------------------------------
// Sampling
// ---------------------------------------------------------------------------

TEST(WeightedSamplerTest, SameSeedSameSequence) {
  WeightedSampler sampler_a(42);
  WeightedSampler sampler_b(42);
  WeightedTable<size_t> table({1, 2, 3}, {0.2f, 0.5f, 0.3f});
  for (int idx = 0; idx < 100; ++idx) {
    EXPECT_EQ(sampler_a.sample(table), sampler_b.sample(table));
    EXPECT_EQ(sampler_a.uniformInt(0, 9), sampler_b.uniformInt(0, 9));
    EXPECT_EQ(sampler_a.uniformFloat(-1.0f, 1.0f), sampler_b.uniformFloat(-1.0f, 1.0f));
  }
  EXPECT_EQ(sampler_a.seed(), 42u);
}

TEST(WeightedSamplerTest, DifferentSeedsDiverge) {
  WeightedSampler sampler_a(1);
  WeightedSampler sampler_b(2);
  int differences = 0;
  for (int idx = 0; idx < 50; ++idx) {
    if (sampler_a.uniformInt(0, 1000) != sampler_b.uniformInt(0, 1000)) ++differences;
  }
  EXPECT_GT(differences, 40);
}

TEST(WeightedSamplerTest, SampleWeightedFrequencies) {
  WeightedSampler sampler(42);
  std::vector<std::string> values = {"a", "b"};
  std::vector<float> weights = {0.25f, 0.75f};
  std::map<std::string, int> counts;
  for (int idx = 0; idx < 8000; ++idx) {
    auto picked = sampler.sampleWeighted(values, weights);
    ASSERT_TRUE(picked.has_value());
    ++counts[*picked];
  }
  EXPECT_GT(counts["a"], 1700);
  EXPECT_LT(counts["a"], 2300);
}

TEST(WeightedSamplerTest, SampleWeightedRejectsMismatchedSizes) {
  WeightedSampler sampler(42);
  std::vector<int> values = {1, 2, 3};
  EXPECT_FALSE(sampler.sampleWeighted(values, {1.0f, 1.0f}).has_value());
}

TEST(WeightedSamplerTest, SampleWeightedRejectsZeroWeights) {
  WeightedSampler sampler(42);
  std::vector<int> values = {1, 2};
  EXPECT_FALSE(sampler.sampleWeighted(values, {0.0f, 0.0f}).has_value());
  EXPECT_FALSE(sampler.sampleWeighted(std::vector<int>{}, {}).has_value());
}

TEST(WeightedSamplerTest, SampleIndexSingleNonZeroWeight) {
  WeightedSampler sampler(3);
  for (int idx = 0; idx < 100; ++idx) {
    EXPECT_EQ(sampler.sampleIndex({0.0f, 0.0f, 5.0f, 0.0f}), std::optional<size_t>(2));
  }
}

TEST(WeightedSamplerTest, UniformIntInclusiveAndDegenerate) {
  WeightedSampler sampler(42);
  bool saw_min = false;
  bool saw_max = false;
  for (int idx = 0; idx < 500; ++idx) {
    int val = sampler.uniformInt(3, 5);
    ASSERT_GE(val, 3);
    ASSERT_LE(val, 5);
    saw_min |= (val == 3);
    saw_max |= (val == 5);
  }
  EXPECT_TRUE(saw_min);
  EXPECT_TRUE(saw_max);
  EXPECT_EQ(sampler.uniformInt(7, 7), 7);
  EXPECT_EQ(sampler.uniformInt(9, 4), 9);
}

TEST(WeightedSamplerTest, RollProbabilityExtremesConsumeNothing) {
  WeightedSampler sampler(42);
  WeightedSampler reference(42);
  EXPECT_TRUE(sampler.rollProbability(1.0f));
  EXPECT_TRUE(sampler.rollProbability(1.5f));
  EXPECT_FALSE(sampler.rollProbability(0.0f));
  EXPECT_FALSE(sampler.rollProbability(-0.5f));
  // The streams are still aligned.
  EXPECT_EQ(sampler.uniformInt(0, 1000000), reference.uniformInt(0, 1000000));
}

}  // namespace
}  // namespace cavewalk
