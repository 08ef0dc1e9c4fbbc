// Seeded random source with weighted discrete choice.
//
// Each generation run owns exactly one sampler. Identical seed and identical
// call sequence reproduce identical outputs, which is what makes a fixed seed
// regenerate the same level.

#ifndef CAVEWALK_CORE_WEIGHTED_SAMPLER_H
#define CAVEWALK_CORE_WEIGHTED_SAMPLER_H

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <random>
#include <string>
#include <utility>
#include <vector>

#include "core/rng_util.h"

namespace cavewalk {

/// @brief Discrete distribution over values, as stored in a generation profile.
template <typename T>
struct WeightedTable {
  std::vector<T> values;
  std::vector<float> weights;

  WeightedTable() = default;
  WeightedTable(std::vector<T> vals, std::vector<float> wts)
      : values(std::move(vals)), weights(std::move(wts)) {}

  /// @brief Check the table is usable for sampling.
  /// @return Empty string when valid, otherwise a description of the problem.
  std::string validate() const {
    if (values.empty()) return "no values";
    if (values.size() != weights.size()) {
      return "values/weights length mismatch (" + std::to_string(values.size()) + " vs " +
             std::to_string(weights.size()) + ")";
    }
    float total = 0.0f;
    for (float weight : weights) {
      if (!std::isfinite(weight) || weight < 0.0f) return "negative or non-finite weight";
      total += weight;
    }
    if (total <= 0.0f) return "all weights are zero";
    return "";
  }

  /// @brief Largest value in the table (default-constructed T if empty).
  T maxValue() const {
    if (values.empty()) return T();
    return *std::max_element(values.begin(), values.end());
  }

  bool operator==(const WeightedTable& other) const {
    return values == other.values && weights == other.weights;
  }
};

/// @brief Seeded, reproducible random source for one generation run.
class WeightedSampler {
 public:
  /// @brief Construct a sampler seeded with the given value.
  explicit WeightedSampler(uint32_t seed) : seed_(seed), rng_(seed) {}

  /// @brief Seed this sampler was constructed with.
  uint32_t seed() const { return seed_; }

  /// @brief Draw a value with probability proportional to its weight.
  /// @param values Candidate values.
  /// @param weights Weights, one per value (need not sum to 1).
  /// @return The drawn value, or std::nullopt if the lengths differ or the
  ///         weights are malformed (configuration error).
  template <typename T>
  std::optional<T> sampleWeighted(const std::vector<T>& values,
                                  const std::vector<float>& weights) {
    if (values.size() != weights.size()) return std::nullopt;
    std::optional<size_t> idx = rng::selectWeightedIndex(rng_, weights);
    if (!idx) return std::nullopt;
    return values[*idx];
  }

  /// @brief Draw from a WeightedTable.
  template <typename T>
  std::optional<T> sample(const WeightedTable<T>& table) {
    return sampleWeighted(table.values, table.weights);
  }

  /// @brief Draw an index with probability proportional to its weight.
  std::optional<size_t> sampleIndex(const std::vector<float>& weights) {
    return rng::selectWeightedIndex(rng_, weights);
  }

  /// @brief Uniform float in [min, max).
  float uniformFloat(float min, float max) { return rng::rollFloat(rng_, min, max); }

  /// @brief Uniform integer in [min, max] inclusive (min when max < min).
  int uniformInt(int min, int max) {
    if (max <= min) return min;
    return rng::rollRange(rng_, min, max);
  }

  /// @brief True with the given probability.
  ///
  /// Probabilities of 0 and 1 are decided without a draw so that they hold
  /// exactly.
  bool rollProbability(float probability) {
    if (probability >= 1.0f) return true;
    if (probability <= 0.0f) return false;
    return rng::rollProbability(rng_, probability);
  }

 private:
  uint32_t seed_;
  std::mt19937 rng_;
};

}  // namespace cavewalk

#endif  // CAVEWALK_CORE_WEIGHTED_SAMPLER_H
