// Random number generation utilities for deterministic level generation.

#ifndef CAVEWALK_CORE_RNG_UTIL_H
#define CAVEWALK_CORE_RNG_UTIL_H

#include <cmath>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <random>
#include <vector>

namespace cavewalk {
namespace rng {

/// @brief Roll a probability check against a threshold.
/// @param rng Mersenne Twister RNG instance.
/// @param threshold Probability threshold in [0.0, 1.0].
/// @return True if the random roll is below threshold.
inline bool rollProbability(std::mt19937& rng, float threshold) {
  std::uniform_real_distribution<float> dist(0.0f, 1.0f);
  return dist(rng) < threshold;
}

/// @brief Generate a random integer in [min, max] inclusive.
/// @param rng Mersenne Twister RNG instance.
/// @param min Minimum value (inclusive).
/// @param max Maximum value (inclusive).
/// @return Random integer in the specified range.
inline int rollRange(std::mt19937& rng, int min, int max) {
  std::uniform_int_distribution<int> dist(min, max);
  return dist(rng);
}

/// @brief Generate a random float in [min, max).
/// @param rng Mersenne Twister RNG instance.
/// @param min Minimum value.
/// @param max Maximum value.
/// @return Random float in the specified range (min when the range is empty).
inline float rollFloat(std::mt19937& rng, float min, float max) {
  if (!(max > min)) return min;
  std::uniform_real_distribution<float> dist(min, max);
  return dist(rng);
}

/// @brief Select an index using weighted probabilities.
///
/// Weights need not sum to 1. Unlike a silent uniform fallback, malformed
/// weights (empty, negative, non-finite, or all zero) yield std::nullopt so the
/// caller can report a configuration error.
///
/// @param rng Mersenne Twister RNG instance.
/// @param weights Non-negative weights.
/// @return Selected index, or std::nullopt for malformed weights.
inline std::optional<size_t> selectWeightedIndex(std::mt19937& rng,
                                                 const std::vector<float>& weights) {
  if (weights.empty()) return std::nullopt;
  float total = 0.0f;
  for (float weight : weights) {
    if (!std::isfinite(weight) || weight < 0.0f) return std::nullopt;
    total += weight;
  }
  if (total <= 0.0f) return std::nullopt;

  std::uniform_real_distribution<float> dist(0.0f, total);
  float roll = dist(rng);
  float cumulative = 0.0f;
  size_t last_positive = 0;
  for (size_t idx = 0; idx < weights.size(); ++idx) {
    if (weights[idx] <= 0.0f) continue;
    last_positive = idx;
    cumulative += weights[idx];
    if (roll < cumulative) return idx;
  }
  // Float accumulation can leave roll == total; never pick a zero-weight entry.
  return last_positive;
}

/// @brief Generate a random seed using the system random device.
/// @return A non-zero random seed (suitable for seeding mt19937).
inline uint32_t generateRandomSeed() {
  std::random_device device;
  uint32_t result = device();
  if (result == 0) result = 1;
  return result;
}

}  // namespace rng
}  // namespace cavewalk

#endif  // CAVEWALK_CORE_RNG_UTIL_H
