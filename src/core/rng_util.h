// Random number generation utilities for reproducible resampling.

#ifndef TESSITURA_CORE_RNG_UTIL_H
#define TESSITURA_CORE_RNG_UTIL_H

#include <cstddef>
#include <cstdint>
#include <random>
#include <vector>

namespace tessitura {
namespace rng {

/// @brief Select a random index from a container.
/// @tparam Container Container type with size().
/// @param rng Mersenne Twister RNG instance.
/// @param container Non-empty container.
/// @return Random index in [0, container.size() - 1].
template <typename Container>
inline size_t selectRandomIndex(std::mt19937& rng, const Container& container) {
  std::uniform_int_distribution<size_t> dist(0, container.size() - 1);
  return dist(rng);
}

/// @brief Mean of one resample drawn with replacement.
///
/// Draws values.size() indices in order from the generator, so the draw
/// sequence depends only on the seed and the sample size.
///
/// @param rng Mersenne Twister RNG instance.
/// @param values Non-empty observations.
/// @return Mean of the resample.
inline double resampleMean(std::mt19937& rng, const std::vector<double>& values) {
  double sum = 0.0;
  for (size_t draw = 0; draw < values.size(); ++draw) {
    sum += values[selectRandomIndex(rng, values)];
  }
  return sum / static_cast<double>(values.size());
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
}  // namespace tessitura

#endif  // TESSITURA_CORE_RNG_UTIL_H
