#pragma once

#include <cstdint>
#include <random>

namespace anchorfit::common {

/**
 * @brief Random source injected into every stochastic step
 *
 * Default-constructed instances are seeded from std::random_device; pass an
 * explicit seed for reproducible runs.
 */
class Rng {
public:
  Rng() : engine_(std::random_device{}()) {}
  explicit Rng(uint32_t seed) : engine_(seed) {}

  // Uniform in [0, 1)
  double uniform() { return uniform_(engine_); }
  double uniform(double lo, double hi) { return lo + (hi - lo) * uniform_(engine_); }
  // Standard normal
  double normal() { return normal_(engine_); }

  // Seed for libraries that keep their own generator (OpenCV).
  uint64_t nextSeed() {
    return (static_cast<uint64_t>(engine_()) << 32) | static_cast<uint64_t>(engine_());
  }

private:
  std::mt19937 engine_;
  std::uniform_real_distribution<double> uniform_{0.0, 1.0};
  std::normal_distribution<double> normal_{0.0, 1.0};
};

}  // namespace anchorfit::common
