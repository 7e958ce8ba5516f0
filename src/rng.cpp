// rng.cpp
#include "rng.h"
#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>

namespace ga {

static uint64_t entropy_seed() {
  std::random_device rd;
  return (static_cast<uint64_t>(rd()) << 32) ^ static_cast<uint64_t>(rd());
}

SeededRng::SeededRng(std::optional<uint64_t> seed)
    : engine_(seed ? *seed : entropy_seed()), seeded_(seed.has_value()) {}

int SeededRng::int_between(int min, int max) {
  if (max < min)
    throw std::invalid_argument("int_between: empty range [" + std::to_string(min) +
                                ", " + std::to_string(max) + "]");
  return std::uniform_int_distribution<int>(min, max)(engine_);
}

double SeededRng::real_between(double min, double max) {
  if (max < min)
    throw std::invalid_argument("real_between: empty range");
  // uniform_real_distribution is half-open; widen by one ulp to include max.
  const double hi = std::nextafter(max, std::numeric_limits<double>::max());
  return std::uniform_real_distribution<double>(min, hi)(engine_);
}

double SeededRng::unit() {
  return std::uniform_real_distribution<double>(0.0, 1.0)(engine_);
}

} // namespace ga
