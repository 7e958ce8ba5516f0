// rng.h
#pragma once
#include <cstdint>
#include <optional>
#include <random>

namespace ga {

// The only source of randomness in a run. Same seed => same sequence.
struct SeededRng {
  explicit SeededRng(std::optional<uint64_t> seed = std::nullopt);

  int int_between(int min, int max);            // inclusive
  double real_between(double min, double max);  // inclusive
  double unit();                                // [0, 1)

  bool seeded() const { return seeded_; }

private:
  std::mt19937_64 engine_;
  bool seeded_ = false;
};

} // namespace ga
