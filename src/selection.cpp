// selection.cpp
#include "selection.h"

namespace ga {

std::vector<double> selection_weights(const Population& pop) {
  double total_distance = 0.0;
  for (const auto& c : pop) total_distance += c.distance;

  std::vector<double> weights;
  weights.reserve(pop.size());
  for (const auto& c : pop)
    weights.push_back(total_distance / (c.distance * total_distance));
  return weights;
}

int select_by_roulette(const std::vector<double>& weights, SeededRng& rng) {
  double total_weight = 0.0;
  for (double w : weights) total_weight += w;

  double section = rng.real_between(0.0, total_weight);
  for (int i = static_cast<int>(weights.size()) - 1; i > 0; --i) {
    section -= weights[i];
    if (section < 0) return i;
  }
  return 0;
}

Population select_parents(const Population& pop, SeededRng& rng) {
  const size_t target = (pop.size() + 1) / 2;
  const auto weights = selection_weights(pop);

  Population parents;
  parents.reserve(target);
  while (parents.size() < target)
    parents.push_back(pop[select_by_roulette(weights, rng)]);
  return parents;
}

} // namespace ga
