// selection.h
#pragma once
#include "rng.h"
#include "types.h"
#include <vector>

namespace ga {

// Inverse-distance weights: smaller distance, bigger slice of the wheel.
std::vector<double> selection_weights(const Population& pop);

// Spins the wheel once. Scans from the last index down to 1, falls back to 0.
int select_by_roulette(const std::vector<double>& weights, SeededRng& rng);

// ceil(pop.size() / 2) draws with replacement.
Population select_parents(const Population& pop, SeededRng& rng);

} // namespace ga
