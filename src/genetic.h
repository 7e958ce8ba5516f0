// genetic.h
#pragma once
#include "context.h"
#include "types.h"
#include <vector>

namespace ga {

struct GeneticResult {
  Population population;             // sorted by distance, best first
  int generations = 0;               // generations actually advanced
  bool converged = false;            // stopped on distance_threshold
  std::vector<double> best_distance; // best distance after each generation
};

// sort -> mutate -> evaluate -> sort -> select -> crossover -> evaluate.
// Falls back to the mutated population when crossover returns fewer
// candidates than it was given.
Population advance_generation(Population pop, double mutation_chance, RunContext& ctx);

// Full run: random population, then generations until max_generations or the
// best distance drops below distance_threshold.
GeneticResult run_genetic(RunContext& ctx, const GeneticOptions& opts);

} // namespace ga
