// mutation.cpp
#include "mutation.h"
#include "fitness.h"
#include "population.h"
#include <iostream>

namespace ga {

int mutate(Population& pop, double mutation_chance, RunContext& ctx) {
  int mutated = 0;
  for (auto& c : pop) {
    if (ctx.rng.unit() < mutation_chance) {
      ++mutated;
      c.assignment = random_assignment(ctx);
      c.total_cost = total_cost(c.assignment);
      evaluate_distance(c, ctx.groups);
    }
  }
  if (ctx.verbose) std::cout << "\t[mutate] mutated=" << mutated << "\n";
  return mutated;
}

} // namespace ga
