// mutation.h
#pragma once
#include "context.h"
#include "types.h"

namespace ga {

// Each candidate, with probability mutation_chance, gets a brand-new
// random_assignment() and freshly computed total_cost and distance.
// Works in place; returns how many candidates were replaced.
int mutate(Population& pop, double mutation_chance, RunContext& ctx);

} // namespace ga
