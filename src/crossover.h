// crossover.h
#pragma once
#include "context.h"
#include "types.h"
#include <vector>

namespace ga {

// Index of the cheapest entry in pool that is compatible with chosen, or -1.
// On equal cost the earliest entry wins.
long find_lowest_cost_compatible(const std::vector<Assignment>& pool,
                                 const std::vector<Assignment>& chosen);

// Pools every parent's pairings and greedily rebuilds offspring from the
// cheapest compatible pairing each step. Returns offspring ++ parents, with
// offspring padded to parents.size() by random duplicates. Returns the parents
// unchanged when there is at most one parent or no offspring could be completed.
// Offspring carry total_cost only; distance is left to the caller.
Population crossover(const Population& parents, RunContext& ctx);

} // namespace ga
