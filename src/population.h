// population.h
#pragma once
#include "context.h"
#include "types.h"
#include <vector>

namespace ga {

// Random start cell, then a diagonal walk (row+1, col+1, each wrapping on its
// own dimension) until ctx.max_assignments pairings are taken. When rows != cols
// the walk can revisit a row or column; callers must not assume validity.
std::vector<Assignment> random_assignment(RunContext& ctx);

double total_cost(const std::vector<Assignment>& assignment);

// n candidates with total_cost set; distance left for the caller.
Population generate_population(RunContext& ctx, int n);

// True when a shares neither row nor column with anything in chosen.
bool is_compatible(const Assignment& a, const std::vector<Assignment>& chosen);

// No shared rows/cols and exactly max_assignments pairings.
bool is_structurally_valid(const Candidate& c, int max_assignments);

} // namespace ga
