// lower_bound.h
#pragma once
#include <optional>
#include "types.h"

namespace ga {

struct LowerBoundParams {
  double cost_scale = 1000.0; // costs are rounded to integers after scaling
  bool log_search = false;
};

// Optimal total cost of min(rows, cols) pairings with no group caps, solved
// exactly with OR-Tools. nullopt if the solver does not report OPTIMAL.
// Lower bound for any candidate of that length, constrained or not.
std::optional<double> minimum_total_cost(const CostMatrix& M,
                                         const LowerBoundParams& params = LowerBoundParams{});

} // namespace ga
