// context.h
#pragma once
#include "types.h"
#include "rng.h"
#include <vector>

namespace ga {

// Everything one run reads or draws from. Owned by the run, never shared.
struct RunContext {
  const CostMatrix& matrix;
  const std::vector<Group>& groups;
  int max_assignments = 0;
  SeededRng& rng;
  bool verbose = false;
};

} // namespace ga
