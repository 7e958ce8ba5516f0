// population.cpp
#include "population.h"
#include <iostream>
#include <stdexcept>
#include <unordered_set>

namespace ga {

std::vector<Assignment> random_assignment(RunContext& ctx) {
  const CostMatrix& M = ctx.matrix;
  if (ctx.max_assignments <= 0)
    throw std::runtime_error("random_assignment: no assignable pairings");

  int col = ctx.rng.int_between(0, M.cols - 1);
  int row = ctx.rng.int_between(0, M.rows - 1);

  std::vector<Assignment> out;
  out.reserve(ctx.max_assignments);
  while ((int)out.size() < ctx.max_assignments) {
    out.push_back(Assignment{row, col, M.at(row, col)});
    row = (row + 1 > M.rows - 1) ? 0 : row + 1;
    col = (col + 1 > M.cols - 1) ? 0 : col + 1;
  }
  return out;
}

double total_cost(const std::vector<Assignment>& assignment) {
  double s = 0.0;
  for (const auto& a : assignment) s += a.cost;
  return s;
}

Population generate_population(RunContext& ctx, int n) {
  Population pop;
  pop.reserve(n > 0 ? n : 0);
  while ((int)pop.size() < n) {
    Candidate c;
    c.assignment = random_assignment(ctx);
    c.total_cost = total_cost(c.assignment);
    pop.push_back(std::move(c));
  }
  if (ctx.verbose)
    std::cout << "[init] population=" << pop.size()
              << " max_assignments=" << ctx.max_assignments << "\n";
  return pop;
}

bool is_compatible(const Assignment& a, const std::vector<Assignment>& chosen) {
  for (const auto& c : chosen)
    if (c.row == a.row || c.col == a.col) return false;
  return true;
}

bool is_structurally_valid(const Candidate& c, int max_assignments) {
  if ((int)c.assignment.size() != max_assignments) return false;
  std::unordered_set<int> rows, cols;
  for (const auto& a : c.assignment) {
    if (!rows.insert(a.row).second) return false;
    if (!cols.insert(a.col).second) return false;
  }
  return true;
}

} // namespace ga
