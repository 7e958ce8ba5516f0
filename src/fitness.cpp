// fitness.cpp
#include "fitness.h"
#include "penalties.h"
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace ga {

double calculate_distance(double total_cost, int possible_assignments, int surplus) {
  if (possible_assignments <= 0)
    throw std::runtime_error("cannot score a candidate with no assignments");
  const double ratio = total_cost / possible_assignments;
  return std::pow(ratio + 1.0, surplus + 1);
}

void evaluate_distance(Candidate& c, const std::vector<Group>& groups) {
  const int surplus = surplus_assignments(c, groups);
  c.distance = calculate_distance(c.total_cost, static_cast<int>(c.assignment.size()), surplus);
}

void evaluate_population(Population& pop, const std::vector<Group>& groups) {
  for (auto& c : pop) evaluate_distance(c, groups);
}

void sort_by_distance(Population& pop) {
  std::stable_sort(pop.begin(), pop.end(),
                   [](const Candidate& a, const Candidate& b) { return a.distance < b.distance; });
}

} // namespace ga
