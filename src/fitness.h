// fitness.h
#pragma once
#include <vector>
#include "types.h"

namespace ga {

// (total_cost / possible + 1) ^ (surplus + 1). Lower is better, 1 is the floor.
double calculate_distance(double total_cost, int possible_assignments, int surplus);

// Recomputes c.distance from its assignment and total_cost.
void evaluate_distance(Candidate& c, const std::vector<Group>& groups);
void evaluate_population(Population& pop, const std::vector<Group>& groups);

// Ascending by distance; equal distances keep their relative order.
void sort_by_distance(Population& pop);

} // namespace ga
