// results.h
#pragma once
#include <vector>
#include <nlohmann/json.hpp>
#include "problem.h"
#include "types.h"

namespace ga {

// Best n candidates as {totalCost, distance, assignment:[{agent, task, cost}]},
// agent being the caller's own agent object.
nlohmann::json top_results_with_real_agents(const Problem& P, Population pop, int n);

// Best n candidates unique by distance, each with a 0/1 solution matrix, pairs
// in row-major order of that matrix, and an assignmentRating.
nlohmann::json top_results_with_dummy_names(const Problem& P, Population pop, int n);

// Picks one of the two formats above from P.real_agents.
nlohmann::json format_results(const Problem& P, const Population& pop, int n);

// rows x cols, 1 where the candidate assigns.
std::vector<std::vector<int>> solution_matrix(const CostMatrix& M, const Candidate& c);

// Fraction of pairs with cost < 3; 0 for no pairs.
double assignment_rating(const nlohmann::json& pairs);

} // namespace ga
