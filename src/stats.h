// stats.h
#pragma once
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "problem.h"
#include "types.h"

namespace ga {

struct CostTally {
  std::string name;
  int value = 0;
};

struct GroupUsage {
  std::string name;
  int assigned = 0;
  int max_assignments = 0;
};

// Summary of one candidate as an organiser would read it.
struct ResultStats {
  int agents_assigned = 0;
  int tasks_assigned = 0;
  int total_agents = 0;
  int total_tasks = 0;
  double mean_cost = 0.0;
  double preference_rating = 0.0;   // mean of 1/cost, a zero cost counts as 1
  std::vector<CostTally> tallies;
  std::vector<GroupUsage> groups;
};

ResultStats compute_stats(const Candidate& c, const Problem& P, const std::vector<Group>& groups);

nlohmann::json stats_to_json(const ResultStats& s);

void print_result_stats(const ResultStats& s);

} // namespace ga
