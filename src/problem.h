// problem.h
#pragma once
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "types.h"

namespace ga {

// Solver input after adaptation: a cost matrix plus the names needed to map
// indices back to the caller's agents and tasks.
struct Problem {
  CostMatrix matrix;
  std::vector<std::string> row_names;  // agent ids
  std::vector<std::string> col_names;  // task ids
  bool real_agents = false;            // built from agents with answers
  nlohmann::json agents;               // caller's agent objects (real_agents only)
  nlohmann::json tasks;                // [{taskId, taskName}] per column
};

// data is either agents with answers or a numeric matrix. For a matrix,
// missing row/col names default to "row_<i>" / "col_<j>".
// Expects validate_input() to have passed.
Problem build_problem(const nlohmann::json& data,
                      const nlohmann::json& row_names = nlohmann::json(),
                      const nlohmann::json& col_names = nlohmann::json());

// Resolves task ids to column indices. Unknown ids are InvalidInput.
std::vector<Group> build_groups(const std::vector<GroupSpec>& specs,
                                const std::vector<std::string>& col_names);

} // namespace ga
