// problem.cpp
#include "problem.h"
#include "utils.h"
#include "validation.h"

#include <algorithm>
#include <unordered_map>

namespace ga {

static std::vector<std::string> names_or_default(const json& names, size_t n, const std::string& prefix) {
  std::vector<std::string> out;
  out.reserve(n);
  if (names.is_array()) {
    for (const auto& v : names) out.push_back(id_to_string(v));
    return out;
  }
  for (size_t i = 0; i < n; ++i) out.push_back(prefix + std::to_string(i));
  return out;
}

static Problem from_agents(const json& agents) {
  Problem P;
  P.real_agents = true;
  P.agents = agents;

  const auto& first = agents[0]["answers"];
  P.matrix.rows = static_cast<int>(agents.size());
  P.matrix.cols = static_cast<int>(first.size());
  P.matrix.m.reserve(static_cast<size_t>(P.matrix.rows) * P.matrix.cols);

  for (const auto& a : agents) {
    P.row_names.push_back(id_to_string(a["agentId"]));
    for (const auto& ans : a["answers"]) P.matrix.m.push_back(ans["cost"].get<double>());
  }

  P.tasks = json::array();
  for (const auto& ans : first) {
    P.col_names.push_back(id_to_string(ans["taskId"]));
    P.tasks.push_back({{"taskId", ans["taskId"]},
                       {"taskName", ans.contains("taskName") ? ans["taskName"] : json(nullptr)}});
  }
  return P;
}

static Problem from_matrix(const json& matrix, const json& row_names, const json& col_names) {
  Problem P;
  P.matrix.rows = static_cast<int>(matrix.size());
  P.matrix.cols = static_cast<int>(matrix[0].size());
  P.matrix.m.reserve(static_cast<size_t>(P.matrix.rows) * P.matrix.cols);
  for (const auto& row : matrix)
    for (const auto& v : row) P.matrix.m.push_back(v.get<double>());

  P.row_names = names_or_default(row_names, P.matrix.rows, "row_");
  P.col_names = names_or_default(col_names, P.matrix.cols, "col_");

  P.tasks = json::array();
  for (const auto& c : P.col_names) P.tasks.push_back({{"taskId", c}, {"taskName", c}});
  return P;
}

Problem build_problem(const json& data, const json& row_names, const json& col_names) {
  if (is_preference_data(data)) return from_agents(data);
  return from_matrix(data, row_names, col_names);
}

std::vector<Group> build_groups(const std::vector<GroupSpec>& specs,
                                const std::vector<std::string>& col_names) {
  std::unordered_map<std::string, int> col_of;
  for (int j = 0; j < (int)col_names.size(); ++j) col_of.emplace(col_names[j], j);

  std::vector<Group> groups;
  groups.reserve(specs.size());
  for (const auto& s : specs) {
    Group g;
    g.name = s.name;
    g.max_assignments = s.max_assignments;
    for (const auto& t : s.tasks) {
      auto it = col_of.find(t);
      if (it == col_of.end()) fail("group " + s.name + " references unknown task " + t);
      if (std::find(g.cols.begin(), g.cols.end(), it->second) == g.cols.end())
        g.cols.push_back(it->second);
    }
    groups.push_back(std::move(g));
  }
  return groups;
}

} // namespace ga
