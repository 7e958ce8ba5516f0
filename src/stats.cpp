// stats.cpp
#include "stats.h"
#include "penalties.h"

#include <functional>
#include <iomanip>
#include <iostream>
#include <unordered_set>

namespace ga {

static int tally(const Candidate& c, const std::function<bool(double)>& pred) {
  int n = 0;
  for (const auto& a : c.assignment) if (pred(a.cost)) ++n;
  return n;
}

ResultStats compute_stats(const Candidate& c, const Problem& P, const std::vector<Group>& groups) {
  ResultStats s;
  std::unordered_set<int> rows, cols;
  double cost_sum = 0.0, inv_sum = 0.0;
  for (const auto& a : c.assignment) {
    rows.insert(a.row);
    cols.insert(a.col);
    cost_sum += a.cost;
    inv_sum += (a.cost > 0.0) ? 1.0 / a.cost : 1.0;
  }
  s.agents_assigned = static_cast<int>(rows.size());
  s.tasks_assigned = static_cast<int>(cols.size());
  s.total_agents = P.matrix.rows;
  s.total_tasks = P.matrix.cols;
  if (!c.assignment.empty()) {
    s.mean_cost = cost_sum / c.assignment.size();
    s.preference_rating = inv_sum / c.assignment.size();
  }

  // Wide surveys get coarse buckets, short ones first-choice vs the rest.
  if (P.matrix.cols > 10) {
    s.tallies = {
      {"top 3", tally(c, [](double x) { return x < 3; })},
      {"top 5", tally(c, [](double x) { return x < 5; })},
      {"top 8", tally(c, [](double x) { return x < 8; })},
      {"10+",   tally(c, [](double x) { return x > 10; })},
    };
  } else {
    s.tallies = {
      {"1st choice",     tally(c, [](double x) { return x == 1; })},
      {"not 1st choice", tally(c, [](double x) { return x > 1; })},
    };
  }

  const auto counts = group_assignment_counts(c, groups);
  for (size_t g = 0; g < groups.size(); ++g)
    s.groups.push_back({groups[g].name, counts[g], groups[g].max_assignments});
  return s;
}

nlohmann::json stats_to_json(const ResultStats& s) {
  nlohmann::json tallies = nlohmann::json::array();
  for (const auto& t : s.tallies) tallies.push_back({{"name", t.name}, {"value", t.value}});
  nlohmann::json groups = nlohmann::json::array();
  for (const auto& g : s.groups)
    groups.push_back({{"name", g.name}, {"assigned", g.assigned}, {"maxAssignments", g.max_assignments}});

  return {
    {"agentsAssigned", s.agents_assigned},
    {"tasksAssigned", s.tasks_assigned},
    {"totalAgents", s.total_agents},
    {"totalTasks", s.total_tasks},
    {"meanCost", s.mean_cost},
    {"preferenceRating", s.preference_rating},
    {"tallies", tallies},
    {"groups", groups}
  };
}

void print_result_stats(const ResultStats& s) {
  const auto flags = std::cout.flags();
  const auto prec = std::cout.precision();
  std::cout << "\n# Best candidate\n";
  std::cout << std::left << std::setw(24) << "agents assigned"
            << s.agents_assigned << " / " << s.total_agents << "\n";
  std::cout << std::left << std::setw(24) << "tasks assigned"
            << s.tasks_assigned << " / " << s.total_tasks << "\n";
  std::cout << std::left << std::setw(24) << "mean cost"
            << std::fixed << std::setprecision(2) << s.mean_cost << "\n";
  std::cout << std::left << std::setw(24) << "preference rating"
            << std::fixed << std::setprecision(3) << s.preference_rating << "\n";
  for (const auto& t : s.tallies)
    std::cout << std::left << std::setw(24) << t.name << t.value << "\n";
  if (!s.groups.empty()) {
    std::cout << "\n" << std::left << std::setw(24) << "group"
              << std::right << std::setw(10) << "assigned"
              << std::setw(10) << "max" << "\n";
    for (const auto& g : s.groups) {
      std::cout << std::left << std::setw(24) << g.name
                << std::right << std::setw(10) << g.assigned
                << std::setw(10) << g.max_assignments
                << (g.assigned > g.max_assignments ? "   over cap" : "") << "\n";
    }
  }
  std::cout << std::endl;
  std::cout.flags(flags);
  std::cout.precision(prec);
}

} // namespace ga
