// penalties.cpp
#include "penalties.h"
#include <algorithm>

namespace ga {

std::vector<int> group_assignment_counts(const Candidate& c, const std::vector<Group>& groups) {
  std::vector<int> counts(groups.size(), 0);
  for (size_t g = 0; g < groups.size(); ++g) {
    const auto& cols = groups[g].cols;
    for (const auto& a : c.assignment) {
      if (std::find(cols.begin(), cols.end(), a.col) != cols.end()) ++counts[g];
    }
  }
  return counts;
}

int surplus_assignments(const Candidate& c, const std::vector<Group>& groups) {
  const auto counts = group_assignment_counts(c, groups);
  int surplus = 0;
  for (size_t g = 0; g < groups.size(); ++g)
    surplus += std::max(counts[g] - groups[g].max_assignments, 0);
  return surplus;
}

int max_column_assignments(int cols, const std::vector<Group>& groups) {
  if (groups.empty()) return cols;
  long long constrained = 0, allowed = 0;
  for (const auto& g : groups) {
    constrained += static_cast<long long>(g.cols.size());
    allowed += g.max_assignments;
  }
  const long long total = (cols - constrained) + allowed;
  return static_cast<int>(std::clamp<long long>(total, 0, cols));
}

Population within_caps(const Population& pop, const std::vector<Group>& groups) {
  Population out;
  for (const auto& c : pop)
    if (surplus_assignments(c, groups) == 0) out.push_back(c);
  return out;
}

} // namespace ga
