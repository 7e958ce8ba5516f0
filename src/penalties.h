// penalties.h
#pragma once
#include <vector>
#include "types.h"

namespace ga {

// Number of the candidate's assignments that land in each group, in group order.
std::vector<int> group_assignment_counts(const Candidate& c, const std::vector<Group>& groups);

// Sum over groups of max(assigned - cap, 0). Zero when there are no groups.
int surplus_assignments(const Candidate& c, const std::vector<Group>& groups);

// Columns outside every group, plus the caps of all groups, clamped to [0, cols].
// Every cap counts, not only the last group's as in the survey tool this replaces.
// Assumes groups do not overlap.
int max_column_assignments(int cols, const std::vector<Group>& groups);

// Candidates with no surplus in any group, in their original order.
Population within_caps(const Population& pop, const std::vector<Group>& groups);

} // namespace ga
