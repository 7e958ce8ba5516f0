// types.h
#pragma once
#include <vector>
#include <string>
#include <cstdint>
#include <optional>

namespace ga {

// Read-only cost grid. Row = agent, col = task. Access with m[row * cols + col].
struct CostMatrix {
  int rows = 0;
  int cols = 0;
  std::vector<double> m;
  inline double at(int r, int c) const { return m[r * cols + c]; }
};

// One agent -> task edge.
struct Assignment {
  int row = 0;
  int col = 0;
  double cost = 0.0;   // copy of CostMatrix::at(row, col)

  bool operator==(const Assignment& o) const {
    return row == o.row && col == o.col && cost == o.cost;
  }
};

struct Candidate {
  std::vector<Assignment> assignment; // length == max_assignments
  double total_cost = 0.0;
  double distance = 0.0;              // derived, see fitness.h

  bool operator==(const Candidate& o) const {
    return assignment == o.assignment && total_cost == o.total_cost && distance == o.distance;
  }
};

using Population = std::vector<Candidate>;

// Column capacity constraint, resolved to matrix indices.
struct Group {
  std::string name;
  std::vector<int> cols;
  int max_assignments = 0;
};

// Group as supplied in the options document (tasks by id).
struct GroupSpec {
  std::string name;                 // optional, defaults to "group_<i>"
  int max_assignments = 0;
  std::vector<std::string> tasks;   // task ids
};

struct GeneticOptions {
  int max_generations = 15;
  double mutation_chance = 0.3;     // [0, 1]
  int returned_candidates = 3;
  int population_size = 30;
  double distance_threshold = 3.0;
  std::vector<GroupSpec> groups;
  std::optional<uint64_t> seed;     // unset = entropy
  bool verbose = false;
  int log_every = 1;                // generations between progress lines
};

} // namespace ga
