// solver.h
#pragma once
#include <string>
#include <nlohmann/json.hpp>
#include "stats.h"
#include "types.h"

namespace ga {

enum class SolveStatus {
  ok,
  invalid_input,      // rejected before any generation ran
  algorithm_failure   // the run raised; nothing is returned
};

const char* to_string(SolveStatus s);

struct SolveOutcome {
  SolveStatus status = SolveStatus::ok;
  std::string error;            // empty when ok
  nlohmann::json results;       // formatted top candidates (ok only)
  nlohmann::json meta;          // run diagnostics (ok only)
  double best_distance = 0.0;
  ResultStats stats;            // best candidate (ok only)

  bool ok() const { return status == SolveStatus::ok; }
};

// Validates, adapts the input, runs the genetic search and formats the best
// opts.returned_candidates. Never throws; check status before using results.
//   data:      agents with answers, or a numeric matrix
//   row_names: agent names for matrix data (optional)
//   col_names: task ids for matrix data (optional)
SolveOutcome solve(const nlohmann::json& data,
                   const GeneticOptions& opts,
                   const nlohmann::json& row_names = nlohmann::json(),
                   const nlohmann::json& col_names = nlohmann::json());

} // namespace ga
