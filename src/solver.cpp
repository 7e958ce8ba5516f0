// solver.cpp
#include "solver.h"

#include <algorithm>
#include <iostream>

#include "context.h"
#include "genetic.h"
#include "lower_bound.h"
#include "options.h"
#include "penalties.h"
#include "problem.h"
#include "results.h"
#include "rng.h"
#include "stats.h"
#include "utils.h"
#include "validation.h"

namespace ga {

const char* to_string(SolveStatus s) {
  switch (s) {
    case SolveStatus::ok: return "ok";
    case SolveStatus::invalid_input: return "invalid_input";
    case SolveStatus::algorithm_failure: return "algorithm_failure";
  }
  return "unknown";
}

SolveOutcome solve(const json& data, const GeneticOptions& opts,
                   const json& row_names, const json& col_names) {
  SolveOutcome out;

  // ---- validate + adapt ----
  Problem P;
  std::vector<Group> groups;
  try {
    validate_options(opts);
    validate_input(data, row_names, col_names);
    P = build_problem(data, row_names, col_names);
    groups = build_groups(opts.groups, P.col_names);
  } catch (const std::exception& e) {
    // InvalidInput, or a json type error while reading the document
    if (opts.verbose) std::cerr << "[solve] invalid input: " << e.what() << "\n";
    out.status = SolveStatus::invalid_input;
    out.error = e.what();
    return out;
  }

  // ---- run ----
  try {
    const long long t0 = NowMillis();

    const int max_cols = max_column_assignments(P.matrix.cols, groups);
    const int max_assignments = std::min(P.matrix.rows, max_cols);
    if (max_assignments <= 0)
      throw std::runtime_error("no assignable pairings (max_assignments=" +
                               std::to_string(max_assignments) + ")");

    SeededRng rng(opts.seed);
    RunContext ctx{P.matrix, groups, max_assignments, rng, opts.verbose};

    if (opts.verbose) {
      std::cout << "[solve] rows=" << P.matrix.rows
                << " cols=" << P.matrix.cols
                << " groups=" << groups.size()
                << " max_column_assignments=" << max_cols
                << " max_assignments=" << max_assignments
                << " seeded=" << (rng.seeded() ? "yes" : "no") << "\n";
    }

    GeneticResult res = run_genetic(ctx, opts);

    // Only candidates within every group cap are returned, unless none is.
    Population returned = std::move(res.population);
    bool caps_met = true;
    if (!groups.empty()) {
      Population compliant = within_caps(returned, groups);
      if (compliant.empty()) {
        caps_met = false;
        std::cerr << "[solve] no candidate within group caps, returning the closest\n";
      } else {
        returned = std::move(compliant);
      }
    }
    const Candidate& best = returned.front();

    out.results = format_results(P, returned, opts.returned_candidates);
    out.best_distance = best.distance;
    out.stats = compute_stats(best, P, groups);

    json meta = {
      {"generations", res.generations},
      {"converged", res.converged},
      {"capsMet", caps_met},
      {"maxAssignments", max_assignments},
      {"maxColumnAssignments", max_cols},
      {"bestDistanceHistory", res.best_distance},
      {"stats", stats_to_json(out.stats)},
      {"options", options_to_json(opts)}
    };

    // The exact bound only speaks for candidates of full length.
    if (max_assignments == std::min(P.matrix.rows, P.matrix.cols)) {
      LowerBoundParams lbp;
      lbp.log_search = opts.verbose;
      if (auto lb = minimum_total_cost(P.matrix, lbp)) {
        meta["lowerBound"] = *lb;
        meta["gap"] = best.total_cost - *lb;
      }
    }

    meta["elapsedMs"] = NowMillis() - t0;
    out.meta = std::move(meta);
    return out;
  } catch (const std::exception& e) {
    std::cerr << "[solve] algorithm failed: " << e.what() << "\n";
    out = SolveOutcome{};
    out.status = SolveStatus::algorithm_failure;
    out.error = "genetic algorithm failed";
    return out;
  }
}

} // namespace ga
