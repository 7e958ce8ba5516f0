// main.cpp
#include <algorithm>
#include <cctype>
#include <atomic>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <future>
#include <iomanip>
#include <iostream>
#include <limits>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include <nlohmann/json.hpp>
#include "utils.h"
#include "options.h"
#include "solver.h"
#include "stats.h"

using json = nlohmann::json;
namespace fs = std::filesystem;

// ---------------- Minimal CLI ----------------
struct Flags {
  std::string data_path;          // required
  std::string options_path;       // optional, defaults otherwise
  std::string out_path = "result.json";
  int runs = 1;
  int threads = 0;                // 0 = hardware concurrency
  std::string seed;               // overrides options.seed when set
  bool verbose = true;            // flipped by --quiet
};

static void print_usage() {
  std::cout <<
R"(Usage:
  genassign --data data.json [--options options.json] [--out result.json]
            [--runs N] [--threads T] [--seed S] [--quiet]

Required:
  --data PATH         Agents with answers, a cost matrix, or
                      {"data": [[...]], "rowNames": [...], "colNames": [...]}

Optional:
  --options PATH      Genetic options (maxGenerations, mutationChance, ...)
  --out PATH          Result file (default result.json)
  --runs N            Independent runs, best one is written (default 1)
  --threads T         Worker threads for --runs (default: hardware)
  --seed S            Base seed; run i uses S + i
  --quiet             Less logging
  --help
)";
}

static int parse_int_flag(const std::string& name, const std::string& v) {
  try {
    size_t pos = 0;
    int x = std::stoi(v, &pos);
    if (pos != v.size()) throw std::invalid_argument(v);
    return x;
  } catch (const std::exception&) {
    std::cerr << "Bad integer for " << name << ": " << v << "\n"; std::exit(2);
  }
}

static Flags parse_flags(int argc, char** argv) {
  Flags f;
  for (int i = 1; i < argc; ++i) {
    std::string a = argv[i];
    auto need = [&](const char* name) {
      if (i + 1 >= argc) { std::cerr << "Missing value for " << name << "\n"; std::exit(2); }
      return std::string(argv[++i]);
    };
    if (a == "--help" || a == "-h") { print_usage(); std::exit(0); }
    else if (a == "--data")    f.data_path = need("--data");
    else if (a == "--options") f.options_path = need("--options");
    else if (a == "--out")     f.out_path = need("--out");
    else if (a == "--runs")    f.runs = parse_int_flag("--runs", need("--runs"));
    else if (a == "--threads") f.threads = parse_int_flag("--threads", need("--threads"));
    else if (a == "--seed")    f.seed = need("--seed");
    else if (a == "--quiet")   f.verbose = false;
    else { std::cerr << "Unknown flag: " << a << "\n"; print_usage(); std::exit(2); }
  }
  if (f.data_path.empty()) {
    std::cerr << "Missing required --data.\n"; print_usage(); std::exit(2);
  }
  if (f.runs < 1) { std::cerr << "--runs must be >= 1\n"; std::exit(2); }
  return f;
}

// ---------------- Small utils ----------------
static json load_json(const std::string& path) {
  std::ifstream in(path);
  if (!in) throw std::runtime_error("Cannot open file: " + path);
  json j; in >> j; return j;
}
static void save_json(const std::string& path, const json& j) {
  const fs::path parent = fs::path(path).parent_path();
  if (!parent.empty()) fs::create_directories(parent);
  std::ofstream out(path);
  if (!out) throw std::runtime_error("Cannot write file: " + path);
  out << std::setw(2) << j << "\n";
}

// Digits are a numeric seed, anything else is hashed like a string seed.
static std::optional<uint64_t> seed_from_flag(const std::string& v) {
  const bool digits = !v.empty() && std::all_of(v.begin(), v.end(), [](unsigned char c) { return std::isdigit(c); });
  if (digits) {
    try { return ga::parse_seed(json(std::stoull(v))); }
    catch (const std::out_of_range&) {}
  }
  return ga::parse_seed(json(v));
}

struct Input {
  json data;
  json row_names;
  json col_names;
};

static json member_or_null(const json& doc, const char* key) {
  return doc.contains(key) ? doc[key] : json();
}

// Bare array, or an object carrying the matrix and its names.
static Input split_input(const json& doc) {
  Input in;
  if (doc.is_object()) {
    in.data = member_or_null(doc, "data");
    in.row_names = member_or_null(doc, "rowNames");
    in.col_names = member_or_null(doc, "colNames");
  } else {
    in.data = doc;
  }
  return in;
}

// ---------------- Multi-start (parallel independent runs) ----------------
struct RunReport {
  int index = -1;
  ga::SolveOutcome outcome;
  long long elapsed_ms = 0;
};

static std::vector<RunReport> run_parallel(const Input& in,
                                           const ga::GeneticOptions& base,
                                           int runs, int threads, bool verbose) {
  std::atomic<int> next_idx{0};
  std::mutex io_mu;
  std::vector<std::future<void>> pool;
  std::vector<RunReport> reports(runs);

  const int max_threads = std::max(1, std::min(threads, runs));
  if (verbose && runs > 1)
    std::cout << "🧭 Multi-start: runs=" << runs << " threads=" << max_threads << "\n";

  for (int t = 0; t < max_threads; ++t) {
    pool.emplace_back(std::async(std::launch::async, [&]() {
      for (;;) {
        int i = next_idx.fetch_add(1);
        if (i >= runs) break;

        // Each run owns its options, rng and problem copy.
        ga::GeneticOptions opts = base;
        if (opts.seed) opts.seed = *opts.seed + static_cast<uint64_t>(i);
        opts.verbose = verbose && runs == 1;

        auto t0 = ga::NowMillis();
        ga::SolveOutcome outcome = ga::solve(in.data, opts, in.row_names, in.col_names);
        auto t1 = ga::NowMillis();

        {
          std::lock_guard<std::mutex> lk(io_mu);
          if (!outcome.ok())
            std::cerr << "Run " << i << " failed: " << outcome.error << "\n";
          else if (verbose && runs > 1)
            std::cout << "   ✓ Run " << i << " best_distance=" << outcome.best_distance
                      << " (" << (t1 - t0) << " ms)\n";
        }
        reports[i] = RunReport{i, std::move(outcome), t1 - t0};
      }
    }));
  }
  for (auto& fut : pool) fut.get();
  return reports;
}

// ---------------- Main ----------------
int main(int argc, char** argv) {
  std::ios::sync_with_stdio(false);
  const Flags flags = parse_flags(argc, argv);
  if (flags.verbose) std::cout << "🚀 genassign: genetic assignment\n";

  json data_doc, options_doc;
  try {
    data_doc = load_json(flags.data_path);
    if (!flags.options_path.empty()) options_doc = load_json(flags.options_path);
  } catch (const std::exception& e) {
    std::cerr << "Failed to load inputs: " << e.what() << "\n"; return 1;
  }

  ga::GeneticOptions opts;
  try {
    opts = ga::parse_options(options_doc);
    if (!flags.seed.empty()) opts.seed = seed_from_flag(flags.seed);
  } catch (const std::exception& e) {
    std::cerr << "Bad options: " << e.what() << "\n"; return 2;
  }
  opts.verbose = flags.verbose;

  const unsigned hw = std::max(1u, std::thread::hardware_concurrency());
  const int threads = flags.threads > 0 ? flags.threads
                                        : static_cast<int>(std::min<unsigned>(hw, std::numeric_limits<int>::max()));

  const Input in = split_input(data_doc);
  auto reports = run_parallel(in, opts, flags.runs, threads, flags.verbose);

  // Best successful run; ties keep the lowest index.
  const RunReport* best = nullptr;
  for (const auto& r : reports) {
    if (!r.outcome.ok()) continue;
    if (!best || r.outcome.best_distance < best->outcome.best_distance) best = &r;
  }

  if (!best) {
    const auto& first = reports.front().outcome;
    std::cerr << "No successful run (" << ga::to_string(first.status) << "): " << first.error << "\n";
    return first.status == ga::SolveStatus::invalid_input ? 2 : 3;
  }

  json meta = best->outcome.meta;
  meta["run"] = best->index;
  meta["runs"] = flags.runs;
  meta["runElapsedMs"] = best->elapsed_ms;
  json run_bests = json::array();
  for (const auto& r : reports)
    run_bests.push_back(r.outcome.ok() ? json(r.outcome.best_distance) : json(nullptr));
  meta["runBestDistances"] = run_bests;

  if (flags.verbose) {
    ga::print_result_stats(best->outcome.stats);
    if (meta.contains("lowerBound"))
      std::cout << "lower bound=" << meta["lowerBound"].get<double>()
                << " gap=" << meta["gap"].get<double>() << "\n";
  }

  try { save_json(flags.out_path, json{{"results", best->outcome.results}, {"meta", meta}}); }
  catch (const std::exception& e) { std::cerr << "Failed to write result: " << e.what() << "\n"; return 4; }

  if (flags.verbose) std::cout << "✅ Result written to " << flags.out_path << "\n";
  return 0;
}
