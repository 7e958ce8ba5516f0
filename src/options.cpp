// options.cpp
#include "options.h"
#include "utils.h"
#include "validation.h"

#include <cmath>
#include <limits>

namespace ga {

// Whole numbers only; 30.0 is accepted, 30.5 and 1e12 are not.
static int int_value(const json& v, const std::string& what) {
  if (v.is_number_unsigned()) {
    if (v.get<uint64_t>() > static_cast<uint64_t>(std::numeric_limits<int>::max()))
      fail(what + " is out of range");
    return static_cast<int>(v.get<uint64_t>());
  }
  if (v.is_number_integer()) {
    const int64_t x = v.get<int64_t>();
    if (x < std::numeric_limits<int>::min() || x > std::numeric_limits<int>::max())
      fail(what + " is out of range");
    return static_cast<int>(x);
  }
  if (v.is_number_float()) {
    const double x = v.get<double>();
    if (!std::isfinite(x) || std::trunc(x) != x ||
        x < std::numeric_limits<int>::min() || x > std::numeric_limits<int>::max())
      fail(what + " must be an integer");
    return static_cast<int>(x);
  }
  fail(what + " must be an integer");
}

static int int_option(const json& j, const char* key, int fallback) {
  if (!j.contains(key)) return fallback;
  return int_value(j[key], key);
}

std::optional<uint64_t> parse_seed(const json& v) {
  if (v.is_null()) return std::nullopt;
  if (v.is_number_unsigned()) return v.get<uint64_t>();
  if (v.is_number_integer()) return static_cast<uint64_t>(v.get<int64_t>());
  if (v.is_number_float()) {
    // 2^64 is exact as a double and is the first value past the range.
    const double x = v.get<double>();
    if (!std::isfinite(x) || x < 0.0 || std::trunc(x) != x || x >= 18446744073709551616.0)
      fail("seed must be a non-negative whole number or a string");
    return static_cast<uint64_t>(x);
  }
  if (v.is_string()) return fnv1a64(v.get<std::string>());
  fail("seed must be an integer or a string");
}

std::vector<GroupSpec> parse_groups(const json& arr) {
  std::vector<GroupSpec> out;
  if (arr.is_null()) return out;
  if (!arr.is_array()) fail("groups must be an array");
  out.reserve(arr.size());
  for (size_t i = 0; i < arr.size(); ++i) {
    const auto& g = arr[i];
    if (!g.is_object()) fail("group " + std::to_string(i) + " must be an object");
    GroupSpec s;
    s.name = g.value("name", "group_" + std::to_string(i));
    if (!g.contains("maxAssignments"))
      fail("group " + s.name + " needs an integer maxAssignments");
    s.max_assignments = int_value(g["maxAssignments"], "group " + s.name + " maxAssignments");
    if (g.contains("tasks")) {
      if (!g["tasks"].is_array()) fail("group " + s.name + ": tasks must be an array");
      for (const auto& t : g["tasks"]) {
        // tasks may be bare ids or task objects
        if (t.is_object()) {
          if (!t.contains("taskId")) fail("group " + s.name + ": task object without taskId");
          s.tasks.push_back(id_to_string(t["taskId"]));
        } else {
          s.tasks.push_back(id_to_string(t));
        }
      }
    }
    out.push_back(std::move(s));
  }
  return out;
}

GeneticOptions parse_options(const json& j) {
  GeneticOptions o;
  if (j.is_null()) return o;
  if (!j.is_object()) fail("options must be an object");
  o.max_generations     = int_option(j, "maxGenerations", o.max_generations);
  o.returned_candidates = int_option(j, "returnedCandidates", o.returned_candidates);
  o.population_size     = int_option(j, "populationSize", o.population_size);
  o.log_every           = int_option(j, "logEvery", o.log_every);
  try {
    o.mutation_chance     = j.value("mutationChance", o.mutation_chance);
    o.distance_threshold  = j.value("distanceThreshold", o.distance_threshold);
    o.verbose             = j.value("verbose", o.verbose);
  } catch (const json::exception& e) {
    fail(std::string("bad options: ") + e.what());
  }
  if (j.contains("groups")) o.groups = parse_groups(j["groups"]);
  if (j.contains("seed")) o.seed = parse_seed(j["seed"]);
  return o;
}

json options_to_json(const GeneticOptions& o) {
  json groups = json::array();
  for (const auto& g : o.groups)
    groups.push_back({{"name", g.name}, {"maxAssignments", g.max_assignments}, {"tasks", g.tasks}});

  json j = {
    {"maxGenerations", o.max_generations},
    {"mutationChance", o.mutation_chance},
    {"returnedCandidates", o.returned_candidates},
    {"populationSize", o.population_size},
    {"distanceThreshold", o.distance_threshold},
    {"groups", groups},
    {"logEvery", o.log_every}
  };
  j["seed"] = o.seed ? json(*o.seed) : json(nullptr);
  return j;
}

} // namespace ga
