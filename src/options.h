// options.h
#pragma once
#include <cstdint>
#include <optional>
#include <nlohmann/json.hpp>
#include "types.h"

namespace ga {

// Reads the camelCase options document. Missing keys take GeneticOptions defaults.
//   {"maxGenerations", 15}, {"mutationChance", 0.3}, {"returnedCandidates", 3},
//   {"populationSize", 30}, {"distanceThreshold", 3}, {"groups", []},
//   {"seed", <int|string>}, {"verbose", false}, {"logEvery", 1}
GeneticOptions parse_options(const nlohmann::json& j);

// Integer seeds pass through, strings are hashed, null/absent gives nullopt.
std::optional<uint64_t> parse_seed(const nlohmann::json& v);

std::vector<GroupSpec> parse_groups(const nlohmann::json& arr);

nlohmann::json options_to_json(const GeneticOptions& o);

} // namespace ga
