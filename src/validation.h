// validation.h
#pragma once
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

#include "types.h"

namespace ga {

// Malformed or inconsistent caller data. Detected before any generation runs.
struct InvalidInput : std::runtime_error {
  using std::runtime_error::runtime_error;
};

[[noreturn]] void fail(const std::string& msg);

// True when data is an array of agents carrying "answers".
bool is_preference_data(const nlohmann::json& data);

// ---- Input data ----
// data: agents with answers, or a numeric matrix. row_names / col_names are
// only consulted for matrix data and may be null.
void validate_input(const nlohmann::json& data,
                    const nlohmann::json& row_names,
                    const nlohmann::json& col_names);

void validate_agents(const nlohmann::json& agents);
void validate_matrix(const nlohmann::json& matrix);
void validate_names(const nlohmann::json& names, std::size_t expected, const std::string& what);

// ---- Options ----
void validate_options(const GeneticOptions& opts);

} // namespace ga
