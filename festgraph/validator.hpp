#pragma once

#include "festgraph_config.hpp"
#include "dependency_graph.hpp"
#include "nlohmann/json.hpp"
#include <string>
#include <string_view>
#include <vector>
#include <expected>
#include <filesystem>
#include <system_error>

namespace festgraph {

enum class issue_code { CYCLE_DETECTED, MISSING_DEPENDENCY, MISSING_SOFT_DEPENDENCY, NUMBERING_GAP };

enum class issue_severity { SEVERITY_ERROR, SEVERITY_WARNING };

struct validation_issue {
  std::string task_id; // Empty for issues that belong to the whole graph
  issue_code code = issue_code::MISSING_DEPENDENCY;
  std::string message;
  issue_severity severity = issue_severity::SEVERITY_ERROR;

  nlohmann::json as_json() const;
};

struct validation_result {
  bool valid = true;
  std::vector<validation_issue> errors;
  std::vector<validation_issue> warnings;
  dependency_graph graph;

  void add_error(const std::string &task_id, issue_code code, const std::string &message);
  void add_warning(const std::string &task_id, issue_code code, const std::string &message);
  nlohmann::json as_json() const;
};

std::string_view to_string(issue_code code);
std::string_view to_string(issue_severity severity);

/**
 * @brief Resolves a festival and checks it for cycles, unresolved references and numbering gaps
 * @param festival_path Festival root directory
 * @return The result with the resolved graph, or an error if the festival couldn't be resolved
 *
 * Uses the festival config file when there is one. Unresolved hard references and cycles are errors,
 * unresolved soft references and numbering gaps are warnings.
 */
std::expected<validation_result, std::error_code> validate(const std::filesystem::path &festival_path);
std::expected<validation_result, std::error_code> validate(const std::filesystem::path &festival_path, const config &configuration);

/**
 * @brief Resolves a single sequence and checks it for cycles
 *
 * The config file is looked up in the festival two levels above the sequence.
 */
std::expected<validation_result, std::error_code> validate_sequence(const std::filesystem::path &sequence_path);
std::expected<validation_result, std::error_code> validate_sequence(const std::filesystem::path &sequence_path, const config &configuration);

void check_cycles(validation_result &result);
void check_references(validation_result &result, const config &configuration);
void check_numbering_gaps(validation_result &result);

} // namespace festgraph
