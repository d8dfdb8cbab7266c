#include "validator.hpp"
#include "resolver.hpp"
#include "utilities.hpp"
#include "spdlog/spdlog.h"
#include "spdlog/fmt/fmt.h"
#include <algorithm>
#include <map>
#include <set>
#include <utility>

namespace festgraph {

std::string_view to_string(issue_code code)
{
  switch (code) {
    case issue_code::CYCLE_DETECTED:
      return "CYCLE_DETECTED";
    case issue_code::MISSING_DEPENDENCY:
      return "MISSING_DEPENDENCY";
    case issue_code::MISSING_SOFT_DEPENDENCY:
      return "MISSING_SOFT_DEPENDENCY";
    case issue_code::NUMBERING_GAP:
      return "NUMBERING_GAP";
  }
  return "UNKNOWN";
}

std::string_view to_string(issue_severity severity)
{
  return severity == issue_severity::SEVERITY_ERROR ? "error" : "warning";
}

nlohmann::json validation_issue::as_json() const
{
  nlohmann::json j;
  if (!task_id.empty())
    j["task_id"] = task_id;
  j["code"]     = std::string(to_string(code));
  j["message"]  = message;
  j["severity"] = std::string(to_string(severity));
  return j;
}

void validation_result::add_error(const std::string &task_id, issue_code code, const std::string &message)
{
  errors.push_back({ task_id, code, message, issue_severity::SEVERITY_ERROR });
  valid = false;
}

void validation_result::add_warning(const std::string &task_id, issue_code code, const std::string &message)
{
  warnings.push_back({ task_id, code, message, issue_severity::SEVERITY_WARNING });
}

nlohmann::json validation_result::as_json() const
{
  nlohmann::json j;
  j["valid"]    = valid;
  j["errors"]   = nlohmann::json::array();
  j["warnings"] = nlohmann::json::array();
  for (const auto &e: errors)
    j["errors"].push_back(e.as_json());
  for (const auto &w: warnings)
    j["warnings"].push_back(w.as_json());
  j["graph"] = graph.as_json();
  return j;
}

void check_cycles(validation_result &result)
{
  const auto sorted = result.graph.topological_sort();
  if (sorted)
    return;

  std::string members;
  for (const auto &id: sorted.error().cycle) {
    if (!members.empty())
      members += " -> ";
    members += id;
  }
  result.add_error("", issue_code::CYCLE_DETECTED, "Circular dependency detected: " + members);
}

void check_references(validation_result &result, const config &configuration)
{
  for (const auto &[id, t]: result.graph.tasks()) {
    for (const auto &reference: t.dependencies)
      if (resolve_task_reference(result.graph, t, reference, configuration) == nullptr)
        result.add_error(id, issue_code::MISSING_DEPENDENCY, fmt::format("Task {} declares dependency on \"{}\" which does not exist", t.name, reference));

    for (const auto &reference: t.soft_dependencies)
      if (resolve_task_reference(result.graph, t, reference, configuration) == nullptr)
        result.add_warning(id, issue_code::MISSING_SOFT_DEPENDENCY, fmt::format("Task {} declares soft dependency on \"{}\" which does not exist", t.name, reference));
  }
}

// Numbering starts at 1, or at 0 when a sequence uses a 00 task
void check_numbering_gaps(validation_result &result)
{
  std::map<std::string, std::set<int>> numbers_by_sequence;
  for (const auto &[id, t]: result.graph.tasks())
    numbers_by_sequence[t.sequence_path].insert(t.number);

  // One warning per run of missing numbers
  for (const auto &[sequence_path, numbers]: numbers_by_sequence) {
    int expected = std::min(*numbers.begin(), 1);
    for (const int number: numbers) {
      if (number == expected + 1)
        result.add_warning("", issue_code::NUMBERING_GAP, fmt::format("Sequence {} has a gap in task numbering at position {}", sequence_path, expected));
      else if (number > expected + 1)
        result.add_warning("", issue_code::NUMBERING_GAP, fmt::format("Sequence {} has a gap in task numbering at positions {}-{}", sequence_path, expected, number - 1));
      expected = number + 1;
    }
  }
}

std::expected<validation_result, std::error_code> validate(const std::filesystem::path &festival_path, const config &configuration)
{
  resolver festival_resolver(configuration);
  auto graph = festival_resolver.resolve_festival(festival_path);
  if (!graph) {
    spdlog::error("Failed to resolve dependencies of {}: {}", festival_path.generic_string(), graph.error().message());
    return std::unexpected(graph.error());
  }

  validation_result result;
  result.graph = std::move(*graph);

  check_cycles(result);
  check_references(result, configuration);
  check_numbering_gaps(result);

  spdlog::info("Validated {}: {} errors, {} warnings", festival_path.generic_string(), result.errors.size(), result.warnings.size());
  return result;
}

std::expected<validation_result, std::error_code> validate(const std::filesystem::path &festival_path)
{
  auto configuration = load_festival_config(festival_path);
  if (!configuration)
    return std::unexpected(configuration.error());
  return validate(festival_path, *configuration);
}

std::expected<validation_result, std::error_code> validate_sequence(const std::filesystem::path &sequence_path, const config &configuration)
{
  resolver sequence_resolver(configuration);
  auto graph = sequence_resolver.resolve_sequence(sequence_path);
  if (!graph) {
    spdlog::error("Failed to resolve sequence dependencies of {}: {}", sequence_path.generic_string(), graph.error().message());
    return std::unexpected(graph.error());
  }

  validation_result result;
  result.graph = std::move(*graph);

  check_cycles(result);
  return result;
}

std::expected<validation_result, std::error_code> validate_sequence(const std::filesystem::path &sequence_path)
{
  // sequence -> phase -> festival
  const std::filesystem::path sequence(normalize_path(sequence_path));
  auto configuration = load_festival_config(sequence.parent_path().parent_path());
  if (!configuration)
    return std::unexpected(configuration.error());
  return validate_sequence(sequence_path, *configuration);
}

} // namespace festgraph
