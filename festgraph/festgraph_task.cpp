#include "festgraph_task.hpp"
#include "utilities.hpp"

namespace festgraph {

std::string_view to_string(task_status status)
{
  switch (status) {
    case task_status::PENDING:
      return "pending";
    case task_status::IN_PROGRESS:
      return "in_progress";
    case task_status::COMPLETE:
      return "complete";
  }
  return "pending";
}

std::string_view to_string(dependency_type type)
{
  switch (type) {
    case dependency_type::IMPLICIT_DEPENDENCY:
      return "implicit";
    case dependency_type::EXPLICIT_DEPENDENCY:
      return "explicit";
    case dependency_type::CROSS_SEQUENCE_DEPENDENCY:
      return "cross_sequence";
    case dependency_type::CROSS_PHASE_DEPENDENCY:
      return "cross_phase";
  }
  return "explicit";
}

/**
 * @brief Converts a status as written in task frontmatter
 *
 * Accepts the task statuses as well as the document statuses used by other festival documents
 * ("completed", "active"). Anything else is not a status.
 */
std::optional<task_status> parse_task_status(std::string_view text)
{
  const auto status = to_lower(trim(text));
  if (status == "pending" || status == "planned")
    return task_status::PENDING;
  if (status == "in_progress" || status == "active")
    return task_status::IN_PROGRESS;
  if (status == "complete" || status == "completed" || status == "done")
    return task_status::COMPLETE;
  return std::nullopt;
}

dependency_type classify_dependency(const task &from, const task &to)
{
  if (from.sequence_path == to.sequence_path)
    return dependency_type::EXPLICIT_DEPENDENCY;
  if (from.phase_path == to.phase_path)
    return dependency_type::CROSS_SEQUENCE_DEPENDENCY;
  return dependency_type::CROSS_PHASE_DEPENDENCY;
}

nlohmann::json task::as_json() const
{
  nlohmann::json j;
  j["id"]                = id;
  j["name"]              = name;
  j["number"]            = number;
  j["path"]              = path;
  j["sequence_path"]     = sequence_path;
  j["phase_path"]        = phase_path;
  j["parallel_group"]    = parallel_group;
  j["status"]            = std::string(to_string(status));
  j["dependencies"]      = dependencies;
  j["soft_dependencies"] = soft_dependencies;

  if (!autonomy_level.empty())
    j["autonomy_level"] = autonomy_level;

  return j;
}

nlohmann::json dependency::as_json() const
{
  return { { "from", from }, { "to", to }, { "type", std::string(to_string(type)) }, { "required", required } };
}

nlohmann::json as_json(const std::vector<const task *> &tasks)
{
  nlohmann::json j = nlohmann::json::array();
  for (const auto *t: tasks)
    j.push_back(t->as_json());
  return j;
}

} // namespace festgraph
