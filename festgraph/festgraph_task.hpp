#pragma once

#include "nlohmann/json.hpp"
#include <string>
#include <string_view>
#include <optional>
#include <vector>

namespace festgraph {

enum class task_status { PENDING, IN_PROGRESS, COMPLETE };

enum class dependency_type {
  IMPLICIT_DEPENDENCY,       // From task numbering
  EXPLICIT_DEPENDENCY,       // Declared reference within the same sequence
  CROSS_SEQUENCE_DEPENDENCY, // Declared reference to another sequence of the same phase
  CROSS_PHASE_DEPENDENCY     // Declared reference to another phase
};

struct task {
  std::string id;   // Unique key. The resolver uses the normalized file path
  std::string name; // Filename without number prefix and extension
  int number = 0;
  std::string path;
  std::string sequence_path;
  std::string phase_path;
  int parallel_group = 0;
  task_status status = task_status::PENDING;
  std::vector<std::string> dependencies;      // Raw hard references in declaration order
  std::vector<std::string> soft_dependencies; // Raw soft references in declaration order
  std::string autonomy_level;

  nlohmann::json as_json() const;
};

// Edge meaning "to requires from"
struct dependency {
  std::string from;
  std::string to;
  dependency_type type = dependency_type::EXPLICIT_DEPENDENCY;
  bool required        = true;

  nlohmann::json as_json() const;
};

std::string_view to_string(task_status status);
std::string_view to_string(dependency_type type);
std::optional<task_status> parse_task_status(std::string_view text);
dependency_type classify_dependency(const task &from, const task &to);
nlohmann::json as_json(const std::vector<const task *> &tasks);

} // namespace festgraph
