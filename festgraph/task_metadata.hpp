#pragma once

#include "festgraph_task.hpp"
#include "festgraph_config.hpp"
#include <string>
#include <string_view>
#include <optional>
#include <vector>
#include <filesystem>

namespace festgraph {

struct task_metadata {
  std::vector<std::string> dependencies;
  std::vector<std::string> soft_dependencies;
  std::optional<int> parallel_group;
  std::optional<task_status> status;
  std::string autonomy_level;
  bool tracked = true;
};

/**
 * @brief Extracts the dependency related metadata of a task file
 * @param path Path of the file. Only used for log messages
 * @param content Raw file content
 * @param configuration Field names to look for
 * @return Metadata with defaults for anything missing or malformed
 *
 * Sources, in order:
 * - A "Dependencies: a, b" line in the document body
 * - The dependency, soft dependency, parallel group, autonomy, status and tracking fields of the YAML frontmatter
 * - An "Autonomy Level: x" line in the document body when the frontmatter has no autonomy field
 *
 * References from the body line come before the frontmatter references.
 */
task_metadata extract_task_metadata(const std::filesystem::path &path, std::string_view content, const config &configuration = {});

std::vector<std::string> parse_dependency_line(std::string_view body);

} // namespace festgraph
