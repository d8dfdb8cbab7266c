#pragma once

#include "festgraph.hpp"
#include <string>
#include <expected>
#include <filesystem>
#include <system_error>

namespace festgraph {

/**
 * @brief Naming conventions and frontmatter field names used while resolving a festival
 *
 * Every member has a default matching the festival layout. A festival can override any of them
 * with a YAML map in its root directory (see festival_config_filename).
 */
struct config {
  /** @brief Suffix of task files, including the dot */
  std::string task_extension = default_task_extension;

  /** @brief Files whose name contains this text (any case) are goal documents, not tasks */
  std::string goal_marker = default_goal_marker;

  std::string dependencies_field      = "fest_dependencies";
  std::string soft_dependencies_field = "fest_soft_dependencies";
  std::string parallel_group_field    = "fest_parallel_group";
  std::string autonomy_field          = "fest_autonomy";
  std::string status_field            = "fest_status";

  /** @brief Boolean field that excludes a file from the graph when false */
  std::string tracking_field = "tracking";
};

/**
 * @brief Loads a configuration file
 * @param config_file_path Path to a YAML file containing a map of config keys
 * @return The configuration, with defaults for any key the file doesn't set, or an error code
 *
 * Unknown keys are ignored. A file that can't be opened, isn't valid YAML or isn't a map is an error.
 */
std::expected<config, std::error_code> load_config_file(const std::filesystem::path &config_file_path);

/**
 * @brief Loads the configuration of a festival
 * @param festival_path Festival root directory
 * @return The configuration from the festival config file if there is one, otherwise the defaults
 */
std::expected<config, std::error_code> load_festival_config(const std::filesystem::path &festival_path);

} // namespace festgraph
