#include "festgraph_config.hpp"
#include "yaml-cpp/yaml.h"
#include "spdlog/spdlog.h"

namespace festgraph {

static void read_string_field(const YAML::Node &node, const std::string &key, std::string &value)
{
  const auto field = node[key];
  if (!field)
    return;

  if (field.IsScalar())
    value = field.Scalar();
  else
    spdlog::warn("Config key '{}' must be a string", key);
}

std::expected<config, std::error_code> load_config_file(const std::filesystem::path &config_file_path)
{
  YAML::Node node;
  try {
    node = YAML::LoadFile(config_file_path.string());
  } catch (const YAML::BadFile &) {
    spdlog::error("Cannot open config file {}", config_file_path.generic_string());
    return std::unexpected(std::make_error_code(std::errc::no_such_file_or_directory));
  } catch (const YAML::Exception &e) {
    spdlog::error("Failed to parse config file {}: {}", config_file_path.generic_string(), e.what());
    return std::unexpected(std::make_error_code(std::errc::invalid_argument));
  }

  config result;

  // An empty file is a valid config with every default
  if (node.IsNull())
    return result;

  if (!node.IsMap()) {
    spdlog::error("Config file {} must contain a map", config_file_path.generic_string());
    return std::unexpected(std::make_error_code(std::errc::invalid_argument));
  }

  read_string_field(node, "task_extension", result.task_extension);
  read_string_field(node, "goal_marker", result.goal_marker);
  read_string_field(node, "dependencies_field", result.dependencies_field);
  read_string_field(node, "soft_dependencies_field", result.soft_dependencies_field);
  read_string_field(node, "parallel_group_field", result.parallel_group_field);
  read_string_field(node, "autonomy_field", result.autonomy_field);
  read_string_field(node, "status_field", result.status_field);
  read_string_field(node, "tracking_field", result.tracking_field);

  if (!result.task_extension.empty() && result.task_extension.front() != '.')
    result.task_extension.insert(0, 1, '.');

  return result;
}

std::expected<config, std::error_code> load_festival_config(const std::filesystem::path &festival_path)
{
  const auto config_path = festival_path / festival_config_filename;

  std::error_code ec;
  if (!std::filesystem::is_regular_file(config_path, ec)) {
    spdlog::debug("No {} in {}, using default config", festival_config_filename, festival_path.generic_string());
    return config{};
  }

  spdlog::info("Loading festival config {}", config_path.generic_string());
  return load_config_file(config_path);
}

} // namespace festgraph
