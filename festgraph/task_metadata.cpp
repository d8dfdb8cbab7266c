#include "task_metadata.hpp"
#include "utilities.hpp"
#include "yaml-cpp/yaml.h"
#include "spdlog/spdlog.h"
#include <regex>
#include <sstream>

namespace festgraph {

// Label of "Dependencies: a, b", "> **Dependencies:** a" and "- Dependencies: a". The value is the rest of the line
static const std::regex dependency_label_regex(R"(^[\s>*\-]*dependencies\**\s*:\**)", std::regex::icase);
static const std::regex autonomy_line_regex(R"(autonomy\s+level\**[:\s*]+(\w+))", std::regex::icase);

std::vector<std::string> parse_dependency_line(std::string_view body)
{
  std::istringstream stream{ std::string(body) };
  std::string line;
  std::smatch match;

  while (std::getline(stream, line)) {
    if (!line.empty() && line.back() == '\r')
      line.pop_back();

    if (!std::regex_search(line, match, dependency_label_regex, std::regex_constants::match_continuous))
      continue;

    // Only the first dependency line counts. Table rows carry other cells after a '|'
    auto value = match.suffix().str();
    value      = std::string(trim(value.substr(0, value.find('|'))));
    if (value.empty() || to_lower(value) == no_dependencies_marker)
      return {};

    std::vector<std::string> references;
    std::istringstream list(value);
    std::string item;
    while (std::getline(list, item, ',')) {
      const auto reference = trim(item);
      if (!reference.empty())
        references.emplace_back(reference);
    }
    return references;
  }

  return {};
}

static void append_references(const YAML::Node &node, std::vector<std::string> &references)
{
  if (!node)
    return;

  if (node.IsScalar()) {
    const auto reference = trim(node.Scalar());
    if (!reference.empty())
      references.emplace_back(reference);
  } else if (node.IsSequence()) {
    for (const auto &item: node)
      if (item.IsScalar()) {
        const auto reference = trim(item.Scalar());
        if (!reference.empty())
          references.emplace_back(reference);
      }
  }
}

static void read_frontmatter(const std::filesystem::path &path, const YAML::Node &frontmatter, const config &configuration, task_metadata &metadata)
{
  append_references(frontmatter[configuration.dependencies_field], metadata.dependencies);
  append_references(frontmatter[configuration.soft_dependencies_field], metadata.soft_dependencies);

  if (const auto node = frontmatter[configuration.parallel_group_field]) {
    int group = 0;
    if (YAML::convert<int>::decode(node, group))
      metadata.parallel_group = group;
    else
      spdlog::debug("{}: '{}' is not an integer", path.generic_string(), configuration.parallel_group_field);
  }

  if (const auto node = frontmatter[configuration.autonomy_field]; node && node.IsScalar())
    metadata.autonomy_level = std::string(trim(node.Scalar()));

  if (const auto node = frontmatter[configuration.status_field]; node && node.IsScalar())
    metadata.status = parse_task_status(node.Scalar());

  if (const auto node = frontmatter[configuration.tracking_field]) {
    bool tracked = true;
    if (YAML::convert<bool>::decode(node, tracked))
      metadata.tracked = tracked;
  }
}

task_metadata extract_task_metadata(const std::filesystem::path &path, std::string_view content, const config &configuration)
{
  task_metadata metadata;
  const auto document = split_frontmatter(content);

  metadata.dependencies = parse_dependency_line(document.body);

  if (document.has_frontmatter) {
    try {
      const YAML::Node frontmatter = YAML::Load(document.yaml);
      if (frontmatter.IsMap())
        read_frontmatter(path, frontmatter, configuration, metadata);
    } catch (const YAML::Exception &e) {
      // Malformed frontmatter is treated as absent. The file stays tracked
      spdlog::debug("{}: ignoring malformed frontmatter: {}", path.generic_string(), e.what());
    }
  }

  if (metadata.autonomy_level.empty()) {
    std::smatch match;
    if (std::regex_search(document.body, match, autonomy_line_regex))
      metadata.autonomy_level = match[1].str();
  }

  return metadata;
}

} // namespace festgraph
