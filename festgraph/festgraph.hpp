#pragma once

#include <string>

namespace festgraph {

const std::string default_task_extension    = ".md";
const std::string default_goal_marker       = "GOAL";
const std::string festival_config_filename  = ".festgraph.yaml";
const std::string relative_reference_prefix = "..";
const std::string frontmatter_delimiter     = "---";

// Dependency line value meaning "no dependencies", compared case-insensitively
const std::string no_dependencies_marker = "none";

} // namespace festgraph
