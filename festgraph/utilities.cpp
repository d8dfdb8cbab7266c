#include "utilities.hpp"
#include "festgraph.hpp"
#include <algorithm>
#include <charconv>
#include <cctype>

namespace festgraph {

static const std::string_view whitespace = " \t\r\n\f\v";

/**
 * @brief Separates YAML frontmatter from the rest of a markdown document
 *
 * Frontmatter starts with a '---' line as the first non-blank line and ends at the next '---' line.
 * A document without an opening delimiter, or with an opening delimiter that is never closed, has no
 * frontmatter and its body is the whole content.
 */
frontmatter_split split_frontmatter(std::string_view content)
{
  frontmatter_split result;
  result.body = std::string(content);

  const auto line_start = content.find_first_not_of(whitespace);
  if (line_start == std::string_view::npos)
    return result;

  const auto line_end = content.find('\n', line_start);
  if (line_end == std::string_view::npos || trim(content.substr(line_start, line_end - line_start)) != frontmatter_delimiter)
    return result;

  const auto yaml_start = line_end + 1;
  auto cursor           = yaml_start;
  while (cursor <= content.size()) {
    const auto end  = content.find('\n', cursor);
    const auto line = content.substr(cursor, end == std::string_view::npos ? std::string_view::npos : end - cursor);
    if (trim(line) == frontmatter_delimiter) {
      result.has_frontmatter = true;
      result.yaml            = std::string(content.substr(yaml_start, cursor - yaml_start));
      result.body            = end == std::string_view::npos ? std::string() : std::string(content.substr(end + 1));
      return result;
    }
    if (end == std::string_view::npos)
      break;
    cursor = end + 1;
  }

  return result;
}

std::string_view trim(std::string_view text)
{
  const auto start = text.find_first_not_of(whitespace);
  if (start == std::string_view::npos)
    return {};
  const auto end = text.find_last_not_of(whitespace);
  return text.substr(start, end - start + 1);
}

std::string to_lower(std::string_view text)
{
  std::string result(text);
  std::transform(result.begin(), result.end(), result.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return result;
}

bool contains_ignore_case(std::string_view haystack, std::string_view needle)
{
  if (needle.empty())
    return false;
  return to_lower(haystack).find(to_lower(needle)) != std::string::npos;
}

// Phase and sequence directories look like "001_PLANNING" or "01_setup"
bool is_numbered_name(std::string_view name)
{
  if (name.size() < 2)
    return false;
  if (name.front() == '.' || name.front() == '_')
    return false;
  return std::isdigit(static_cast<unsigned char>(name.front())) != 0;
}

std::optional<int> leading_number(std::string_view name)
{
  const auto digits = std::find_if_not(name.begin(), name.end(), [](unsigned char c) {
                        return std::isdigit(c) != 0;
                      })
                      - name.begin();
  if (digits == 0)
    return std::nullopt;

  int number      = 0;
  const auto last = name.data() + digits;
  auto [ptr, ec]  = std::from_chars(name.data(), last, number);
  if (ec != std::errc() || ptr != last)
    return std::nullopt;

  return number;
}

std::string strip_number_prefix(std::string_view name)
{
  auto rest = name.substr(std::min(name.find_first_not_of("0123456789"), name.size()));
  if (!rest.empty() && (rest.front() == '_' || rest.front() == '-' || rest.front() == ' '))
    rest.remove_prefix(1);

  if (rest.empty())
    return std::string(name);
  return std::string(rest);
}

std::string normalize_path(const fs::path &path)
{
  auto normal = path.lexically_normal();
  if (!normal.has_filename() && normal.has_parent_path() && normal != normal.root_path())
    normal = normal.parent_path();
  return normal.generic_string();
}

} // namespace festgraph
