#pragma once

#include <string>
#include <string_view>
#include <expected>
#include <optional>
#include <fstream>
#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

namespace festgraph {

struct frontmatter_split {
  bool has_frontmatter = false;
  std::string yaml; // Text between the delimiters
  std::string body; // Everything after the closing delimiter, or the whole document
};

frontmatter_split split_frontmatter(std::string_view content);
std::string_view trim(std::string_view text);
std::string to_lower(std::string_view text);
bool contains_ignore_case(std::string_view haystack, std::string_view needle);
bool is_numbered_name(std::string_view name);
std::optional<int> leading_number(std::string_view name);
std::string strip_number_prefix(std::string_view name);
std::string normalize_path(const fs::path &path);

template <class CharContainer>
static std::expected<size_t, std::error_code> get_file_contents(std::filesystem::path filename, CharContainer *container)
{
  std::ifstream file(filename, std::ios::binary | std::ios::ate);
  if (!file) {
    return std::unexpected(std::make_error_code(std::errc::no_such_file_or_directory));
  }

  const auto file_size = file.tellg();
  if (file_size < 0) {
    return std::unexpected(std::make_error_code(std::errc::io_error));
  }

  container->resize(static_cast<typename CharContainer::size_type>(file_size));

  file.seekg(0);
  if (!file.read(reinterpret_cast<char *>(container->data()), file_size)) {
    return std::unexpected(std::make_error_code(std::errc::io_error));
  }

  return container->size();
}

template <class CharContainer>
static std::expected<CharContainer, std::error_code> get_file_contents(std::filesystem::path filename)
{
  CharContainer cc;
  auto result = get_file_contents(filename, &cc);
  if (result) {
    return cc;
  }
  return std::unexpected(result.error());
}

} // namespace festgraph
