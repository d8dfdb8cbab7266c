#pragma once

#include "gtest/gtest.h"
#include <string>
#include <vector>
#include <fstream>
#include <filesystem>

namespace fs = std::filesystem;

// Builds a festival tree under a temporary directory owned by the current test
class FestivalFixture : public ::testing::Test {
protected:
  void SetUp() override
  {
    const auto *info = ::testing::UnitTest::GetInstance()->current_test_info();
    root             = fs::temp_directory_path() / "festgraph_tests" / (std::string(info->test_suite_name()) + "." + info->name());
    fs::remove_all(root);
    fs::create_directories(root);
  }

  void TearDown() override
  {
    std::error_code ec;
    for (const auto &path: restricted)
      fs::permissions(path, fs::perms::owner_all, ec);
    fs::remove_all(root, ec);
  }

  fs::path write_file(const fs::path &relative, const std::string &content = "")
  {
    const auto file = root / relative;
    fs::create_directories(file.parent_path());
    std::ofstream(file, std::ios::binary) << content;
    return file;
  }

  fs::path make_directory(const fs::path &relative)
  {
    const auto directory = root / relative;
    fs::create_directories(directory);
    return directory;
  }

  /**
   * @brief Removes every permission from a file or directory under the root
   * @return false if the path can still be read, as happens when running as root
   */
  bool make_unreadable(const fs::path &relative)
  {
    const auto path = root / relative;
    fs::permissions(path, fs::perms::none);
    restricted.push_back(path);

    std::error_code ec;
    if (fs::is_directory(path, ec)) {
      fs::directory_iterator iterator(path, ec);
      return static_cast<bool>(ec);
    }
    return !std::ifstream(path).is_open();
  }

  static std::string frontmatter(const std::string &yaml, const std::string &body = "# Task\n")
  {
    return "---\n" + yaml + "---\n" + body;
  }

  fs::path root;
  std::vector<fs::path> restricted;
};
