#include "gtest/gtest.h"
#include "festival_fixture.hpp"
#include "festgraph_config.hpp"

using namespace festgraph;

class ConfigTest : public FestivalFixture {};

TEST_F(ConfigTest, DefaultsMatchFestivalLayout)
{
  const config defaults;
  EXPECT_EQ(defaults.task_extension, ".md");
  EXPECT_EQ(defaults.goal_marker, "GOAL");
  EXPECT_EQ(defaults.dependencies_field, "fest_dependencies");
  EXPECT_EQ(defaults.soft_dependencies_field, "fest_soft_dependencies");
  EXPECT_EQ(defaults.parallel_group_field, "fest_parallel_group");
  EXPECT_EQ(defaults.autonomy_field, "fest_autonomy");
  EXPECT_EQ(defaults.status_field, "fest_status");
  EXPECT_EQ(defaults.tracking_field, "tracking");
}

TEST_F(ConfigTest, LoadOverridesSomeKeys)
{
  const auto file = write_file("custom.yaml", "task_extension: txt\ndependencies_field: requires\nunknown_key: 3\n");
  auto result     = load_config_file(file);
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->task_extension, ".txt");
  EXPECT_EQ(result->dependencies_field, "requires");
  EXPECT_EQ(result->goal_marker, "GOAL");
  EXPECT_EQ(result->soft_dependencies_field, "fest_soft_dependencies");
}

TEST_F(ConfigTest, NonStringValueKeepsDefault)
{
  const auto file = write_file("custom.yaml", "goal_marker: [a, b]\n");
  auto result     = load_config_file(file);
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->goal_marker, "GOAL");
}

TEST_F(ConfigTest, EmptyFileGivesDefaults)
{
  const auto file = write_file("empty.yaml");
  auto result     = load_config_file(file);
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->task_extension, ".md");
}

TEST_F(ConfigTest, MissingFileIsAnError)
{
  auto result = load_config_file(root / "missing.yaml");
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), std::make_error_code(std::errc::no_such_file_or_directory));
}

TEST_F(ConfigTest, MalformedYamlIsAnError)
{
  const auto file = write_file("bad.yaml", "task_extension: [unterminated\n");
  auto result     = load_config_file(file);
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), std::make_error_code(std::errc::invalid_argument));
}

TEST_F(ConfigTest, NonMapIsAnError)
{
  const auto file = write_file("list.yaml", "- a\n- b\n");
  auto result     = load_config_file(file);
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), std::make_error_code(std::errc::invalid_argument));
}

TEST_F(ConfigTest, FestivalWithoutConfigFileUsesDefaults)
{
  auto result = load_festival_config(root);
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->goal_marker, "GOAL");
}

TEST_F(ConfigTest, FestivalConfigFileIsLoaded)
{
  write_file(".festgraph.yaml", "goal_marker: OBJECTIVE\n");
  auto result = load_festival_config(root);
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->goal_marker, "OBJECTIVE");
}
