#include "gtest/gtest.h"
#include "task_metadata.hpp"

using namespace festgraph;

class TaskMetadataTest : public ::testing::Test {
protected:
  task_metadata extract(const std::string &content)
  {
    return extract_task_metadata("01_task.md", content, configuration);
  }

  config configuration;
};

TEST_F(TaskMetadataTest, EmptyFileHasDefaults)
{
  const auto metadata = extract("");
  EXPECT_TRUE(metadata.dependencies.empty());
  EXPECT_TRUE(metadata.soft_dependencies.empty());
  EXPECT_FALSE(metadata.parallel_group.has_value());
  EXPECT_FALSE(metadata.status.has_value());
  EXPECT_TRUE(metadata.autonomy_level.empty());
  EXPECT_TRUE(metadata.tracked);
}

TEST_F(TaskMetadataTest, LegacyDependencyLine)
{
  const auto metadata = extract("# Task\n\nDependencies: 01_design, 02_api ,\n");
  EXPECT_EQ(metadata.dependencies, (std::vector<std::string>{ "01_design", "02_api" }));
}

TEST_F(TaskMetadataTest, DecoratedDependencyLine)
{
  EXPECT_EQ(parse_dependency_line("> **Dependencies:** design\n"), std::vector<std::string>{ "design" });
  EXPECT_EQ(parse_dependency_line("- dependencies: design, api\n"), (std::vector<std::string>{ "design", "api" }));
  EXPECT_EQ(parse_dependency_line("**Dependencies**: design | **Owner**: someone\n"), std::vector<std::string>{ "design" });
}

TEST_F(TaskMetadataTest, NoneMeansNoDependencies)
{
  EXPECT_TRUE(parse_dependency_line("Dependencies: None\n").empty());
  EXPECT_TRUE(parse_dependency_line("Dependencies: none\n").empty());
  EXPECT_TRUE(parse_dependency_line("Dependencies:\n").empty());
}

TEST_F(TaskMetadataTest, OnlyFirstDependencyLineCounts)
{
  EXPECT_EQ(parse_dependency_line("Dependencies: a\nDependencies: b\n"), std::vector<std::string>{ "a" });
  EXPECT_TRUE(parse_dependency_line("Dependencies: none\nDependencies: b\n").empty());
}

TEST_F(TaskMetadataTest, DependencyLineWithWindowsLineEndings)
{
  EXPECT_EQ(parse_dependency_line("Dependencies: a, b\r\nOther: c\r\n"), (std::vector<std::string>{ "a", "b" }));
}

TEST_F(TaskMetadataTest, VeryLongDependencyLine)
{
  std::string line = "Dependencies: ";
  for (int i = 0; i < 8000; ++i)
    line += "task_" + std::to_string(i) + ", ";
  ASSERT_GE(line.size(), 64 * 1024);

  const auto metadata = extract("# Task\n\n" + line + "\n**Autonomy Level:** high\n");
  ASSERT_EQ(metadata.dependencies.size(), 8000);
  EXPECT_EQ(metadata.dependencies.front(), "task_0");
  EXPECT_EQ(metadata.dependencies.back(), "task_7999");
  EXPECT_EQ(metadata.autonomy_level, "high");
}

TEST_F(TaskMetadataTest, VeryLongOrdinaryLine)
{
  const auto metadata = extract("# Task\n" + std::string(100 * 1024, 'x') + "\n");
  EXPECT_TRUE(metadata.dependencies.empty());
}

TEST_F(TaskMetadataTest, DependencyWordInsideSentenceIsIgnored)
{
  EXPECT_TRUE(parse_dependency_line("Check the dependencies: later\n").empty());
}

TEST_F(TaskMetadataTest, FrontmatterFields)
{
  const auto metadata = extract("---\n"
                                "fest_dependencies:\n"
                                "  - 01_design\n"
                                "  - ../02_backend/01_api\n"
                                "fest_soft_dependencies: 03_docs\n"
                                "fest_parallel_group: 4\n"
                                "fest_autonomy: high\n"
                                "fest_status: completed\n"
                                "---\n"
                                "# Task\n");
  EXPECT_EQ(metadata.dependencies, (std::vector<std::string>{ "01_design", "../02_backend/01_api" }));
  EXPECT_EQ(metadata.soft_dependencies, std::vector<std::string>{ "03_docs" });
  EXPECT_EQ(metadata.parallel_group, 4);
  EXPECT_EQ(metadata.autonomy_level, "high");
  EXPECT_EQ(metadata.status, task_status::COMPLETE);
  EXPECT_TRUE(metadata.tracked);
}

TEST_F(TaskMetadataTest, LegacyReferencesComeFirst)
{
  const auto metadata = extract("---\nfest_dependencies: [b]\n---\nDependencies: a\n");
  EXPECT_EQ(metadata.dependencies, (std::vector<std::string>{ "a", "b" }));
}

TEST_F(TaskMetadataTest, FrontmatterKeyIsNotALegacyLine)
{
  const auto metadata = extract("---\nfest_dependencies: []\n---\n# Task\n");
  EXPECT_TRUE(metadata.dependencies.empty());
}

TEST_F(TaskMetadataTest, InvalidParallelGroupIsIgnored)
{
  const auto metadata = extract("---\nfest_parallel_group: soon\n---\n");
  EXPECT_FALSE(metadata.parallel_group.has_value());
}

TEST_F(TaskMetadataTest, UnknownStatusIsIgnored)
{
  EXPECT_FALSE(extract("---\nfest_status: blocked\n---\n").status.has_value());
  EXPECT_EQ(extract("---\nfest_status: active\n---\n").status, task_status::IN_PROGRESS);
}

TEST_F(TaskMetadataTest, UntrackedFile)
{
  EXPECT_FALSE(extract("---\ntracking: false\n---\n").tracked);
  EXPECT_TRUE(extract("---\ntracking: true\n---\n").tracked);
}

TEST_F(TaskMetadataTest, MalformedFrontmatterIsIgnored)
{
  const auto metadata = extract("---\nfest_dependencies: [a, b\ntracking: false\n---\nDependencies: c\n");
  EXPECT_EQ(metadata.dependencies, std::vector<std::string>{ "c" });
  EXPECT_TRUE(metadata.tracked);
}

TEST_F(TaskMetadataTest, AutonomyLevelFromBody)
{
  EXPECT_EQ(extract("# Task\n**Autonomy Level:** medium\n").autonomy_level, "medium");
  EXPECT_EQ(extract("---\nfest_autonomy: low\n---\nAutonomy Level: high\n").autonomy_level, "low");
}

TEST_F(TaskMetadataTest, CustomFieldNames)
{
  configuration.dependencies_field = "requires";
  configuration.tracking_field     = "in_graph";

  const auto metadata = extract("---\nrequires: [setup]\nfest_dependencies: [ignored]\nin_graph: false\n---\n");
  EXPECT_EQ(metadata.dependencies, std::vector<std::string>{ "setup" });
  EXPECT_FALSE(metadata.tracked);
}
