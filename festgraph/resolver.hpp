#pragma once

#include "festgraph_config.hpp"
#include "dependency_graph.hpp"
#include "task_metadata.hpp"
#include <atomic>
#include <string>
#include <string_view>
#include <vector>
#include <expected>
#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

namespace festgraph {

/**
 * @brief Builds dependency graphs from a festival directory tree
 *
 * A festival holds numbered phase directories, each holding numbered sequence directories, each
 * holding numbered task files. Tasks get implicit edges from their numbering and explicit edges from
 * the references they declare.
 */
class resolver {
public:
  explicit resolver(festgraph::config configuration = {});

  /**
   * @brief Resolves every phase and sequence of a festival
   * @param festival_path Festival root directory
   * @return The graph, or an error if the root can't be listed or the resolution was cancelled
   *
   * Phase and sequence directories that can't be listed are skipped.
   */
  std::expected<dependency_graph, std::error_code> resolve_festival(const fs::path &festival_path);

  /**
   * @brief Resolves a single sequence
   * @param sequence_path Sequence directory. Its parent is taken as the phase
   * @return The graph, or an error if the sequence can't be listed or the resolution was cancelled
   *
   * References to tasks outside the sequence stay unresolved.
   */
  std::expected<dependency_graph, std::error_code> resolve_sequence(const fs::path &sequence_path);

  std::expected<std::vector<task>, std::error_code> load_sequence_tasks(const fs::path &sequence_path, const fs::path &phase_path) const;
  bool is_task_file(const fs::path &file) const;

  festgraph::config configuration;

  // Checked before each phase and each sequence. Resolution stops with operation_canceled when set
  const std::atomic<bool> *cancel_flag = nullptr;

private:
  bool cancelled() const
  {
    return cancel_flag != nullptr && cancel_flag->load();
  }
};

std::expected<std::vector<fs::path>, std::error_code> list_numbered_directories(const fs::path &parent);
void add_implicit_dependencies(dependency_graph &graph, const std::vector<task> &sequence_tasks);
void add_explicit_dependencies(dependency_graph &graph, const config &configuration = {});

/**
 * @brief Finds the task a declared reference points to
 * @param graph Graph holding every task the reference may resolve to
 * @param from Task declaring the reference
 * @param reference Raw reference text
 * @param configuration Supplies the task file extension
 * @return The referenced task, or nullptr
 *
 * A reference starting with ".." is a path relative to the sequence of 'from'. Anything else is first
 * matched against the names of the tasks in the same sequence, then treated as a path within that sequence.
 */
const task *resolve_task_reference(const dependency_graph &graph, const task &from, std::string_view reference, const config &configuration = {});

} // namespace festgraph
