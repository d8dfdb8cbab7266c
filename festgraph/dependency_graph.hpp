#pragma once

#include "festgraph_task.hpp"
#include "nlohmann/json.hpp"
#include <string>
#include <string_view>
#include <vector>
#include <map>
#include <unordered_map>
#include <expected>
#include <filesystem>

namespace festgraph {

/**
 * @brief Returned by topological_sort() when the graph has a cycle
 *
 * Holds the ids of a cycle found by depth-first search, with the first id repeated at the end.
 * When no single cycle can be isolated it holds every task that could not be ordered.
 */
struct cycle_error {
  std::vector<std::string> cycle;

  std::string message() const;
  nlohmann::json as_json() const;
};

/**
 * @brief Directed graph of tasks and the dependencies between them
 *
 * An edge from A to B means B requires A. Nodes must be added before any edge that uses them.
 * The graph does not prevent cycles, they are reported by the ordering queries.
 */
class dependency_graph {
public:
  dependency_graph()  = default;
  ~dependency_graph() = default;

  /**
   * @brief Adds a task node
   * @return false if a task with the same id is already in the graph
   */
  bool add_task(task new_task);

  /**
   * @brief Adds an edge meaning that 'to' requires 'from'
   * @return false if either endpoint is not in the graph
   */
  bool add_dependency(const std::string &from, const std::string &to, dependency_type type, bool required);

  task *get_task(const std::string &id);
  const task *get_task(const std::string &id) const;
  const task *get_task_by_path(const std::filesystem::path &path) const;

  /**
   * @brief Finds a task by what a user would type
   * @param name Task name, filename, or filename without extension
   * @return The first matching task in id order, nullptr if none
   */
  const task *find_task(std::string_view name) const;

  bool set_status(const std::string &id, task_status status);

  /** @brief Direct predecessors of a task. Empty for an unknown id */
  std::vector<const task *> get_dependencies(const std::string &id) const;

  /** @brief Direct successors of a task. Empty for an unknown id */
  std::vector<const task *> get_dependents(const std::string &id) const;

  size_t in_degree(const std::string &id) const;

  /**
   * @brief Orders every task after all of its predecessors (Kahn's algorithm)
   *
   * Soft edges count the same as hard ones. Among tasks that are ready at the same time the lowest
   * number comes first, then the lowest id.
   */
  std::expected<std::vector<const task *>, cycle_error> topological_sort() const;

  bool has_cycle() const;

  /**
   * @brief Splits the tasks into levels that can each run in parallel
   *
   * Level k holds every task whose predecessors are all in levels before k. Each level is ordered
   * by number then id. Empty if the graph has a cycle.
   */
  std::vector<std::vector<const task *>> get_parallel_groups() const;

  /**
   * @brief Longest chain of dependent tasks, counted in tasks
   *
   * Empty if the graph has no edges or has a cycle.
   */
  std::vector<const task *> critical_path() const;

  /** @brief Pending tasks whose predecessors are all complete, by number then id */
  std::vector<const task *> get_ready_tasks() const;

  const std::map<std::string, task> &tasks() const
  {
    return task_map;
  }

  const std::vector<dependency> &edges() const
  {
    return edge_list;
  }

  size_t size() const
  {
    return task_map.size();
  }

  nlohmann::json as_json() const;

private:
  std::vector<std::string> find_cycle() const;

  std::map<std::string, task> task_map;
  std::vector<dependency> edge_list;                                  // Discovery order
  std::unordered_map<std::string, size_t> incoming_count;             // In-degree, one per edge
  std::unordered_map<std::string, std::vector<std::string>> outgoing; // One entry per edge
  std::unordered_map<std::string, std::vector<std::string>> incoming; // One entry per edge
  std::unordered_map<std::string, std::string> path_index;
};

nlohmann::json as_json(const std::vector<std::vector<const task *>> &groups);

} // namespace festgraph
