#include "dependency_graph.hpp"
#include "utilities.hpp"
#include "spdlog/spdlog.h"
#include <unordered_set>
#include <utility>

namespace festgraph {

bool dependency_graph::add_task(task new_task)
{
  if (task_map.contains(new_task.id))
    return false;

  const auto id = new_task.id;
  if (!new_task.path.empty())
    path_index.insert({ normalize_path(new_task.path), id });

  task_map.insert({ id, std::move(new_task) });
  incoming_count[id] = 0;
  outgoing[id]       = {};
  incoming[id]       = {};
  return true;
}

bool dependency_graph::add_dependency(const std::string &from, const std::string &to, dependency_type type, bool required)
{
  if (!task_map.contains(from) || !task_map.contains(to)) {
    spdlog::error("Cannot add dependency {} -> {}: unknown task", from, to);
    return false;
  }

  edge_list.push_back({ from, to, type, required });
  ++incoming_count[to];
  outgoing[from].push_back(to);
  incoming[to].push_back(from);
  return true;
}

task *dependency_graph::get_task(const std::string &id)
{
  auto i = task_map.find(id);
  return i != task_map.end() ? &i->second : nullptr;
}

const task *dependency_graph::get_task(const std::string &id) const
{
  auto i = task_map.find(id);
  return i != task_map.end() ? &i->second : nullptr;
}

const task *dependency_graph::get_task_by_path(const std::filesystem::path &path) const
{
  auto i = path_index.find(normalize_path(path));
  if (i == path_index.end())
    return nullptr;
  return get_task(i->second);
}

const task *dependency_graph::find_task(std::string_view name) const
{
  for (const auto &[id, t]: task_map) {
    const std::filesystem::path file(t.path);
    if (t.name == name || file.filename().string() == name || file.stem().string() == name)
      return &t;
  }
  return nullptr;
}

bool dependency_graph::set_status(const std::string &id, task_status status)
{
  auto t = get_task(id);
  if (t == nullptr)
    return false;
  t->status = status;
  return true;
}

static std::vector<const task *> unique_tasks(const std::map<std::string, task> &task_map, const std::vector<std::string> &ids)
{
  std::vector<const task *> result;
  std::unordered_set<std::string> seen;
  for (const auto &id: ids)
    if (seen.insert(id).second)
      result.push_back(&task_map.at(id));
  return result;
}

std::vector<const task *> dependency_graph::get_dependencies(const std::string &id) const
{
  auto i = incoming.find(id);
  if (i == incoming.end())
    return {};
  return unique_tasks(task_map, i->second);
}

std::vector<const task *> dependency_graph::get_dependents(const std::string &id) const
{
  auto i = outgoing.find(id);
  if (i == outgoing.end())
    return {};
  return unique_tasks(task_map, i->second);
}

size_t dependency_graph::in_degree(const std::string &id) const
{
  auto i = incoming_count.find(id);
  return i != incoming_count.end() ? i->second : 0;
}

nlohmann::json dependency_graph::as_json() const
{
  nlohmann::json j;
  j["tasks"] = nlohmann::json::object();
  for (const auto &[id, t]: task_map)
    j["tasks"][id] = t.as_json();

  j["edges"] = nlohmann::json::array();
  for (const auto &e: edge_list)
    j["edges"].push_back(e.as_json());

  return j;
}

nlohmann::json as_json(const std::vector<std::vector<const task *>> &groups)
{
  nlohmann::json j = nlohmann::json::array();
  for (const auto &group: groups)
    j.push_back(as_json(group));
  return j;
}

std::string cycle_error::message() const
{
  if (cycle.empty())
    return "circular dependency detected";
  return "circular dependency: " + cycle.front() + " -> ... -> " + cycle.back();
}

nlohmann::json cycle_error::as_json() const
{
  return { { "message", message() }, { "cycle", cycle } };
}

} // namespace festgraph
