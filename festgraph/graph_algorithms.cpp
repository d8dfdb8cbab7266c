#include "dependency_graph.hpp"
#include <algorithm>
#include <set>
#include <utility>

namespace festgraph {

static bool by_number_then_id(const task *left, const task *right)
{
  if (left->number == right->number)
    return left->id < right->id;
  return left->number < right->number;
}

std::expected<std::vector<const task *>, cycle_error> dependency_graph::topological_sort() const
{
  auto remaining = incoming_count;

  // Ordered by (number, id) so the output is stable across runs
  std::set<std::pair<int, std::string>> ready;
  for (const auto &[id, t]: task_map)
    if (remaining[id] == 0)
      ready.insert({ t.number, id });

  std::vector<const task *> sorted;
  sorted.reserve(task_map.size());

  while (!ready.empty()) {
    const auto id = ready.begin()->second;
    ready.erase(ready.begin());
    sorted.push_back(&task_map.at(id));

    for (const auto &dependent: outgoing.at(id))
      if (--remaining[dependent] == 0)
        ready.insert({ task_map.at(dependent).number, dependent });
  }

  if (sorted.size() != task_map.size()) {
    cycle_error error;
    error.cycle = find_cycle();
    if (error.cycle.empty())
      for (const auto &[id, t]: task_map)
        if (remaining[id] != 0)
          error.cycle.push_back(id);
    return std::unexpected(error);
  }

  return sorted;
}

/**
 * @brief Depth-first search with white/grey/black marking
 * @return The first cycle found, as a list of ids starting and ending with the same id. Empty if acyclic
 *
 * Roots are visited in id order and children in edge order, so the same graph always reports the same cycle.
 */
std::vector<std::string> dependency_graph::find_cycle() const
{
  enum class colour { WHITE, GREY, BLACK };
  std::unordered_map<std::string, colour> state;
  for (const auto &[id, t]: task_map)
    state[id] = colour::WHITE;

  for (const auto &[root, root_task]: task_map) {
    if (state[root] != colour::WHITE)
      continue;

    // Each entry is a task on the current path and the index of its next child to visit
    std::vector<std::pair<std::string, size_t>> stack;
    stack.push_back({ root, 0 });
    state[root] = colour::GREY;

    while (!stack.empty()) {
      auto &[id, next_child] = stack.back();
      const auto &children   = outgoing.at(id);

      if (next_child == children.size()) {
        state[id] = colour::BLACK;
        stack.pop_back();
        continue;
      }

      const auto child = children[next_child++];
      if (state[child] == colour::GREY) {
        std::vector<std::string> cycle;
        auto start = std::find_if(stack.begin(), stack.end(), [&child](const auto &entry) {
          return entry.first == child;
        });
        for (; start != stack.end(); ++start)
          cycle.push_back(start->first);
        cycle.push_back(child);
        return cycle;
      }

      if (state[child] == colour::WHITE) {
        state[child] = colour::GREY;
        stack.push_back({ child, 0 });
      }
    }
  }

  return {};
}

bool dependency_graph::has_cycle() const
{
  return !find_cycle().empty();
}

std::vector<std::vector<const task *>> dependency_graph::get_parallel_groups() const
{
  auto remaining = incoming_count;
  std::vector<std::vector<const task *>> groups;
  std::vector<const task *> wavefront;
  size_t placed = 0;

  for (const auto &[id, t]: task_map)
    if (remaining[id] == 0)
      wavefront.push_back(&t);

  // Each pass removes the current wavefront and its outgoing edges
  while (!wavefront.empty()) {
    std::sort(wavefront.begin(), wavefront.end(), by_number_then_id);

    std::vector<const task *> next;
    for (const auto *t: wavefront)
      for (const auto &dependent: outgoing.at(t->id))
        if (--remaining[dependent] == 0)
          next.push_back(&task_map.at(dependent));

    placed += wavefront.size();
    groups.push_back(std::move(wavefront));
    wavefront = std::move(next);
  }

  if (placed != task_map.size())
    return {};

  return groups;
}

std::vector<const task *> dependency_graph::critical_path() const
{
  if (edge_list.empty())
    return {};

  const auto sorted = topological_sort();
  if (!sorted)
    return {};

  std::unordered_map<std::string, size_t> position;
  for (size_t i = 0; i < sorted->size(); ++i)
    position[(*sorted)[i]->id] = i;

  // length[t] = 1 + longest predecessor, previous[t] = that predecessor
  std::unordered_map<std::string, size_t> length;
  std::unordered_map<std::string, std::string> previous;
  for (const auto *t: *sorted) {
    size_t longest                   = 0;
    const std::string *best_previous = nullptr;
    for (const auto &predecessor: incoming.at(t->id)) {
      const auto predecessor_length = length[predecessor];
      if (predecessor_length > longest || (predecessor_length == longest && best_previous != nullptr && position[predecessor] < position[*best_previous])) {
        longest       = predecessor_length;
        best_previous = &predecessor;
      }
    }
    length[t->id] = longest + 1;
    if (best_previous != nullptr)
      previous[t->id] = *best_previous;
  }

  // The path ends at the first task in topological order with the greatest length
  const task *end   = nullptr;
  size_t end_length   = 0;
  for (const auto *t: *sorted)
    if (length[t->id] > end_length) {
      end        = t;
      end_length = length[t->id];
    }

  std::vector<const task *> path;
  for (auto id = end->id;;) {
    path.push_back(&task_map.at(id));
    auto i = previous.find(id);
    if (i == previous.end())
      break;
    id = i->second;
  }
  std::reverse(path.begin(), path.end());

  return path;
}

std::vector<const task *> dependency_graph::get_ready_tasks() const
{
  std::vector<const task *> ready;

  for (const auto &[id, t]: task_map) {
    if (t.status != task_status::PENDING)
      continue;

    const auto &predecessors = incoming.at(id);
    const bool all_complete  = std::all_of(predecessors.begin(), predecessors.end(), [this](const std::string &predecessor) {
      return task_map.at(predecessor).status == task_status::COMPLETE;
    });

    if (all_complete)
      ready.push_back(&t);
  }

  std::sort(ready.begin(), ready.end(), by_number_then_id);
  return ready;
}

} // namespace festgraph
