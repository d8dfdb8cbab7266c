#include "resolver.hpp"
#include "utilities.hpp"
#include "spdlog/spdlog.h"
#include <algorithm>
#include <map>
#include <utility>

namespace festgraph {

static std::error_code cancelled_error()
{
  return std::make_error_code(std::errc::operation_canceled);
}

resolver::resolver(festgraph::config configuration) : configuration(std::move(configuration))
{
}

std::expected<std::vector<fs::path>, std::error_code> list_numbered_directories(const fs::path &parent)
{
  std::error_code ec;
  fs::directory_iterator iterator(parent, ec);
  if (ec)
    return std::unexpected(ec);

  std::vector<fs::path> directories;
  for (auto end = fs::directory_iterator(); iterator != end; iterator.increment(ec)) {
    if (ec)
      return std::unexpected(ec);

    std::error_code status_ec;
    if (iterator->is_directory(status_ec) && is_numbered_name(iterator->path().filename().string()))
      directories.push_back(iterator->path());
  }
  if (ec)
    return std::unexpected(ec);

  // Zero padded names make this the numeric order
  std::sort(directories.begin(), directories.end(), [](const fs::path &a, const fs::path &b) {
    return a.filename().string() < b.filename().string();
  });
  return directories;
}

bool resolver::is_task_file(const fs::path &file) const
{
  const auto name = file.filename().string();
  if (!name.ends_with(configuration.task_extension))
    return false;
  if (contains_ignore_case(name, configuration.goal_marker))
    return false;
  return leading_number(name).has_value();
}

static std::expected<std::vector<fs::path>, std::error_code> list_regular_files(const fs::path &directory)
{
  std::error_code ec;
  fs::directory_iterator iterator(directory, ec);
  if (ec)
    return std::unexpected(ec);

  std::vector<fs::path> files;
  for (auto end = fs::directory_iterator(); iterator != end; iterator.increment(ec)) {
    if (ec)
      return std::unexpected(ec);

    std::error_code status_ec;
    if (iterator->is_regular_file(status_ec))
      files.push_back(iterator->path());
  }
  if (ec)
    return std::unexpected(ec);

  return files;
}

std::expected<std::vector<task>, std::error_code> resolver::load_sequence_tasks(const fs::path &sequence_path, const fs::path &phase_path) const
{
  auto files = list_regular_files(sequence_path);
  if (!files)
    return std::unexpected(files.error());

  std::vector<task> tasks;
  for (const auto &file: *files) {
    if (!is_task_file(file))
      continue;

    std::string content;
    if (auto result = get_file_contents<std::string>(file); result)
      content = std::move(*result);
    else
      spdlog::warn("Cannot read {}: {}", file.generic_string(), result.error().message());

    auto metadata = extract_task_metadata(file, content, configuration);
    if (!metadata.tracked) {
      spdlog::debug("Skipping untracked file {}", file.generic_string());
      continue;
    }

    const auto filename = file.filename().string();
    task new_task;
    new_task.path              = normalize_path(file);
    new_task.id                = new_task.path;
    new_task.name              = strip_number_prefix(filename.substr(0, filename.size() - configuration.task_extension.size()));
    new_task.number            = leading_number(filename).value_or(0);
    new_task.sequence_path     = normalize_path(sequence_path);
    new_task.phase_path        = normalize_path(phase_path);
    new_task.parallel_group    = metadata.parallel_group.value_or(new_task.number);
    new_task.status            = metadata.status.value_or(task_status::PENDING);
    new_task.dependencies      = std::move(metadata.dependencies);
    new_task.soft_dependencies = std::move(metadata.soft_dependencies);
    new_task.autonomy_level    = std::move(metadata.autonomy_level);
    tasks.push_back(std::move(new_task));
  }

  std::sort(tasks.begin(), tasks.end(), [](const task &a, const task &b) {
    if (a.number == b.number)
      return a.id < b.id;
    return a.number < b.number;
  });

  return tasks;
}

std::expected<dependency_graph, std::error_code> resolver::resolve_festival(const fs::path &festival_path)
{
  auto phases = list_numbered_directories(festival_path);
  if (!phases) {
    spdlog::error("Cannot list festival {}: {}", festival_path.generic_string(), phases.error().message());
    return std::unexpected(phases.error());
  }

  dependency_graph graph;
  for (const auto &phase_path: *phases) {
    if (cancelled())
      return std::unexpected(cancelled_error());

    auto sequences = list_numbered_directories(phase_path);
    if (!sequences) {
      spdlog::warn("Skipping phase {}: {}", phase_path.generic_string(), sequences.error().message());
      continue;
    }

    for (const auto &sequence_path: *sequences) {
      if (cancelled())
        return std::unexpected(cancelled_error());

      auto tasks = load_sequence_tasks(sequence_path, phase_path);
      if (!tasks) {
        spdlog::warn("Skipping sequence {}: {}", sequence_path.generic_string(), tasks.error().message());
        continue;
      }

      for (const auto &t: *tasks)
        if (!graph.add_task(t))
          spdlog::warn("Duplicate task id {}", t.id);

      add_implicit_dependencies(graph, *tasks);
    }
  }

  add_explicit_dependencies(graph, configuration);

  spdlog::info("Resolved {} tasks and {} dependencies in {}", graph.size(), graph.edges().size(), festival_path.generic_string());
  return graph;
}

std::expected<dependency_graph, std::error_code> resolver::resolve_sequence(const fs::path &sequence_path)
{
  if (cancelled())
    return std::unexpected(cancelled_error());

  const fs::path sequence(normalize_path(sequence_path));
  auto tasks = load_sequence_tasks(sequence, sequence.parent_path());
  if (!tasks) {
    spdlog::error("Cannot list sequence {}: {}", sequence.generic_string(), tasks.error().message());
    return std::unexpected(tasks.error());
  }

  dependency_graph graph;
  for (const auto &t: *tasks)
    if (!graph.add_task(t))
      spdlog::warn("Duplicate task id {}", t.id);

  add_implicit_dependencies(graph, *tasks);
  add_explicit_dependencies(graph, configuration);

  spdlog::debug("Resolved {} tasks and {} dependencies in {}", graph.size(), graph.edges().size(), sequence.generic_string());
  return graph;
}

/**
 * Every task at a number depends on every task at the previous number present in the sequence.
 * Tasks sharing a number are not ordered between themselves and gaps in the numbering are skipped.
 */
void add_implicit_dependencies(dependency_graph &graph, const std::vector<task> &sequence_tasks)
{
  std::map<int, std::vector<std::string>> by_number;
  for (const auto &t: sequence_tasks)
    by_number[t.number].push_back(t.id);

  const std::vector<std::string> *previous = nullptr;
  for (const auto &[number, ids]: by_number) {
    if (previous != nullptr)
      for (const auto &to: ids)
        for (const auto &from: *previous)
          graph.add_dependency(from, to, dependency_type::IMPLICIT_DEPENDENCY, true);
    previous = &ids;
  }
}

void add_explicit_dependencies(dependency_graph &graph, const config &configuration)
{
  for (const auto &[id, t]: graph.tasks()) {
    for (const auto &reference: t.dependencies)
      if (const auto *required_task = resolve_task_reference(graph, t, reference, configuration))
        graph.add_dependency(required_task->id, id, classify_dependency(*required_task, t), true);

    for (const auto &reference: t.soft_dependencies)
      if (const auto *preferred_task = resolve_task_reference(graph, t, reference, configuration))
        graph.add_dependency(preferred_task->id, id, classify_dependency(*preferred_task, t), false);
  }
}

const task *resolve_task_reference(const dependency_graph &graph, const task &from, std::string_view reference, const config &configuration)
{
  const auto ref = trim(reference);
  if (ref.empty())
    return nullptr;

  const auto &extension = configuration.task_extension;
  auto task_file_path   = [&](std::string_view relative) {
    auto path = (fs::path(from.sequence_path) / fs::path(relative)).generic_string();
    if (!path.ends_with(extension))
      path += extension;
    return path;
  };

  if (ref.starts_with(relative_reference_prefix))
    return graph.get_task_by_path(task_file_path(ref));

  const auto stem = ref.ends_with(extension) ? ref.substr(0, ref.size() - extension.size()) : ref;
  for (const auto &[id, t]: graph.tasks())
    if (t.sequence_path == from.sequence_path && (t.name == ref || t.name == stem))
      return &t;

  return graph.get_task_by_path(task_file_path(ref));
}

} // namespace festgraph
