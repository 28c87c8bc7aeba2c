#include "ferry/cli/commands.hpp"
#include "ferry/storage/state_strings.hpp"
#include "ferry/storage/task_store.hpp"
#include "ferry/util/log.hpp"

#include <format>
#include <print>

namespace ferry::cli {

namespace {

auto describe_recurrence(const TaskRecord& task) -> std::string {
  if (!task.recurring || !task.interval_minutes) {
    return "once";
  }
  return std::format("every {}m", *task.interval_minutes);
}

}  // namespace

// Reads the task file without taking the lock, so it also works while
// `ferry serve` owns it.
auto cmd_list(const ListOptions& opts) -> int {
  auto config = load_config(opts.config_file, false);
  if (!config) {
    return 1;
  }
  log::set_level(log::Level::Warn);

  TaskStore store{config->storage.tasks_file};
  auto outcome = store.load();
  if (outcome == LoadOutcome::Unreadable || outcome == LoadOutcome::Corrupt) {
    std::println(stderr, "Error: task file {} is {}", store.path(),
                 load_outcome_name(outcome));
    return 1;
  }

  const auto tasks = store.list();
  if (tasks.empty()) {
    std::println("No tasks scheduled.");
    return 0;
  }

  std::println("{:<10} {:<9} {:<10} {:<20} {:<10} {}", "ID", "TYPE", "STATUS",
               "NEXT RUN", "REPEAT", "SOURCE -> DESTINATION");
  for (const auto& task : tasks) {
    auto next = task.status == TaskStatus::Pending
                    ? format_local(task.scheduled_at)
                    : std::string{"-"};
    auto route = task.destination
                     ? std::format("{} -> {}", task.source, *task.destination)
                     : task.source;
    std::println("{:<10} {:<9} {:<10} {:<20} {:<10} {}",
                 task.id.value().substr(0, 8), task_type_name(task.type),
                 task_status_name(task.status), next,
                 describe_recurrence(task), route);
    if (task.last_error) {
      std::println("{:<10} error: {}", "", *task.last_error);
    }
  }
  return 0;
}

}  // namespace ferry::cli
