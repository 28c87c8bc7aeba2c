#include "ferry/app/application.hpp"
#include "ferry/cli/commands.hpp"
#include "ferry/storage/task_store.hpp"

#include <print>

namespace ferry::cli {

namespace {

auto resolve_or_report(const std::vector<TaskRecord>& tasks,
                       std::string_view id_or_prefix) -> Result<TaskId> {
  auto id = resolve_task_id(tasks, id_or_prefix);
  if (!id) {
    if (id.error() == Error::InvalidArgument) {
      std::println(stderr, "Error: '{}' matches more than one task",
                   id_or_prefix);
    } else {
      std::println(stderr, "Error: no task matches '{}'", id_or_prefix);
    }
  }
  return id;
}

// The task file belongs to a running `ferry serve`: resolve the id from an
// unlocked read and leave the removal in its spool.
auto queue_for_owner(const SystemConfig& config, std::string_view id_or_prefix)
    -> int {
  TaskStore store{config.storage.tasks_file};
  auto outcome = store.load();
  if (outcome == LoadOutcome::Unreadable || outcome == LoadOutcome::Corrupt) {
    std::println(stderr, "Error: task file {} is {}", store.path(),
                 load_outcome_name(outcome));
    return 1;
  }
  auto id = resolve_or_report(store.list(), id_or_prefix);
  if (!id) {
    return 1;
  }

  RequestSpool spool{RequestSpool::for_tasks_file(config.storage.tasks_file)};
  auto queued = spool.submit(
      ControlRequest{.kind = ControlRequest::Kind::Remove, .id = *id});
  if (!queued) {
    std::println(stderr, "Error: {}", queued.error().message());
    return 1;
  }
  std::println("Queued removal of {}; the running scheduler applies it "
               "within {}s",
               *id, config.scheduler.poll_interval_sec);
  return 0;
}

}  // namespace

auto cmd_remove(const RemoveOptions& opts) -> int {
  auto config = load_config(opts.config_file, false);
  if (!config) {
    return 1;
  }
  if (!setup_logging(config->logging)) {
    return 1;
  }

  Application app(*config);
  if (auto r = app.open(); !r) {
    if (r.error() == Error::Locked) {
      return queue_for_owner(*config, opts.id);
    }
    std::println(stderr, "Error: {}", r.error().message());
    return 1;
  }

  auto& scheduler = app.scheduler();
  auto id = resolve_or_report(scheduler.list(), opts.id);
  if (!id) {
    return 1;
  }

  if (auto r = scheduler.remove(*id); !r) {
    std::println(stderr, "Error: {}", r.error().message());
    return 1;
  }
  std::println("Removed {}", *id);
  return 0;
}

}  // namespace ferry::cli
