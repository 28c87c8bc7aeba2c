#include "ferry/cli/commands.hpp"
#include "ferry/storage/run_history.hpp"
#include "ferry/storage/state_strings.hpp"
#include "ferry/util/log.hpp"

#include <print>

namespace ferry::cli {

auto cmd_history(const HistoryOptions& opts) -> int {
  auto config = load_config(opts.config_file, false);
  if (!config) {
    return 1;
  }
  log::set_level(log::Level::Warn);

  if (config->storage.history_db.empty()) {
    std::println(stderr, "Error: run history is disabled (storage.history_db)");
    return 1;
  }

  RunHistory history(config->storage.history_db);
  if (auto r = history.open(); !r) {
    std::println(stderr, "Error: {}", r.error().message());
    return 1;
  }

  auto runs = history.list(opts.task_id, opts.limit);
  if (!runs) {
    std::println(stderr, "Error: {}", runs.error().message());
    return 1;
  }
  if (runs->empty()) {
    std::println("No runs recorded.");
    return 0;
  }

  std::println("{:<20} {:<10} {:<9} {:<8} {:>12} {}", "FINISHED", "TASK",
               "TYPE", "OUTCOME", "BYTES", "SOURCE");
  for (const auto& run : *runs) {
    std::println("{:<20} {:<10} {:<9} {:<8} {:>12} {}",
                 format_local(run.finished_at),
                 run.task_id.value().substr(0, 8), task_type_name(run.type),
                 run.succeeded ? "ok" : "failed", run.bytes_done, run.source);
    if (!run.succeeded && !run.error.empty()) {
      std::println("{:<20} error: {}", "", run.error);
    }
  }
  return 0;
}

}  // namespace ferry::cli
