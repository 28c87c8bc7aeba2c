#include "ferry/app/application.hpp"
#include "ferry/cli/commands.hpp"
#include "ferry/util/log.hpp"

#include <print>

namespace ferry::cli {

auto cmd_run_due(const RunDueOptions& opts) -> int {
  auto config = load_config(opts.config_file, true);
  if (!config) {
    return 1;
  }
  if (!setup_logging(config->logging)) {
    return 1;
  }

  Application app(std::move(*config));
  if (auto r = app.open(); !r) {
    std::println(stderr, "Error: {}", r.error().message());
    return 1;
  }

  auto before = app.scheduler().list();
  auto dispatched = app.scheduler().run_pending();

  std::size_t failed = 0;
  for (const auto& task : app.scheduler().list()) {
    for (const auto& old : before) {
      if (old.id == task.id && old.status == TaskStatus::Pending &&
          task.status == TaskStatus::Failed) {
        ++failed;
      }
    }
  }
  std::println("Ran {} due tasks, {} failed", dispatched, failed);
  return failed > 0 ? 1 : 0;
}

}  // namespace ferry::cli
