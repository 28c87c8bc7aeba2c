#include "ferry/app/application.hpp"
#include "ferry/cli/commands.hpp"

#include <print>

namespace ferry::cli {

namespace {

// The task file belongs to a running `ferry serve`; leave the request in its
// spool instead.
auto queue_for_owner(const SystemConfig& config, TaskRequest request) -> int {
  if (auto r = validate_request(request); !r) {
    std::println(stderr, "Error: {}", r.error().message());
    return 1;
  }
  RequestSpool spool{RequestSpool::for_tasks_file(config.storage.tasks_file)};
  auto queued = spool.submit(
      ControlRequest{.kind = ControlRequest::Kind::Add,
                     .task = std::move(request)});
  if (!queued) {
    std::println(stderr, "Error: {}", queued.error().message());
    return 1;
  }
  std::println("Queued as {}; the running scheduler adds it within {}s",
               *queued, config.scheduler.poll_interval_sec);
  return 0;
}

}  // namespace

auto cmd_add(const AddOptions& opts) -> int {
  auto config = load_config(opts.config_file, false);
  if (!config) {
    return 1;
  }
  if (!setup_logging(config->logging)) {
    return 1;
  }

  auto request = build_request(opts, config->paths, Clock::now());
  if (!request) {
    return 1;
  }

  Application app(*config);
  if (auto r = app.open(); !r) {
    if (r.error() == Error::Locked) {
      return queue_for_owner(*config, std::move(*request));
    }
    std::println(stderr, "Error: {}", r.error().message());
    return 1;
  }

  auto id = app.scheduler().add(std::move(*request));
  if (!id) {
    std::println(stderr, "Error: {}", id.error().message());
    return 1;
  }
  std::println("{}", *id);
  return 0;
}

}  // namespace ferry::cli
