#include "ferry/app/application.hpp"
#include "ferry/cli/commands.hpp"
#include "ferry/util/daemon.hpp"
#include "ferry/util/log.hpp"

#include <print>

namespace ferry::cli {

auto cmd_serve(const ServeOptions& opts) -> int {
  auto result = load_config(opts.config_file, true);
  if (!result) {
    return 1;
  }
  auto config = std::move(*result);

  if (opts.daemon && config.logging.file.empty()) {
    std::println(stderr, "Error: --daemon requires logging.file in the config");
    return 1;
  }
  if (!setup_logging(config.logging)) {
    return 1;
  }

  if (opts.daemon && !daemonize()) {
    std::println(stderr, "Error: Failed to daemonize");
    return 1;
  }

  log::start();

  Application app(std::move(config));
  if (auto r = app.open(); !r) {
    log::error("Initialization failed: {}", r.error().message());
    log::stop();
    return 1;
  }

  setup_signal_handlers();

  const auto& cfg = app.config();
  log::info("ferry serving {} ({} connector)", cfg.storage.tasks_file,
            connector_type_name(cfg.connector.type));

  if (cfg.scheduler.autostart) {
    app.start();
  } else {
    log::info("scheduler.autostart is off; waiting for shutdown");
  }

  wait_for_shutdown();
  log::info("Received shutdown signal, stopping...");
  app.stop();

  log::info("ferry stopped.");
  log::stop();
  return 0;
}

}  // namespace ferry::cli
