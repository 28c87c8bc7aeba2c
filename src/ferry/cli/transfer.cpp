#include "ferry/app/application.hpp"
#include "ferry/cli/commands.hpp"
#include "ferry/storage/state_strings.hpp"

#include <print>

namespace ferry::cli {

auto cmd_transfer(const TransferOptions& opts) -> int {
  auto config = load_config(opts.config_file, true);
  if (!config) {
    return 1;
  }
  if (!setup_logging(config->logging)) {
    return 1;
  }

  std::string destination;
  if (needs_destination(opts.type)) {
    if (!opts.destination || opts.destination->empty()) {
      std::println(stderr, "Error: {} needs a destination",
                   task_type_name(opts.type));
      return 1;
    }
    destination =
        resolve_destination(opts.type, *opts.destination, config->paths);
  }

  auto connector = create_connector(config->connector);
  if (!connector) {
    std::println(stderr, "Error: {}", connector.error().message());
    return 1;
  }
  auto& remote = **connector;

  auto r = transfer_now(remote, opts.type, opts.source, destination);
  remote.disconnect();
  if (!r) {
    return 1;
  }

  switch (opts.type) {
    case TaskType::Upload:
      std::println("Uploaded {} -> {}", opts.source, destination);
      break;
    case TaskType::Download:
      std::println("Downloaded {} -> {}", opts.source, destination);
      break;
    case TaskType::Delete:
      std::println("Deleted {}", opts.source);
      break;
  }
  return 0;
}

auto cmd_check(const CheckOptions& opts) -> int {
  auto config = load_config(opts.config_file, true);
  if (!config) {
    return 1;
  }
  if (!setup_logging(config->logging)) {
    return 1;
  }

  auto connector = create_connector(config->connector);
  if (!connector) {
    std::println(stderr, "Error: {}", connector.error().message());
    return 1;
  }
  auto& remote = **connector;

  if (auto r = remote.connect(); !r) {
    std::println(stderr, "Connection failed: {}", r.error());
    return 1;
  }
  remote.disconnect();
  std::println("Connection OK");
  return 0;
}

}  // namespace ferry::cli
