#include "ferry/app/application.hpp"
#include "ferry/cli/commands.hpp"

#include <print>

namespace ferry::cli {

auto cmd_ls(const LsOptions& opts) -> int {
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
    std::println(stderr, "Error: {}", r.error());
    return 1;
  }
  auto entries = remote.list(opts.remote_dir);
  remote.disconnect();
  if (!entries) {
    std::println(stderr, "Error: {}", entries.error());
    return 1;
  }

  std::println("{}:", opts.remote_dir);
  for (const auto& entry : *entries) {
    if (entry.is_dir) {
      std::println("  [DIR]  {}/", entry.name);
    } else {
      std::println("  [FILE] {} ({} bytes)", entry.name, entry.size);
    }
  }
  return 0;
}

}  // namespace ferry::cli
