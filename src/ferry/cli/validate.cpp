#include "ferry/cli/commands.hpp"
#include "ferry/config/config.hpp"

#include <print>

namespace ferry::cli {

auto cmd_validate(const ValidateOptions& opts) -> int {
  if (opts.config_file.empty()) {
    std::println(stderr, "Error: validate requires -c <config>");
    return 1;
  }
  auto config = load_config(opts.config_file, true);
  if (!config) {
    std::println("✗ {}", opts.config_file);
    return 1;
  }

  std::println("✓ {} - Valid", opts.config_file);
  std::print("\n{}", ConfigLoader::to_string(*config));
  return 0;
}

}  // namespace ferry::cli
