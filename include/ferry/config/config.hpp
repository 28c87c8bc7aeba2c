#pragma once

#include "ferry/config/system_config.hpp"
#include "ferry/core/error.hpp"

#include <string>
#include <string_view>

namespace ferry {

class ConfigLoader {
public:
  // FileNotFound if the file cannot be opened, ParseError on bad YAML. An
  // empty document yields the defaults.
  [[nodiscard]] static auto load_from_file(std::string_view path)
      -> Result<SystemConfig>;
  [[nodiscard]] static auto load_from_string(std::string_view yaml_str)
      -> Result<SystemConfig>;

  // InvalidArgument, with the reason logged. Commands that never touch the
  // remote side skip the connector section.
  [[nodiscard]] static auto validate(const SystemConfig& config,
                                     bool check_connector = true)
      -> Result<void>;

  // Effective configuration, keys at their default omitted.
  [[nodiscard]] static auto to_string(const SystemConfig& config)
      -> std::string;
};

}  // namespace ferry
