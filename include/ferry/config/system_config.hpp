#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace ferry {

struct StorageConfig {
  std::string tasks_file{"scheduled_tasks.json"};
  std::string history_db{"ferry_history.db"};
  int history_keep{1000};
};

inline constexpr int kMaxPollIntervalSec = 24 * 60 * 60;

struct SchedulerConfig {
  int poll_interval_sec{10};
  bool autostart{true};
};

struct LoggingConfig {
  std::string level{"info"};
  std::string file;
};

enum class ConnectorType : std::uint8_t { Command, Local };

[[nodiscard]] constexpr auto connector_type_name(ConnectorType type) noexcept
    -> std::string_view {
  switch (type) {
    case ConnectorType::Command: return "command";
    case ConnectorType::Local: return "local";
  }
  return "command";
}

[[nodiscard]] inline auto parse_connector_type(std::string_view str) noexcept
    -> std::optional<ConnectorType> {
  if (str == "command") return ConnectorType::Command;
  if (str == "local") return ConnectorType::Local;
  return std::nullopt;
}

// Shell command templates. Placeholders: {local} {remote} {remote_shell}
// {host} {port} {user} {identity}. {remote_shell} is quoted twice, for
// paths that a remote shell parses again (everything run through ssh).
struct CommandTemplates {
  std::string connect{
      "ssh -p {port} {identity} -o BatchMode=yes {user}@{host} true"};
  std::string mkdir{"ssh -p {port} {identity} -o BatchMode=yes {user}@{host} "
                    "mkdir -p -- {remote_shell}"};
  std::string upload{"ssh -p {port} {identity} -o BatchMode=yes {user}@{host} "
                     "cat \\> {remote_shell} < {local}"};
  std::string download{"ssh -p {port} {identity} -o BatchMode=yes "
                       "{user}@{host} cat -- {remote_shell} > {local}"};
  std::string remove{"ssh -p {port} {identity} -o BatchMode=yes {user}@{host} "
                     "rm -f -- {remote_shell}"};
  std::string list{"ssh -p {port} {identity} -o BatchMode=yes {user}@{host} "
                   "ls -1Ap -- {remote_shell}"};

  friend auto operator==(const CommandTemplates&, const CommandTemplates&)
      -> bool = default;
};

struct ConnectorConfig {
  ConnectorType type{ConnectorType::Command};
  std::string host;
  int port{22};
  std::string username;
  std::string private_key_path;
  std::string root{"./remote"};
  int command_timeout_sec{0};
  CommandTemplates commands;
};

struct PathsConfig {
  std::string remote_upload_dir{"/"};
  std::string local_download_dir{"./downloads"};
};

struct SystemConfig {
  StorageConfig storage;
  SchedulerConfig scheduler;
  LoggingConfig logging;
  ConnectorConfig connector;
  PathsConfig paths;
};

}  // namespace ferry
