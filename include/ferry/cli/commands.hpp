#pragma once

#include "ferry/config/system_config.hpp"
#include "ferry/core/error.hpp"
#include "ferry/scheduler/task.hpp"
#include "ferry/transfer/connector.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace ferry::cli {

struct ServeOptions {
  std::string config_file;
  bool daemon{false};
};

struct AddOptions {
  std::string config_file;
  std::string type;
  std::string source;
  std::optional<std::string> destination;
  std::optional<std::string> at;
  std::optional<int> in_minutes;
  std::optional<int> every_minutes;
};

struct ListOptions {
  std::string config_file;
};

struct RemoveOptions {
  std::string config_file;
  std::string id;
};

struct RunDueOptions {
  std::string config_file;
};

struct HistoryOptions {
  std::string config_file;
  std::string task_id;
  std::size_t limit{20};
};

struct LsOptions {
  std::string config_file;
  std::string remote_dir{"/"};
};

// put, get and rm: one operation right away, outside the task file.
struct TransferOptions {
  std::string config_file;
  TaskType type{TaskType::Upload};
  std::string source;
  std::optional<std::string> destination;
};

struct CheckOptions {
  std::string config_file;
};

struct ValidateOptions {
  std::string config_file;
};

[[nodiscard]] auto cmd_serve(const ServeOptions& opts) -> int;
[[nodiscard]] auto cmd_add(const AddOptions& opts) -> int;
[[nodiscard]] auto cmd_list(const ListOptions& opts) -> int;
[[nodiscard]] auto cmd_remove(const RemoveOptions& opts) -> int;
[[nodiscard]] auto cmd_run_due(const RunDueOptions& opts) -> int;
[[nodiscard]] auto cmd_history(const HistoryOptions& opts) -> int;
[[nodiscard]] auto cmd_ls(const LsOptions& opts) -> int;
[[nodiscard]] auto cmd_validate(const ValidateOptions& opts) -> int;
[[nodiscard]] auto cmd_transfer(const TransferOptions& opts) -> int;
[[nodiscard]] auto cmd_check(const CheckOptions& opts) -> int;

// Shared by the commands above.

// Defaults when path is empty. Prints the error to stderr.
[[nodiscard]] auto load_config(std::string_view path, bool check_connector)
    -> Result<SystemConfig>;

// Applies logging.level and logging.file; false if the file cannot be opened.
[[nodiscard]] auto setup_logging(const LoggingConfig& config) -> bool;

// Turns add options into a request: --at/--in pick the first run (default
// now), --every makes it recurring, relative destinations are resolved
// against the configured directories.
[[nodiscard]] auto build_request(const AddOptions& opts,
                                 const PathsConfig& paths, TimePoint now)
    -> Result<TaskRequest>;

// Relative upload destinations go under paths.remote_upload_dir, relative
// download destinations under paths.local_download_dir.
[[nodiscard]] auto resolve_destination(TaskType type, const std::string& dest,
                                       const PathsConfig& paths) -> std::string;

// Connects if needed, then runs one operation. NotConnected if the
// connection fails, TransferFailure if the operation does; the connector's
// reason is printed to stderr.
[[nodiscard]] auto transfer_now(ITransferConnector& connector, TaskType type,
                                const std::string& source,
                                const std::string& destination) -> Result<void>;

// Full id or unique prefix. NotFound if nothing matches, InvalidArgument if
// the prefix is ambiguous.
[[nodiscard]] auto resolve_task_id(const std::vector<TaskRecord>& tasks,
                                   std::string_view id_or_prefix)
    -> Result<TaskId>;

}  // namespace ferry::cli
