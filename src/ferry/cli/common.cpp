#include "ferry/cli/commands.hpp"

#include "ferry/config/config.hpp"
#include "ferry/storage/state_strings.hpp"
#include "ferry/util/log.hpp"

#include <cstdint>
#include <filesystem>
#include <print>

namespace ferry::cli {

namespace {

auto join_remote(std::string_view dir, std::string_view name) -> std::string {
  if (dir.empty()) {
    return std::string(name);
  }
  std::string out{dir};
  if (out.back() != '/') {
    out += '/';
  }
  out += name;
  return out;
}

}  // namespace

auto load_config(std::string_view path, bool check_connector)
    -> Result<SystemConfig> {
  SystemConfig config;
  if (!path.empty()) {
    auto result = ConfigLoader::load_from_file(path);
    if (!result) {
      std::println(stderr, "Error: {}: {}", path, result.error().message());
      return fail(result.error());
    }
    config = std::move(*result);
  }
  if (auto r = ConfigLoader::validate(config, check_connector); !r) {
    std::println(stderr, "Error: invalid configuration");
    return fail(r.error());
  }
  return config;
}

auto setup_logging(const LoggingConfig& config) -> bool {
  log::set_level(config.level);
  if (!config.file.empty() && !log::set_file(config.file)) {
    std::println(stderr, "Error: Failed to open log file: {}", config.file);
    return false;
  }
  return true;
}

auto build_request(const AddOptions& opts, const PathsConfig& paths,
                   TimePoint now) -> Result<TaskRequest> {
  TaskRequest request;

  auto type = parse_task_type(opts.type);
  if (!type) {
    std::println(stderr, "Error: --type must be upload, download or delete");
    return fail(Error::InvalidArgument);
  }
  request.type = *type;
  request.source = opts.source;

  if (opts.destination && needs_destination(request.type)) {
    request.destination =
        resolve_destination(request.type, *opts.destination, paths);
  } else if (opts.destination) {
    std::println(stderr, "Error: --dest is not used by delete tasks");
    return fail(Error::InvalidArgument);
  }

  if (opts.at && opts.in_minutes) {
    std::println(stderr, "Error: use either --at or --in, not both");
    return fail(Error::InvalidArgument);
  }
  request.scheduled_at = now;
  if (opts.at) {
    auto at = parse_iso8601(*opts.at);
    if (!at) {
      std::println(stderr, "Error: --at: cannot parse '{}' as ISO-8601",
                   *opts.at);
      return fail(Error::InvalidArgument);
    }
    request.scheduled_at = *at;
  } else if (opts.in_minutes) {
    if (*opts.in_minutes < 0 || *opts.in_minutes > kMaxIntervalMinutes) {
      std::println(stderr, "Error: --in must be in 0..{}", kMaxIntervalMinutes);
      return fail(Error::InvalidArgument);
    }
    request.scheduled_at = now + std::chrono::minutes(*opts.in_minutes);
  }

  if (opts.every_minutes) {
    if (*opts.every_minutes <= 0 || *opts.every_minutes > kMaxIntervalMinutes) {
      std::println(stderr, "Error: --every must be in 1..{}",
                   kMaxIntervalMinutes);
      return fail(Error::InvalidArgument);
    }
    request.recurring = true;
    request.interval_minutes = *opts.every_minutes;
  }
  return request;
}

auto resolve_destination(TaskType type, const std::string& dest,
                         const PathsConfig& paths) -> std::string {
  if (type == TaskType::Upload && !dest.starts_with('/')) {
    return join_remote(paths.remote_upload_dir, dest);
  }
  if (type == TaskType::Download && std::filesystem::path{dest}.is_relative()) {
    return (std::filesystem::path{paths.local_download_dir} / dest).string();
  }
  return dest;
}

auto transfer_now(ITransferConnector& connector, TaskType type,
                  const std::string& source, const std::string& destination)
    -> Result<void> {
  if (!connector.is_connected()) {
    if (auto r = connector.connect(); !r) {
      std::println(stderr, "Error: {}", r.error());
      return fail(Error::NotConnected);
    }
  }

  auto report = [](std::int64_t done, std::int64_t total) {
    log::debug("{}/{} bytes", done, total);
  };
  TransferResult<void> r;
  switch (type) {
    case TaskType::Upload:
      r = connector.upload(source, destination, report);
      break;
    case TaskType::Download:
      r = connector.download(source, destination, report);
      break;
    case TaskType::Delete:
      r = connector.remove(source);
      break;
  }
  if (!r) {
    std::println(stderr, "Error: {}", r.error());
    return fail(Error::TransferFailure);
  }
  return ok();
}

auto resolve_task_id(const std::vector<TaskRecord>& tasks,
                     std::string_view id_or_prefix) -> Result<TaskId> {
  if (id_or_prefix.empty()) {
    return fail(Error::NotFound);
  }

  for (const auto& task : tasks) {
    if (task.id.value() == id_or_prefix) {
      return task.id;
    }
  }

  const TaskRecord* match = nullptr;
  for (const auto& task : tasks) {
    if (task.id.starts_with(id_or_prefix)) {
      if (match) {
        return fail(Error::InvalidArgument);
      }
      match = &task;
    }
  }
  if (!match) {
    return fail(Error::NotFound);
  }
  return match->id;
}

}  // namespace ferry::cli
