#pragma once

#include "ferry/core/error.hpp"
#include "ferry/scheduler/task.hpp"

#include <cstddef>
#include <filesystem>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace ferry {

// Directory of queued control requests, one JSON file each. Any process may
// submit; only the holder of the task file lock drains.
class RequestSpool {
public:
  // Applies one request. TaskRunning keeps it queued for the next drain.
  using Handler = std::function<Result<void>(const ControlRequest&)>;

  explicit RequestSpool(std::filesystem::path directory);

  // "<tasks_file>.spool"
  [[nodiscard]] static auto for_tasks_file(std::string_view tasks_file)
      -> std::filesystem::path;

  // Writes the request under a temporary name and renames it into place, so
  // a drain never sees a partial file. Returns the queued file name.
  [[nodiscard]] auto submit(const ControlRequest& request)
      -> Result<std::string>;

  // Hands queued requests to the handler oldest first and returns how many
  // it accepted. Accepted requests are deleted. Files that do not decode,
  // and requests the handler refuses for any reason but TaskRunning, are
  // renamed to "*.rejected".
  auto drain(const Handler& handler) -> std::size_t;

  // Requests waiting to be drained.
  [[nodiscard]] auto pending() const -> std::size_t;

  [[nodiscard]] auto directory() const noexcept
      -> const std::filesystem::path& {
    return directory_;
  }

private:
  [[nodiscard]] auto queued_files() const -> std::vector<std::filesystem::path>;
  auto reject(const std::filesystem::path& file) -> void;

  std::filesystem::path directory_;
};

}  // namespace ferry
