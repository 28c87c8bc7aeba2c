#pragma once

#include "ferry/scheduler/task.hpp"

#include <algorithm>
#include <array>
#include <optional>
#include <string_view>
#include <utility>

namespace ferry {

namespace detail {

constexpr std::array<std::string_view, 3> kTaskTypeNames = {
    "upload",
    "download",
    "delete",
};

constexpr std::array<std::string_view, 4> kTaskStatusNames = {
    "pending",
    "running",
    "completed",
    "failed",
};

}  // namespace detail

[[nodiscard]] inline auto task_type_name(TaskType type) noexcept
    -> std::string_view {
  auto idx = std::to_underlying(type);
  return idx < detail::kTaskTypeNames.size() ? detail::kTaskTypeNames[idx]
                                             : "unknown";
}

// Unlike the display helpers, parsing is strict: an unknown name in the task
// file means the file is not ours to interpret.
[[nodiscard]] inline auto parse_task_type(std::string_view name) noexcept
    -> std::optional<TaskType> {
  auto it = std::ranges::find(detail::kTaskTypeNames, name);
  if (it == detail::kTaskTypeNames.end()) {
    return std::nullopt;
  }
  return static_cast<TaskType>(
      std::ranges::distance(detail::kTaskTypeNames.begin(), it));
}

[[nodiscard]] inline auto task_status_name(TaskStatus status) noexcept
    -> std::string_view {
  auto idx = std::to_underlying(status);
  return idx < detail::kTaskStatusNames.size() ? detail::kTaskStatusNames[idx]
                                               : "unknown";
}

[[nodiscard]] inline auto parse_task_status(std::string_view name) noexcept
    -> std::optional<TaskStatus> {
  auto it = std::ranges::find(detail::kTaskStatusNames, name);
  if (it == detail::kTaskStatusNames.end()) {
    return std::nullopt;
  }
  return static_cast<TaskStatus>(
      std::ranges::distance(detail::kTaskStatusNames.begin(), it));
}

}  // namespace ferry
