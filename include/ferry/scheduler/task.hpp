#pragma once

#include "ferry/util/id.hpp"
#include "ferry/util/time.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>

namespace ferry {

enum class TaskType : std::uint8_t {
  Upload,
  Download,
  Delete,
};

enum class TaskStatus : std::uint8_t {
  Pending,
  Running,
  Completed,
  Failed,
};

[[nodiscard]] constexpr auto is_valid(TaskType type) noexcept -> bool {
  return type == TaskType::Upload || type == TaskType::Download ||
         type == TaskType::Delete;
}

[[nodiscard]] constexpr auto needs_destination(TaskType type) noexcept
    -> bool {
  return type != TaskType::Delete;
}

// Upper bound for interval_minutes and for "run in N minutes" delays; keeps
// every computed schedule inside the range of TimePoint.
inline constexpr int kMaxIntervalMinutes = 60 * 24 * 366 * 10;

struct TaskRecord {
  TaskId id;
  TaskType type{TaskType::Upload};
  std::string source;
  std::optional<std::string> destination;
  TimePoint scheduled_at{};
  bool recurring{false};
  std::optional<int> interval_minutes;
  TaskStatus status{TaskStatus::Pending};
  std::optional<TimePoint> last_run_at;
  std::optional<std::string> last_error;
  TimePoint created_at{};

  // Fields found in the task file that this version does not know about;
  // written back untouched.
  nlohmann::json extensions = nlohmann::json::object();

  [[nodiscard]] auto is_due(TimePoint now) const noexcept -> bool {
    return status == TaskStatus::Pending && scheduled_at <= now;
  }

  friend auto operator==(const TaskRecord&, const TaskRecord&)
      -> bool = default;
};

// What a caller supplies to Scheduler::add; the scheduler fills in the id,
// status and timestamps.
struct TaskRequest {
  TaskType type{TaskType::Upload};
  std::string source;
  std::optional<std::string> destination;
  TimePoint scheduled_at{};
  bool recurring{false};
  std::optional<int> interval_minutes;
};

// A task change written by a process that could not take the task file
// lock; the lock owner applies it.
struct ControlRequest {
  enum class Kind : std::uint8_t { Add, Remove };

  Kind kind{Kind::Add};
  TaskRequest task;  // Add
  TaskId id;         // Remove
};

// One execution attempt, as reported to observers and the run history.
struct RunRecord {
  TaskId task_id;
  TaskType type{TaskType::Upload};
  std::string source;
  std::optional<std::string> destination;
  TimePoint started_at{};
  TimePoint finished_at{};
  bool succeeded{false};
  std::string error;
  std::int64_t bytes_done{0};
};

struct ProgressEvent {
  std::int64_t bytes_done{0};
  std::int64_t bytes_total{0};
};

}  // namespace ferry
