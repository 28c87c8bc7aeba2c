#pragma once

#include "ferry/core/error.hpp"
#include "ferry/scheduler/task.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace ferry {

enum class LoadOutcome : std::uint8_t {
  Loaded,
  Missing,
  Unreadable,
  Corrupt,
};

[[nodiscard]] constexpr auto load_outcome_name(LoadOutcome outcome) noexcept
    -> std::string_view {
  switch (outcome) {
    case LoadOutcome::Loaded: return "loaded";
    case LoadOutcome::Missing: return "missing";
    case LoadOutcome::Unreadable: return "unreadable";
    case LoadOutcome::Corrupt: return "corrupt";
  }
  return "unknown";
}

// Ordered id -> TaskRecord map backed by a JSON file. Not synchronized: the
// owner serializes access.
class TaskStore {
public:
  explicit TaskStore(std::string path);

  TaskStore(const TaskStore&) = delete;
  TaskStore& operator=(const TaskStore&) = delete;
  TaskStore(TaskStore&&) = default;
  TaskStore& operator=(TaskStore&&) = default;

  // Replaces the in-memory records with the file's. Never fails: a missing,
  // unreadable or corrupt file leaves the store empty. An unreadable or
  // corrupt file is left on disk and copied to <path>.<outcome>-<stamp>
  // before the next save() replaces it; if that copy fails, save() does too.
  auto load() -> LoadOutcome;

  // Atomic: temp file + fsync + rename + directory fsync.
  [[nodiscard]] auto save() -> Result<void>;

  [[nodiscard]] auto add(TaskRecord record) -> Result<void>;
  [[nodiscard]] auto remove(const TaskId& id) -> Result<void>;
  [[nodiscard]] auto update(const TaskRecord& record) -> Result<void>;
  [[nodiscard]] auto get(const TaskId& id) const -> Result<TaskRecord>;

  // Points into the store; invalidated by add() and remove().
  [[nodiscard]] auto find(const TaskId& id) -> TaskRecord*;
  [[nodiscard]] auto find(const TaskId& id) const -> const TaskRecord*;

  [[nodiscard]] auto contains(const TaskId& id) const -> bool;

  // Copy in insertion order.
  [[nodiscard]] auto list() const -> std::vector<TaskRecord>;

  [[nodiscard]] auto size() const noexcept -> std::size_t {
    return records_.size();
  }
  [[nodiscard]] auto empty() const noexcept -> bool {
    return records_.empty();
  }
  [[nodiscard]] auto path() const noexcept -> const std::string& {
    return path_;
  }

private:
  auto rebuild_index() -> void;
  [[nodiscard]] auto backup_unusable_file(LoadOutcome outcome)
      -> Result<void>;
  [[nodiscard]] auto write_atomically(const std::string& content)
      -> Result<void>;

  std::string path_;
  std::vector<TaskRecord> records_;
  std::unordered_map<std::string, std::size_t, StringHash, StringEqual> index_;
  std::optional<LoadOutcome> preserve_on_disk_;
};

}  // namespace ferry
