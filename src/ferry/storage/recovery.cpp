#include "ferry/storage/recovery.hpp"

#include "ferry/util/log.hpp"

namespace ferry {

Recovery::Recovery(TaskStore& store) : store_(store) {
}

auto Recovery::recover() -> Result<RecoveryResult> {
  RecoveryResult result;

  for (const auto& record : store_.list()) {
    if (record.status != TaskStatus::Running) {
      continue;
    }
    auto* task = store_.find(record.id);
    task->status = TaskStatus::Failed;
    task->last_error = std::string{kInterruptedError};
    result.interrupted.push_back(record.id);
    log::warn("Task {} was running when the process exited, marked failed",
              record.id);
  }

  if (result.interrupted.empty()) {
    return result;
  }

  if (auto r = store_.save(); !r) {
    log::error("Failed to persist recovered tasks: {}", r.error().message());
    return fail(r.error());
  }
  log::info("Recovered {} interrupted tasks", result.interrupted.size());
  return result;
}

}  // namespace ferry
