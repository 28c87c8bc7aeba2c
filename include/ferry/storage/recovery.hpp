#pragma once

#include "ferry/core/error.hpp"
#include "ferry/storage/task_store.hpp"
#include "ferry/util/id.hpp"

#include <string_view>
#include <vector>

namespace ferry {

inline constexpr std::string_view kInterruptedError =
    "interrupted: process exited while the transfer was running";

struct RecoveryResult {
  std::vector<TaskId> interrupted;
};

// A record still marked Running on disk belongs to a process that died
// mid-transfer. It becomes Failed and is never re-run automatically.
class Recovery {
public:
  explicit Recovery(TaskStore& store);

  // In-memory state is repaired even when persisting it fails; the error is
  // then PersistenceFailure.
  [[nodiscard]] auto recover() -> Result<RecoveryResult>;

private:
  TaskStore& store_;
};

}  // namespace ferry
