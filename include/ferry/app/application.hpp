#pragma once

#include "ferry/config/system_config.hpp"
#include "ferry/core/error.hpp"
#include "ferry/scheduler/scheduler.hpp"
#include "ferry/storage/request_spool.hpp"
#include "ferry/storage/run_history.hpp"
#include "ferry/storage/task_store.hpp"
#include "ferry/transfer/connector.hpp"
#include "ferry/util/file_lock.hpp"

#include <memory>

namespace ferry {

[[nodiscard]] auto create_connector(const ConnectorConfig& config)
    -> Result<std::unique_ptr<ITransferConnector>>;

// Wires config, task file, connector, run history and scheduler together.
class Application {
public:
  explicit Application(SystemConfig config);
  ~Application();

  Application(const Application&) = delete;
  auto operator=(const Application&) -> Application& = delete;

  // Locks and loads the task file, repairs interrupted tasks, opens the run
  // history, builds the scheduler and applies queued control requests.
  // Locked if another process owns the task file.
  [[nodiscard]] auto open() -> Result<void>;
  [[nodiscard]] auto is_open() const noexcept -> bool {
    return scheduler_ != nullptr;
  }

  // Applies queued control requests; the scheduler also calls this before
  // every pass while running. Returns how many were applied.
  auto apply_queued_requests() -> std::size_t;

  auto start() -> void;
  auto stop() -> void;
  [[nodiscard]] auto is_running() const noexcept -> bool;

  // Valid after a successful open().
  [[nodiscard]] auto scheduler() -> Scheduler& {
    return *scheduler_;
  }
  [[nodiscard]] auto connector() -> ITransferConnector& {
    return *connector_;
  }

  // nullptr when history is disabled or failed to open.
  [[nodiscard]] auto history() -> RunHistory* {
    return history_.get();
  }

  [[nodiscard]] auto spool() -> RequestSpool& {
    return spool_;
  }

  [[nodiscard]] auto config() const noexcept -> const SystemConfig& {
    return config_;
  }
  [[nodiscard]] auto load_outcome() const noexcept -> LoadOutcome {
    return load_outcome_;
  }

private:
  auto setup_callbacks() -> void;
  auto open_history() -> void;

  SystemConfig config_;
  FileLock lock_;
  LoadOutcome load_outcome_{LoadOutcome::Missing};
  RequestSpool spool_;

  std::unique_ptr<ITransferConnector> connector_;
  std::unique_ptr<RunHistory> history_;
  std::unique_ptr<Scheduler> scheduler_;
};

}  // namespace ferry
