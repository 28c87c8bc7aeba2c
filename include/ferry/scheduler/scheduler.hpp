#pragma once

#include "ferry/core/error.hpp"
#include "ferry/scheduler/task.hpp"
#include "ferry/storage/task_store.hpp"
#include "ferry/transfer/connector.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace ferry {

// InvalidTask unless the request describes a runnable task. Drops the
// destination of a Delete request.
[[nodiscard]] auto validate_request(TaskRequest& request) -> Result<void>;

// Owns the task store and the background loop that dispatches due tasks to
// the connector one at a time. Every public method is thread-safe.
class Scheduler {
public:
  using ProgressObserver =
      std::function<void(const TaskId&, const ProgressEvent&)>;
  using RunObserver = std::function<void(const RunRecord&)>;
  using PassHook = std::function<void()>;

  Scheduler(TaskStore store, ITransferConnector& connector,
            std::chrono::seconds poll_interval);
  ~Scheduler();

  Scheduler(const Scheduler&) = delete;
  auto operator=(const Scheduler&) -> Scheduler& = delete;

  // InvalidTask when the request is malformed. PersistenceFailure means the
  // task exists in memory but is not on disk yet.
  [[nodiscard]] auto add(TaskRequest request) -> Result<TaskId>;

  // NotFound, TaskRunning while the transfer is in flight, or
  // PersistenceFailure (removed from memory only).
  [[nodiscard]] auto remove(const TaskId& id) -> Result<void>;

  [[nodiscard]] auto list() const -> std::vector<TaskRecord>;
  [[nodiscard]] auto get(const TaskId& id) const -> Result<TaskRecord>;

  // Idempotent. The first pass runs right away.
  auto start() -> void;
  // Idempotent. Waits for the current transfer; does not interrupt it.
  // Concurrent start()/stop() calls are serialized.
  auto stop() -> void;
  auto wake() -> void;

  // One pass on the calling thread; never overlaps the loop's passes.
  // Returns the number of tasks dispatched.
  auto run_pending() -> std::size_t;

  [[nodiscard]] auto is_running() const noexcept -> bool {
    return running_.load();
  }
  [[nodiscard]] auto poll_interval() const noexcept -> std::chrono::seconds {
    return poll_interval_;
  }

  // Set before start(); called on the thread running the pass.
  auto set_on_progress(ProgressObserver cb) -> void;
  auto set_on_run_finished(RunObserver cb) -> void;
  // Runs on the loop thread before every pass, with no lock held.
  auto set_before_pass(PassHook hook) -> void;

private:
  auto run_loop() -> void;
  auto run_pass() -> std::size_t;
  auto run_task(const TaskId& id) -> bool;
  [[nodiscard]] auto execute(const TaskRecord& task, std::int64_t& bytes_done)
      -> TransferResult<void>;
  auto persist(std::string_view context) -> Result<void>;
  auto notify_run_finished(const RunRecord& run) -> void;

  mutable std::mutex store_mu_;
  TaskStore store_;

  std::mutex pass_mu_;
  std::mutex lifecycle_mu_;
  ITransferConnector& connector_;
  std::chrono::seconds poll_interval_;

  std::atomic<bool> running_{false};
  std::atomic<bool> stopping_{false};
  int wake_fd_{-1};
  std::thread loop_thread_;

  ProgressObserver on_progress_;
  RunObserver on_run_finished_;
  PassHook before_pass_;
};

}  // namespace ferry
