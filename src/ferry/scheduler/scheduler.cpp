#include "ferry/scheduler/scheduler.hpp"

#include "ferry/storage/state_strings.hpp"
#include "ferry/util/log.hpp"

#include <sys/eventfd.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <limits>

#include <poll.h>
#include <unistd.h>

namespace ferry {

auto validate_request(TaskRequest& request) -> Result<void> {
  if (!is_valid(request.type)) {
    log::warn("Rejected task: unknown type");
    return fail(Error::InvalidTask);
  }
  if (request.source.empty()) {
    log::warn("Rejected task: empty source");
    return fail(Error::InvalidTask);
  }
  if (needs_destination(request.type)) {
    if (!request.destination || request.destination->empty()) {
      log::warn("Rejected {} task: destination required",
                task_type_name(request.type));
      return fail(Error::InvalidTask);
    }
  } else {
    request.destination.reset();
  }
  if (request.recurring) {
    if (!request.interval_minutes || *request.interval_minutes <= 0) {
      log::warn("Rejected recurring task: interval must be positive");
      return fail(Error::InvalidTask);
    }
    if (*request.interval_minutes > kMaxIntervalMinutes) {
      log::warn("Rejected recurring task: interval exceeds {} minutes",
                kMaxIntervalMinutes);
      return fail(Error::InvalidTask);
    }
  } else if (request.interval_minutes) {
    log::warn("Rejected task: interval given for a one-shot task");
    return fail(Error::InvalidTask);
  }
  return ok();
}

Scheduler::Scheduler(TaskStore store, ITransferConnector& connector,
                     std::chrono::seconds poll_interval)
    : store_(std::move(store)),
      connector_(connector),
      poll_interval_(poll_interval) {
  wake_fd_ = eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
  if (wake_fd_ < 0) {
    log::error("Failed to create eventfd: {}", std::strerror(errno));
  }
}

Scheduler::~Scheduler() {
  stop();
  if (wake_fd_ >= 0) {
    close(wake_fd_);
    wake_fd_ = -1;
  }
}

auto Scheduler::add(TaskRequest request) -> Result<TaskId> {
  if (auto r = validate_request(request); !r) {
    return fail(r.error());
  }

  auto now = truncate_ms(Clock::now());
  TaskRecord record;
  record.id = generate_task_id();
  record.type = request.type;
  record.source = std::move(request.source);
  record.destination = std::move(request.destination);
  record.scheduled_at = truncate_ms(request.scheduled_at);
  record.recurring = request.recurring;
  record.interval_minutes = request.interval_minutes;
  record.status = TaskStatus::Pending;
  record.created_at = now;

  auto id = record.id;
  bool due = record.scheduled_at <= now;
  {
    std::lock_guard lock(store_mu_);
    if (auto r = store_.add(std::move(record)); !r) {
      return fail(r.error());
    }
    log::info("Added {} task {}", task_type_name(request.type), id);
    if (auto r = persist("add"); !r) {
      log::error("Task {} is scheduled but not yet saved to {}", id,
                 store_.path());
      if (due) {
        wake();
      }
      return fail(r.error());
    }
  }

  if (due) {
    wake();
  }
  return id;
}

auto Scheduler::remove(const TaskId& id) -> Result<void> {
  std::lock_guard lock(store_mu_);
  const auto* record = store_.find(id);
  if (!record) {
    return fail(Error::NotFound);
  }
  if (record->status == TaskStatus::Running) {
    return fail(Error::TaskRunning);
  }
  if (auto r = store_.remove(id); !r) {
    return r;
  }
  log::info("Removed task {}", id);
  if (auto r = persist("remove"); !r) {
    log::error("Task {} is removed but still present in {}", id,
               store_.path());
    return r;
  }
  return ok();
}

auto Scheduler::list() const -> std::vector<TaskRecord> {
  std::lock_guard lock(store_mu_);
  return store_.list();
}

auto Scheduler::get(const TaskId& id) const -> Result<TaskRecord> {
  std::lock_guard lock(store_mu_);
  return store_.get(id);
}

auto Scheduler::set_on_progress(ProgressObserver cb) -> void {
  on_progress_ = std::move(cb);
}

auto Scheduler::set_on_run_finished(RunObserver cb) -> void {
  on_run_finished_ = std::move(cb);
}

auto Scheduler::set_before_pass(PassHook hook) -> void {
  before_pass_ = std::move(hook);
}

auto Scheduler::start() -> void {
  std::lock_guard lifecycle(lifecycle_mu_);
  if (running_.load())
    return;

  stopping_.store(false);
  loop_thread_ = std::thread([this] { run_loop(); });
  running_.store(true);
  log::info("Scheduler started (poll every {}s)", poll_interval_.count());
}

auto Scheduler::stop() -> void {
  std::lock_guard lifecycle(lifecycle_mu_);
  if (!running_.exchange(false))
    return;

  stopping_.store(true);
  wake();
  if (loop_thread_.joinable()) {
    loop_thread_.join();
  }
  {
    // A pass started through run_pending() may still be in flight
    std::lock_guard pass(pass_mu_);
    stopping_.store(false);
  }
  log::info("Scheduler stopped");
}

auto Scheduler::wake() -> void {
  if (wake_fd_ < 0) {
    return;
  }
  std::uint64_t val = 1;
  if (write(wake_fd_, &val, sizeof(val)) < 0) {
    log::warn("Failed to write to wake fd: {}", std::strerror(errno));
  }
}

auto Scheduler::run_pending() -> std::size_t {
  std::lock_guard pass(pass_mu_);
  return run_pass();
}

auto Scheduler::run_loop() -> void {
  pollfd pfd{wake_fd_, POLLIN, 0};
  auto interval_ms =
      std::chrono::duration_cast<std::chrono::milliseconds>(poll_interval_)
          .count();
  auto timeout_ms = static_cast<int>(std::clamp<std::int64_t>(
      interval_ms, 1, std::numeric_limits<int>::max()));

  while (!stopping_.load()) {
    if (before_pass_) {
      try {
        before_pass_();
      } catch (const std::exception& e) {
        log::error("Pre-pass hook failed: {}", e.what());
      }
    }
    if (stopping_.load())
      break;
    {
      std::lock_guard pass(pass_mu_);
      run_pass();
    }

    if (stopping_.load())
      break;

    int ret = ::poll(&pfd, 1, timeout_ms);
    if (ret < 0 && errno != EINTR) {
      log::error("poll failed: {}", std::strerror(errno));
      break;
    }

    // Drain eventfd
    std::uint64_t val;
    while (wake_fd_ >= 0 && ::read(wake_fd_, &val, sizeof(val)) > 0) {
    }
  }
}

auto Scheduler::run_pass() -> std::size_t {
  auto now = Clock::now();

  std::vector<std::pair<TimePoint, TaskId>> due;
  {
    std::lock_guard lock(store_mu_);
    for (const auto& record : store_.list()) {
      if (record.is_due(now)) {
        due.emplace_back(record.scheduled_at, record.id);
      }
    }
  }
  if (due.empty()) {
    return 0;
  }
  std::ranges::sort(due);
  log::debug("{} tasks due", due.size());

  std::size_t dispatched = 0;
  for (const auto& [scheduled_at, id] : due) {
    if (stopping_.load()) {
      log::info("Stop requested, leaving {} due tasks pending",
                due.size() - dispatched);
      break;
    }
    if (run_task(id)) {
      ++dispatched;
    }
  }
  return dispatched;
}

auto Scheduler::run_task(const TaskId& id) -> bool {
  TaskRecord snapshot;
  auto started = truncate_ms(Clock::now());
  {
    std::lock_guard lock(store_mu_);
    auto* record = store_.find(id);
    if (!record || record->status != TaskStatus::Pending) {
      return false;
    }
    record->status = TaskStatus::Running;
    record->last_run_at = started;
    snapshot = *record;
    (void)persist("start");
  }

  log::info("Running {} task {}: {}", task_type_name(snapshot.type), id,
            snapshot.source);
  std::int64_t bytes_done = 0;
  auto outcome = execute(snapshot, bytes_done);
  auto finished = truncate_ms(Clock::now());

  {
    std::lock_guard lock(store_mu_);
    auto* record = store_.find(id);
    if (!record) {
      log::warn("Task {} vanished while running", id);
    } else {
      record->last_run_at = finished;
      if (outcome) {
        record->last_error.reset();
        if (record->recurring && record->interval_minutes) {
          record->status = TaskStatus::Pending;
          record->scheduled_at =
              finished + std::chrono::minutes(*record->interval_minutes);
          log::info("Task {} done, next run at {}", id,
                    to_iso8601(record->scheduled_at));
        } else {
          record->status = TaskStatus::Completed;
          log::info("Task {} completed", id);
        }
      } else {
        record->status = TaskStatus::Failed;
        record->last_error = outcome.error();
        log::warn("Task {} failed: {}", id, outcome.error());
      }
      (void)persist("finish");
    }
  }

  RunRecord run;
  run.task_id = id;
  run.type = snapshot.type;
  run.source = snapshot.source;
  run.destination = snapshot.destination;
  run.started_at = started;
  run.finished_at = finished;
  run.succeeded = outcome.has_value();
  if (!outcome) {
    run.error = outcome.error();
  }
  run.bytes_done = bytes_done;
  notify_run_finished(run);
  return true;
}

auto Scheduler::execute(const TaskRecord& task, std::int64_t& bytes_done)
    -> TransferResult<void> {
  auto on_progress = [&](std::int64_t done, std::int64_t total) {
    bytes_done = done;
    if (on_progress_) {
      on_progress_(task.id, ProgressEvent{done, total});
    }
  };

  try {
    if (!connector_.is_connected()) {
      if (auto r = connector_.connect(); !r) {
        return r;
      }
    }

    const auto destination = task.destination.value_or("");
    switch (task.type) {
      case TaskType::Upload:
        return connector_.upload(task.source, destination, on_progress);
      case TaskType::Download:
        return connector_.download(task.source, destination, on_progress);
      case TaskType::Delete:
        return connector_.remove(task.source);
    }
    return std::unexpected(std::string{"unknown task type"});
  } catch (const std::exception& e) {
    return std::unexpected(std::string{e.what()});
  } catch (...) {
    return std::unexpected(std::string{"unknown exception"});
  }
}

// Caller holds store_mu_.
auto Scheduler::persist(std::string_view context) -> Result<void> {
  auto r = store_.save();
  if (!r) {
    log::error("Failed to persist tasks after {}: {}", context,
               r.error().message());
    return fail(Error::PersistenceFailure);
  }
  return ok();
}

auto Scheduler::notify_run_finished(const RunRecord& run) -> void {
  if (!on_run_finished_) {
    return;
  }
  try {
    on_run_finished_(run);
  } catch (const std::exception& e) {
    log::error("Run observer failed for task {}: {}", run.task_id, e.what());
  }
}

}  // namespace ferry
