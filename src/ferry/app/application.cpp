#include "ferry/app/application.hpp"

#include "ferry/storage/recovery.hpp"
#include "ferry/transfer/command_connector.hpp"
#include "ferry/transfer/local_connector.hpp"
#include "ferry/util/log.hpp"

#include <filesystem>

namespace ferry {

auto create_connector(const ConnectorConfig& config)
    -> Result<std::unique_ptr<ITransferConnector>> {
  switch (config.type) {
    case ConnectorType::Command:
      return std::make_unique<CommandConnector>(config);
    case ConnectorType::Local:
      return std::make_unique<LocalConnector>(config.root);
  }
  return fail(Error::InvalidArgument);
}

Application::Application(SystemConfig config)
    : config_(std::move(config)),
      spool_(RequestSpool::for_tasks_file(config_.storage.tasks_file)) {
}

Application::~Application() {
  stop();
  scheduler_.reset();
  if (connector_) {
    connector_->disconnect();
  }
}

auto Application::open() -> Result<void> {
  if (scheduler_) {
    return ok();
  }

  const auto& tasks_file = config_.storage.tasks_file;
  if (auto parent = std::filesystem::path{tasks_file}.parent_path();
      !parent.empty()) {
    std::error_code ec;
    std::filesystem::create_directories(parent, ec);
    if (ec) {
      log::error("Cannot create {}: {}", parent.string(), ec.message());
      return fail(Error::FileOpenFailed);
    }
  }

  auto lock = FileLock::acquire(tasks_file + ".lock");
  if (!lock) {
    if (lock.error() == Error::Locked) {
      log::warn("{} is in use by another ferry process", tasks_file);
    }
    return fail(lock.error());
  }
  lock_ = std::move(*lock);

  TaskStore store{tasks_file};
  load_outcome_ = store.load();
  if (auto r = Recovery{store}.recover(); !r) {
    log::warn("Interrupted tasks repaired in memory only: {}",
              r.error().message());
  }

  auto connector = create_connector(config_.connector);
  if (!connector) {
    return fail(connector.error());
  }
  connector_ = std::move(*connector);

  open_history();

  scheduler_ = std::make_unique<Scheduler>(
      std::move(store), *connector_,
      std::chrono::seconds(config_.scheduler.poll_interval_sec));
  setup_callbacks();
  apply_queued_requests();
  return ok();
}

auto Application::apply_queued_requests() -> std::size_t {
  if (!scheduler_) {
    return 0;
  }
  auto applied = spool_.drain([this](const ControlRequest& request)
                                  -> Result<void> {
    switch (request.kind) {
      case ControlRequest::Kind::Add: {
        auto id = scheduler_->add(request.task);
        // PersistenceFailure still leaves the task scheduled.
        if (!id && id.error() != Error::PersistenceFailure) {
          return fail(id.error());
        }
        if (id) {
          log::info("Added task {} from a queued request", *id);
        }
        return ok();
      }
      case ControlRequest::Kind::Remove: {
        auto r = scheduler_->remove(request.id);
        if (!r && r.error() != Error::PersistenceFailure) {
          return fail(r.error());
        }
        log::info("Removed task {} on a queued request", request.id);
        return ok();
      }
    }
    return fail(Error::InvalidArgument);
  });
  if (applied > 0) {
    log::info("Applied {} queued request(s)", applied);
  }
  return applied;
}

auto Application::open_history() -> void {
  if (config_.storage.history_db.empty()) {
    log::debug("Run history disabled");
    return;
  }
  auto history = std::make_unique<RunHistory>(config_.storage.history_db);
  if (auto r = history->open(); !r) {
    log::warn("Run history unavailable ({}): {}", config_.storage.history_db,
              r.error().message());
    return;
  }
  history_ = std::move(history);
}

auto Application::setup_callbacks() -> void {
  scheduler_->set_on_progress(
      [](const TaskId& id, const ProgressEvent& event) {
        log::debug("Task {}: {}/{} bytes", id, event.bytes_done,
                   event.bytes_total);
      });

  scheduler_->set_before_pass([this] { apply_queued_requests(); });

  scheduler_->set_on_run_finished([this](const RunRecord& run) {
    if (!history_) {
      return;
    }
    if (auto r = history_->record(run); !r) {
      log::warn("Failed to record run of task {}: {}", run.task_id,
                r.error().message());
      return;
    }
    auto keep = config_.storage.history_keep;
    if (keep > 0) {
      if (auto r = history_->prune(static_cast<std::size_t>(keep)); !r) {
        log::warn("Failed to prune run history: {}", r.error().message());
      }
    }
  });
}

auto Application::start() -> void {
  if (!scheduler_) {
    log::error("Application::start called before open");
    return;
  }
  scheduler_->start();
}

auto Application::stop() -> void {
  if (scheduler_) {
    scheduler_->stop();
  }
}

auto Application::is_running() const noexcept -> bool {
  return scheduler_ && scheduler_->is_running();
}

}  // namespace ferry
