#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <cstdio>
#include <deque>
#include <format>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace ferry::log {

enum class Level : std::uint8_t {
  Trace,
  Debug,
  Info,
  Warn,
  Error
};

[[nodiscard]] constexpr auto level_name(Level level) noexcept
    -> std::string_view {
  constexpr std::string_view names[] = {"trace", "debug", "info", "warn",
                                        "error"};
  return names[static_cast<std::uint8_t>(level)];
}

[[nodiscard]] constexpr auto level_color(Level level) noexcept
    -> std::string_view {
  constexpr std::string_view colors[] = {
      "\033[90m",  // trace: gray
      "\033[36m",  // debug: cyan
      "\033[32m",  // info: green
      "\033[33m",  // warn: yellow
      "\033[31m"   // error: red
  };
  return colors[static_cast<std::uint8_t>(level)];
}

// One queued line: the console copy carries the level color, the file copy
// does not.
struct Line {
  Level level;
  std::string console;
  std::string plain;
};

// Async logger. Callers format on their own thread and hand the line to a
// single writer thread; before start() and after stop() lines are written
// synchronously.
class Logger {
  static constexpr std::size_t QUEUE_CAPACITY = 8192;
  static constexpr std::size_t BATCH_SIZE = 64;

  std::atomic<Level> level_{Level::Info};
  std::atomic<bool> running_{false};

  std::mutex mu_;
  std::condition_variable cv_;
  std::deque<Line> queue_;
  bool stopping_{false};
  std::thread writer_;

  std::mutex sink_mu_;
  std::FILE* file_{nullptr};

  auto write_batch(const std::vector<Line>& batch) -> void {
    std::lock_guard lock(sink_mu_);
    for (const auto& line : batch) {
      std::fputs(line.console.c_str(), stdout);
      if (file_) {
        std::fputs(line.plain.c_str(), file_);
      }
    }
    std::fflush(stdout);
    if (file_) {
      std::fflush(file_);
    }
  }

  auto writer_loop() -> void {
    std::vector<Line> batch;
    batch.reserve(BATCH_SIZE);

    while (true) {
      {
        std::unique_lock lock(mu_);
        cv_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
        if (queue_.empty() && stopping_) {
          break;
        }
        while (!queue_.empty() && batch.size() < BATCH_SIZE) {
          batch.push_back(std::move(queue_.front()));
          queue_.pop_front();
        }
      }
      write_batch(batch);
      batch.clear();
    }
  }

public:
  Logger() = default;
  ~Logger() {
    stop();
    std::lock_guard lock(sink_mu_);
    if (file_) {
      std::fclose(file_);
      file_ = nullptr;
    }
  }

  Logger(const Logger&) = delete;
  Logger& operator=(const Logger&) = delete;

  auto start() -> void {
    if (running_.exchange(true))
      return;
    {
      std::lock_guard lock(mu_);
      stopping_ = false;
    }
    writer_ = std::thread([this] { writer_loop(); });
  }

  // Drains everything queued so far, then returns to synchronous writes.
  auto stop() -> void {
    if (!running_.exchange(false))
      return;
    {
      std::lock_guard lock(mu_);
      stopping_ = true;
    }
    cv_.notify_one();
    if (writer_.joinable()) {
      writer_.join();
    }
  }

  // Appends to path in addition to stdout. An empty path closes the file.
  auto set_file(const std::string& path) -> bool {
    std::lock_guard lock(sink_mu_);
    if (file_) {
      std::fclose(file_);
      file_ = nullptr;
    }
    if (path.empty()) {
      return true;
    }
    file_ = std::fopen(path.c_str(), "a");
    return file_ != nullptr;
  }

  auto set_level(Level level) noexcept -> void {
    level_.store(level, std::memory_order_release);
  }

  [[nodiscard]] auto level() const noexcept -> Level {
    return level_.load(std::memory_order_acquire);
  }

  template <typename... Args>
  auto log(Level level, std::format_string<Args...> fmt, Args&&... args)
      -> void {
    if (level < level_.load(std::memory_order_acquire))
      return;

    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::floor<std::chrono::milliseconds>(now);
    auto tid =
        std::hash<std::thread::id>{}(std::this_thread::get_id()) % 1000000;
    auto message = std::format(fmt, std::forward<Args>(args)...);

    Line line{
        level,
        std::format("[{:%Y-%m-%d %H:%M:%S}] [{}{}{}] [{}] {}\n", time,
                    level_color(level), level_name(level), "\033[0m", tid,
                    message),
        std::format("[{:%Y-%m-%d %H:%M:%S}] [{}] [{}] {}\n", time,
                    level_name(level), tid, message),
    };

    if (running_.load(std::memory_order_acquire)) {
      std::unique_lock lock(mu_);
      if (!stopping_ && queue_.size() < QUEUE_CAPACITY) {
        queue_.push_back(std::move(line));
        lock.unlock();
        cv_.notify_one();
        return;
      }
    }

    // Not started, shutting down, or queue full
    write_batch({std::move(line)});
  }
};

inline Logger& logger() {
  static Logger instance;
  return instance;
}

inline auto set_level(Level level) noexcept -> void {
  logger().set_level(level);
}

inline auto set_level(std::string_view name) noexcept -> void {
  Level level = Level::Info;
  if (name == "trace")
    level = Level::Trace;
  else if (name == "debug")
    level = Level::Debug;
  else if (name == "warn")
    level = Level::Warn;
  else if (name == "error")
    level = Level::Error;
  logger().set_level(level);
}

[[nodiscard]] constexpr auto is_level_name(std::string_view name) noexcept
    -> bool {
  return name == "trace" || name == "debug" || name == "info" ||
         name == "warn" || name == "error";
}

inline auto set_file(const std::string& path) -> bool {
  return logger().set_file(path);
}

inline auto start() -> void {
  logger().start();
}
inline auto stop() -> void {
  logger().stop();
}

template <typename... Args>
auto trace(std::format_string<Args...> fmt, Args&&... args) -> void {
  logger().log(Level::Trace, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto debug(std::format_string<Args...> fmt, Args&&... args) -> void {
  logger().log(Level::Debug, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto info(std::format_string<Args...> fmt, Args&&... args) -> void {
  logger().log(Level::Info, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto warn(std::format_string<Args...> fmt, Args&&... args) -> void {
  logger().log(Level::Warn, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto error(std::format_string<Args...> fmt, Args&&... args) -> void {
  logger().log(Level::Error, fmt, std::forward<Args>(args)...);
}

}  // namespace ferry::log
