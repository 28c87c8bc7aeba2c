#pragma once

#include "ferry/scheduler/task.hpp"
#include "ferry/transfer/connector.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <functional>
#include <mutex>
#include <optional>
#include <queue>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace ferry::test {

// Fresh directory under /tmp, removed with everything in it on destruction.
class TempDir {
public:
  TempDir() {
    std::string pattern = "/tmp/ferry_test_XXXXXX";
    if (::mkdtemp(pattern.data()) == nullptr) {
      throw std::runtime_error("mkdtemp failed");
    }
    path_ = pattern;
  }
  ~TempDir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
  }

  TempDir(const TempDir&) = delete;
  TempDir& operator=(const TempDir&) = delete;

  [[nodiscard]] auto path() const -> const std::filesystem::path& {
    return path_;
  }
  [[nodiscard]] auto file(std::string_view name) const -> std::string {
    return (path_ / name).string();
  }

private:
  std::filesystem::path path_;
};

inline auto write_file(const std::filesystem::path& path,
                       std::string_view content) -> void {
  std::filesystem::create_directories(path.parent_path());
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  out << content;
}

inline auto read_file(const std::filesystem::path& path) -> std::string {
  std::ifstream in(path, std::ios::binary);
  std::stringstream buffer;
  buffer << in.rdbuf();
  return buffer.str();
}

template <typename T>
class BlockingQueue {
public:
  void push(T value) {
    std::lock_guard<std::mutex> lock(mutex_);
    queue_.push(std::move(value));
    cv_.notify_one();
  }

  template <typename Rep, typename Period>
  [[nodiscard]] auto try_pop_for(const std::chrono::duration<Rep, Period>& timeout)
      -> std::optional<T> {
    std::unique_lock<std::mutex> lock(mutex_);
    if (cv_.wait_for(lock, timeout, [this] { return !queue_.empty(); })) {
      T value = std::move(queue_.front());
      queue_.pop();
      return value;
    }
    return std::nullopt;
  }

private:
  std::queue<T> queue_;
  std::mutex mutex_;
  std::condition_variable cv_;
};

// Polls pred every few milliseconds until it holds or timeout expires.
template <typename Pred>
[[nodiscard]] auto wait_until(Pred pred,
                              std::chrono::milliseconds timeout =
                                  std::chrono::seconds(5)) -> bool {
  auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    if (pred()) {
      return true;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(2));
  }
  return pred();
}

// Scriptable in-memory connector. Operations can be made to fail, throw, or
// block on a gate until the test releases them.
class FakeConnector : public ITransferConnector {
public:
  struct Call {
    std::string op;
    std::string first;
    std::string second;
  };

  static constexpr std::int64_t kFileSize = 100;

  auto connect() -> TransferResult<void> override {
    std::lock_guard lock(mu_);
    ++connect_calls_;
    if (connect_error_) {
      return std::unexpected(*connect_error_);
    }
    connected_ = true;
    return {};
  }

  auto disconnect() -> void override {
    std::lock_guard lock(mu_);
    connected_ = false;
  }

  auto is_connected() const -> bool override {
    std::lock_guard lock(mu_);
    return connected_;
  }

  auto upload(const std::string& local, const std::string& remote,
              const ProgressCallback& on_progress)
      -> TransferResult<void> override {
    return perform("upload", local, remote, on_progress);
  }

  auto download(const std::string& remote, const std::string& local,
                const ProgressCallback& on_progress)
      -> TransferResult<void> override {
    return perform("download", remote, local, on_progress);
  }

  auto remove(const std::string& remote) -> TransferResult<void> override {
    return perform("delete", remote, "", {});
  }

  auto list(const std::string& remote_dir)
      -> TransferResult<std::vector<RemoteEntry>> override {
    std::lock_guard lock(mu_);
    calls_.push_back({"list", remote_dir, ""});
    return std::vector<RemoteEntry>{};
  }

  auto fail_with(std::optional<std::string> message) -> void {
    std::lock_guard lock(mu_);
    error_ = std::move(message);
  }

  auto fail_connect_with(std::optional<std::string> message) -> void {
    std::lock_guard lock(mu_);
    connect_error_ = std::move(message);
  }

  auto throw_on_transfer(bool enabled) -> void {
    std::lock_guard lock(mu_);
    throw_ = enabled;
  }

  // Subsequent transfers park until release().
  auto block() -> void {
    std::lock_guard lock(mu_);
    blocked_ = true;
  }

  auto release() -> void {
    {
      std::lock_guard lock(mu_);
      blocked_ = false;
    }
    cv_.notify_all();
  }

  // True once `count` transfers have started (blocked ones included).
  [[nodiscard]] auto wait_for_entered(std::size_t count,
                                      std::chrono::milliseconds timeout =
                                          std::chrono::seconds(5)) -> bool {
    std::unique_lock lock(mu_);
    return cv_.wait_for(lock, timeout, [&] { return entered_ >= count; });
  }

  [[nodiscard]] auto calls() const -> std::vector<Call> {
    std::lock_guard lock(mu_);
    return calls_;
  }

  [[nodiscard]] auto transfer_count() const -> std::size_t {
    std::lock_guard lock(mu_);
    return entered_;
  }

  [[nodiscard]] auto connect_calls() const -> int {
    std::lock_guard lock(mu_);
    return connect_calls_;
  }

  // Largest number of transfers observed in flight at the same time.
  [[nodiscard]] auto max_concurrent() const -> int {
    return max_in_flight_.load();
  }

private:
  auto perform(std::string op, const std::string& first,
               const std::string& second, const ProgressCallback& on_progress)
      -> TransferResult<void> {
    std::unique_lock lock(mu_);
    calls_.push_back({op, first, second});
    ++entered_;
    cv_.notify_all();

    auto now_in_flight = ++in_flight_;
    auto prev = max_in_flight_.load();
    while (now_in_flight > prev &&
           !max_in_flight_.compare_exchange_weak(prev, now_in_flight)) {
    }

    cv_.wait(lock, [this] { return !blocked_; });
    --in_flight_;

    if (throw_) {
      throw std::runtime_error("connector exploded");
    }
    if (error_) {
      return std::unexpected(*error_);
    }
    lock.unlock();

    if (on_progress) {
      on_progress(0, kFileSize);
      on_progress(kFileSize, kFileSize);
    }
    return {};
  }

  mutable std::mutex mu_;
  std::condition_variable cv_;
  bool connected_{false};
  bool blocked_{false};
  bool throw_{false};
  std::optional<std::string> error_;
  std::optional<std::string> connect_error_;
  std::vector<Call> calls_;
  std::size_t entered_{0};
  int connect_calls_{0};
  int in_flight_{0};
  std::atomic<int> max_in_flight_{0};
};

[[nodiscard]] inline auto upload_request(
    TimePoint at = Clock::now(), std::optional<int> every = std::nullopt)
    -> TaskRequest {
  TaskRequest request;
  request.type = TaskType::Upload;
  request.source = "/tmp/a.txt";
  request.destination = "/remote/a.txt";
  request.scheduled_at = at;
  request.recurring = every.has_value();
  request.interval_minutes = every;
  return request;
}

}  // namespace ferry::test
