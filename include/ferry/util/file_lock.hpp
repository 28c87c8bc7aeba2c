#pragma once

#include "ferry/core/error.hpp"

#include <string>
#include <string_view>
#include <utility>

namespace ferry {

// Exclusive advisory lock (flock) held for the object's lifetime. Used to
// keep two processes from owning the same task file.
class FileLock {
public:
  FileLock() = default;
  ~FileLock();

  FileLock(FileLock&& other) noexcept
      : fd_(std::exchange(other.fd_, -1)), path_(std::move(other.path_)) {
  }
  FileLock& operator=(FileLock&& other) noexcept;
  FileLock(const FileLock&) = delete;
  FileLock& operator=(const FileLock&) = delete;

  // Non-blocking: fails with Error::Locked when another process holds it.
  [[nodiscard]] static auto acquire(std::string_view path) -> Result<FileLock>;

  auto release() -> void;

  [[nodiscard]] auto held() const noexcept -> bool {
    return fd_ >= 0;
  }
  [[nodiscard]] auto path() const noexcept -> const std::string& {
    return path_;
  }

private:
  FileLock(int fd, std::string path) : fd_(fd), path_(std::move(path)) {
  }

  int fd_{-1};
  std::string path_;
};

}  // namespace ferry
