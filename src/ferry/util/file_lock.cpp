#include "ferry/util/file_lock.hpp"

#include "ferry/util/log.hpp"

#include <sys/file.h>

#include <cerrno>
#include <cstring>

#include <fcntl.h>
#include <unistd.h>

namespace ferry {

FileLock::~FileLock() {
  release();
}

FileLock& FileLock::operator=(FileLock&& other) noexcept {
  if (this != &other) {
    release();
    fd_ = std::exchange(other.fd_, -1);
    path_ = std::move(other.path_);
  }
  return *this;
}

auto FileLock::acquire(std::string_view path) -> Result<FileLock> {
  std::string path_str{path};
  int fd = ::open(path_str.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
  if (fd < 0) {
    log::error("Failed to open lock file {}: {}", path_str,
               std::strerror(errno));
    return fail(Error::FileOpenFailed);
  }

  if (::flock(fd, LOCK_EX | LOCK_NB) < 0) {
    int err = errno;
    ::close(fd);
    if (err == EWOULDBLOCK) {
      return fail(Error::Locked);
    }
    log::error("flock failed on {}: {}", path_str, std::strerror(err));
    return fail(Error::FileOpenFailed);
  }

  return FileLock{fd, std::move(path_str)};
}

auto FileLock::release() -> void {
  if (fd_ >= 0) {
    ::flock(fd_, LOCK_UN);
    ::close(fd_);
    fd_ = -1;
  }
}

}  // namespace ferry
