#include "ferry/transfer/process.hpp"

#include "ferry/util/log.hpp"

#include <sys/wait.h>

#include <algorithm>
#include <array>
#include <cerrno>
#include <cstring>
#include <format>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <unistd.h>

namespace ferry {

namespace {

inline constexpr std::size_t MAX_OUTPUT_SIZE = 1024 * 1024;
inline constexpr std::size_t READ_BUFFER_SIZE = 4096;

auto create_pipe() -> std::pair<int, int> {
  int fds[2];
  if (pipe2(fds, O_CLOEXEC) < 0) {
    return {-1, -1};
  }
  return {fds[0], fds[1]};
}

auto fork_and_exec(const std::string& cmd, const std::string& working_dir,
                   int stdin_fd, int stdout_write_fd) -> pid_t {
  pid_t pid = fork();
  if (pid < 0) {
    return -1;
  }

  if (pid == 0) {
    // Child process - must only use async-signal-safe functions
    setpgid(0, 0);

    dup2(stdin_fd, STDIN_FILENO);
    dup2(stdout_write_fd, STDOUT_FILENO);
    dup2(stdout_write_fd, STDERR_FILENO);

    if (!working_dir.empty()) {
      if (chdir(working_dir.c_str()) < 0) {
        _exit(127);
      }
    }

    execl("/bin/sh", "sh", "-c", cmd.c_str(), nullptr);
    _exit(127);
  }

  setpgid(pid, pid);
  return pid;
}

auto get_exit_code(int status) -> int {
  if (WIFEXITED(status)) {
    return WEXITSTATUS(status);
  }
  if (WIFSIGNALED(status)) {
    return 128 + WTERMSIG(status);
  }
  return -1;
}

// Reads until EOF or the deadline. Returns true on timeout.
auto read_output(int fd, std::chrono::seconds timeout,
                 std::chrono::steady_clock::time_point start,
                 std::string& output) -> bool {
  std::array<char, READ_BUFFER_SIZE> buffer;
  pollfd pfd{fd, POLLIN, 0};

  while (true) {
    int timeout_ms = -1;
    if (timeout.count() > 0) {
      auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
          timeout - (std::chrono::steady_clock::now() - start));
      if (remaining.count() <= 0) {
        return true;
      }
      timeout_ms = static_cast<int>(remaining.count());
    }

    int ret = ::poll(&pfd, 1, timeout_ms);
    if (ret < 0) {
      if (errno == EINTR) {
        continue;
      }
      log::warn("poll on command output failed: {}", std::strerror(errno));
      return false;
    }
    if (ret == 0) {
      return true;
    }

    ssize_t bytes_read = ::read(fd, buffer.data(), buffer.size());
    if (bytes_read < 0) {
      if (errno == EINTR || errno == EAGAIN) {
        continue;
      }
      return false;
    }
    if (bytes_read == 0) {
      return false;
    }

    // Keep draining past the cap so the child never blocks on a full pipe
    auto room = MAX_OUTPUT_SIZE - std::min(output.size(), MAX_OUTPUT_SIZE);
    output.append(buffer.data(),
                  std::min(room, static_cast<std::size_t>(bytes_read)));
  }
}

}  // namespace

auto run_command(const std::string& cmd, std::chrono::seconds timeout,
                 const std::string& working_dir) -> ProcessResult {
  ProcessResult result;

  int null_fd = ::open("/dev/null", O_RDONLY | O_CLOEXEC);
  if (null_fd < 0) {
    result.error = std::format("Failed to open /dev/null: {}",
                               std::strerror(errno));
    return result;
  }

  auto [read_fd, write_fd] = create_pipe();
  if (read_fd < 0) {
    ::close(null_fd);
    result.error = "Failed to create pipe";
    return result;
  }

  auto start = std::chrono::steady_clock::now();
  pid_t pid = fork_and_exec(cmd, working_dir, null_fd, write_fd);
  ::close(write_fd);
  ::close(null_fd);
  if (pid < 0) {
    ::close(read_fd);
    result.error = "Failed to fork process";
    return result;
  }
  log::trace("Started pid {}: {}", pid, cmd);

  result.timed_out = read_output(read_fd, timeout, start, result.output);
  ::close(read_fd);

  if (result.timed_out) {
    log::warn("Command timed out after {}s, killing process group {}",
              timeout.count(), pid);
    kill(-pid, SIGKILL);
  }

  int status = 0;
  while (waitpid(pid, &status, 0) < 0) {
    if (errno != EINTR) {
      log::warn("waitpid failed for pid {}: {}", pid, std::strerror(errno));
      return result;
    }
  }
  result.exit_code = get_exit_code(status);
  return result;
}

}  // namespace ferry
