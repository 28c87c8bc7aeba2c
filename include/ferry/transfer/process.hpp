#pragma once

#include <chrono>
#include <string>

namespace ferry {

struct ProcessResult {
  int exit_code{-1};
  std::string output;  // stdout and stderr interleaved
  std::string error;   // set when the process could not be started
  bool timed_out{false};
};

// Runs cmd through /bin/sh in its own process group and blocks until it
// exits. A zero timeout waits forever; otherwise the whole group is killed
// when the timeout expires.
[[nodiscard]] auto run_command(const std::string& cmd,
                               std::chrono::seconds timeout,
                               const std::string& working_dir = {})
    -> ProcessResult;

}  // namespace ferry
