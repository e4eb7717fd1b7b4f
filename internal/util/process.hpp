#pragma once

#include <chrono>
#include <string>
#include <vector>

namespace lidar::util {

struct ProcessResult {
  int         exit_code{-1};
  bool        timed_out{false};
  std::string output; // stdout and stderr, interleaved
};

/*
  Runs argv[0] (looked up on PATH) with the remaining arguments and waits for
  it to exit. The child is killed with SIGKILL once timeout elapses.

  Throws std::system_error when the process cannot be started.
*/
ProcessResult RunProcess(const std::vector<std::string>& argv, std::chrono::milliseconds timeout);

} // namespace lidar::util
