#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace lidar::util {

/*
  Central error types.

  The orchestrator records what() as the job's error message; lidarctl maps
  them to exit codes.
*/

class ValidationError : public std::runtime_error {
 public:
  explicit ValidationError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class NoCoverage : public std::runtime_error {
 public:
  explicit NoCoverage(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Network or storage failure that may succeed when retried.
class TransientIoError : public std::runtime_error {
 public:
  explicit TransientIoError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// External tool (point-cloud toolkit, tiling converter) failed or produced no output.
class ToolFailure : public std::runtime_error {
 public:
  explicit ToolFailure(const std::string& msg) : std::runtime_error(msg) {
  }
};

class DeadlineExceeded : public std::runtime_error {
 public:
  explicit DeadlineExceeded(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Bulk seeding stopped part way; batches before the failure stay committed.
class SeedError : public std::runtime_error {
 public:
  SeedError(const std::string& msg, std::size_t committed) : std::runtime_error(msg), committed_(committed) {
  }

  std::size_t Committed() const noexcept {
    return committed_;
  }

 private:
  std::size_t committed_;
};

} // namespace lidar::util
