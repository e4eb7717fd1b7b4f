#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace lidar::model {

/*
  Processing job lifecycle.

    pending -> queued -> processing -> completed
                                   \-> failed

  pending and queued jobs may be failed directly (cancellation, rejected
  input). completed and failed are terminal.
*/
enum class JobStatus : std::uint8_t {
  kPending    = 0,
  kQueued     = 1,
  kProcessing = 2,
  kCompleted  = 3,
  kFailed     = 4,
};

constexpr bool IsTerminal(JobStatus status) {
  return status == JobStatus::kCompleted || status == JobStatus::kFailed;
}

constexpr bool CanTransition(JobStatus from, JobStatus to) {
  if (IsTerminal(from)) {
    return false;
  }
  if (from == to) {
    // progress updates while running
    return from == JobStatus::kProcessing;
  }
  if (to == JobStatus::kFailed) {
    return true;
  }
  if (to == JobStatus::kCompleted) {
    return from == JobStatus::kProcessing;
  }

  return static_cast<std::uint8_t>(to) > static_cast<std::uint8_t>(from);
}

constexpr std::string_view ToString(JobStatus status) {
  switch (status) {
    case JobStatus::kPending:
      return "pending";
    case JobStatus::kQueued:
      return "queued";
    case JobStatus::kProcessing:
      return "processing";
    case JobStatus::kCompleted:
      return "completed";
    case JobStatus::kFailed:
      return "failed";
  }
  return "unknown";
}

constexpr std::optional<JobStatus> ParseJobStatus(std::string_view text) {
  if (text == "pending") return JobStatus::kPending;
  if (text == "queued") return JobStatus::kQueued;
  if (text == "processing") return JobStatus::kProcessing;
  if (text == "completed") return JobStatus::kCompleted;
  if (text == "failed") return JobStatus::kFailed;
  return std::nullopt;
}

} // namespace lidar::model
