#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "internal/db/model/job_record.hpp"

namespace lidar::pipeline {

// Progress checkpoints reached when each phase begins.
inline constexpr std::int32_t kIngestProgress         = 10;
inline constexpr std::int32_t kSpectralFusionProgress = 30;
inline constexpr std::int32_t kSegmentationProgress   = 50;
inline constexpr std::int32_t kTilingProgress         = 70;
inline constexpr std::int32_t kPublishProgress        = 90;

struct JobResult {
  std::string                 tileset_url;
  std::optional<std::int64_t> tree_count;
  std::int64_t                point_count = 0;
};

/*
  Finite-state wrapper around a job record.

    Start            pending|queued -> processing, progress 0
    Begin<Phase>     processing, progress raised to the phase checkpoint
    ReportProgress   processing, progress never lowered
    Complete         processing -> completed, progress 100, results set
    Fail             any non-terminal -> failed, error detail set

  Phases may be skipped but never revisited. Every illegal call throws
  util::InvalidState and leaves the record untouched.
*/
class JobStateMachine {
 public:
  explicit JobStateMachine(db::model::JobRecord job);

  const db::model::JobRecord& Job() const {
    return job_;
  }

  void Start(std::uint64_t now_ms);

  void BeginIngest();
  void BeginSpectralFusion();
  void BeginSegmentation();
  void BeginTiling();
  void BeginPublish();

  void ReportProgress(std::int32_t progress, const std::string& message);

  void Complete(const JobResult& result, std::uint64_t now_ms);
  void Fail(const std::string& error, std::uint64_t now_ms);

 private:
  void RequireProcessing(const char* operation) const;
  void Advance(std::int32_t progress, const std::string& message);

  db::model::JobRecord job_;
};

} // namespace lidar::pipeline
