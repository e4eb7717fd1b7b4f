#include "internal/pipeline/job_state_machine.hpp"

#include <utility>

#include "internal/util/errors.hpp"

namespace lidar::pipeline {

using lidar::model::JobStatus;

JobStateMachine::JobStateMachine(db::model::JobRecord job) : job_(std::move(job)) {
}

void JobStateMachine::RequireProcessing(const char* operation) const {
  if (job_.status != JobStatus::kProcessing) {
    throw util::InvalidState(std::string(operation) + " on job " + job_.id + " in state " + std::string(lidar::model::ToString(job_.status)));
  }
}

void JobStateMachine::Advance(std::int32_t progress, const std::string& message) {
  if (progress < job_.progress || progress > 100) {
    throw util::InvalidState("job " + job_.id + " cannot move progress from " + std::to_string(job_.progress) + " to " +
                             std::to_string(progress));
  }
  job_.progress       = progress;
  job_.status_message = message;
}

void JobStateMachine::Start(std::uint64_t now_ms) {
  if (job_.status != JobStatus::kPending && job_.status != JobStatus::kQueued) {
    throw util::InvalidState("cannot start job " + job_.id + " in state " + std::string(lidar::model::ToString(job_.status)));
  }
  job_.status         = JobStatus::kProcessing;
  job_.progress       = 0;
  job_.status_message = "Processing started";
  job_.error_message.clear();
  job_.started_at_ms = now_ms;
}

void JobStateMachine::BeginIngest() {
  RequireProcessing("BeginIngest");
  Advance(kIngestProgress, "Downloading and cleaning point cloud");
}

void JobStateMachine::BeginSpectralFusion() {
  RequireProcessing("BeginSpectralFusion");
  Advance(kSpectralFusionProgress, "Applying spectral colorization");
}

void JobStateMachine::BeginSegmentation() {
  RequireProcessing("BeginSegmentation");
  Advance(kSegmentationProgress, "Detecting trees");
}

void JobStateMachine::BeginTiling() {
  RequireProcessing("BeginTiling");
  Advance(kTilingProgress, "Generating 3D tiles");
}

void JobStateMachine::BeginPublish() {
  RequireProcessing("BeginPublish");
  Advance(kPublishProgress, "Uploading tile set");
}

void JobStateMachine::ReportProgress(std::int32_t progress, const std::string& message) {
  RequireProcessing("ReportProgress");
  Advance(progress, message);
}

void JobStateMachine::Complete(const JobResult& result, std::uint64_t now_ms) {
  RequireProcessing("Complete");
  if (result.tileset_url.empty()) {
    throw util::InvalidState("job " + job_.id + " cannot complete without a tile set");
  }
  job_.status          = JobStatus::kCompleted;
  job_.progress        = 100;
  job_.status_message  = "Processing completed";
  job_.tileset_url     = result.tileset_url;
  job_.tree_count      = result.tree_count;
  job_.point_count     = result.point_count;
  job_.completed_at_ms = now_ms;
}

void JobStateMachine::Fail(const std::string& error, std::uint64_t now_ms) {
  if (lidar::model::IsTerminal(job_.status)) {
    throw util::InvalidState("cannot fail job " + job_.id + " in state " + std::string(lidar::model::ToString(job_.status)));
  }
  job_.status          = JobStatus::kFailed;
  job_.status_message  = "Processing failed";
  job_.error_message   = error.empty() ? "unknown error" : error;
  job_.completed_at_ms = now_ms;
}

} // namespace lidar::pipeline
