#include "internal/pipeline/job_tracker.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace lidar::pipeline {

using lidar::model::JobStatus;
using observability::StringField;

JobTracker::JobTracker(std::shared_ptr<db::Repository> repository) : repository_(std::move(repository)) {
}

db::model::JobRecord JobTracker::Submit(db::model::JobRecord job) {
  if (job.id.empty()) {
    job.id = util::NewId();
  }
  if (job.created_at_ms == 0) {
    job.created_at_ms = util::ToUnixMillis(util::Now());
  }
  job.status         = JobStatus::kQueued;
  job.progress       = 0;
  job.status_message = "Queued";

  auto tx = repository_->Begin();
  db::ThrowIfError(repository_->InsertJob(*tx, job), "submit job " + job.id);
  tx->Commit();

  LIDAR_LOG_INFO("Job submitted", {StringField("job_id", job.id), StringField("parcel_id", job.parcel_id)});
  return job;
}

db::model::JobRecord JobTracker::Load(const std::string& job_id) {
  auto tx  = repository_->Begin();
  auto job = repository_->GetJob(*tx, job_id);
  tx->Commit();
  if (!job) {
    throw util::NotFound("job not found: " + job_id);
  }
  return *job;
}

std::optional<JobStateMachine> JobTracker::Claim(const std::string& job_id) {
  auto tx  = repository_->Begin();
  auto job = repository_->GetJob(*tx, job_id);
  if (!job) {
    throw util::NotFound("job not found: " + job_id);
  }
  if (job->status != JobStatus::kQueued && job->status != JobStatus::kPending) {
    LIDAR_LOG_INFO("Job not claimable", {StringField("job_id", job_id), StringField("status", lidar::model::ToString(job->status))});
    return std::nullopt;
  }

  const auto      observed = job->status;
  JobStateMachine machine(std::move(*job));
  machine.Start(util::ToUnixMillis(util::Now()));

  auto result = repository_->TransitionJob(*tx, machine.Job(), observed);
  if (result.code == db::ErrorCode::Conflict) {
    LIDAR_LOG_INFO("Job claimed elsewhere", {StringField("job_id", job_id)});
    return std::nullopt;
  }
  db::ThrowIfError(result, "claim job " + job_id);
  tx->Commit();
  return machine;
}

void JobTracker::Persist(const JobStateMachine& machine) {
  auto tx     = repository_->Begin();
  auto result = repository_->TransitionJob(*tx, machine.Job(), JobStatus::kProcessing);
  if (result.code == db::ErrorCode::Conflict) {
    throw util::InvalidState("job " + machine.Job().id + " is no longer processing");
  }
  db::ThrowIfError(result, "persist job " + machine.Job().id);
  tx->Commit();
}

bool JobTracker::Cancel(const std::string& job_id, const std::string& reason) {
  auto tx  = repository_->Begin();
  auto job = repository_->GetJob(*tx, job_id);
  if (!job) {
    throw util::NotFound("job not found: " + job_id);
  }
  if (job->status != JobStatus::kQueued && job->status != JobStatus::kPending) {
    return false;
  }

  const auto      observed = job->status;
  JobStateMachine machine(std::move(*job));
  machine.Fail(reason, util::ToUnixMillis(util::Now()));

  auto result = repository_->TransitionJob(*tx, machine.Job(), observed);
  if (result.code == db::ErrorCode::Conflict) {
    return false;
  }
  db::ThrowIfError(result, "cancel job " + job_id);
  tx->Commit();

  LIDAR_LOG_INFO("Job cancelled", {StringField("job_id", job_id), StringField("reason", reason)});
  return true;
}

std::vector<db::model::JobRecord> JobTracker::ListQueued(std::size_t limit) {
  auto tx   = repository_->Begin();
  auto jobs = repository_->ListJobsByStatus(*tx, JobStatus::kQueued, limit);
  tx->Commit();
  return jobs;
}

} // namespace lidar::pipeline
