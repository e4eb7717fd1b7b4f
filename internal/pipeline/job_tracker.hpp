#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/pipeline/job_state_machine.hpp"

namespace lidar::pipeline {

/*
  Persists job state. Each write runs in its own committed transaction and
  only succeeds while the stored status is still the one the caller saw.
*/
class JobTracker {
 public:
  explicit JobTracker(std::shared_ptr<db::Repository> repository);

  // Inserts a queued job; assigns id and created_at when unset.
  db::model::JobRecord Submit(db::model::JobRecord job);

  // Throws util::NotFound.
  db::model::JobRecord Load(const std::string& job_id);

  // pending|queued -> processing. nullopt when the job is already running,
  // finished, or was claimed concurrently.
  std::optional<JobStateMachine> Claim(const std::string& job_id);

  // Writes a running or just-finished job; throws util::InvalidState when
  // the stored job is no longer processing.
  void Persist(const JobStateMachine& machine);

  // Fails a job that has not started. Returns false once it is processing
  // or terminal.
  bool Cancel(const std::string& job_id, const std::string& reason);

  std::vector<db::model::JobRecord> ListQueued(std::size_t limit);

 private:
  std::shared_ptr<db::Repository> repository_;
};

} // namespace lidar::pipeline
