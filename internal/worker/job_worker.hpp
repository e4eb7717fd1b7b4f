#pragma once

#include <atomic>
#include <memory>
#include <thread>

#include "job_scheduler.hpp"

namespace lidar::pipeline {
class PipelineOrchestrator;
class JobTracker;
} // namespace lidar::pipeline

namespace lidar::worker {

/*
  Background worker that runs queued jobs, one at a time, until the
  scheduler shuts down.
*/
class JobWorker {
 public:
  JobWorker(std::shared_ptr<JobScheduler> scheduler, std::shared_ptr<pipeline::PipelineOrchestrator> orchestrator);
  ~JobWorker();

  void Start();
  void Stop();

 private:
  void Run();

  std::shared_ptr<JobScheduler>                   scheduler_;
  std::shared_ptr<pipeline::PipelineOrchestrator> orchestrator_;

  std::thread       thread_;
  std::atomic<bool> running_{false};
};

// Offers up to batch queued jobs from the repository to the scheduler.
// Returns the number of newly enqueued jobs.
std::size_t FeedQueuedJobs(pipeline::JobTracker& tracker, JobScheduler& scheduler, std::size_t batch);

} // namespace lidar::worker
