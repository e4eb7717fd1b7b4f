#include "job_worker.hpp"

#include <exception>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/pipeline/job_tracker.hpp"
#include "internal/pipeline/pipeline_orchestrator.hpp"

namespace lidar::worker {

using observability::StringField;

JobWorker::JobWorker(std::shared_ptr<JobScheduler> scheduler, std::shared_ptr<pipeline::PipelineOrchestrator> orchestrator)
    : scheduler_(std::move(scheduler)), orchestrator_(std::move(orchestrator)) {
}

JobWorker::~JobWorker() {
  Stop();
}

void JobWorker::Start() {
  running_ = true;
  thread_  = std::thread(&JobWorker::Run, this);
}

void JobWorker::Stop() {
  scheduler_->Shutdown();
  running_ = false;
  if (thread_.joinable()) thread_.join();
}

void JobWorker::Run() {
  while (running_) {
    auto task = scheduler_->Dequeue();
    if (!task) break;

    try {
      orchestrator_->Run(task->job_id);
    } catch (const std::exception& e) {
      // already recorded on the job
      LIDAR_LOG_WARN("Job ended with error", {StringField("job_id", task->job_id), StringField("error", e.what())});
    }
    scheduler_->Finished(task->job_id);
  }
}

std::size_t FeedQueuedJobs(pipeline::JobTracker& tracker, JobScheduler& scheduler, std::size_t batch) {
  std::size_t enqueued = 0;
  for (const auto& job : tracker.ListQueued(batch)) {
    if (scheduler.EnqueueIfAbsent(JobTask{job.id})) {
      ++enqueued;
    }
  }
  return enqueued;
}

} // namespace lidar::worker
