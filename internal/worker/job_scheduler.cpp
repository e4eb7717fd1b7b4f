#include "job_scheduler.hpp"

namespace lidar::worker {

bool JobScheduler::EnqueueIfAbsent(const JobTask& task) {
  {
    std::lock_guard lock(mutex_);
    if (shutdown_ || !tracked_.insert(task.job_id).second) return false;
    queue_.push_back(task);
  }
  cv_.notify_one();
  return true;
}

std::optional<JobTask> JobScheduler::Dequeue() {
  std::unique_lock lock(mutex_);

  cv_.wait(lock, [&] { return shutdown_ || !queue_.empty(); });

  // queued jobs stay queued in the repository for the next process
  if (shutdown_) return std::nullopt;

  JobTask task = queue_.front();
  queue_.pop_front();
  return task;
}

void JobScheduler::Finished(const std::string& job_id) {
  std::lock_guard lock(mutex_);
  tracked_.erase(job_id);
}

std::size_t JobScheduler::Pending() const {
  std::lock_guard lock(mutex_);
  return queue_.size();
}

void JobScheduler::Shutdown() {
  {
    std::lock_guard lock(mutex_);
    shutdown_ = true;
  }
  cv_.notify_all();
}

} // namespace lidar::worker
