#pragma once

#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_set>

namespace lidar::worker {

struct JobTask {
  std::string job_id;
};

/*
  Thread-safe blocking queue for job workers.

  A job id is tracked from EnqueueIfAbsent until Finished, so a poller can offer the
  same queued job repeatedly without it running twice in this process.
  Cancellation goes through JobTracker::Cancel; a failed row is never fed.
*/
class JobScheduler {
 public:
  // false when the id is already queued or running here.
  bool EnqueueIfAbsent(const JobTask& task);

  // blocking wait; nullopt once Shutdown was called
  std::optional<JobTask> Dequeue();

  // Called by the worker when a dequeued job is done.
  void Finished(const std::string& job_id);

  std::size_t Pending() const;

  void Shutdown();

 private:
  mutable std::mutex              mutex_;
  std::condition_variable         cv_;
  std::deque<JobTask>             queue_;
  std::unordered_set<std::string> tracked_;
  bool                            shutdown_ = false;
};

} // namespace lidar::worker
