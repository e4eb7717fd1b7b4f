#include "internal/pipeline/job_state_machine.hpp"

#include <cassert>
#include <iostream>
#include <string>

#include "internal/util/errors.hpp"

using lidar::db::model::JobRecord;
using lidar::model::JobStatus;
using lidar::pipeline::JobResult;
using lidar::pipeline::JobStateMachine;

namespace {

JobRecord QueuedJob() {
  JobRecord job;
  job.id        = "job-1";
  job.tenant_id = "tenant";
  job.parcel_id = "parcel";
  job.status    = JobStatus::kQueued;
  return job;
}

template <typename Fn>
bool ThrowsInvalidState(Fn&& fn) {
  try {
    fn();
  } catch (const lidar::util::InvalidState&) {
    return true;
  }
  return false;
}

void TestHappyPathReachesCompleted() {
  JobStateMachine machine(QueuedJob());
  machine.Start(1000);
  assert(machine.Job().status == JobStatus::kProcessing);
  assert(machine.Job().progress == 0);
  assert(machine.Job().started_at_ms == 1000);

  machine.BeginIngest();
  assert(machine.Job().progress == lidar::pipeline::kIngestProgress);
  machine.BeginSpectralFusion();
  machine.BeginSegmentation();
  machine.BeginTiling();
  machine.BeginPublish();
  assert(machine.Job().progress == lidar::pipeline::kPublishProgress);
  machine.ReportProgress(95, "Creating digital twin entities");

  JobResult result;
  result.tileset_url = "https://tiles.example/tilesets/job-1/tileset.json";
  result.tree_count  = 3;
  result.point_count = 1200;
  machine.Complete(result, 2000);

  const auto& job = machine.Job();
  assert(job.status == JobStatus::kCompleted);
  assert(job.progress == 100);
  assert(job.tileset_url == result.tileset_url);
  assert(job.tree_count == 3);
  assert(job.point_count == 1200);
  assert(job.completed_at_ms == 2000);
}

void TestPhasesMayBeSkippedButNotRevisited() {
  JobStateMachine machine(QueuedJob());
  machine.Start(1);
  machine.BeginIngest();
  machine.BeginSegmentation();
  assert(ThrowsInvalidState([&] { machine.BeginSpectralFusion(); }));
  assert(machine.Job().progress == lidar::pipeline::kSegmentationProgress);
  assert(ThrowsInvalidState([&] { machine.ReportProgress(20, "back"); }));
  assert(ThrowsInvalidState([&] { machine.ReportProgress(101, "over"); }));
}

void TestPhasesRequireProcessing() {
  JobStateMachine machine(QueuedJob());
  assert(ThrowsInvalidState([&] { machine.BeginIngest(); }));
  assert(machine.Job().status == JobStatus::kQueued);
}

void TestCompleteNeedsTileset() {
  JobStateMachine machine(QueuedJob());
  machine.Start(1);
  assert(ThrowsInvalidState([&] { machine.Complete(JobResult{}, 2); }));
  assert(machine.Job().status == JobStatus::kProcessing);
}

void TestFailFromQueuedAndProcessing() {
  JobStateMachine queued(QueuedJob());
  queued.Fail("cancelled", 5);
  assert(queued.Job().status == JobStatus::kFailed);
  assert(queued.Job().error_message == "cancelled");

  JobStateMachine running(QueuedJob());
  running.Start(1);
  running.BeginIngest();
  running.Fail("", 6);
  assert(running.Job().status == JobStatus::kFailed);
  assert(running.Job().error_message == "unknown error");
  assert(running.Job().completed_at_ms == 6);
}

void TestTerminalStatesAreFinal() {
  JobStateMachine machine(QueuedJob());
  machine.Fail("boom", 1);
  assert(ThrowsInvalidState([&] { machine.Fail("again", 2); }));
  assert(ThrowsInvalidState([&] { machine.Start(3); }));
  assert(machine.Job().error_message == "boom");

  JobStateMachine done(QueuedJob());
  done.Start(1);
  JobResult result;
  result.tileset_url = "file:///tiles/tileset.json";
  done.Complete(result, 2);
  assert(ThrowsInvalidState([&] { done.Fail("late", 3); }));
  assert(done.Job().status == JobStatus::kCompleted);
}

void TestStartResetsPreviousError() {
  auto job          = QueuedJob();
  job.error_message = "stale";
  JobStateMachine machine(job);
  machine.Start(1);
  assert(machine.Job().error_message.empty());
  assert(ThrowsInvalidState([&] { machine.Start(2); }));
}

void TestTransitionTable() {
  using lidar::model::CanTransition;
  assert(CanTransition(JobStatus::kPending, JobStatus::kQueued));
  assert(CanTransition(JobStatus::kQueued, JobStatus::kProcessing));
  assert(CanTransition(JobStatus::kProcessing, JobStatus::kProcessing));
  assert(CanTransition(JobStatus::kQueued, JobStatus::kFailed));
  assert(!CanTransition(JobStatus::kQueued, JobStatus::kCompleted));
  assert(!CanTransition(JobStatus::kCompleted, JobStatus::kFailed));
  assert(!CanTransition(JobStatus::kFailed, JobStatus::kQueued));
  assert(lidar::model::ParseJobStatus("processing") == JobStatus::kProcessing);
  assert(!lidar::model::ParseJobStatus("running").has_value());
}

} // namespace

int main() {
  TestHappyPathReachesCompleted();
  TestPhasesMayBeSkippedButNotRevisited();
  TestPhasesRequireProcessing();
  TestCompleteNeedsTileset();
  TestFailFromQueuedAndProcessing();
  TestTerminalStatesAreFinal();
  TestStartResetsPreviousError();
  TestTransitionTable();

  std::cout << "lidar_unit_job_state_machine: pass\n";
  return 0;
}
