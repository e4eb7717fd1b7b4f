#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/worker/job_scheduler.hpp"
#include "internal/worker/job_worker.hpp"

using lidar::observability::IntField;
using lidar::observability::StringField;

static volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

int main(int argc, char** argv) {
  std::string config_path;
  if (argc == 2) {
    config_path = argv[1];
  } else if (argc == 3 && std::string(argv[1]) == "--config") {
    config_path = argv[2];
  } else {
    std::cerr << "Usage: lidar-worker <config.yaml> OR lidar-worker --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = lidar::config::ConfigLoader::LoadFromYaml(config_path);

    lidar::observability::InitializeTracing(config);
    lidar::observability::InitializeMetrics(config);
    lidar::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto runtime = lidar::factory::Build(config);

    // ------------------------------------------------------------
    // Start workers
    // ------------------------------------------------------------
    auto scheduler = std::make_shared<lidar::worker::JobScheduler>();

    std::vector<std::unique_ptr<lidar::worker::JobWorker>> workers;
    for (std::uint32_t i = 0; i < config.worker().threads(); ++i) {
      workers.push_back(std::make_unique<lidar::worker::JobWorker>(scheduler, runtime.orchestrator));
    }

    // Register signal handlers before starting workers to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    for (auto& worker : workers) worker->Start();
    LIDAR_LOG_INFO("lidar-worker started", {IntField("threads", config.worker().threads()),
                                            IntField("poll_interval_ms", config.worker().poll_interval_ms())});

    const auto poll_interval = std::chrono::milliseconds(config.worker().poll_interval_ms());
    auto       next_poll     = std::chrono::steady_clock::now();
    while (g_running) {
      if (std::chrono::steady_clock::now() >= next_poll) {
        try {
          const auto enqueued = lidar::worker::FeedQueuedJobs(*runtime.tracker, *scheduler, config.worker().poll_batch_size());
          if (enqueued > 0) {
            LIDAR_LOG_INFO("Queued jobs picked up", {IntField("jobs", static_cast<std::int64_t>(enqueued))});
          }
        } catch (const std::exception& e) {
          LIDAR_LOG_WARN("Polling for queued jobs failed", {StringField("error", e.what())});
        }
        next_poll = std::chrono::steady_clock::now() + poll_interval;
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    LIDAR_LOG_INFO("Shutting down lidar-worker", {IntField("abandoned", static_cast<std::int64_t>(scheduler->Pending()))});

    for (auto& worker : workers) worker->Stop();
    lidar::observability::ShutdownLogging();
    lidar::observability::ShutdownMetrics();
    lidar::observability::ShutdownTracing();
  } catch (const std::exception& e) {
    LIDAR_LOG_ERROR("Fatal error", {StringField("error", e.what())});
    lidar::observability::ShutdownLogging();
    lidar::observability::ShutdownMetrics();
    lidar::observability::ShutdownTracing();
    return 2;
  }

  return 0;
}
