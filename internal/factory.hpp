#pragma once

#include <memory>

#include "config/config.pb.h"
#include "internal/cache/tile_cache.hpp"
#include "internal/coverage/coverage_index.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/pipeline/job_tracker.hpp"
#include "internal/pipeline/pipeline_orchestrator.hpp"
#include "internal/storage/object_store.hpp"

namespace lidar::factory {

/*
  Runtime

  Owns all long-lived services of one process.
  Everything here lives for the lifetime of the process.
*/
struct Runtime {
  std::shared_ptr<db::Repository> repository;
  storage::ObjectStorePtr         store;

  std::shared_ptr<coverage::CoverageIndex>        coverage;
  std::shared_ptr<cache::TileCache>               tile_cache;
  std::shared_ptr<pipeline::JobTracker>           tracker;
  std::shared_ptr<pipeline::PipelineOrchestrator> orchestrator;
};

/*
  Selects and bootstraps the configured repository backend.
  Throws std::runtime_error when the backend is not compiled in.
*/
std::shared_ptr<db::Repository> BuildRepository(const lidar::runtime::config::RuntimeConfig& config);

/*
  Build

  Constructs every service from runtime config.

  NOTE:
  This is the composition root of the application.
  It is the ONLY place allowed to know concrete DB, storage and tool types.
*/
Runtime Build(const lidar::runtime::config::RuntimeConfig& config);

} // namespace lidar::factory
