#pragma once

#include <chrono>
#include <filesystem>
#include <memory>
#include <string>

#include "internal/cache/tile_cache.hpp"
#include "internal/coverage/coverage_index.hpp"
#include "internal/fetch/origin_fetcher.hpp"
#include "internal/pipeline/job_tracker.hpp"
#include "internal/pipeline/processing_options.hpp"
#include "internal/publish/entity_graph_publisher.hpp"
#include "internal/segmentation/tree_segmenter.hpp"
#include "internal/storage/object_store.hpp"
#include "internal/tiling/tiling_converter.hpp"
#include "internal/toolkit/geometry_toolkit.hpp"

namespace lidar::pipeline {

// Collaborators, built once by the composition root.
struct PipelineServices {
  std::shared_ptr<JobTracker>                    tracker;
  std::shared_ptr<coverage::CoverageIndex>       coverage;
  std::shared_ptr<cache::TileCache>              tile_cache;
  fetch::OriginFetcherPtr                        fetcher;
  toolkit::GeometryToolkitPtr                    toolkit;
  std::shared_ptr<segmentation::TreeSegmenter>   segmenter;
  tiling::TilingConverterPtr                     tiling;
  storage::ObjectStorePtr                        store;
  publish::EntityGraphPublisherPtr               publisher;
};

struct PipelineSettings {
  std::filesystem::path            work_root;
  std::chrono::seconds             job_deadline{1800};
  std::string                      tileset_prefix{"tilesets"};
  std::string                      area_srs{"EPSG:4326"};
  segmentation::SegmentationParams defaults;
};

/*
  Runs one processing job end to end:

    ingest (10) → spectral fusion (30) → tree segmentation (50)
      → tiling (70) → publish (90) → completed (100)

  Each checkpoint is persisted before its phase starts. Any failure is
  persisted as the job's error and rethrown; the per-job work directory is
  removed on every path.
*/
class PipelineOrchestrator {
 public:
  PipelineOrchestrator(PipelineServices services, PipelineSettings settings);

  // false when the job was not claimable (already running or finished).
  bool Run(const std::string& job_id);

 private:
  JobResult Execute(JobStateMachine& machine, std::chrono::steady_clock::time_point deadline);

  PipelineServices services_;
  PipelineSettings settings_;
};

} // namespace lidar::pipeline
