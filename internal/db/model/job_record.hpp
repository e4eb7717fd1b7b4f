#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "internal/model/job_status.hpp"

namespace lidar::db::model {

/*
  Persistent processing job row.

  status/progress are only advanced through pipeline::JobStateMachine.
  Result fields are set together when the job completes.
*/
struct JobRecord {
  std::string id;
  std::string tenant_id;
  std::string parcel_id;

  // absent: process the whole source file
  std::optional<std::string> area_wkt;
  // uploaded file or explicit origin locator; absent: resolve via coverage
  std::optional<std::string> source_url;

  // lidar.processing.v1.ProcessingConfig as JSON
  std::string config_json{"{}"};

  lidar::model::JobStatus status = lidar::model::JobStatus::kPending;
  std::int32_t            progress = 0;
  std::string             status_message;
  std::string             error_message;

  std::string                 tileset_url;
  std::optional<std::int64_t> tree_count;
  std::optional<std::int64_t> point_count;

  std::uint64_t created_at_ms   = 0;
  std::uint64_t started_at_ms   = 0; // 0 = not started
  std::uint64_t completed_at_ms = 0; // 0 = not finished
};

} // namespace lidar::db::model
