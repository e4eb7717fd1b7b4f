#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>

#include "internal/geo/envelope.hpp"
#include "internal/toolkit/pipeline_spec.hpp"

namespace lidar::toolkit {

struct PointCloudInfo {
  std::uint64_t point_count = 0;
  geo::Envelope bounds;
  double        min_z = 0.0;
  double        max_z = 0.0;
};

/*
  Point-cloud processing engine.

  Execute runs a pipeline to completion; failures throw util::ToolFailure
  with the engine's message.
*/
class GeometryToolkit {
 public:
  virtual ~GeometryToolkit() = default;

  virtual void Execute(const PipelineSpec& spec) = 0;

  // Header metadata of a LAS/LAZ file without reading its points.
  virtual PointCloudInfo Inspect(const std::filesystem::path& point_file) = 0;
};

using GeometryToolkitPtr = std::shared_ptr<GeometryToolkit>;

} // namespace lidar::toolkit
