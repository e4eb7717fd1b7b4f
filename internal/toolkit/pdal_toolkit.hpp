#pragma once

#include "internal/toolkit/geometry_toolkit.hpp"

namespace lidar::toolkit {

// GeometryToolkit backed by the PDAL library.
class PdalToolkit final : public GeometryToolkit {
 public:
  void           Execute(const PipelineSpec& spec) override;
  PointCloudInfo Inspect(const std::filesystem::path& point_file) override;
};

} // namespace lidar::toolkit
