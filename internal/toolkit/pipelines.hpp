#pragma once

#include <filesystem>
#include <optional>
#include <string>

#include "internal/geo/envelope.hpp"
#include "internal/toolkit/pipeline_spec.hpp"

namespace lidar::toolkit {

struct CropArea {
  std::string wkt;
  std::string srs{"EPSG:4326"};
};

// read → [crop] → statistical outlier removal → ground/noise ELM → laszip
PipelineSpec CleanPointCloud(const std::filesystem::path& input, const std::filesystem::path& output, const std::optional<CropArea>& crop);

// Adds an NDVI dimension sampled from band 1 of raster.
PipelineSpec ColorizeWithNdvi(const std::filesystem::path& input, const std::filesystem::path& raster, const std::filesystem::path& output);

struct GridSpec {
  geo::Envelope bounds;
  double        resolution = 0.5;
};

// Ground-classified terrain model, IDW interpolated.
PipelineSpec TerrainModel(const std::filesystem::path& input, const std::filesystem::path& output, const GridSpec& grid);

// Highest return per cell.
PipelineSpec SurfaceModel(const std::filesystem::path& input, const std::filesystem::path& output, const GridSpec& grid);

constexpr double kRasterNoData = -9999.0;

} // namespace lidar::toolkit
