#pragma once

#include <filesystem>
#include <memory>

#include "internal/raster/raster.hpp"

namespace lidar::raster {

/*
  Single-band raster file access.

  Read maps the band's nodata value to kUndefined; Write stores kUndefined
  cells as nodata. Failures throw util::ToolFailure.
*/
class RasterIo {
 public:
  virtual ~RasterIo() = default;

  virtual Raster Read(const std::filesystem::path& path) = 0;
  virtual void   Write(const std::filesystem::path& path, const Raster& raster) = 0;
};

using RasterIoPtr = std::shared_ptr<RasterIo>;

// GeoTIFF through GDAL, band 1, Float64.
class GdalRasterIo final : public RasterIo {
 public:
  GdalRasterIo();

  Raster Read(const std::filesystem::path& path) override;
  void   Write(const std::filesystem::path& path, const Raster& raster) override;

  static constexpr double kNoData = -9999.0;
};

} // namespace lidar::raster
