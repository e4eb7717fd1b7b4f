#pragma once

#include <filesystem>
#include <vector>

#include "internal/raster/raster_io.hpp"
#include "internal/toolkit/geometry_toolkit.hpp"

namespace lidar::segmentation {

struct SegmentationParams {
  double min_height    = 2.0; // meters
  double search_radius = 3.0; // meters
  double resolution    = 0.5; // meters per pixel
};

struct DetectedTree {
  int    label          = 0;
  double x              = 0.0; // raster reference system
  double y              = 0.0;
  double height         = 0.0;
  double crown_diameter = 0.0; // circle of equal area
  double crown_area     = 0.0;
};

struct SegmentationResult {
  raster::Raster            chm;
  std::vector<DetectedTree> trees;
};

// Peak suppression distance in pixels: max(1, floor(radius / resolution)).
int MinPeakDistance(const SegmentationParams& params);

// Canopy height model, tree tops and crowns from aligned surface/terrain
// rasters. Pure; the CHM inherits the surface raster's georeference.
SegmentationResult SegmentTrees(const raster::Raster& dsm, const raster::Raster& dtm, const SegmentationParams& params);

/*
  Runs the full detection for a cleaned point file: terrain and surface
  rasters on a shared grid, segmentation, and chm.tif in work_dir.
*/
class TreeSegmenter {
 public:
  TreeSegmenter(toolkit::GeometryToolkitPtr toolkit, raster::RasterIoPtr raster_io);

  std::vector<DetectedTree> Run(const std::filesystem::path& point_file, const std::filesystem::path& work_dir,
                                const SegmentationParams& params);

 private:
  toolkit::GeometryToolkitPtr toolkit_;
  raster::RasterIoPtr         raster_io_;
};

} // namespace lidar::segmentation
