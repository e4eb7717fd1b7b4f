#pragma once

#include "internal/raster/raster.hpp"

namespace lidar::segmentation {

// DSM − DTM; undefined or negative cells become 0. Shapes must match.
raster::Grid ComputeCanopyHeight(const raster::Grid& dsm, const raster::Grid& dtm);

// Cells below min_height become 0.
raster::Grid ThresholdCanopy(const raster::Grid& chm, double min_height);

// Separable Gaussian blur, kernel radius int(4σ + 0.5), mirrored borders
// (the edge cell is repeated: -1 → 0, n → n-1).
raster::Grid GaussianSmooth(const raster::Grid& grid, double sigma);

} // namespace lidar::segmentation
