#pragma once

#include <vector>

#include "internal/raster/raster.hpp"

namespace lidar::segmentation {

struct Peak {
  Eigen::Index row   = 0;
  Eigen::Index col   = 0;
  double       value = 0.0;
};

/*
  Local maxima of grid: cells equal to the maximum of the (2d+1)² window
  around them (clipped at the edges) with value > min_height and > 0. A
  peak exactly at min_height is not a tree top.

  Candidates are accepted highest first (ties by row-major position); a
  candidate within d cells (Chebyshev) of an accepted peak is dropped.
*/
std::vector<Peak> FindTreeTops(const raster::Grid& grid, int min_distance, double min_height);

} // namespace lidar::segmentation
