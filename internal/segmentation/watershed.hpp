#pragma once

#include <vector>

#include "internal/raster/raster.hpp"
#include "internal/segmentation/tree_tops.hpp"

namespace lidar::segmentation {

// 0 = unlabeled; marker i gets label i + 1.
using LabelGrid = Eigen::Array<int, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;

/*
  Marker-controlled watershed of the inverted surface: regions grow from the
  markers into 4-connected neighbours with value > 0, highest values first.
  Cells reached at equal value are processed in arrival order.
*/
LabelGrid MarkerWatershed(const raster::Grid& surface, const std::vector<Peak>& markers);

} // namespace lidar::segmentation
