#include "internal/segmentation/canopy.hpp"
#include "internal/segmentation/tree_segmenter.hpp"
#include "internal/segmentation/tree_tops.hpp"
#include "internal/segmentation/watershed.hpp"

#include <cassert>
#include <algorithm>
#include <cmath>
#include <iostream>
#include <numbers>

#include "internal/util/errors.hpp"

using lidar::raster::Grid;
using lidar::raster::Raster;
using lidar::segmentation::SegmentationParams;

namespace {

bool Near(double a, double b, double eps = 1e-9) {
  return std::abs(a - b) <= eps;
}

Raster MakeRaster(const Grid& cells) {
  Raster raster;
  raster.cells                  = cells;
  raster.transform.origin_x     = 100.0;
  raster.transform.origin_y     = 200.0;
  raster.transform.pixel_width  = 0.5;
  raster.transform.pixel_height = -0.5;
  raster.spatial_ref_wkt        = "LOCAL_CS[\"test\"]";
  return raster;
}

// Cone of the given height with slope one cell per metre of height.
void AddCone(Grid& grid, Eigen::Index row, Eigen::Index col, double height) {
  for (Eigen::Index r = 0; r < grid.rows(); ++r) {
    for (Eigen::Index c = 0; c < grid.cols(); ++c) {
      const double dist = std::hypot(static_cast<double>(r - row), static_cast<double>(c - col));
      grid(r, c)        = std::max(grid(r, c), height - dist);
    }
  }
}

void TestCanopyHeightClampsUndefinedAndNegative() {
  Grid dsm(1, 3);
  dsm << 5.0, lidar::raster::kUndefined, 1.0;
  Grid dtm(1, 3);
  dtm << 2.0, 1.0, 3.0;

  const Grid chm = lidar::segmentation::ComputeCanopyHeight(dsm, dtm);
  assert(chm(0, 0) == 3.0);
  assert(chm(0, 1) == 0.0);
  assert(chm(0, 2) == 0.0);

  const Grid thresholded = lidar::segmentation::ThresholdCanopy(chm, 4.0);
  assert(thresholded(0, 0) == 0.0);
}

void TestGaussianKeepsConstantGrid() {
  const Grid flat     = Grid::Constant(7, 5, 3.0);
  const Grid smoothed = lidar::segmentation::GaussianSmooth(flat, 1.0);
  for (Eigen::Index i = 0; i < smoothed.size(); ++i) {
    assert(Near(smoothed.data()[i], 3.0, 1e-9));
  }
}

void TestMinPeakDistance() {
  SegmentationParams params;
  assert(lidar::segmentation::MinPeakDistance(params) == 6);

  params.search_radius = 0.2;
  assert(lidar::segmentation::MinPeakDistance(params) == 1);

  params.resolution = 0.0;
  bool threw        = false;
  try {
    (void)lidar::segmentation::MinPeakDistance(params);
  } catch (const lidar::util::ValidationError&) {
    threw = true;
  }
  assert(threw);
}

void TestTreeTopsSuppressNearbyPeaks() {
  Grid grid = Grid::Zero(11, 14);
  grid(5, 5) = 10.0;
  grid(5, 8) = 9.0;

  const auto wide = lidar::segmentation::FindTreeTops(grid, 5, 2.0);
  assert(wide.size() == 1);
  assert(wide[0].row == 5 && wide[0].col == 5);

  const auto narrow = lidar::segmentation::FindTreeTops(grid, 1, 2.0);
  assert(narrow.size() == 2);
  assert(narrow[0].value == 10.0);
  assert(narrow[1].col == 8);

  const auto tall_only = lidar::segmentation::FindTreeTops(grid, 1, 9.5);
  assert(tall_only.size() == 1);
}

void TestTreeTopAtThresholdIsRejected() {
  Grid grid = Grid::Zero(7, 7);
  grid(3, 3) = 2.0;

  assert(lidar::segmentation::FindTreeTops(grid, 1, 2.0).empty());
  assert(lidar::segmentation::FindTreeTops(grid, 1, 1.999).size() == 1);
}

void TestWatershedGrowsFromMarkers() {
  Grid surface(1, 5);
  surface << 5.0, 3.0, 1.0, 3.0, 5.0;
  std::vector<lidar::segmentation::Peak> markers{{0, 0, 5.0}, {0, 4, 5.0}};

  const auto labels = lidar::segmentation::MarkerWatershed(surface, markers);
  assert(labels(0, 0) == 1 && labels(0, 1) == 1);
  assert(labels(0, 3) == 2 && labels(0, 4) == 2);
  assert(labels(0, 2) == 1);

  surface(0, 2) = 0.0;
  const auto cut = lidar::segmentation::MarkerWatershed(surface, markers);
  assert(cut(0, 2) == 0);
}

void TestSingleCone() {
  Grid dsm = Grid::Zero(30, 30);
  AddCone(dsm, 15, 15, 8.0);
  const Grid dtm = Grid::Zero(30, 30);

  const auto result = lidar::segmentation::SegmentTrees(MakeRaster(dsm), MakeRaster(dtm), SegmentationParams{});
  assert(result.trees.size() == 1);

  const auto& tree = result.trees[0];
  assert(tree.label == 1);
  assert(Near(tree.x, 107.75));
  assert(Near(tree.y, 192.25));
  assert(Near(tree.height, 8.0));
  assert(tree.crown_area > 0.0);
  assert(Near(tree.crown_diameter, 2.0 * std::sqrt(tree.crown_area / std::numbers::pi)));

  assert(result.chm.Rows() == 30 && result.chm.Cols() == 30);
  assert(result.chm.transform.origin_x == 100.0);
  assert(result.chm.spatial_ref_wkt == "LOCAL_CS[\"test\"]");
}

void TestThreeSeparatedCones() {
  Grid dsm = Grid::Constant(60, 60, 50.0);
  Grid canopy = Grid::Zero(60, 60);
  AddCone(canopy, 15, 15, 8.0);
  AddCone(canopy, 15, 45, 10.0);
  AddCone(canopy, 45, 30, 12.0);
  dsm += canopy;
  const Grid dtm = Grid::Constant(60, 60, 50.0);

  const auto result = lidar::segmentation::SegmentTrees(MakeRaster(dsm), MakeRaster(dtm), SegmentationParams{});
  assert(result.trees.size() == 3);

  // highest first
  assert(Near(result.trees[0].height, 12.0));
  assert(Near(result.trees[1].height, 10.0));
  assert(Near(result.trees[2].height, 8.0));
  for (std::size_t i = 0; i < result.trees.size(); ++i) {
    assert(result.trees[i].label == static_cast<int>(i + 1));
    assert(result.trees[i].crown_area > 0.0);
  }
  // the tallest cone has the widest crown above the threshold
  assert(result.trees[0].crown_area > result.trees[2].crown_area);
}

void TestEmptyCanopyHasNoTrees() {
  const Grid ground = Grid::Constant(20, 20, 30.0);
  const auto result = lidar::segmentation::SegmentTrees(MakeRaster(ground), MakeRaster(ground), SegmentationParams{});
  assert(result.trees.empty());
  assert((result.chm.cells == 0.0).all());
}

void TestLowVegetationHasNoTrees() {
  const Grid dsm    = Grid::Constant(20, 20, 1.5);
  const Grid dtm    = Grid::Zero(20, 20);
  const auto result = lidar::segmentation::SegmentTrees(MakeRaster(dsm), MakeRaster(dtm), SegmentationParams{});
  assert(result.trees.empty());
}

void TestUndefinedSurfaceHasNoTrees() {
  const Grid dsm    = Grid::Constant(10, 10, lidar::raster::kUndefined);
  const Grid dtm    = Grid::Zero(10, 10);
  const auto result = lidar::segmentation::SegmentTrees(MakeRaster(dsm), MakeRaster(dtm), SegmentationParams{});
  assert(result.trees.empty());
  assert((result.chm.cells == 0.0).all());
}

} // namespace

int main() {
  TestCanopyHeightClampsUndefinedAndNegative();
  TestGaussianKeepsConstantGrid();
  TestMinPeakDistance();
  TestTreeTopsSuppressNearbyPeaks();
  TestTreeTopAtThresholdIsRejected();
  TestWatershedGrowsFromMarkers();
  TestSingleCone();
  TestThreeSeparatedCones();
  TestEmptyCanopyHasNoTrees();
  TestLowVegetationHasNoTrees();
  TestUndefinedSurfaceHasNoTrees();

  std::cout << "lidar_unit_segmentation: pass\n";
  return 0;
}
