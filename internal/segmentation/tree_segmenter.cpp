#include "internal/segmentation/tree_segmenter.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <numbers>

#include "internal/observability/logging.hpp"
#include "internal/segmentation/canopy.hpp"
#include "internal/segmentation/tree_tops.hpp"
#include "internal/segmentation/watershed.hpp"
#include "internal/toolkit/pipelines.hpp"
#include "internal/util/errors.hpp"

namespace lidar::segmentation {

using observability::DoubleField;
using observability::IntField;
using observability::StringField;

namespace {

constexpr double kSmoothingSigma = 1.0;

} // namespace

int MinPeakDistance(const SegmentationParams& params) {
  if (params.resolution <= 0.0) {
    throw util::ValidationError("resolution must be positive");
  }
  return std::max(1, static_cast<int>(std::floor(params.search_radius / params.resolution)));
}

SegmentationResult SegmentTrees(const raster::Raster& dsm, const raster::Raster& dtm, const SegmentationParams& params) {
  SegmentationResult result;
  result.chm.transform       = dsm.transform;
  result.chm.spatial_ref_wkt = dsm.spatial_ref_wkt;
  result.chm.cells           = ComputeCanopyHeight(dsm.cells, dtm.cells);

  const raster::Grid smoothed = GaussianSmooth(ThresholdCanopy(result.chm.cells, params.min_height), kSmoothingSigma);
  const auto         peaks    = FindTreeTops(smoothed, MinPeakDistance(params), params.min_height);
  if (peaks.empty()) {
    return result;
  }

  const LabelGrid labels = MarkerWatershed(smoothed, peaks);

  std::vector<std::int64_t> pixels(peaks.size() + 1, 0);
  for (Eigen::Index i = 0; i < labels.size(); ++i) {
    pixels[static_cast<std::size_t>(labels.data()[i])] += 1;
  }

  const double pixel_area = dsm.transform.PixelArea();
  result.trees.reserve(peaks.size());
  for (std::size_t i = 0; i < peaks.size(); ++i) {
    const auto& peak = peaks[i];
    const auto  at   = dsm.transform.PixelCenter(peak.row, peak.col);

    DetectedTree tree;
    tree.label          = static_cast<int>(i + 1);
    tree.x              = at.x;
    tree.y              = at.y;
    tree.height         = result.chm.cells(peak.row, peak.col);
    tree.crown_area     = static_cast<double>(pixels[i + 1]) * pixel_area;
    tree.crown_diameter = 2.0 * std::sqrt(tree.crown_area / std::numbers::pi);
    result.trees.push_back(tree);
  }
  return result;
}

TreeSegmenter::TreeSegmenter(toolkit::GeometryToolkitPtr toolkit, raster::RasterIoPtr raster_io)
    : toolkit_(std::move(toolkit)), raster_io_(std::move(raster_io)) {
}

std::vector<DetectedTree> TreeSegmenter::Run(const std::filesystem::path& point_file, const std::filesystem::path& work_dir,
                                             const SegmentationParams& params) {
  const auto info = toolkit_->Inspect(point_file);
  if (info.point_count == 0) {
    LIDAR_LOG_WARN("No points left for tree detection", {StringField("file", point_file.string())});
    return {};
  }

  toolkit::GridSpec grid;
  grid.bounds     = info.bounds;
  grid.resolution = params.resolution;

  const auto dtm_path = work_dir / "dtm.tif";
  const auto dsm_path = work_dir / "dsm.tif";
  toolkit_->Execute(toolkit::TerrainModel(point_file, dtm_path, grid));
  toolkit_->Execute(toolkit::SurfaceModel(point_file, dsm_path, grid));

  const auto dtm = raster_io_->Read(dtm_path);
  const auto dsm = raster_io_->Read(dsm_path);
  if (dtm.Rows() != dsm.Rows() || dtm.Cols() != dsm.Cols()) {
    throw util::ToolFailure("terrain and surface rasters are not aligned");
  }

  auto result = SegmentTrees(dsm, dtm, params);
  raster_io_->Write(work_dir / "chm.tif", result.chm);

  LIDAR_LOG_INFO("Tree detection finished", {IntField("trees", static_cast<std::int64_t>(result.trees.size())),
                                             IntField("rows", dsm.Rows()), IntField("cols", dsm.Cols()),
                                             DoubleField("resolution", params.resolution)});
  return std::move(result.trees);
}

} // namespace lidar::segmentation
