#include "internal/segmentation/tree_tops.hpp"

#include <algorithm>
#include <cstdlib>

namespace lidar::segmentation {

std::vector<Peak> FindTreeTops(const raster::Grid& grid, int min_distance, double min_height) {
  const Eigen::Index rows = grid.rows();
  const Eigen::Index cols = grid.cols();
  const Eigen::Index d    = std::max(1, min_distance);

  std::vector<Peak> candidates;
  for (Eigen::Index r = 0; r < rows; ++r) {
    for (Eigen::Index c = 0; c < cols; ++c) {
      const double value = grid(r, c);
      if (!(value > 0.0) || !(value > min_height)) {
        continue;
      }

      const Eigen::Index r0 = std::max<Eigen::Index>(0, r - d);
      const Eigen::Index r1 = std::min<Eigen::Index>(rows - 1, r + d);
      const Eigen::Index c0 = std::max<Eigen::Index>(0, c - d);
      const Eigen::Index c1 = std::min<Eigen::Index>(cols - 1, c + d);
      if (grid.block(r0, c0, r1 - r0 + 1, c1 - c0 + 1).maxCoeff() <= value) {
        candidates.push_back(Peak{r, c, value});
      }
    }
  }

  // stable: equal values keep row-major order
  std::stable_sort(candidates.begin(), candidates.end(), [](const Peak& a, const Peak& b) { return a.value > b.value; });

  std::vector<Peak> accepted;
  for (const auto& candidate : candidates) {
    const bool too_close = std::any_of(accepted.begin(), accepted.end(), [&](const Peak& peak) {
      return std::max(std::abs(peak.row - candidate.row), std::abs(peak.col - candidate.col)) <= d;
    });
    if (!too_close) {
      accepted.push_back(candidate);
    }
  }
  return accepted;
}

} // namespace lidar::segmentation
