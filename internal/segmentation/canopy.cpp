#include "internal/segmentation/canopy.hpp"

#include <cmath>
#include <stdexcept>
#include <vector>

namespace lidar::segmentation {

using raster::Grid;

namespace {

Eigen::Index Reflect(Eigen::Index i, Eigen::Index n) {
  if (n == 1) {
    return 0;
  }
  const Eigen::Index period = 2 * n;
  i %= period;
  if (i < 0) {
    i += period;
  }
  return i < n ? i : period - i - 1;
}

std::vector<double> GaussianKernel(double sigma, int radius) {
  std::vector<double> weights(static_cast<std::size_t>(2 * radius + 1));
  double              sum = 0.0;
  for (int k = -radius; k <= radius; ++k) {
    const double w                           = std::exp(-0.5 * (k * k) / (sigma * sigma));
    weights[static_cast<std::size_t>(k + radius)] = w;
    sum += w;
  }
  for (auto& w : weights) {
    w /= sum;
  }
  return weights;
}

} // namespace

Grid ComputeCanopyHeight(const Grid& dsm, const Grid& dtm) {
  if (dsm.rows() != dtm.rows() || dsm.cols() != dtm.cols()) {
    throw std::invalid_argument("surface and terrain grids differ in shape");
  }
  Grid chm = dsm - dtm;
  return (chm.isNaN() || chm < 0.0).select(0.0, chm);
}

Grid ThresholdCanopy(const Grid& chm, double min_height) {
  return (chm < min_height).select(0.0, chm);
}

Grid GaussianSmooth(const Grid& grid, double sigma) {
  if (grid.size() == 0 || sigma <= 0.0) {
    return grid;
  }

  const int  radius  = static_cast<int>(4.0 * sigma + 0.5);
  const auto weights = GaussianKernel(sigma, radius);
  const auto rows    = grid.rows();
  const auto cols    = grid.cols();

  Grid horizontal(rows, cols);
  for (Eigen::Index r = 0; r < rows; ++r) {
    for (Eigen::Index c = 0; c < cols; ++c) {
      double acc = 0.0;
      for (int k = -radius; k <= radius; ++k) {
        acc += weights[static_cast<std::size_t>(k + radius)] * grid(r, Reflect(c + k, cols));
      }
      horizontal(r, c) = acc;
    }
  }

  Grid out(rows, cols);
  for (Eigen::Index r = 0; r < rows; ++r) {
    for (Eigen::Index c = 0; c < cols; ++c) {
      double acc = 0.0;
      for (int k = -radius; k <= radius; ++k) {
        acc += weights[static_cast<std::size_t>(k + radius)] * horizontal(Reflect(r + k, rows), c);
      }
      out(r, c) = acc;
    }
  }
  return out;
}

} // namespace lidar::segmentation
