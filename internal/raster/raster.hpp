#pragma once

#include <Eigen/Core>

#include <array>
#include <cmath>
#include <limits>
#include <string>

namespace lidar::raster {

// Row-major cell grid, (row, col); NaN marks an undefined cell.
using Grid = Eigen::Array<double, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;

constexpr double kUndefined = std::numeric_limits<double>::quiet_NaN();

struct Point2 {
  double x = 0.0;
  double y = 0.0;
};

/*
  Affine pixel → georeferenced mapping, GDAL coefficient order:

    x = origin_x + col * pixel_width + row * row_rotation
    y = origin_y + col * col_rotation + row * pixel_height
*/
struct GeoTransform {
  double origin_x     = 0.0;
  double pixel_width  = 1.0;
  double row_rotation = 0.0;
  double origin_y     = 0.0;
  double col_rotation = 0.0;
  double pixel_height = -1.0;

  std::array<double, 6> ToGdal() const {
    return {origin_x, pixel_width, row_rotation, origin_y, col_rotation, pixel_height};
  }

  static GeoTransform FromGdal(const std::array<double, 6>& c) {
    return GeoTransform{c[0], c[1], c[2], c[3], c[4], c[5]};
  }

  Point2 PixelCenter(Eigen::Index row, Eigen::Index col) const {
    const double c = static_cast<double>(col) + 0.5;
    const double r = static_cast<double>(row) + 0.5;
    return {origin_x + c * pixel_width + r * row_rotation, origin_y + c * col_rotation + r * pixel_height};
  }

  double PixelArea() const {
    return std::abs(pixel_width * pixel_height - row_rotation * col_rotation);
  }
};

struct Raster {
  Grid         cells;
  GeoTransform transform;
  std::string  spatial_ref_wkt;

  Eigen::Index Rows() const {
    return cells.rows();
  }

  Eigen::Index Cols() const {
    return cells.cols();
  }
};

} // namespace lidar::raster
