#include "internal/raster/raster_io.hpp"

#include <cpl_conv.h>
#include <gdal_priv.h>
#include <ogr_spatialref.h>

#include <mutex>

#include "internal/util/errors.hpp"

namespace lidar::raster {

GdalRasterIo::GdalRasterIo() {
  static std::once_flag registered;
  std::call_once(registered, [] { GDALAllRegister(); });
}

Raster GdalRasterIo::Read(const std::filesystem::path& path) {
  GDALDatasetUniquePtr dataset(GDALDataset::Open(path.c_str(), GDAL_OF_RASTER | GDAL_OF_READONLY));
  if (!dataset) {
    throw util::ToolFailure("cannot open raster " + path.string() + ": " + CPLGetLastErrorMsg());
  }
  if (dataset->GetRasterCount() < 1) {
    throw util::ToolFailure("raster " + path.string() + " has no bands");
  }

  Raster raster;
  const int cols = dataset->GetRasterXSize();
  const int rows = dataset->GetRasterYSize();
  raster.cells.resize(rows, cols);

  std::array<double, 6> coefficients{};
  if (dataset->GetGeoTransform(coefficients.data()) == CE_None) {
    raster.transform = GeoTransform::FromGdal(coefficients);
  }
  if (const auto* srs = dataset->GetSpatialRef()) {
    raster.spatial_ref_wkt = srs->exportToWkt();
  }

  GDALRasterBand* band = dataset->GetRasterBand(1);
  if (band->RasterIO(GF_Read, 0, 0, cols, rows, raster.cells.data(), cols, rows, GDT_Float64, 0, 0) != CE_None) {
    throw util::ToolFailure("cannot read raster " + path.string() + ": " + CPLGetLastErrorMsg());
  }

  int          has_nodata = 0;
  const double nodata     = band->GetNoDataValue(&has_nodata);
  if (has_nodata) {
    raster.cells = (raster.cells == nodata).select(kUndefined, raster.cells);
  }
  return raster;
}

void GdalRasterIo::Write(const std::filesystem::path& path, const Raster& raster) {
  GDALDriver* driver = GetGDALDriverManager()->GetDriverByName("GTiff");
  if (driver == nullptr) {
    throw util::ToolFailure("GTiff driver is not available");
  }

  const int cols = static_cast<int>(raster.Cols());
  const int rows = static_cast<int>(raster.Rows());

  GDALDatasetUniquePtr dataset(driver->Create(path.c_str(), cols, rows, 1, GDT_Float64, nullptr));
  if (!dataset) {
    throw util::ToolFailure("cannot create raster " + path.string() + ": " + CPLGetLastErrorMsg());
  }

  auto coefficients = raster.transform.ToGdal();
  dataset->SetGeoTransform(coefficients.data());
  if (!raster.spatial_ref_wkt.empty()) {
    OGRSpatialReference srs;
    if (srs.importFromWkt(raster.spatial_ref_wkt.c_str()) == OGRERR_NONE) {
      dataset->SetSpatialRef(&srs);
    }
  }

  Grid cells = raster.cells.isNaN().select(kNoData, raster.cells);

  GDALRasterBand* band = dataset->GetRasterBand(1);
  band->SetNoDataValue(kNoData);
  if (band->RasterIO(GF_Write, 0, 0, cols, rows, cells.data(), cols, rows, GDT_Float64, 0, 0) != CE_None) {
    throw util::ToolFailure("cannot write raster " + path.string() + ": " + CPLGetLastErrorMsg());
  }
}

} // namespace lidar::raster
