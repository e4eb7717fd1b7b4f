#include "internal/toolkit/pipelines.hpp"

#include <sstream>

namespace lidar::toolkit {
namespace {

// writers.gdal bounds: ([minx, maxx],[miny, maxy])
std::string FormatBounds(const geo::Envelope& e) {
  std::ostringstream out;
  out.precision(17);
  out << "([" << e.min_x << ", " << e.max_x << "],[" << e.min_y << ", " << e.max_y << "])";
  return out.str();
}

void AddGdalWriter(PipelineSpec& spec, const std::filesystem::path& output, const GridSpec& grid, const char* output_type) {
  spec.Stage("writers.gdal")
      .Option("filename", output.string())
      .Option("gdaldriver", "GTiff")
      .Option("output_type", output_type)
      .Option("resolution", grid.resolution)
      .Option("bounds", FormatBounds(grid.bounds))
      .Option("nodata", kRasterNoData);
}

} // namespace

PipelineSpec CleanPointCloud(const std::filesystem::path& input, const std::filesystem::path& output, const std::optional<CropArea>& crop) {
  PipelineSpec spec;
  spec.Stage("readers.las").Option("filename", input.string());
  if (crop) {
    spec.Stage("filters.crop").Option("polygon", crop->wkt).Option("a_srs", crop->srs);
  }
  spec.Stage("filters.outlier").Option("method", "statistical").Option("mean_k", 12).Option("multiplier", 2.0);
  spec.Stage("filters.elm");
  spec.Stage("writers.las").Option("filename", output.string()).Option("compression", "laszip");
  return spec;
}

PipelineSpec ColorizeWithNdvi(const std::filesystem::path& input, const std::filesystem::path& raster, const std::filesystem::path& output) {
  PipelineSpec spec;
  spec.Stage("readers.las").Option("filename", input.string());
  spec.Stage("filters.colorization").Option("raster", raster.string()).Option("dimensions", "NDVI:1:256.0");
  spec.Stage("writers.las").Option("filename", output.string()).Option("compression", "laszip").Option("extra_dims", "NDVI=float");
  return spec;
}

PipelineSpec TerrainModel(const std::filesystem::path& input, const std::filesystem::path& output, const GridSpec& grid) {
  PipelineSpec spec;
  spec.Stage("readers.las").Option("filename", input.string());
  spec.Stage("filters.smrf");
  spec.Stage("filters.range").Option("limits", "Classification[2:2]");
  AddGdalWriter(spec, output, grid, "idw");
  return spec;
}

PipelineSpec SurfaceModel(const std::filesystem::path& input, const std::filesystem::path& output, const GridSpec& grid) {
  PipelineSpec spec;
  spec.Stage("readers.las").Option("filename", input.string());
  AddGdalWriter(spec, output, grid, "max");
  return spec;
}

} // namespace lidar::toolkit
