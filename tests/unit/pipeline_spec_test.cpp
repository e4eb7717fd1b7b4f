#include "internal/toolkit/pipeline_spec.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

#include <cassert>
#include <iostream>
#include <string>
#include <variant>

#include "internal/toolkit/pipelines.hpp"

using lidar::toolkit::FindOption;
using lidar::toolkit::PipelineSpec;

namespace {

std::string StringOption(const PipelineSpec& spec, const std::string& type, const std::string& key) {
  const auto* value = FindOption(spec, type, key);
  assert(value != nullptr);
  return std::get<std::string>(*value);
}

void TestBuilderKeepsStageOrderAndTypes() {
  PipelineSpec spec;
  spec.Stage("readers.las").Option("filename", "in.laz");
  spec.Stage("filters.outlier").Option("mean_k", 12).Option("multiplier", 2.0).Option("enabled", true);

  assert(spec.Stages().size() == 2);
  assert(spec.Describe() == "readers.las -> filters.outlier");

  assert(std::get<std::int64_t>(*FindOption(spec, "filters.outlier", "mean_k")) == 12);
  assert(std::get<double>(*FindOption(spec, "filters.outlier", "multiplier")) == 2.0);
  assert(std::get<bool>(*FindOption(spec, "filters.outlier", "enabled")));
  assert(FindOption(spec, "filters.outlier", "missing") == nullptr);
  assert(FindOption(spec, "writers.las", "filename") == nullptr);
}

void TestJsonIsAPdalPipeline() {
  PipelineSpec spec;
  spec.Stage("readers.las").Option("filename", "in.laz");
  spec.Stage("filters.outlier").Option("mean_k", 12).Option("enabled", false);

  google::protobuf::Struct parsed;
  assert(google::protobuf::util::JsonStringToMessage(spec.ToJson(), &parsed).ok());

  const auto& stages = parsed.fields().at("pipeline").list_value();
  assert(stages.values_size() == 2);

  const auto& reader = stages.values(0).struct_value().fields();
  assert(reader.at("type").string_value() == "readers.las");
  assert(reader.at("filename").string_value() == "in.laz");

  const auto& outlier = stages.values(1).struct_value().fields();
  assert(outlier.at("mean_k").number_value() == 12.0);
  assert(!outlier.at("enabled").bool_value());
}

void TestCleanPipelineWithAndWithoutCrop() {
  const auto plain = lidar::toolkit::CleanPointCloud("/w/tile.laz", "/w/cleaned.laz", std::nullopt);
  assert(plain.Describe() == "readers.las -> filters.outlier -> filters.elm -> writers.las");
  assert(StringOption(plain, "writers.las", "compression") == "laszip");
  assert(StringOption(plain, "filters.outlier", "method") == "statistical");

  lidar::toolkit::CropArea crop;
  crop.wkt           = "POLYGON((0 0, 1 0, 1 1, 0 1, 0 0))";
  const auto cropped = lidar::toolkit::CleanPointCloud("/w/tile.laz", "/w/cleaned.laz", crop);
  assert(cropped.Describe() == "readers.las -> filters.crop -> filters.outlier -> filters.elm -> writers.las");
  assert(StringOption(cropped, "filters.crop", "polygon") == crop.wkt);
  assert(StringOption(cropped, "filters.crop", "a_srs") == "EPSG:4326");
}

void TestNdviColorization() {
  const auto spec = lidar::toolkit::ColorizeWithNdvi("/w/cleaned.laz", "/w/ndvi.tif", "/w/colored.laz");
  assert(spec.Describe() == "readers.las -> filters.colorization -> writers.las");
  assert(StringOption(spec, "filters.colorization", "raster") == "/w/ndvi.tif");
  assert(StringOption(spec, "filters.colorization", "dimensions") == "NDVI:1:256.0");
  assert(StringOption(spec, "writers.las", "extra_dims") == "NDVI=float");
}

void TestElevationModelsShareTheGrid() {
  lidar::toolkit::GridSpec grid;
  grid.bounds     = {0.0, 20.0, 10.0, 30.5};
  grid.resolution = 0.5;

  const auto terrain = lidar::toolkit::TerrainModel("/w/cleaned.laz", "/w/dtm.tif", grid);
  const auto surface = lidar::toolkit::SurfaceModel("/w/cleaned.laz", "/w/dsm.tif", grid);

  assert(terrain.Describe() == "readers.las -> filters.smrf -> filters.range -> writers.gdal");
  assert(surface.Describe() == "readers.las -> writers.gdal");
  assert(StringOption(terrain, "filters.range", "limits") == "Classification[2:2]");
  assert(StringOption(terrain, "writers.gdal", "output_type") == "idw");
  assert(StringOption(surface, "writers.gdal", "output_type") == "max");

  assert(StringOption(terrain, "writers.gdal", "bounds") == "([0, 10],[20, 30.5])");
  assert(StringOption(terrain, "writers.gdal", "bounds") == StringOption(surface, "writers.gdal", "bounds"));
  assert(std::get<double>(*FindOption(surface, "writers.gdal", "resolution")) == 0.5);
  assert(std::get<double>(*FindOption(surface, "writers.gdal", "nodata")) == lidar::toolkit::kRasterNoData);
}

} // namespace

int main() {
  TestBuilderKeepsStageOrderAndTypes();
  TestJsonIsAPdalPipeline();
  TestCleanPipelineWithAndWithoutCrop();
  TestNdviColorization();
  TestElevationModelsShareTheGrid();

  std::cout << "lidar_unit_pipeline_spec: pass\n";
  return 0;
}
