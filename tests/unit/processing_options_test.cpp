#include "internal/pipeline/processing_options.hpp"

#include <cassert>
#include <iostream>
#include <string>

#include "internal/util/errors.hpp"

using lidar::pipeline::ColorMode;
using lidar::pipeline::ParseProcessingConfig;
using lidar::pipeline::ResolveProcessingOptions;
using lidar::segmentation::SegmentationParams;

namespace {

bool RejectsConfig(const std::string& json) {
  try {
    (void)ResolveProcessingOptions(ParseProcessingConfig(json), SegmentationParams{});
  } catch (const lidar::util::ValidationError&) {
    return true;
  }
  return false;
}

void TestEmptyConfigUsesDefaults() {
  SegmentationParams defaults;
  defaults.min_height = 3.0;

  for (const std::string json : {"", "{}"}) {
    const auto options = ResolveProcessingOptions(ParseProcessingConfig(json), defaults);
    assert(options.color_mode == ColorMode::kHeight);
    assert(!options.detect_trees);
    assert(options.segmentation.min_height == 3.0);
    assert(options.segmentation.search_radius == 3.0);
    assert(options.segmentation.resolution == 0.5);
    assert(options.ndvi_source_url.empty());
  }
}

void TestCamelAndSnakeCaseNames() {
  const auto camel = ResolveProcessingOptions(
      ParseProcessingConfig(R"({"colorMode":"ndvi","detectTrees":true,"treeMinHeight":4.5,"ndviSourceUrl":"https://x/ndvi.tif"})"),
      SegmentationParams{});
  assert(camel.color_mode == ColorMode::kNdvi);
  assert(camel.detect_trees);
  assert(camel.segmentation.min_height == 4.5);
  assert(camel.ndvi_source_url == "https://x/ndvi.tif");

  const auto snake = ResolveProcessingOptions(
      ParseProcessingConfig(R"({"color_mode":"classification","chm_resolution":1.0,"preferred_source":"IDENA"})"), SegmentationParams{});
  assert(snake.color_mode == ColorMode::kClassification);
  assert(snake.segmentation.resolution == 1.0);
  assert(snake.preferred_source == "IDENA");
}

void TestExplicitZeroMinHeightIsKept() {
  SegmentationParams defaults;
  defaults.min_height = 2.0;
  const auto options  = ResolveProcessingOptions(ParseProcessingConfig(R"({"treeMinHeight":0})"), defaults);
  assert(options.segmentation.min_height == 0.0);
}

void TestInvalidConfigsAreRejected() {
  assert(RejectsConfig("not json"));
  assert(RejectsConfig(R"({"unknownKnob":1})"));
  assert(RejectsConfig(R"({"colorMode":"infrared"})"));
  assert(RejectsConfig(R"({"treeMinHeight":-1})"));
  assert(RejectsConfig(R"({"treeSearchRadius":0})"));
  assert(RejectsConfig(R"({"chmResolution":-0.5})"));
}

} // namespace

int main() {
  TestEmptyConfigUsesDefaults();
  TestCamelAndSnakeCaseNames();
  TestExplicitZeroMinHeightIsKept();
  TestInvalidConfigsAreRejected();

  std::cout << "lidar_unit_processing_options: pass\n";
  return 0;
}
