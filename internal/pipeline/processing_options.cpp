#include "internal/pipeline/processing_options.hpp"

#include <google/protobuf/util/json_util.h>

#include "internal/util/errors.hpp"

namespace lidar::pipeline {

ColorMode ParseColorMode(const std::string& text) {
  if (text.empty() || text == "height") return ColorMode::kHeight;
  if (text == "ndvi") return ColorMode::kNdvi;
  if (text == "rgb") return ColorMode::kRgb;
  if (text == "classification") return ColorMode::kClassification;
  throw util::ValidationError("unknown color mode: " + text);
}

lidar::processing::v1::ProcessingConfig ParseProcessingConfig(const std::string& json) {
  lidar::processing::v1::ProcessingConfig config;
  if (json.empty()) {
    return config;
  }

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;
  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);
  if (!status.ok()) {
    throw util::ValidationError("invalid processing config: " + std::string(status.message()));
  }
  return config;
}

ProcessingOptions ResolveProcessingOptions(const lidar::processing::v1::ProcessingConfig& config,
                                           const segmentation::SegmentationParams& defaults) {
  ProcessingOptions options;
  options.color_mode       = ParseColorMode(config.color_mode());
  options.detect_trees     = config.detect_trees();
  options.ndvi_source_url  = config.ndvi_source_url();
  options.preferred_source = config.preferred_source();

  options.segmentation = defaults;
  if (config.has_tree_min_height()) options.segmentation.min_height = config.tree_min_height();
  if (config.has_tree_search_radius()) options.segmentation.search_radius = config.tree_search_radius();
  if (config.has_chm_resolution()) options.segmentation.resolution = config.chm_resolution();

  if (options.segmentation.min_height < 0.0) {
    throw util::ValidationError("treeMinHeight must not be negative");
  }
  if (options.segmentation.search_radius <= 0.0) {
    throw util::ValidationError("treeSearchRadius must be positive");
  }
  if (options.segmentation.resolution <= 0.0) {
    throw util::ValidationError("chmResolution must be positive");
  }
  return options;
}

} // namespace lidar::pipeline
