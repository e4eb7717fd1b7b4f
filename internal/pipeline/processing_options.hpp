#pragma once

#include <string>

#include "internal/segmentation/tree_segmenter.hpp"
#include "lidar/processing/v1/processing_config.pb.h"

namespace lidar::pipeline {

enum class ColorMode {
  kHeight,
  kNdvi,
  kRgb,
  kClassification,
};

// Empty text selects kHeight. Throws util::ValidationError.
ColorMode ParseColorMode(const std::string& text);

// Per-job config from its JSON form (camelCase or snake_case names).
// Throws util::ValidationError on malformed JSON or unknown fields.
lidar::processing::v1::ProcessingConfig ParseProcessingConfig(const std::string& json);

struct ProcessingOptions {
  ColorMode                        color_mode = ColorMode::kHeight;
  bool                             detect_trees = false;
  segmentation::SegmentationParams segmentation;
  std::string                      ndvi_source_url;
  std::string                      preferred_source;
};

// Fills unset values from defaults and validates ranges.
ProcessingOptions ResolveProcessingOptions(const lidar::processing::v1::ProcessingConfig& config,
                                           const segmentation::SegmentationParams& defaults);

} // namespace lidar::pipeline
