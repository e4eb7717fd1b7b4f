#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "internal/geo/envelope.hpp"

namespace lidar::db::model {

/*
  One source tile in the coverage index.

  Written once during seeding and never updated; removed only when a re-seed
  clears its source. The envelope duplicates the footprint's bounding box so
  backends without a spatial type can pre-filter candidates.
*/
struct CoverageTileRecord {
  std::string tile_name; // unique

  std::string source;

  std::optional<std::int32_t> flight_year;
  std::optional<double>       point_density;

  std::string laz_url;

  std::string   footprint_wkt;
  geo::Envelope envelope;

  // free-form JSON object text
  std::string metadata_json{"{}"};

  std::uint64_t created_at_ms = 0;
};

struct CoverageQuery {
  geo::Envelope              envelope;
  std::string                area_wkt;
  std::optional<std::string> source;
};

} // namespace lidar::db::model
