#pragma once

#include <string>
#include <vector>

#include "internal/coverage/coverage_index.hpp"

namespace lidar::coverage {

// Attribute names holding tile fields. "A|B" tries A, then B; empty
// fields are not read.
struct FieldMapping {
  std::string url_field{"URL"};
  std::string name_field{"NOMBRE"};
  std::string year_field{"AÑO"};
  std::string density_field{"DENSIDAD"};
};

/*
  Reads tile records from any OGR vector dataset: shapefile, GeoJSON, or a
  "WFS:<url>" connection string. Geometries are reprojected to EPSG:4326 when
  the layer declares another reference system; every attribute is kept in
  the record's metadata.

  An empty layer reads every layer of the dataset.

  Throws util::ValidationError when the dataset or layer cannot be opened.
*/
std::vector<SeedRecord> ReadFeatureSource(const std::string& dataset, const FieldMapping& fields = {}, const std::string& layer = {});

// Convenience for CoverageIndex::Seed(ReadFeatureSource(...), options).
std::size_t SeedFromFeatureSource(CoverageIndex& index, const std::string& dataset, const FieldMapping& fields, const SeedOptions& options,
                                  const std::string& layer = {});

// Field names published by the IDENA LiDAR flight index.
FieldMapping IdenaWfsFields();

} // namespace lidar::coverage
