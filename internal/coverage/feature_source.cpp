#include "internal/coverage/feature_source.hpp"

#include <gdal_priv.h>
#include <ogr_spatialref.h>
#include <ogrsf_frmts.h>

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

#include <algorithm>
#include <charconv>
#include <cstdlib>
#include <memory>
#include <mutex>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace lidar::coverage {

using observability::IntField;
using observability::StringField;

namespace {

std::optional<std::int32_t> ParseYear(const char* text) {
  std::int32_t value = 0;
  const char*  end   = text + std::char_traits<char>::length(text);
  auto [ptr, ec]     = std::from_chars(text, end, value);
  if (ec != std::errc{} || ptr == text) {
    return std::nullopt;
  }
  return value;
}

std::optional<double> ParseDensity(const char* text) {
  char*        end   = nullptr;
  const double value = std::strtod(text, &end);
  if (end == text) {
    return std::nullopt;
  }
  return value;
}

const char* FieldText(OGRFeature& feature, const std::string& names) {
  std::size_t start = 0;
  while (start <= names.size()) {
    const auto end  = std::min(names.find('|', start), names.size());
    const auto name = names.substr(start, end - start);
    start           = end + 1;
    if (name.empty()) {
      continue;
    }
    const int index = feature.GetFieldIndex(name.c_str());
    if (index >= 0 && feature.IsFieldSetAndNotNull(index)) {
      const char* text = feature.GetFieldAsString(index);
      if (text != nullptr && *text != '\0') {
        return text;
      }
    }
  }
  return nullptr;
}

std::string AttributesJson(OGRFeature& feature) {
  google::protobuf::Struct attributes;
  auto&                    fields = *attributes.mutable_fields();

  for (int i = 0; i < feature.GetFieldCount(); ++i) {
    const auto* definition = feature.GetFieldDefnRef(i);
    if (!feature.IsFieldSetAndNotNull(i)) {
      fields[definition->GetNameRef()].set_null_value(google::protobuf::NULL_VALUE);
      continue;
    }
    switch (definition->GetType()) {
      case OFTInteger:
      case OFTInteger64:
      case OFTReal:
        fields[definition->GetNameRef()].set_number_value(feature.GetFieldAsDouble(i));
        break;
      default:
        fields[definition->GetNameRef()].set_string_value(feature.GetFieldAsString(i));
        break;
    }
  }

  std::string json;
  if (!google::protobuf::util::MessageToJsonString(attributes, &json).ok()) {
    return "{}";
  }
  return json;
}

} // namespace

FieldMapping IdenaWfsFields() {
  FieldMapping fields;
  fields.url_field     = "URL_DESCARGA|URL";
  fields.name_field    = "FICHERO|NOMBRE";
  fields.year_field    = "ANYO";
  fields.density_field = "DENSIDAD";
  return fields;
}

std::vector<SeedRecord> ReadFeatureSource(const std::string& dataset, const FieldMapping& mapping, const std::string& layer_name) {
  static std::once_flag registered;
  std::call_once(registered, [] { GDALAllRegister(); });

  GDALDatasetUniquePtr source(GDALDataset::Open(dataset.c_str(), GDAL_OF_VECTOR | GDAL_OF_READONLY));
  if (!source) {
    throw util::ValidationError("cannot open feature source " + dataset + ": " + CPLGetLastErrorMsg());
  }

  OGRSpatialReference wgs84;
  wgs84.importFromEPSG(4326);
  wgs84.SetAxisMappingStrategy(OAMS_TRADITIONAL_GIS_ORDER);

  std::vector<OGRLayer*> layers;
  if (layer_name.empty()) {
    for (OGRLayer* layer : source->GetLayers()) {
      layers.push_back(layer);
    }
  } else {
    OGRLayer* layer = source->GetLayerByName(layer_name.c_str());
    if (layer == nullptr) {
      throw util::ValidationError("feature source " + dataset + " has no layer " + layer_name);
    }
    layers.push_back(layer);
  }

  std::vector<SeedRecord> records;
  for (OGRLayer* layer : layers) {
    LIDAR_LOG_INFO("Reading coverage layer",
                   {StringField("dataset", dataset), StringField("layer", layer->GetName()), IntField("features", layer->GetFeatureCount())});

    const OGRSpatialReference*                       layer_srs = layer->GetSpatialRef();
    std::unique_ptr<OGRCoordinateTransformation>     to_wgs84;
    if (layer_srs && !layer_srs->IsSame(&wgs84)) {
      to_wgs84.reset(OGRCreateCoordinateTransformation(layer_srs, &wgs84));
      if (!to_wgs84) {
        throw util::ValidationError(std::string("cannot reproject layer ") + layer->GetName() + " to EPSG:4326");
      }
    }

    for (auto& feature : *layer) {
      SeedRecord record;

      if (const char* url = FieldText(*feature, mapping.url_field)) {
        record.laz_url = url;
      }
      if (const char* name = FieldText(*feature, mapping.name_field)) {
        record.tile_name = std::string(name);
      }
      if (const char* year = FieldText(*feature, mapping.year_field)) {
        record.flight_year = ParseYear(year);
      }
      if (const char* density = FieldText(*feature, mapping.density_field)) {
        record.point_density = ParseDensity(density);
      }

      if (OGRGeometry* geometry = feature->GetGeometryRef()) {
        OGRGeometryUniquePtr copy(geometry->clone());
        if (to_wgs84 && copy->transform(to_wgs84.get()) != OGRERR_NONE) {
          LIDAR_LOG_WARN("Skipping feature that failed to reproject", {IntField("fid", feature->GetFID())});
          continue;
        }
        record.footprint_wkt = copy->exportToWkt();
      }

      record.metadata_json = AttributesJson(*feature);
      records.push_back(std::move(record));
    }
  }
  return records;
}

std::size_t SeedFromFeatureSource(CoverageIndex& index, const std::string& dataset, const FieldMapping& fields, const SeedOptions& options,
                                  const std::string& layer) {
  return index.Seed(ReadFeatureSource(dataset, fields, layer), options);
}

} // namespace lidar::coverage
