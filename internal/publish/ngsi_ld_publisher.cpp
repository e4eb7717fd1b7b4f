#include "internal/publish/entity_graph_publisher.hpp"

#include <cpr/cpr.h>

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

#include <algorithm>
#include <exception>

#include "internal/observability/logging.hpp"
#include "internal/storage/object_store.hpp"
#include "internal/util/time.hpp"

namespace lidar::publish {

using google::protobuf::Struct;
using google::protobuf::Value;
using observability::IntField;
using observability::StringField;

namespace {

constexpr const char* kCoreContext = "https://uri.etsi.org/ngsi-ld/v1/ngsi-ld-core-context.jsonld";

void SetProperty(Struct& entity, const std::string& name, Value value, const char* unit_code = nullptr) {
  auto& fields = *(*entity.mutable_fields())[name].mutable_struct_value()->mutable_fields();
  fields["type"].set_string_value("Property");
  fields["value"] = std::move(value);
  if (unit_code != nullptr) {
    fields["unitCode"].set_string_value(unit_code);
  }
}

Value StringValue(const std::string& text) {
  Value value;
  value.set_string_value(text);
  return value;
}

Value NumberValue(double number) {
  Value value;
  value.set_number_value(number);
  return value;
}

Struct NewEntity(const std::string& id, const std::string& type, const std::string& parcel_id) {
  Struct entity;
  auto&  fields = *entity.mutable_fields();
  fields["@context"].mutable_list_value()->add_values()->set_string_value(kCoreContext);
  fields["id"].set_string_value(id);
  fields["type"].set_string_value(type);

  auto& parcel = *fields["refAgriParcel"].mutable_struct_value()->mutable_fields();
  parcel["type"].set_string_value("Relationship");
  parcel["object"].set_string_value(ParcelUrn(parcel_id));
  return entity;
}

std::string ToJson(const Struct& entity) {
  std::string json;
  if (!google::protobuf::util::MessageToJsonString(entity, &json).ok()) {
    return "{}";
  }
  return json;
}

} // namespace

std::string ParcelUrn(const std::string& parcel_id) {
  if (parcel_id.rfind("urn:", 0) == 0) {
    return parcel_id;
  }
  return "urn:ngsi-ld:AgriParcel:" + parcel_id;
}

NgsiLdPublisher::NgsiLdPublisher(NgsiLdOptions options) : options_(std::move(options)) {
}

std::string NgsiLdPublisher::LayerEntityJson(const LayerPublication& publication, const std::string& observed_at) {
  auto entity = NewEntity("urn:ngsi-ld:PointCloudLayer:" + publication.job_id, "PointCloudLayer", publication.parcel_id);
  SetProperty(entity, "tilesetUrl", StringValue(publication.tileset_url));
  SetProperty(entity, "source", StringValue(publication.source.empty() ? "PNOA" : publication.source));
  SetProperty(entity, "dateObserved", StringValue(observed_at));
  SetProperty(entity, "pipelineStatus", StringValue("COMPLETED"));
  SetProperty(entity, "treeCount", NumberValue(static_cast<double>(publication.trees.size())));
  if (publication.point_count > 0) {
    SetProperty(entity, "pointCount", NumberValue(static_cast<double>(publication.point_count)));
  }
  return ToJson(entity);
}

std::string NgsiLdPublisher::TreeEntityJson(const LayerPublication& publication, const segmentation::DetectedTree& tree) {
  auto entity = NewEntity("urn:ngsi-ld:AgriTree:" + publication.job_id + "_" + std::to_string(tree.label), "AgriTree", publication.parcel_id);

  Value point;
  auto& geometry = *point.mutable_struct_value()->mutable_fields();
  geometry["type"].set_string_value("Point");
  auto* coordinates = geometry["coordinates"].mutable_list_value();
  coordinates->add_values()->set_number_value(tree.x);
  coordinates->add_values()->set_number_value(tree.y);

  auto& location = *(*entity.mutable_fields())["location"].mutable_struct_value()->mutable_fields();
  location["type"].set_string_value("GeoProperty");
  location["value"] = std::move(point);

  SetProperty(entity, "height", NumberValue(tree.height), "MTR");
  SetProperty(entity, "crownDiameter", NumberValue(tree.crown_diameter), "MTR");
  SetProperty(entity, "crownArea", NumberValue(tree.crown_area), "MTK");
  return ToJson(entity);
}

bool NgsiLdPublisher::Post(const std::string& body, const std::string& tenant_id, const std::string& entity_id) {
  cpr::Header headers{{"Content-Type", "application/ld+json"}, {"Accept", "application/ld+json"}};
  if (!tenant_id.empty()) {
    headers["NGSILD-Tenant"] = tenant_id;
  }

  auto response = cpr::Post(cpr::Url{storage::JoinKey(options_.base_url, "ngsi-ld/v1/entities")}, headers, cpr::Body{body},
                            cpr::Timeout{options_.timeout});
  if (response.error) {
    LIDAR_LOG_WARN("Entity graph request failed", {StringField("entity", entity_id), StringField("error", response.error.message)});
    return false;
  }
  if (response.status_code != 201 && response.status_code != 204) {
    LIDAR_LOG_WARN("Entity graph rejected entity", {StringField("entity", entity_id), IntField("status", response.status_code)});
    return false;
  }
  return true;
}

void NgsiLdPublisher::Publish(const LayerPublication& publication) {
  try {
    const auto layer_id = "urn:ngsi-ld:PointCloudLayer:" + publication.job_id;
    if (Post(LayerEntityJson(publication, util::FormatIso8601(util::Now())), publication.tenant_id, layer_id)) {
      LIDAR_LOG_INFO("Published point cloud layer", {StringField("entity", layer_id)});
    }

    const std::size_t limit     = std::min(publication.trees.size(), options_.max_trees);
    std::size_t       published = 0;
    for (std::size_t i = 0; i < limit; ++i) {
      const auto& tree = publication.trees[i];
      if (Post(TreeEntityJson(publication, tree), publication.tenant_id, publication.job_id + "_" + std::to_string(tree.label))) {
        ++published;
      }
    }
    if (limit > 0) {
      LIDAR_LOG_INFO("Published tree entities", {StringField("job_id", publication.job_id), IntField("published", static_cast<std::int64_t>(published)),
                                                 IntField("detected", static_cast<std::int64_t>(publication.trees.size()))});
    }
  } catch (const std::exception& e) {
    LIDAR_LOG_WARN("Entity graph publishing failed", {StringField("job_id", publication.job_id), StringField("error", e.what())});
  }
}

} // namespace lidar::publish
