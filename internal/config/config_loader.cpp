#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <filesystem>
#include <stdexcept>

namespace lidar::config {

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // quoted scalars stay strings
  if (node.Tag() == "!") {
    value->set_string_value(scalar_value);
    return;
  }

  // detect numeric / bool
  if (scalar_value == "true" || scalar_value == "false") {
    value->set_bool_value(scalar_value == "true");
    return;
  }

  char*        endptr        = nullptr;
  const double numeric_value = strtod(scalar_value.c_str(), &endptr);
  if (!scalar_value.empty() && endptr && *endptr == '\0') {
    value->set_number_value(numeric_value);
    return;
  }

  value->set_string_value(scalar_value);
}

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
      value->set_null_value(google::protobuf::NullValue::NULL_VALUE);
      break;

    case YAML::NodeType::Scalar:
      SetScalarValue(node, value);
      break;

    case YAML::NodeType::Sequence: {
      auto* list_value = value->mutable_list_value();
      for (size_t i = 0; i < node.size(); ++i) {
        YamlToProtoValue(node[i], list_value->add_values());
      }
      break;
    }

    case YAML::NodeType::Map: {
      auto* struct_value = value->mutable_struct_value();
      for (auto it : node) {
        YamlToProtoValue(it.second, &(*struct_value->mutable_fields())[it.first.Scalar()]);
      }
      break;
    }

    default:
      throw std::runtime_error("Unsupported YAML node");
  }
}

static lidar::runtime::config::RuntimeConfig ParseYaml(const YAML::Node& yaml) {
  google::protobuf::Value json_value;
  YamlToProtoValue(yaml, &json_value);

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  lidar::runtime::config::RuntimeConfig config;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);
  if (!status.ok()) {
    throw std::runtime_error("Invalid configuration: " + std::string(status.message()));
  }

  ConfigLoader::ApplyDefaults(config);
  ConfigLoader::Validate(config);
  return config;
}

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

lidar::runtime::config::RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }
  return ParseYaml(yaml);
}

lidar::runtime::config::RuntimeConfig ConfigLoader::LoadFromYamlString(const std::string& text) {
  YAML::Node yaml;
  try {
    yaml = YAML::Load(text);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to parse YAML config: " + std::string(e.what()));
  }
  return ParseYaml(yaml);
}

void ConfigLoader::ApplyDefaults(lidar::runtime::config::RuntimeConfig& config) {
  auto* storage = config.mutable_storage();
  if (storage->cache_prefix().empty()) {
    storage->set_cache_prefix("source-tiles");
  }
  if (storage->tileset_prefix().empty()) {
    storage->set_tileset_prefix("tilesets");
  }

  auto* processing = config.mutable_processing();
  if (processing->work_root().empty()) {
    processing->set_work_root((std::filesystem::temp_directory_path() / "lidar-work").string());
  }
  if (processing->job_deadline_seconds() == 0) {
    processing->set_job_deadline_seconds(1800);
  }
  if (processing->download_timeout_seconds() == 0) {
    processing->set_download_timeout_seconds(600);
  }
  if (processing->tiling_command().empty()) {
    processing->set_tiling_command("py3dtiles");
  }
  if (processing->area_srs().empty()) {
    processing->set_area_srs("EPSG:4326");
  }

  auto* defaults = processing->mutable_defaults();
  if (defaults->tree_min_height() == 0.0) {
    defaults->set_tree_min_height(2.0);
  }
  if (defaults->tree_search_radius() == 0.0) {
    defaults->set_tree_search_radius(3.0);
  }
  if (defaults->chm_resolution() == 0.0) {
    defaults->set_chm_resolution(0.5);
  }

  auto* worker = config.mutable_worker();
  if (worker->threads() == 0) {
    worker->set_threads(2);
  }
  if (worker->poll_interval_ms() == 0) {
    worker->set_poll_interval_ms(2000);
  }
  if (worker->poll_batch_size() == 0) {
    worker->set_poll_batch_size(16);
  }

  auto* entity_graph = config.mutable_entity_graph();
  if (entity_graph->max_trees() == 0) {
    entity_graph->set_max_trees(100);
  }
  if (entity_graph->timeout_ms() == 0) {
    entity_graph->set_timeout_ms(10000);
  }
}

void ConfigLoader::Validate(const lidar::runtime::config::RuntimeConfig& config) {
  if (config.storage().object_root().empty()) {
    throw std::runtime_error("Invalid configuration: storage.object_root is required");
  }
  if (config.database().has_sqlite() && config.database().sqlite().path().empty()) {
    throw std::runtime_error("Invalid configuration: database.sqlite.path is required");
  }
  if (config.database().has_postgres() && config.database().postgres().connection_uri().empty()) {
    throw std::runtime_error("Invalid configuration: database.postgres.connection_uri is required");
  }

  const auto& defaults = config.processing().defaults();
  if (defaults.tree_min_height() < 0.0) {
    throw std::runtime_error("Invalid configuration: processing.defaults.tree_min_height must not be negative");
  }
  if (defaults.tree_search_radius() <= 0.0) {
    throw std::runtime_error("Invalid configuration: processing.defaults.tree_search_radius must be positive");
  }
  if (defaults.chm_resolution() <= 0.0) {
    throw std::runtime_error("Invalid configuration: processing.defaults.chm_resolution must be positive");
  }
}

} // namespace lidar::config
