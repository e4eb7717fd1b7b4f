#include "internal/toolkit/pipeline_spec.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

#include <stdexcept>
#include <type_traits>

namespace lidar::toolkit {

PipelineSpec::StageBuilder& PipelineSpec::StageBuilder::Option(std::string key, std::string value) {
  stage_.options.emplace_back(std::move(key), std::move(value));
  return *this;
}

PipelineSpec::StageBuilder& PipelineSpec::StageBuilder::Option(std::string key, const char* value) {
  return Option(std::move(key), std::string(value));
}

PipelineSpec::StageBuilder& PipelineSpec::StageBuilder::Option(std::string key, double value) {
  stage_.options.emplace_back(std::move(key), value);
  return *this;
}

PipelineSpec::StageBuilder& PipelineSpec::StageBuilder::Option(std::string key, std::int64_t value) {
  stage_.options.emplace_back(std::move(key), value);
  return *this;
}

PipelineSpec::StageBuilder& PipelineSpec::StageBuilder::Option(std::string key, int value) {
  return Option(std::move(key), static_cast<std::int64_t>(value));
}

PipelineSpec::StageBuilder& PipelineSpec::StageBuilder::Option(std::string key, bool value) {
  stage_.options.emplace_back(std::move(key), value);
  return *this;
}

PipelineSpec::StageBuilder PipelineSpec::Stage(std::string type) {
  stages_.push_back(StageSpec{std::move(type), {}});
  return StageBuilder(stages_.back());
}

std::string PipelineSpec::Describe() const {
  std::string out;
  for (const auto& stage : stages_) {
    if (!out.empty()) {
      out += " -> ";
    }
    out += stage.type;
  }
  return out;
}

std::string PipelineSpec::ToJson() const {
  google::protobuf::Struct root;
  auto*                    stages = (*root.mutable_fields())["pipeline"].mutable_list_value();

  for (const auto& stage : stages_) {
    auto& fields = *stages->add_values()->mutable_struct_value()->mutable_fields();
    fields["type"].set_string_value(stage.type);

    for (const auto& [key, value] : stage.options) {
      auto& out = fields[key];
      std::visit(
          [&out](const auto& v) {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, std::string>) {
              out.set_string_value(v);
            } else if constexpr (std::is_same_v<T, bool>) {
              out.set_bool_value(v);
            } else {
              out.set_number_value(static_cast<double>(v));
            }
          },
          value);
    }
  }

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(root, &json);
  if (!status.ok()) {
    throw std::runtime_error("cannot serialize pipeline: " + std::string(status.message()));
  }
  return json;
}

const OptionValue* FindOption(const PipelineSpec& spec, const std::string& type, const std::string& key) {
  for (const auto& stage : spec.Stages()) {
    if (stage.type != type) {
      continue;
    }
    for (const auto& [name, value] : stage.options) {
      if (name == key) {
        return &value;
      }
    }
    return nullptr;
  }
  return nullptr;
}

} // namespace lidar::toolkit
