#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "internal/segmentation/tree_segmenter.hpp"

namespace lidar::publish {

struct LayerPublication {
  std::string                                      job_id;
  std::string                                      tenant_id;
  std::string                                      parcel_id;
  std::string                                      tileset_url;
  std::string                                      source;
  std::int64_t                                     point_count = 0;
  std::vector<segmentation::DetectedTree>          trees;
};

/*
  Best-effort export of a finished job to the digital-twin entity graph.

  Implementations log failures and never throw.
*/
class EntityGraphPublisher {
 public:
  virtual ~EntityGraphPublisher() = default;

  virtual void Publish(const LayerPublication& publication) = 0;
};

using EntityGraphPublisherPtr = std::shared_ptr<EntityGraphPublisher>;

// Used when no entity graph is configured.
class NullEntityGraphPublisher final : public EntityGraphPublisher {
 public:
  void Publish(const LayerPublication&) override {
  }
};

struct NgsiLdOptions {
  std::string               base_url;
  std::size_t               max_trees = 100;
  std::chrono::milliseconds timeout{10000};
};

/*
  POSTs one PointCloudLayer entity and up to max_trees AgriTree entities to
  <base_url>/ngsi-ld/v1/entities, tenant in the NGSILD-Tenant header.
*/
class NgsiLdPublisher final : public EntityGraphPublisher {
 public:
  explicit NgsiLdPublisher(NgsiLdOptions options);

  void Publish(const LayerPublication& publication) override;

  // Entity bodies, exposed for tests.
  static std::string LayerEntityJson(const LayerPublication& publication, const std::string& observed_at);
  static std::string TreeEntityJson(const LayerPublication& publication, const segmentation::DetectedTree& tree);

 private:
  bool Post(const std::string& body, const std::string& tenant_id, const std::string& entity_id);

  NgsiLdOptions options_;
};

// "urn:ngsi-ld:AgriParcel:<id>" unless id already is a URN.
std::string ParcelUrn(const std::string& parcel_id);

} // namespace lidar::publish
