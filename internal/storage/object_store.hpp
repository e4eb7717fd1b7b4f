#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>

namespace lidar::storage {

/*
  Key-addressed object storage.

  Keys are '/'-separated relative paths, e.g. "source-tiles/<tile>.laz" or
  "tilesets/<job_id>/tileset.json". Writes replace whole objects.

  Implementations:
    ObjectArrowStore → any arrow::fs::FileSystem (local, S3 / MinIO, GCS)

  Failures throw std::runtime_error.
*/
class ObjectStore {
 public:
  virtual ~ObjectStore() = default;

  // Uploads a local file; returns the number of bytes written.
  virtual std::uint64_t PutFile(const std::string& key, const std::filesystem::path& source) = 0;

  // Downloads an object into a local file; returns the number of bytes read.
  virtual std::uint64_t GetFile(const std::string& key, const std::filesystem::path& destination) = 0;

  virtual bool Exists(const std::string& key) = 0;

  // Removes every object below prefix. Missing prefixes are not an error.
  virtual void DeletePrefix(const std::string& prefix) = 0;

  // Locator clients use to fetch the object.
  virtual std::string PublicUrl(const std::string& key) const = 0;
};

using ObjectStorePtr = std::shared_ptr<ObjectStore>;

// Uploads every regular file below directory as <prefix>/<relative path>.
// Returns the number of files uploaded.
std::size_t UploadDirectory(ObjectStore& store, const std::filesystem::path& directory, const std::string& prefix);

// Joins key segments with exactly one '/' between them.
std::string JoinKey(const std::string& prefix, const std::string& name);

} // namespace lidar::storage
