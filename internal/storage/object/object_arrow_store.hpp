#pragma once

#include <arrow/filesystem/filesystem.h>

#include <memory>
#include <string>

#include "internal/storage/object_store.hpp"

namespace lidar::storage {

/*
  Object storage over an Arrow filesystem (local directory, S3 / MinIO, GCS).

  Characteristics:
    - whole-object writes, streamed in fixed-size chunks
    - no fsync semantics
    - Content-Type metadata on writes (ignored by the local filesystem)
*/

class ObjectArrowStore final : public ObjectStore {
 public:
  ObjectArrowStore(std::shared_ptr<arrow::fs::FileSystem> fs, std::string root_path, std::string public_base_url);

  // Builds the store from storage.object_root / storage.public_base_url.
  static std::shared_ptr<ObjectArrowStore> FromUri(const std::string& object_root, const std::string& public_base_url);

  std::uint64_t PutFile(const std::string& key, const std::filesystem::path& source) override;
  std::uint64_t GetFile(const std::string& key, const std::filesystem::path& destination) override;
  bool          Exists(const std::string& key) override;
  void          DeletePrefix(const std::string& prefix) override;
  std::string   PublicUrl(const std::string& key) const override;

 private:
  std::string ObjectPath(const std::string& key) const;

  std::shared_ptr<arrow::fs::FileSystem> fs_;
  std::string                            root_path_;
  std::string                            public_base_url_;
};

} // namespace lidar::storage
