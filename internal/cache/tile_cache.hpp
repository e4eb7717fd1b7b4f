#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>

#include "internal/db/api/repository.hpp"
#include "internal/fetch/origin_fetcher.hpp"
#include "internal/storage/object_store.hpp"

namespace lidar::cache {

struct TileCacheOptions {
  // key prefix for cached tiles in object storage
  std::string object_prefix{"source-tiles"};
};

struct TileCacheStats {
  std::uint64_t tile_count        = 0;
  std::uint64_t total_bytes       = 0;
  std::uint64_t total_accesses    = 0;
  std::uint64_t downloads_avoided = 0;
};

/*
  Shared cache of downloaded source tiles.

  Entries live in the repository, bytes in object storage under
  <object_prefix>/<tile>.laz. Only complete entries are served; any other
  state triggers a fresh download from the origin.

  Concurrent misses for one tile may both download. Completion overwrites
  the entry with identical size and key, so the last writer wins and no
  lock is held across the download.
*/
class TileCache {
 public:
  TileCache(std::shared_ptr<db::Repository> repository, storage::ObjectStorePtr store, fetch::OriginFetcherPtr fetcher,
            TileCacheOptions options = {});

  // Returns work_dir/<tile>.laz holding the tile bytes.
  // Throws util::TransientIoError when neither the cache nor the origin
  // can provide them.
  std::filesystem::path ResolveLocalFile(const std::string& source_url, const std::filesystem::path& work_dir);

  TileCacheStats Stats() const;

  // Last path segment without extension; query and fragment are ignored.
  // Throws util::ValidationError when nothing is left.
  static std::string DeriveTileName(const std::string& source_url);

 private:
  bool TryServeFromCache(const db::model::TileCacheRecord& entry, const std::filesystem::path& destination);

  std::filesystem::path DownloadAndCache(const std::string& tile_name, const std::string& source_url, const std::filesystem::path& destination);

  std::shared_ptr<db::Repository> repository_;
  storage::ObjectStorePtr         store_;
  fetch::OriginFetcherPtr         fetcher_;
  TileCacheOptions                options_;
};

} // namespace lidar::cache
