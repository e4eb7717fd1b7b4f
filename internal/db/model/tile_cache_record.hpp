#pragma once

#include <cstdint>
#include <string>

#include "internal/model/cache_state.hpp"

namespace lidar::db::model {

/*
  Shared tile cache entry, keyed by tile name.

  attempt_id identifies the download that moved the entry to kDownloading; a
  failure is only recorded if that attempt still owns the row.
*/
struct TileCacheRecord {
  std::string tile_name;
  std::string source_url;
  std::string object_key;

  lidar::model::CacheState state = lidar::model::CacheState::kDownloading;
  std::string              attempt_id;

  std::uint64_t size_bytes          = 0;
  std::uint64_t downloaded_at_ms    = 0;
  std::uint64_t last_accessed_at_ms = 0;
  std::uint64_t access_count        = 0;
  std::uint64_t updated_at_ms       = 0;
};

// Aggregates over complete entries only.
struct TileCacheTotals {
  std::uint64_t tile_count     = 0;
  std::uint64_t total_bytes    = 0;
  std::uint64_t total_accesses = 0;
};

} // namespace lidar::db::model
