#include "internal/cache/tile_cache.hpp"

#include <exception>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace lidar::cache {

using lidar::model::CacheState;
using observability::IntField;
using observability::StringField;

TileCache::TileCache(std::shared_ptr<db::Repository> repository, storage::ObjectStorePtr store, fetch::OriginFetcherPtr fetcher,
                     TileCacheOptions options)
    : repository_(std::move(repository)), store_(std::move(store)), fetcher_(std::move(fetcher)), options_(std::move(options)) {
}

std::string TileCache::DeriveTileName(const std::string& source_url) {
  auto path = source_url.substr(0, source_url.find_first_of("?#"));
  while (!path.empty() && path.back() == '/') {
    path.pop_back();
  }

  auto name = path.substr(path.find_last_of('/') == std::string::npos ? 0 : path.find_last_of('/') + 1);
  if (const auto dot = name.rfind('.'); dot != std::string::npos && dot > 0) {
    name.erase(dot);
  }
  if (name.empty()) {
    throw util::ValidationError("cannot derive a tile name from " + source_url);
  }
  return name;
}

std::filesystem::path TileCache::ResolveLocalFile(const std::string& source_url, const std::filesystem::path& work_dir) {
  const auto tile_name   = DeriveTileName(source_url);
  const auto destination = work_dir / (tile_name + ".laz");

  observability::SpanScope span("tile_cache.resolve");
  span.SetAttribute("tile", tile_name);

  std::optional<db::model::TileCacheRecord> entry;
  {
    auto tx = repository_->Begin();
    entry   = repository_->GetCachedTile(*tx, tile_name);
    tx->Commit();
  }

  if (entry && entry->state == CacheState::kComplete && TryServeFromCache(*entry, destination)) {
    observability::Metrics::Instance().RecordCacheLookup(true);
    return destination;
  }

  observability::Metrics::Instance().RecordCacheLookup(false);
  return DownloadAndCache(tile_name, source_url, destination);
}

bool TileCache::TryServeFromCache(const db::model::TileCacheRecord& entry, const std::filesystem::path& destination) {
  try {
    store_->GetFile(entry.object_key, destination);
  } catch (const std::exception& e) {
    LIDAR_LOG_WARN("Cached tile unreadable, downloading again",
                   {StringField("tile", entry.tile_name), StringField("key", entry.object_key), StringField("error", e.what())});
    return false;
  }

  try {
    auto tx = repository_->Begin();
    db::ThrowIfError(repository_->TouchCachedTile(*tx, entry.tile_name, util::ToUnixMillis(util::Now())), "touch cached tile");
    tx->Commit();
  } catch (const std::exception& e) {
    LIDAR_LOG_WARN("Failed to record cache access", {StringField("tile", entry.tile_name), StringField("error", e.what())});
  }

  LIDAR_LOG_INFO("Tile cache hit", {StringField("tile", entry.tile_name), IntField("bytes", static_cast<std::int64_t>(entry.size_bytes))});
  return true;
}

std::filesystem::path TileCache::DownloadAndCache(const std::string& tile_name, const std::string& source_url,
                                                  const std::filesystem::path& destination) {
  db::model::TileCacheRecord entry;
  entry.tile_name     = tile_name;
  entry.source_url    = source_url;
  entry.object_key    = storage::JoinKey(options_.object_prefix, tile_name + ".laz");
  entry.state         = CacheState::kDownloading;
  entry.attempt_id    = util::NewId();
  entry.updated_at_ms = util::ToUnixMillis(util::Now());

  {
    auto tx = repository_->Begin();
    db::ThrowIfError(repository_->BeginCachedTileDownload(*tx, entry), "begin tile download");
    tx->Commit();
  }

  LIDAR_LOG_INFO("Tile cache miss", {StringField("tile", tile_name), StringField("url", source_url)});

  try {
    entry.size_bytes = fetcher_->Fetch(source_url, destination);
    store_->PutFile(entry.object_key, destination);
  } catch (const std::exception& e) {
    try {
      auto tx = repository_->Begin();
      db::ThrowIfError(repository_->FailCachedTileDownload(*tx, tile_name, entry.attempt_id, util::ToUnixMillis(util::Now())),
                       "mark tile download failed");
      tx->Commit();
    } catch (const std::exception& mark_error) {
      LIDAR_LOG_WARN("Failed to mark tile download failed", {StringField("tile", tile_name), StringField("error", mark_error.what())});
    }

    if (dynamic_cast<const util::TransientIoError*>(&e) != nullptr) {
      throw;
    }
    throw util::TransientIoError("caching " + tile_name + " failed: " + e.what());
  }

  try {
    const auto now            = util::ToUnixMillis(util::Now());
    entry.state               = CacheState::kComplete;
    entry.downloaded_at_ms    = now;
    entry.last_accessed_at_ms = now;
    entry.updated_at_ms       = now;

    auto tx = repository_->Begin();
    db::ThrowIfError(repository_->CompleteCachedTile(*tx, entry), "complete tile download");
    tx->Commit();
  } catch (const std::exception& e) {
    LIDAR_LOG_WARN("Tile downloaded but cache entry not updated", {StringField("tile", tile_name), StringField("error", e.what())});
  }

  return destination;
}

TileCacheStats TileCache::Stats() const {
  db::model::TileCacheTotals totals;
  {
    auto tx = repository_->Begin();
    totals  = repository_->SumCompleteCachedTiles(*tx);
    tx->Commit();
  }

  TileCacheStats stats;
  stats.tile_count        = totals.tile_count;
  stats.total_bytes       = totals.total_bytes;
  stats.total_accesses    = totals.total_accesses;
  stats.downloads_avoided = totals.total_accesses > totals.tile_count ? totals.total_accesses - totals.tile_count : 0;
  return stats;
}

} // namespace lidar::cache
