#include "memory_repository.hpp"

#include <algorithm>

#include "memory_tx.hpp"

namespace lidar::db::memory {

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

// ---------------------------------------------------------------------
// Coverage index
// ---------------------------------------------------------------------

Result MemoryRepository::InsertCoverageTile(Transaction& t, const model::CoverageTileRecord& r) {
  auto& s = TX(t).Mutable();
  if (s.coverage.contains(r.tile_name)) return Result::Err(ErrorCode::AlreadyExists, r.tile_name);
  s.coverage[r.tile_name] = r;
  return Result::Ok();
}

std::optional<model::CoverageTileRecord> MemoryRepository::GetCoverageTile(Transaction& t, const std::string& tile_name) {
  const auto& s  = TX(t).View();
  auto        it = s.coverage.find(tile_name);
  if (it == s.coverage.end()) return std::nullopt;
  return it->second;
}

std::vector<model::CoverageTileRecord> MemoryRepository::FindCoverageCandidates(Transaction& t, const model::CoverageQuery& query) {
  std::vector<model::CoverageTileRecord> out;
  for (const auto& [_, record] : TX(t).View().coverage) {
    if (query.source && record.source != *query.source) continue;
    if (!record.envelope.Intersects(query.envelope)) continue;
    out.push_back(record);
  }
  return out;
}

Result MemoryRepository::DeleteCoverageBySource(Transaction& t, const std::string& source) {
  std::erase_if(TX(t).Mutable().coverage, [&](const auto& entry) { return entry.second.source == source; });
  return Result::Ok();
}

std::vector<std::pair<std::string, std::uint64_t>> MemoryRepository::CountCoverageBySource(Transaction& t) {
  std::map<std::string, std::uint64_t> counts;
  for (const auto& [_, record] : TX(t).View().coverage) {
    ++counts[record.source];
  }
  return {counts.begin(), counts.end()};
}

// ---------------------------------------------------------------------
// Tile cache
// ---------------------------------------------------------------------

std::optional<model::TileCacheRecord> MemoryRepository::GetCachedTile(Transaction& t, const std::string& tile_name) {
  const auto& s  = TX(t).View();
  auto        it = s.tile_cache.find(tile_name);
  if (it == s.tile_cache.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::BeginCachedTileDownload(Transaction& t, const model::TileCacheRecord& r) {
  auto& s = TX(t).Mutable();

  model::TileCacheRecord next = r;
  next.state                  = lidar::model::CacheState::kDownloading;

  auto it = s.tile_cache.find(r.tile_name);
  if (it != s.tile_cache.end()) {
    next.access_count        = it->second.access_count;
    next.last_accessed_at_ms = it->second.last_accessed_at_ms;
  }
  s.tile_cache[r.tile_name] = std::move(next);
  return Result::Ok();
}

Result MemoryRepository::CompleteCachedTile(Transaction& t, const model::TileCacheRecord& r) {
  auto& s = TX(t).Mutable();

  std::uint64_t accesses = 0;
  auto          it       = s.tile_cache.find(r.tile_name);
  if (it != s.tile_cache.end()) {
    accesses = it->second.access_count;
  }

  model::TileCacheRecord next = r;
  next.state                  = lidar::model::CacheState::kComplete;
  next.access_count           = accesses + 1;
  s.tile_cache[r.tile_name]   = std::move(next);
  return Result::Ok();
}

Result MemoryRepository::FailCachedTileDownload(Transaction& t, const std::string& tile_name, const std::string& attempt_id, std::uint64_t at_ms) {
  auto& s  = TX(t).Mutable();
  auto  it = s.tile_cache.find(tile_name);
  if (it == s.tile_cache.end() || it->second.attempt_id != attempt_id || it->second.state != lidar::model::CacheState::kDownloading) {
    return Result::Err(ErrorCode::Conflict, "download attempt no longer owns " + tile_name);
  }
  it->second.state         = lidar::model::CacheState::kFailed;
  it->second.updated_at_ms = at_ms;
  return Result::Ok();
}

Result MemoryRepository::TouchCachedTile(Transaction& t, const std::string& tile_name, std::uint64_t at_ms) {
  auto& s  = TX(t).Mutable();
  auto  it = s.tile_cache.find(tile_name);
  if (it == s.tile_cache.end() || it->second.state != lidar::model::CacheState::kComplete) {
    return Result::Err(ErrorCode::NotFound, tile_name);
  }
  it->second.access_count += 1;
  it->second.last_accessed_at_ms = at_ms;
  return Result::Ok();
}

model::TileCacheTotals MemoryRepository::SumCompleteCachedTiles(Transaction& t) {
  model::TileCacheTotals totals;
  for (const auto& [_, record] : TX(t).View().tile_cache) {
    if (record.state != lidar::model::CacheState::kComplete) continue;
    totals.tile_count += 1;
    totals.total_bytes += record.size_bytes;
    totals.total_accesses += record.access_count;
  }
  return totals;
}

// ---------------------------------------------------------------------
// Processing jobs
// ---------------------------------------------------------------------

Result MemoryRepository::InsertJob(Transaction& t, const model::JobRecord& r) {
  auto& s = TX(t).Mutable();
  if (s.jobs.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists, r.id);
  s.jobs[r.id] = r;
  return Result::Ok();
}

std::optional<model::JobRecord> MemoryRepository::GetJob(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.jobs.find(id);
  if (it == s.jobs.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::UpdateJob(Transaction& t, const model::JobRecord& r) {
  auto& s  = TX(t).Mutable();
  auto  it = s.jobs.find(r.id);
  if (it == s.jobs.end()) return Result::Err(ErrorCode::NotFound, r.id);
  it->second = r;
  return Result::Ok();
}

Result MemoryRepository::TransitionJob(Transaction& t, const model::JobRecord& r, lidar::model::JobStatus expected) {
  auto& s  = TX(t).Mutable();
  auto  it = s.jobs.find(r.id);
  if (it == s.jobs.end()) return Result::Err(ErrorCode::NotFound, r.id);
  if (it->second.status != expected) return Result::Err(ErrorCode::Conflict, "job status changed concurrently");
  it->second = r;
  return Result::Ok();
}

std::vector<model::JobRecord> MemoryRepository::ListJobsByStatus(Transaction& t, lidar::model::JobStatus status, std::size_t limit) {
  std::vector<model::JobRecord> out;
  for (const auto& [_, record] : TX(t).View().jobs) {
    if (record.status == status) out.push_back(record);
  }
  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) {
    if (a.created_at_ms != b.created_at_ms) return a.created_at_ms < b.created_at_ms;
    return a.id < b.id;
  });
  if (out.size() > limit) out.resize(limit);
  return out;
}

} // namespace lidar::db::memory
