#include "pg_repository.hpp"

namespace lidar::db::postgres {

namespace {

constexpr const char* kCoverageColumns =
    "tile_name,source,flight_year,point_density,laz_url,ST_AsText(footprint),min_x,min_y,max_x,max_y,metadata::text,created_at_ms";

model::CoverageTileRecord ReadCoverage(const pqxx::row& row) {
  model::CoverageTileRecord r;
  r.tile_name = row[0].c_str();
  r.source    = row[1].c_str();
  if (!row[2].is_null()) r.flight_year = row[2].as<int32_t>();
  if (!row[3].is_null()) r.point_density = row[3].as<double>();
  r.laz_url       = row[4].c_str();
  r.footprint_wkt = row[5].c_str();
  r.envelope      = {row[6].as<double>(), row[7].as<double>(), row[8].as<double>(), row[9].as<double>()};
  r.metadata_json = row[10].c_str();
  r.created_at_ms = row[11].as<uint64_t>();
  return r;
}

model::TileCacheRecord ReadCache(const pqxx::row& row) {
  model::TileCacheRecord r;
  r.tile_name           = row[0].c_str();
  r.source_url          = row[1].c_str();
  r.object_key          = row[2].c_str();
  r.state               = lidar::model::ParseCacheState(row[3].c_str()).value_or(lidar::model::CacheState::kFailed);
  r.attempt_id          = row[4].c_str();
  r.size_bytes          = row[5].as<uint64_t>();
  r.downloaded_at_ms    = row[6].as<uint64_t>();
  r.last_accessed_at_ms = row[7].as<uint64_t>();
  r.access_count        = row[8].as<uint64_t>();
  r.updated_at_ms       = row[9].as<uint64_t>();
  return r;
}

model::JobRecord ReadJob(const pqxx::row& row) {
  model::JobRecord r;
  r.id        = row[0].c_str();
  r.tenant_id = row[1].c_str();
  r.parcel_id = row[2].c_str();
  if (!row[3].is_null()) r.area_wkt = row[3].c_str();
  if (!row[4].is_null()) r.source_url = row[4].c_str();
  r.config_json    = row[5].c_str();
  r.status         = lidar::model::ParseJobStatus(row[6].c_str()).value_or(lidar::model::JobStatus::kFailed);
  r.progress       = row[7].as<int32_t>();
  r.status_message = row[8].c_str();
  r.error_message  = row[9].c_str();
  r.tileset_url    = row[10].c_str();
  if (!row[11].is_null()) r.tree_count = row[11].as<int64_t>();
  if (!row[12].is_null()) r.point_count = row[12].as<int64_t>();
  r.created_at_ms   = row[13].as<uint64_t>();
  r.started_at_ms   = row[14].as<uint64_t>();
  r.completed_at_ms = row[15].as<uint64_t>();
  return r;
}

std::string StatusText(lidar::model::JobStatus status) {
  return std::string(lidar::model::ToString(status));
}

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return std::make_unique<PgTransaction>(pool_);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::unique_violation*>(&e)) {
    return Result::Err(ErrorCode::AlreadyExists, e.what());
  }
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e)) {
    return Result::Err(ErrorCode::ConstraintViolation, e.what());
  }
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) {
    return Result::Err(ErrorCode::IOError, e.what());
  }
  return Result::Err(ErrorCode::InternalError, e.what());
}

// ------------------------------------------------------------------
// Coverage index
// ------------------------------------------------------------------

Result PgRepository::InsertCoverageTile(Transaction& t, const model::CoverageTileRecord& r) {
  try {
    TX(t).Work().exec_params(
        "INSERT INTO coverage_tiles(tile_name,source,flight_year,point_density,laz_url,footprint,min_x,min_y,max_x,max_y,metadata,created_at_ms) "
        "VALUES($1,$2,$3,$4,$5,ST_GeomFromText($6,4326),$7,$8,$9,$10,$11::jsonb,$12);",
        r.tile_name, r.source, r.flight_year, r.point_density, r.laz_url, r.footprint_wkt, r.envelope.min_x, r.envelope.min_y,
        r.envelope.max_x, r.envelope.max_y, r.metadata_json, r.created_at_ms);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::CoverageTileRecord> PgRepository::GetCoverageTile(Transaction& t, const std::string& tile_name) {
  auto res = TX(t).Work().exec_params(std::string("SELECT ") + kCoverageColumns + " FROM coverage_tiles WHERE tile_name=$1;", tile_name);
  if (res.empty()) return std::nullopt;
  return ReadCoverage(res[0]);
}

std::vector<model::CoverageTileRecord> PgRepository::FindCoverageCandidates(Transaction& t, const model::CoverageQuery& query) {
  auto res = TX(t).Work().exec_params(std::string("SELECT ") + kCoverageColumns +
                                          " FROM coverage_tiles WHERE ST_Intersects(footprint, ST_GeomFromText($1,4326))"
                                          " AND ($2::text IS NULL OR source=$2);",
                                      query.area_wkt, query.source);

  std::vector<model::CoverageTileRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    out.push_back(ReadCoverage(row));
  }
  return out;
}

Result PgRepository::DeleteCoverageBySource(Transaction& t, const std::string& source) {
  try {
    TX(t).Work().exec_params("DELETE FROM coverage_tiles WHERE source=$1;", source);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<std::pair<std::string, std::uint64_t>> PgRepository::CountCoverageBySource(Transaction& t) {
  auto res = TX(t).Work().exec("SELECT source, COUNT(*) FROM coverage_tiles GROUP BY source ORDER BY source;");

  std::vector<std::pair<std::string, std::uint64_t>> out;
  for (const auto& row : res) {
    out.emplace_back(row[0].c_str(), row[1].as<uint64_t>());
  }
  return out;
}

// ------------------------------------------------------------------
// Tile cache
// ------------------------------------------------------------------

std::optional<model::TileCacheRecord> PgRepository::GetCachedTile(Transaction& t, const std::string& tile_name) {
  auto res = TX(t).Work().exec_prepared("get_cached_tile", tile_name);
  if (res.empty()) return std::nullopt;
  return ReadCache(res[0]);
}

Result PgRepository::BeginCachedTileDownload(Transaction& t, const model::TileCacheRecord& r) {
  try {
    TX(t).Work().exec_params(
        "INSERT INTO tile_cache(tile_name,source_url,object_key,state,attempt_id,updated_at_ms) VALUES($1,$2,$3,'downloading',$4,$5) "
        "ON CONFLICT(tile_name) DO UPDATE SET source_url=EXCLUDED.source_url,object_key=EXCLUDED.object_key,state='downloading',"
        "attempt_id=EXCLUDED.attempt_id,updated_at_ms=EXCLUDED.updated_at_ms;",
        r.tile_name, r.source_url, r.object_key, r.attempt_id, r.updated_at_ms);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::CompleteCachedTile(Transaction& t, const model::TileCacheRecord& r) {
  try {
    TX(t).Work().exec_params(
        "INSERT INTO tile_cache(tile_name,source_url,object_key,state,attempt_id,size_bytes,downloaded_at_ms,last_accessed_at_ms,access_count,updated_at_ms) "
        "VALUES($1,$2,$3,'complete',$4,$5,$6,$7,1,$8) "
        "ON CONFLICT(tile_name) DO UPDATE SET source_url=EXCLUDED.source_url,object_key=EXCLUDED.object_key,state='complete',"
        "attempt_id=EXCLUDED.attempt_id,size_bytes=EXCLUDED.size_bytes,downloaded_at_ms=EXCLUDED.downloaded_at_ms,"
        "last_accessed_at_ms=EXCLUDED.last_accessed_at_ms,access_count=tile_cache.access_count+1,updated_at_ms=EXCLUDED.updated_at_ms;",
        r.tile_name, r.source_url, r.object_key, r.attempt_id, r.size_bytes, r.downloaded_at_ms, r.last_accessed_at_ms, r.updated_at_ms);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::FailCachedTileDownload(Transaction& t, const std::string& tile_name, const std::string& attempt_id, std::uint64_t at_ms) {
  try {
    auto res = TX(t).Work().exec_params(
        "UPDATE tile_cache SET state='failed',updated_at_ms=$3 WHERE tile_name=$1 AND attempt_id=$2 AND state='downloading';", tile_name,
        attempt_id, at_ms);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::Conflict, "download attempt no longer owns " + tile_name);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::TouchCachedTile(Transaction& t, const std::string& tile_name, std::uint64_t at_ms) {
  try {
    auto res = TX(t).Work().exec_prepared("touch_cached_tile", tile_name, at_ms);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound, tile_name);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

model::TileCacheTotals PgRepository::SumCompleteCachedTiles(Transaction& t) {
  auto res = TX(t).Work().exec(
      "SELECT COUNT(*), COALESCE(SUM(size_bytes),0), COALESCE(SUM(access_count),0) FROM tile_cache WHERE state='complete';");

  model::TileCacheTotals totals;
  if (!res.empty()) {
    totals.tile_count     = res[0][0].as<uint64_t>();
    totals.total_bytes    = res[0][1].as<uint64_t>();
    totals.total_accesses = res[0][2].as<uint64_t>();
  }
  return totals;
}

// ------------------------------------------------------------------
// Processing jobs
// ------------------------------------------------------------------

Result PgRepository::InsertJob(Transaction& t, const model::JobRecord& r) {
  try {
    TX(t).Work().exec_params(
        "INSERT INTO processing_jobs(id,tenant_id,parcel_id,area_wkt,source_url,config,status,progress,status_message,error_message,"
        "tileset_url,tree_count,point_count,created_at_ms,started_at_ms,completed_at_ms) "
        "VALUES($1,$2,$3,$4,$5,$6::jsonb,$7,$8,$9,$10,$11,$12,$13,$14,$15,$16);",
        r.id, r.tenant_id, r.parcel_id, r.area_wkt, r.source_url, r.config_json, StatusText(r.status), r.progress, r.status_message,
        r.error_message, r.tileset_url, r.tree_count, r.point_count, r.created_at_ms, r.started_at_ms, r.completed_at_ms);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::JobRecord> PgRepository::GetJob(Transaction& t, const std::string& id) {
  auto res = TX(t).Work().exec_prepared("get_job", id);
  if (res.empty()) return std::nullopt;
  return ReadJob(res[0]);
}

Result PgRepository::UpdateJob(Transaction& t, const model::JobRecord& r) {
  try {
    auto res = TX(t).Work().exec_prepared("update_job", r.id, r.area_wkt, r.source_url, r.config_json, StatusText(r.status), r.progress,
                                          r.status_message, r.error_message, r.tileset_url, r.tree_count, r.point_count, r.started_at_ms,
                                          r.completed_at_ms, r.tenant_id);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound, r.id);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::TransitionJob(Transaction& t, const model::JobRecord& r, lidar::model::JobStatus expected) {
  try {
    auto res = TX(t).Work().exec_prepared("transition_job", r.id, r.area_wkt, r.source_url, r.config_json, StatusText(r.status), r.progress,
                                          r.status_message, r.error_message, r.tileset_url, r.tree_count, r.point_count, r.started_at_ms,
                                          r.completed_at_ms, r.tenant_id, StatusText(expected));
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::Conflict, "job status changed concurrently");
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::JobRecord> PgRepository::ListJobsByStatus(Transaction& t, lidar::model::JobStatus status, std::size_t limit) {
  auto res = TX(t).Work().exec_params(
      "SELECT id,tenant_id,parcel_id,area_wkt,source_url,config::text,status,progress,status_message,error_message,"
      "tileset_url,tree_count,point_count,created_at_ms,started_at_ms,completed_at_ms "
      "FROM processing_jobs WHERE status=$1 ORDER BY created_at_ms, id LIMIT $2;",
      StatusText(status), static_cast<int64_t>(limit));

  std::vector<model::JobRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    out.push_back(ReadJob(row));
  }
  return out;
}

} // namespace lidar::db::postgres
