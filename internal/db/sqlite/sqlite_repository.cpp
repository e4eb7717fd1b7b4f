#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <stdexcept>
#include <type_traits>

namespace lidar::db::sqlite {

using lidar::db::ErrorCode;
using lidar::db::Result;

namespace {

struct StmtDeleter {
    void operator()(sqlite3_stmt* st) const { sqlite3_finalize(st); }
};
using Stmt = std::unique_ptr<sqlite3_stmt, StmtDeleter>;

Stmt Prepare(sqlite3* db, const char* sql) {
    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) {
        throw std::runtime_error(std::string("sqlite prepare: ") + sqlite3_errmsg(db));
    }
    return Stmt(st);
}

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
    sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindOptText(sqlite3_stmt* st, int idx, const std::optional<std::string>& s) {
    if (s) BindText(st, idx, *s);
    else sqlite3_bind_null(st, idx);
}

void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
    sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindI64(sqlite3_stmt* st, int idx, int64_t v) {
    sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindDouble(sqlite3_stmt* st, int idx, double v) {
    sqlite3_bind_double(st, idx, v);
}

template <typename T>
void BindOpt(sqlite3_stmt* st, int idx, const std::optional<T>& v) {
    if (!v) {
        sqlite3_bind_null(st, idx);
    } else if constexpr (std::is_floating_point_v<T>) {
        BindDouble(st, idx, *v);
    } else {
        BindI64(st, idx, static_cast<int64_t>(*v));
    }
}

std::string ColText(sqlite3_stmt* st, int col) {
    const unsigned char* t = sqlite3_column_text(st, col);
    return t ? reinterpret_cast<const char*>(t) : "";
}

std::optional<std::string> ColOptText(sqlite3_stmt* st, int col) {
    if (sqlite3_column_type(st, col) == SQLITE_NULL) return std::nullopt;
    return ColText(st, col);
}

uint64_t ColU64(sqlite3_stmt* st, int col) {
    return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

std::optional<int64_t> ColOptI64(sqlite3_stmt* st, int col) {
    if (sqlite3_column_type(st, col) == SQLITE_NULL) return std::nullopt;
    return static_cast<int64_t>(sqlite3_column_int64(st, col));
}

std::optional<double> ColOptDouble(sqlite3_stmt* st, int col) {
    if (sqlite3_column_type(st, col) == SQLITE_NULL) return std::nullopt;
    return sqlite3_column_double(st, col);
}

constexpr const char* kCoverageColumns =
    "tile_name,source,flight_year,point_density,laz_url,footprint_wkt,min_x,min_y,max_x,max_y,metadata,created_at_ms";

model::CoverageTileRecord ReadCoverage(sqlite3_stmt* st) {
    model::CoverageTileRecord r;
    r.tile_name = ColText(st, 0);
    r.source = ColText(st, 1);
    if (auto year = ColOptI64(st, 2)) r.flight_year = static_cast<int32_t>(*year);
    r.point_density = ColOptDouble(st, 3);
    r.laz_url = ColText(st, 4);
    r.footprint_wkt = ColText(st, 5);
    r.envelope = {sqlite3_column_double(st, 6), sqlite3_column_double(st, 7), sqlite3_column_double(st, 8), sqlite3_column_double(st, 9)};
    r.metadata_json = ColText(st, 10);
    r.created_at_ms = ColU64(st, 11);
    return r;
}

constexpr const char* kCacheColumns =
    "tile_name,source_url,object_key,state,attempt_id,size_bytes,downloaded_at_ms,last_accessed_at_ms,access_count,updated_at_ms";

model::TileCacheRecord ReadCache(sqlite3_stmt* st) {
    model::TileCacheRecord r;
    r.tile_name = ColText(st, 0);
    r.source_url = ColText(st, 1);
    r.object_key = ColText(st, 2);
    r.state = lidar::model::ParseCacheState(ColText(st, 3)).value_or(lidar::model::CacheState::kFailed);
    r.attempt_id = ColText(st, 4);
    r.size_bytes = ColU64(st, 5);
    r.downloaded_at_ms = ColU64(st, 6);
    r.last_accessed_at_ms = ColU64(st, 7);
    r.access_count = ColU64(st, 8);
    r.updated_at_ms = ColU64(st, 9);
    return r;
}

constexpr const char* kJobColumns =
    "id,tenant_id,parcel_id,area_wkt,source_url,config,status,progress,status_message,error_message,"
    "tileset_url,tree_count,point_count,created_at_ms,started_at_ms,completed_at_ms";

model::JobRecord ReadJob(sqlite3_stmt* st) {
    model::JobRecord r;
    r.id = ColText(st, 0);
    r.tenant_id = ColText(st, 1);
    r.parcel_id = ColText(st, 2);
    r.area_wkt = ColOptText(st, 3);
    r.source_url = ColOptText(st, 4);
    r.config_json = ColText(st, 5);
    const auto status = ColText(st, 6);
    r.status = lidar::model::ParseJobStatus(status).value_or(lidar::model::JobStatus::kFailed);
    r.progress = sqlite3_column_int(st, 7);
    r.status_message = ColText(st, 8);
    r.error_message = ColText(st, 9);
    r.tileset_url = ColText(st, 10);
    r.tree_count = ColOptI64(st, 11);
    r.point_count = ColOptI64(st, 12);
    r.created_at_ms = ColU64(st, 13);
    r.started_at_ms = ColU64(st, 14);
    r.completed_at_ms = ColU64(st, 15);
    return r;
}

// Binds the mutable job columns as ?1..?13 with the id as ?14.
void BindJobUpdate(sqlite3_stmt* st, const model::JobRecord& r) {
    BindOptText(st, 1, r.area_wkt);
    BindOptText(st, 2, r.source_url);
    BindText(st, 3, r.config_json);
    BindText(st, 4, std::string(lidar::model::ToString(r.status)));
    sqlite3_bind_int(st, 5, r.progress);
    BindText(st, 6, r.status_message);
    BindText(st, 7, r.error_message);
    BindText(st, 8, r.tileset_url);
    BindOpt(st, 9, r.tree_count);
    BindOpt(st, 10, r.point_count);
    BindU64(st, 11, r.started_at_ms);
    BindU64(st, 12, r.completed_at_ms);
    BindText(st, 13, r.tenant_id);
    BindText(st, 14, r.id);
}

constexpr const char* kJobUpdateSql =
    "UPDATE processing_jobs SET area_wkt=?1,source_url=?2,config=?3,status=?4,progress=?5,status_message=?6,error_message=?7,"
    "tileset_url=?8,tree_count=?9,point_count=?10,started_at_ms=?11,completed_at_ms=?12,tenant_id=?13 WHERE id=?14";

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db)
    : db_(std::move(db)) {}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
    return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
    return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
    if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
        return Result::Ok();

    switch (rc & 0xFF) {
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
            return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
        case SQLITE_CONSTRAINT:
            if (rc == SQLITE_CONSTRAINT_PRIMARYKEY || rc == SQLITE_CONSTRAINT_UNIQUE)
                return Result::Err(ErrorCode::AlreadyExists, sqlite3_errmsg(db));
            return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
        case SQLITE_IOERR:
            return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
        default:
            return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    }
}

// ------------------------------------------------------------------
// Coverage index
// ------------------------------------------------------------------

Result SqliteRepository::InsertCoverageTile(Transaction& t, const model::CoverageTileRecord& r) {
    auto* db = TX(t).Handle();
    auto st = Prepare(db,
        "INSERT INTO coverage_tiles(tile_name,source,flight_year,point_density,laz_url,footprint_wkt,min_x,min_y,max_x,max_y,metadata,created_at_ms) "
        "VALUES(?,?,?,?,?,?,?,?,?,?,?,?);");

    BindText(st.get(), 1, r.tile_name);
    BindText(st.get(), 2, r.source);
    BindOpt(st.get(), 3, r.flight_year);
    BindOpt(st.get(), 4, r.point_density);
    BindText(st.get(), 5, r.laz_url);
    BindText(st.get(), 6, r.footprint_wkt);
    BindDouble(st.get(), 7, r.envelope.min_x);
    BindDouble(st.get(), 8, r.envelope.min_y);
    BindDouble(st.get(), 9, r.envelope.max_x);
    BindDouble(st.get(), 10, r.envelope.max_y);
    BindText(st.get(), 11, r.metadata_json);
    BindU64(st.get(), 12, r.created_at_ms);

    return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::CoverageTileRecord>
SqliteRepository::GetCoverageTile(Transaction& t, const std::string& tile_name) {
    auto* db = TX(t).Handle();
    auto st = Prepare(db, (std::string("SELECT ") + kCoverageColumns + " FROM coverage_tiles WHERE tile_name=?;").c_str());
    BindText(st.get(), 1, tile_name);

    if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;
    return ReadCoverage(st.get());
}

std::vector<model::CoverageTileRecord>
SqliteRepository::FindCoverageCandidates(Transaction& t, const model::CoverageQuery& query) {
    auto* db = TX(t).Handle();
    auto st = Prepare(db, (std::string("SELECT ") + kCoverageColumns +
                           " FROM coverage_tiles WHERE min_x<=?1 AND max_x>=?2 AND min_y<=?3 AND max_y>=?4 AND (?5 IS NULL OR source=?5);").c_str());
    BindDouble(st.get(), 1, query.envelope.max_x);
    BindDouble(st.get(), 2, query.envelope.min_x);
    BindDouble(st.get(), 3, query.envelope.max_y);
    BindDouble(st.get(), 4, query.envelope.min_y);
    BindOptText(st.get(), 5, query.source);

    std::vector<model::CoverageTileRecord> out;
    int rc;
    while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
        out.push_back(ReadCoverage(st.get()));
    }
    if (rc != SQLITE_DONE) {
        throw std::runtime_error(std::string("coverage query: ") + sqlite3_errmsg(db));
    }
    return out;
}

Result SqliteRepository::DeleteCoverageBySource(Transaction& t, const std::string& source) {
    auto* db = TX(t).Handle();
    auto st = Prepare(db, "DELETE FROM coverage_tiles WHERE source=?;");
    BindText(st.get(), 1, source);
    return Translate(db, sqlite3_step(st.get()));
}

std::vector<std::pair<std::string, std::uint64_t>> SqliteRepository::CountCoverageBySource(Transaction& t) {
    auto* db = TX(t).Handle();
    auto st = Prepare(db, "SELECT source, COUNT(*) FROM coverage_tiles GROUP BY source ORDER BY source;");

    std::vector<std::pair<std::string, std::uint64_t>> out;
    while (sqlite3_step(st.get()) == SQLITE_ROW) {
        out.emplace_back(ColText(st.get(), 0), ColU64(st.get(), 1));
    }
    return out;
}

// ------------------------------------------------------------------
// Tile cache
// ------------------------------------------------------------------

std::optional<model::TileCacheRecord>
SqliteRepository::GetCachedTile(Transaction& t, const std::string& tile_name) {
    auto* db = TX(t).Handle();
    auto st = Prepare(db, (std::string("SELECT ") + kCacheColumns + " FROM tile_cache WHERE tile_name=?;").c_str());
    BindText(st.get(), 1, tile_name);

    if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;
    return ReadCache(st.get());
}

Result SqliteRepository::BeginCachedTileDownload(Transaction& t, const model::TileCacheRecord& r) {
    auto* db = TX(t).Handle();
    auto st = Prepare(db,
        "INSERT INTO tile_cache(tile_name,source_url,object_key,state,attempt_id,updated_at_ms) VALUES(?1,?2,?3,'downloading',?4,?5) "
        "ON CONFLICT(tile_name) DO UPDATE SET source_url=?2,object_key=?3,state='downloading',attempt_id=?4,updated_at_ms=?5;");
    BindText(st.get(), 1, r.tile_name);
    BindText(st.get(), 2, r.source_url);
    BindText(st.get(), 3, r.object_key);
    BindText(st.get(), 4, r.attempt_id);
    BindU64(st.get(), 5, r.updated_at_ms);
    return Translate(db, sqlite3_step(st.get()));
}

Result SqliteRepository::CompleteCachedTile(Transaction& t, const model::TileCacheRecord& r) {
    auto* db = TX(t).Handle();
    auto st = Prepare(db,
        "INSERT INTO tile_cache(tile_name,source_url,object_key,state,attempt_id,size_bytes,downloaded_at_ms,last_accessed_at_ms,access_count,updated_at_ms) "
        "VALUES(?1,?2,?3,'complete',?4,?5,?6,?7,1,?8) "
        "ON CONFLICT(tile_name) DO UPDATE SET source_url=?2,object_key=?3,state='complete',attempt_id=?4,size_bytes=?5,"
        "downloaded_at_ms=?6,last_accessed_at_ms=?7,access_count=tile_cache.access_count+1,updated_at_ms=?8;");
    BindText(st.get(), 1, r.tile_name);
    BindText(st.get(), 2, r.source_url);
    BindText(st.get(), 3, r.object_key);
    BindText(st.get(), 4, r.attempt_id);
    BindU64(st.get(), 5, r.size_bytes);
    BindU64(st.get(), 6, r.downloaded_at_ms);
    BindU64(st.get(), 7, r.last_accessed_at_ms);
    BindU64(st.get(), 8, r.updated_at_ms);
    return Translate(db, sqlite3_step(st.get()));
}

Result SqliteRepository::FailCachedTileDownload(Transaction& t, const std::string& tile_name, const std::string& attempt_id, std::uint64_t at_ms) {
    auto* db = TX(t).Handle();
    auto st = Prepare(db, "UPDATE tile_cache SET state='failed',updated_at_ms=? WHERE tile_name=? AND attempt_id=? AND state='downloading';");
    BindU64(st.get(), 1, at_ms);
    BindText(st.get(), 2, tile_name);
    BindText(st.get(), 3, attempt_id);

    auto result = Translate(db, sqlite3_step(st.get()));
    if (!result) return result;
    if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::Conflict, "download attempt no longer owns " + tile_name);
    return Result::Ok();
}

Result SqliteRepository::TouchCachedTile(Transaction& t, const std::string& tile_name, std::uint64_t at_ms) {
    auto* db = TX(t).Handle();
    auto st = Prepare(db, "UPDATE tile_cache SET access_count=access_count+1,last_accessed_at_ms=? WHERE tile_name=? AND state='complete';");
    BindU64(st.get(), 1, at_ms);
    BindText(st.get(), 2, tile_name);

    auto result = Translate(db, sqlite3_step(st.get()));
    if (!result) return result;
    if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound, tile_name);
    return Result::Ok();
}

model::TileCacheTotals SqliteRepository::SumCompleteCachedTiles(Transaction& t) {
    auto* db = TX(t).Handle();
    auto st = Prepare(db,
        "SELECT COUNT(*), COALESCE(SUM(size_bytes),0), COALESCE(SUM(access_count),0) FROM tile_cache WHERE state='complete';");

    model::TileCacheTotals totals;
    if (sqlite3_step(st.get()) == SQLITE_ROW) {
        totals.tile_count = ColU64(st.get(), 0);
        totals.total_bytes = ColU64(st.get(), 1);
        totals.total_accesses = ColU64(st.get(), 2);
    }
    return totals;
}

// ------------------------------------------------------------------
// Processing jobs
// ------------------------------------------------------------------

Result SqliteRepository::InsertJob(Transaction& t, const model::JobRecord& r) {
    auto* db = TX(t).Handle();
    auto st = Prepare(db,
        "INSERT INTO processing_jobs(area_wkt,source_url,config,status,progress,status_message,error_message,tileset_url,"
        "tree_count,point_count,started_at_ms,completed_at_ms,tenant_id,id,parcel_id,created_at_ms) "
        "VALUES(?1,?2,?3,?4,?5,?6,?7,?8,?9,?10,?11,?12,?13,?14,?15,?16);");
    BindJobUpdate(st.get(), r);
    BindText(st.get(), 15, r.parcel_id);
    BindU64(st.get(), 16, r.created_at_ms);
    return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::JobRecord> SqliteRepository::GetJob(Transaction& t, const std::string& id) {
    auto* db = TX(t).Handle();
    auto st = Prepare(db, (std::string("SELECT ") + kJobColumns + " FROM processing_jobs WHERE id=?;").c_str());
    BindText(st.get(), 1, id);

    if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;
    return ReadJob(st.get());
}

Result SqliteRepository::UpdateJob(Transaction& t, const model::JobRecord& r) {
    auto* db = TX(t).Handle();
    auto st = Prepare(db, (std::string(kJobUpdateSql) + ";").c_str());
    BindJobUpdate(st.get(), r);

    auto result = Translate(db, sqlite3_step(st.get()));
    if (!result) return result;
    if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound, r.id);
    return Result::Ok();
}

Result SqliteRepository::TransitionJob(Transaction& t, const model::JobRecord& r, lidar::model::JobStatus expected) {
    auto* db = TX(t).Handle();
    auto st = Prepare(db, (std::string(kJobUpdateSql) + " AND status=?15;").c_str());
    BindJobUpdate(st.get(), r);
    BindText(st.get(), 15, std::string(lidar::model::ToString(expected)));

    auto result = Translate(db, sqlite3_step(st.get()));
    if (!result) return result;
    if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::Conflict, "job status changed concurrently");
    return Result::Ok();
}

std::vector<model::JobRecord> SqliteRepository::ListJobsByStatus(Transaction& t, lidar::model::JobStatus status, std::size_t limit) {
    auto* db = TX(t).Handle();
    auto st = Prepare(db, (std::string("SELECT ") + kJobColumns + " FROM processing_jobs WHERE status=? ORDER BY created_at_ms, id LIMIT ?;").c_str());
    BindText(st.get(), 1, std::string(lidar::model::ToString(status)));
    BindU64(st.get(), 2, limit);

    std::vector<model::JobRecord> out;
    while (sqlite3_step(st.get()) == SQLITE_ROW) {
        out.push_back(ReadJob(st.get()));
    }
    return out;
}

} // namespace lidar::db::sqlite
