#include "sqlite_db.hpp"

#include <stdexcept>
#include <vector>

namespace lidar::db::sqlite {

static void ThrowIf(int rc, sqlite3* db, const char* what) {
  if (rc != SQLITE_OK) {
    throw std::runtime_error(std::string(what) + ": " + sqlite3_errmsg(db));
  }
}

SqliteDB::SqliteDB(std::string path) : path_(std::move(path)) {
  int rc = sqlite3_open_v2(path_.c_str(), &db_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);

  if (rc != SQLITE_OK) {
    std::string msg = db_ ? sqlite3_errmsg(db_) : "sqlite open failed";
    if (db_) sqlite3_close(db_);
    db_ = nullptr;
    throw std::runtime_error("sqlite open " + path_ + ": " + msg);
  }

  Configure();
}

SqliteDB::~SqliteDB() {
  if (db_) sqlite3_close(db_);
}

void SqliteDB::Exec(const std::string& sql) {
  char* err = nullptr;
  int   rc  = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    std::string msg = err ? err : "sqlite exec failed";
    sqlite3_free(err);
    throw std::runtime_error(msg);
  }
}

void SqliteDB::Configure() {
  // WAL lets lidarctl read while the worker writes
  Exec("PRAGMA journal_mode=WAL;");
  Exec("PRAGMA synchronous=NORMAL;");
  Exec("PRAGMA foreign_keys=ON;");

  // wait for locks held by other processes instead of failing immediately
  ThrowIf(sqlite3_busy_timeout(db_, 5000), db_, "busy_timeout");

  Exec("PRAGMA temp_store=MEMORY;");
}

void BootstrapSchema(SqliteDB& db) {
  static const std::vector<std::string> kBootstrapSql = {
      "CREATE TABLE IF NOT EXISTS coverage_tiles (tile_name TEXT PRIMARY KEY, source TEXT NOT NULL, flight_year INTEGER, point_density REAL, "
      "laz_url TEXT NOT NULL, footprint_wkt TEXT NOT NULL, min_x REAL NOT NULL, min_y REAL NOT NULL, max_x REAL NOT NULL, max_y REAL NOT NULL, "
      "metadata TEXT NOT NULL DEFAULT '{}', created_at_ms INTEGER NOT NULL);",
      "CREATE INDEX IF NOT EXISTS coverage_tiles_source_idx ON coverage_tiles(source);",
      "CREATE INDEX IF NOT EXISTS coverage_tiles_envelope_idx ON coverage_tiles(min_x, max_x, min_y, max_y);",
      "CREATE TABLE IF NOT EXISTS tile_cache (tile_name TEXT PRIMARY KEY, source_url TEXT NOT NULL, object_key TEXT NOT NULL, state TEXT NOT NULL, "
      "attempt_id TEXT NOT NULL, size_bytes INTEGER NOT NULL DEFAULT 0, downloaded_at_ms INTEGER NOT NULL DEFAULT 0, "
      "last_accessed_at_ms INTEGER NOT NULL DEFAULT 0, access_count INTEGER NOT NULL DEFAULT 0, updated_at_ms INTEGER NOT NULL);",
      "CREATE TABLE IF NOT EXISTS processing_jobs (id TEXT PRIMARY KEY, tenant_id TEXT NOT NULL, parcel_id TEXT NOT NULL, area_wkt TEXT, source_url TEXT, "
      "config TEXT NOT NULL, status TEXT NOT NULL, progress INTEGER NOT NULL, status_message TEXT NOT NULL, error_message TEXT NOT NULL, "
      "tileset_url TEXT NOT NULL, tree_count INTEGER, point_count INTEGER, created_at_ms INTEGER NOT NULL, started_at_ms INTEGER NOT NULL, "
      "completed_at_ms INTEGER NOT NULL);",
      "CREATE INDEX IF NOT EXISTS processing_jobs_status_idx ON processing_jobs(status, created_at_ms);"};

  for (const auto& sql : kBootstrapSql) {
    db.Exec(sql);
  }
}

} // namespace lidar::db::sqlite
