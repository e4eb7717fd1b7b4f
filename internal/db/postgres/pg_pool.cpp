#include "pg_pool.hpp"

namespace lidar::db::postgres {

PgPool::PgPool(std::string conninfo, std::size_t max_connections)
    : conninfo_(std::move(conninfo)),
      max_connections_(max_connections == 0 ? 1 : max_connections) {
}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  std::unique_lock lock(mutex_);
  cv_.wait(lock, [this] { return !idle_.empty() || live_connections_ < max_connections_; });

  if (!idle_.empty()) {
    auto conn = std::move(idle_.back());
    idle_.pop_back();
    lock.unlock();

    if (conn->is_open()) {
      return Wrap(conn.release());
    }
    // server dropped it; replace below
    lock.lock();
    --live_connections_;
  }

  ++live_connections_;
  lock.unlock();

  try {
    auto conn = std::make_unique<pqxx::connection>(conninfo_);
    PrepareStatements(*conn);
    return Wrap(conn.release());
  } catch (const std::exception&) {
    {
      std::lock_guard rollback_lock(mutex_);
      --live_connections_;
    }
    cv_.notify_one();
    throw;
  }
}

void PgPool::PrepareStatements(pqxx::connection& conn) {
  conn.prepare("get_job",
               "SELECT id,tenant_id,parcel_id,area_wkt,source_url,config::text,status,progress,status_message,error_message,"
               "tileset_url,tree_count,point_count,created_at_ms,started_at_ms,completed_at_ms "
               "FROM processing_jobs WHERE id=$1");

  conn.prepare("update_job",
               "UPDATE processing_jobs SET area_wkt=$2,source_url=$3,config=$4::jsonb,status=$5,progress=$6,status_message=$7,"
               "error_message=$8,tileset_url=$9,tree_count=$10,point_count=$11,started_at_ms=$12,completed_at_ms=$13,tenant_id=$14 "
               "WHERE id=$1");

  conn.prepare("transition_job",
               "UPDATE processing_jobs SET area_wkt=$2,source_url=$3,config=$4::jsonb,status=$5,progress=$6,status_message=$7,"
               "error_message=$8,tileset_url=$9,tree_count=$10,point_count=$11,started_at_ms=$12,completed_at_ms=$13,tenant_id=$14 "
               "WHERE id=$1 AND status=$15");

  conn.prepare("get_cached_tile",
               "SELECT tile_name,source_url,object_key,state,attempt_id,size_bytes,downloaded_at_ms,last_accessed_at_ms,"
               "access_count,updated_at_ms FROM tile_cache WHERE tile_name=$1");

  conn.prepare("touch_cached_tile",
               "UPDATE tile_cache SET access_count=access_count+1,last_accessed_at_ms=$2 WHERE tile_name=$1 AND state='complete'");
}

std::shared_ptr<pqxx::connection> PgPool::Wrap(pqxx::connection* conn) {
  std::weak_ptr<PgPool> weak_self = shared_from_this();
  return std::shared_ptr<pqxx::connection>(conn, [weak_self](pqxx::connection* released_conn) {
    if (auto self = weak_self.lock()) {
      self->Release(released_conn);
      return;
    }
    delete released_conn;
  });
}

void PgPool::Release(pqxx::connection* conn) {
  {
    std::lock_guard lock(mutex_);
    idle_.emplace_back(conn);
  }
  cv_.notify_one();
}

void BootstrapSchema(PgPool& pool) {
  auto       conn = pool.Acquire();
  pqxx::work tx(*conn);

  tx.exec("CREATE EXTENSION IF NOT EXISTS postgis;");
  tx.exec("CREATE TABLE IF NOT EXISTS coverage_tiles (tile_name TEXT PRIMARY KEY, source TEXT NOT NULL, flight_year INTEGER, "
          "point_density DOUBLE PRECISION, laz_url TEXT NOT NULL, footprint geometry(Geometry, 4326) NOT NULL, "
          "min_x DOUBLE PRECISION NOT NULL, min_y DOUBLE PRECISION NOT NULL, max_x DOUBLE PRECISION NOT NULL, max_y DOUBLE PRECISION NOT NULL, "
          "metadata JSONB NOT NULL DEFAULT '{}', created_at_ms BIGINT NOT NULL);");
  tx.exec("CREATE INDEX IF NOT EXISTS coverage_tiles_footprint_idx ON coverage_tiles USING GIST (footprint);");
  tx.exec("CREATE INDEX IF NOT EXISTS coverage_tiles_source_idx ON coverage_tiles(source);");
  tx.exec("CREATE TABLE IF NOT EXISTS tile_cache (tile_name TEXT PRIMARY KEY, source_url TEXT NOT NULL, object_key TEXT NOT NULL, "
          "state TEXT NOT NULL, attempt_id TEXT NOT NULL, size_bytes BIGINT NOT NULL DEFAULT 0, downloaded_at_ms BIGINT NOT NULL DEFAULT 0, "
          "last_accessed_at_ms BIGINT NOT NULL DEFAULT 0, access_count BIGINT NOT NULL DEFAULT 0, updated_at_ms BIGINT NOT NULL);");
  tx.exec("CREATE TABLE IF NOT EXISTS processing_jobs (id TEXT PRIMARY KEY, tenant_id TEXT NOT NULL, parcel_id TEXT NOT NULL, "
          "area_wkt TEXT, source_url TEXT, config JSONB NOT NULL, status TEXT NOT NULL, progress INTEGER NOT NULL, "
          "status_message TEXT NOT NULL, error_message TEXT NOT NULL, tileset_url TEXT NOT NULL, tree_count BIGINT, point_count BIGINT, "
          "created_at_ms BIGINT NOT NULL, started_at_ms BIGINT NOT NULL, completed_at_ms BIGINT NOT NULL);");
  tx.exec("CREATE INDEX IF NOT EXISTS processing_jobs_status_idx ON processing_jobs(status, created_at_ms);");

  tx.commit();
}

} // namespace lidar::db::postgres
