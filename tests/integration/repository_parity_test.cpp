#include <algorithm>
#include <cassert>
#include <chrono>
#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"

#if LIDAR_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif

#if LIDAR_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace {

using lidar::db::ErrorCode;
using lidar::db::Repository;
using lidar::db::memory::MemoryRepository;
using lidar::db::model::CoverageTileRecord;
using lidar::db::model::JobRecord;
using lidar::db::model::TileCacheRecord;
using lidar::model::CacheState;
using lidar::model::JobStatus;

uint64_t NowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

struct BackendFactory {
  std::string                                       name;
  std::function<std::shared_ptr<Repository>()>      make_repository;
  std::function<bool()>                             supports_restart;
  std::function<void(std::shared_ptr<Repository>&)> restart;
  std::function<void()>                             cleanup;
};

CoverageTileRecord MakeTile(const std::string& name, const std::string& source, double min_x, double min_y, double size) {
  CoverageTileRecord tile;
  tile.tile_name   = name;
  tile.source      = source;
  tile.flight_year = 2023;
  tile.laz_url     = "https://origin.example/laz/" + name + ".laz";
  tile.envelope    = {min_x, min_y, min_x + size, min_y + size};

  const auto p = [](double x, double y) { return std::to_string(x) + " " + std::to_string(y); };
  tile.footprint_wkt = "POLYGON((" + p(min_x, min_y) + ", " + p(min_x + size, min_y) + ", " + p(min_x + size, min_y + size) + ", " +
                       p(min_x, min_y + size) + ", " + p(min_x, min_y) + "))";
  tile.created_at_ms = NowMs();
  return tile;
}

std::vector<std::string> TileNames(const std::vector<CoverageTileRecord>& tiles) {
  std::vector<std::string> names;
  for (const auto& tile : tiles) names.push_back(tile.tile_name);
  std::sort(names.begin(), names.end());
  return names;
}

void VerifyCoverageReadWrite(Repository& repo, const std::string& prefix) {
  const auto source = prefix + "-source";
  const auto west   = MakeTile(prefix + "-west", source, -1.70, 42.80, 0.01);
  const auto east   = MakeTile(prefix + "-east", source, -1.60, 42.80, 0.01);

  {
    auto tx = repo.Begin();
    assert(repo.InsertCoverageTile(*tx, west));
    assert(repo.InsertCoverageTile(*tx, east));
    tx->Commit();
  }
  {
    // a unique violation aborts the postgres transaction
    auto tx = repo.Begin();
    assert(repo.InsertCoverageTile(*tx, west).code == ErrorCode::AlreadyExists);
    tx->Rollback();
  }

  auto tx = repo.Begin();

  auto loaded = repo.GetCoverageTile(*tx, west.tile_name);
  assert(loaded.has_value());
  assert(loaded->source == source);
  assert(loaded->flight_year == 2023);
  assert(!loaded->point_density.has_value());
  assert(loaded->laz_url == west.laz_url);
  assert(std::abs(loaded->envelope.min_x - west.envelope.min_x) < 1e-9);
  assert(std::abs(loaded->envelope.max_y - west.envelope.max_y) < 1e-9);

  lidar::db::model::CoverageQuery query;
  query.envelope = {-1.695, 42.805, -1.694, 42.806};
  query.area_wkt = "POLYGON((-1.695 42.805, -1.694 42.805, -1.694 42.806, -1.695 42.806, -1.695 42.805))";
  query.source   = source;
  assert(TileNames(repo.FindCoverageCandidates(*tx, query)) == std::vector<std::string>{west.tile_name});

  query.source = prefix + "-other";
  assert(repo.FindCoverageCandidates(*tx, query).empty());

  const auto counts = repo.CountCoverageBySource(*tx);
  const auto it     = std::find_if(counts.begin(), counts.end(), [&](const auto& entry) { return entry.first == source; });
  assert(it != counts.end() && it->second == 2);

  assert(repo.DeleteCoverageBySource(*tx, source));
  assert(!repo.GetCoverageTile(*tx, west.tile_name).has_value());
  assert(!repo.GetCoverageTile(*tx, east.tile_name).has_value());
  tx->Commit();
}

void VerifyTileCacheLifecycle(Repository& repo, const std::string& prefix) {
  const auto tile_name = prefix + "-tile";

  auto totals_before = [&]() {
    auto tx     = repo.Begin();
    auto totals = repo.SumCompleteCachedTiles(*tx);
    tx->Commit();
    return totals;
  }();

  TileCacheRecord entry;
  entry.tile_name     = tile_name;
  entry.source_url    = "https://origin.example/laz/" + tile_name + ".laz";
  entry.object_key    = "source-tiles/" + tile_name + ".laz";
  entry.attempt_id    = "attempt-1";
  entry.updated_at_ms = NowMs();

  auto tx = repo.Begin();
  assert(repo.BeginCachedTileDownload(*tx, entry));
  assert(repo.GetCachedTile(*tx, tile_name)->state == CacheState::kDownloading);
  assert(!repo.TouchCachedTile(*tx, tile_name, NowMs()));

  assert(repo.FailCachedTileDownload(*tx, tile_name, "attempt-other", NowMs()).code == ErrorCode::Conflict);
  assert(repo.FailCachedTileDownload(*tx, tile_name, "attempt-1", NowMs()));
  assert(repo.GetCachedTile(*tx, tile_name)->state == CacheState::kFailed);
  assert(repo.FailCachedTileDownload(*tx, tile_name, "attempt-1", NowMs()).code == ErrorCode::Conflict);

  entry.attempt_id = "attempt-2";
  assert(repo.BeginCachedTileDownload(*tx, entry));

  entry.size_bytes       = 11;
  entry.downloaded_at_ms = NowMs();
  assert(repo.CompleteCachedTile(*tx, entry));

  auto complete = repo.GetCachedTile(*tx, tile_name);
  assert(complete->state == CacheState::kComplete);
  assert(complete->size_bytes == 11);
  assert(complete->access_count == 1);
  assert(complete->object_key == entry.object_key);

  assert(repo.TouchCachedTile(*tx, tile_name, NowMs()));
  assert(repo.GetCachedTile(*tx, tile_name)->access_count == 2);

  // a re-download keeps the access history
  entry.attempt_id = "attempt-3";
  assert(repo.BeginCachedTileDownload(*tx, entry));
  assert(repo.GetCachedTile(*tx, tile_name)->access_count == 2);
  assert(repo.CompleteCachedTile(*tx, entry));
  assert(repo.GetCachedTile(*tx, tile_name)->access_count == 3);

  const auto totals = repo.SumCompleteCachedTiles(*tx);
  assert(totals.tile_count == totals_before.tile_count + 1);
  assert(totals.total_bytes == totals_before.total_bytes + 11);
  assert(totals.total_accesses == totals_before.total_accesses + 3);
  tx->Commit();
}

JobRecord MakeJob(const std::string& id, std::uint64_t created_at_ms) {
  JobRecord job;
  job.id             = id;
  job.tenant_id      = "farm-co";
  job.parcel_id      = "parcel-7";
  job.source_url     = "https://uploads.example/" + id + ".laz";
  job.config_json    = "{}";
  job.status         = JobStatus::kQueued;
  job.status_message = "Queued";
  job.created_at_ms  = created_at_ms;
  return job;
}

std::vector<std::string> QueuedIds(Repository& repo, const std::string& prefix) {
  auto tx   = repo.Begin();
  auto jobs = repo.ListJobsByStatus(*tx, JobStatus::kQueued, 10000);
  tx->Commit();

  std::vector<std::string> ids;
  for (const auto& job : jobs) {
    if (job.id.rfind(prefix, 0) == 0) ids.push_back(job.id);
  }
  return ids;
}

void VerifyJobTransitions(Repository& repo, const std::string& prefix) {
  const auto later   = MakeJob(prefix + "-later", 2000);
  const auto earlier = MakeJob(prefix + "-earlier", 1000);

  {
    auto tx = repo.Begin();
    assert(repo.InsertJob(*tx, later));
    assert(repo.InsertJob(*tx, earlier));
    tx->Commit();
  }
  {
    auto tx = repo.Begin();
    assert(repo.InsertJob(*tx, earlier).code == ErrorCode::AlreadyExists);
    tx->Rollback();
  }

  assert((QueuedIds(repo, prefix) == std::vector<std::string>{earlier.id, later.id}));

  auto tx = repo.Begin();

  auto claimed          = *repo.GetJob(*tx, earlier.id);
  claimed.status        = JobStatus::kProcessing;
  claimed.progress      = 10;
  claimed.started_at_ms = 3000;
  assert(repo.TransitionJob(*tx, claimed, JobStatus::kQueued));
  assert(repo.TransitionJob(*tx, claimed, JobStatus::kQueued).code == ErrorCode::Conflict);

  claimed.status          = JobStatus::kCompleted;
  claimed.progress        = 100;
  claimed.tileset_url     = "https://objects.example/tilesets/" + earlier.id + "/tileset.json";
  claimed.point_count     = 5;
  claimed.completed_at_ms = 4000;
  assert(repo.TransitionJob(*tx, claimed, JobStatus::kProcessing));

  const auto loaded = repo.GetJob(*tx, earlier.id);
  assert(loaded.has_value());
  assert(loaded->status == JobStatus::kCompleted);
  assert(loaded->progress == 100);
  assert(loaded->tileset_url == claimed.tileset_url);
  assert(loaded->point_count == 5);
  assert(!loaded->tree_count.has_value());
  assert(!loaded->area_wkt.has_value());
  assert(loaded->source_url == earlier.source_url);
  assert(loaded->started_at_ms == 3000);
  assert(loaded->completed_at_ms == 4000);

  assert(repo.UpdateJob(*tx, MakeJob(prefix + "-missing", 1)).code == ErrorCode::NotFound);
  assert(!repo.GetJob(*tx, prefix + "-missing").has_value());
  tx->Commit();

  assert(QueuedIds(repo, prefix) == std::vector<std::string>{later.id});
}

void VerifyRollbackBehavior(Repository& repo, const std::string& prefix) {
  {
    auto tx = repo.Begin();
    assert(repo.InsertJob(*tx, MakeJob(prefix + "-rolled-back", 1)));
    tx->Rollback();
  }
  {
    auto tx = repo.Begin();
    assert(repo.InsertJob(*tx, MakeJob(prefix + "-abandoned", 1)));
    // destroyed without commit
  }

  auto tx = repo.Begin();
  assert(!repo.GetJob(*tx, prefix + "-rolled-back").has_value());
  assert(!repo.GetJob(*tx, prefix + "-abandoned").has_value());
  tx->Commit();
}

void VerifyRestartDurability(BackendFactory& backend, const std::string& prefix) {
  if (!backend.supports_restart()) {
    return;
  }

  auto repo = backend.make_repository();
  {
    auto tx = repo->Begin();
    assert(repo->InsertJob(*tx, MakeJob(prefix + "-job", 1)));
    assert(repo->InsertCoverageTile(*tx, MakeTile(prefix + "-tile", prefix + "-source", 10.0, 10.0, 1.0)));
    tx->Commit();
  }

  backend.restart(repo);

  auto tx = repo->Begin();
  assert(repo->GetJob(*tx, prefix + "-job").has_value());
  assert(repo->GetCoverageTile(*tx, prefix + "-tile").has_value());
  assert(repo->DeleteCoverageBySource(*tx, prefix + "-source"));
  tx->Commit();
}

BackendFactory MakeMemoryFactory() {
  return BackendFactory{
      .name             = "memory",
      .make_repository  = []() { return std::make_shared<MemoryRepository>(); },
      .supports_restart = []() { return false; },
      .restart          = [](std::shared_ptr<Repository>&) {},
      .cleanup          = []() {},
  };
}

#if LIDAR_DB_SQLITE
BackendFactory MakeSqliteFactory() {
  auto db_path = (std::filesystem::temp_directory_path() / ("lidar_integration_sqlite_" + std::to_string(NowMs()) + ".db")).string();

  auto make_repo = [db_path]() {
    auto db = std::make_shared<lidar::db::sqlite::SqliteDB>(db_path);
    db->Configure();
    lidar::db::sqlite::BootstrapSchema(*db);
    return std::make_shared<lidar::db::sqlite::SqliteRepository>(std::move(db));
  };

  return BackendFactory{
      .name             = "sqlite",
      .make_repository  = make_repo,
      .supports_restart = []() { return true; },
      .restart          = [make_repo](std::shared_ptr<Repository>& repo) {
        repo.reset();
        repo = make_repo();
      },
      .cleanup = [db_path]() {
        std::filesystem::remove(db_path);
        std::filesystem::remove(db_path + "-wal");
        std::filesystem::remove(db_path + "-shm");
      },
  };
}
#endif

#if LIDAR_DB_POSTGRES
BackendFactory MakePostgresFactory() {
  const char* uri = std::getenv("LIDAR_TEST_POSTGRES_URI");
  if (uri == nullptr || std::string(uri).empty()) {
    throw std::runtime_error("LIDAR_TEST_POSTGRES_URI is not set");
  }

  auto conninfo  = std::string(uri);
  auto make_repo = [conninfo]() {
    auto pool = std::make_shared<lidar::db::postgres::PgPool>(conninfo);
    lidar::db::postgres::BootstrapSchema(*pool);
    return std::make_shared<lidar::db::postgres::PgRepository>(std::move(pool));
  };

  return BackendFactory{
      .name             = "postgres",
      .make_repository  = make_repo,
      .supports_restart = []() { return true; },
      .restart          = [make_repo](std::shared_ptr<Repository>& repo) { repo = make_repo(); },
      .cleanup          = []() {},
  };
}
#endif

void RunBackendSuite(BackendFactory& backend) {
  std::cout << "running backend suite: " << backend.name << "\n";
  auto       repo   = backend.make_repository();
  const auto prefix = backend.name + "-" + std::to_string(NowMs());

  VerifyCoverageReadWrite(*repo, prefix + "-coverage");
  VerifyTileCacheLifecycle(*repo, prefix + "-cache");
  VerifyJobTransitions(*repo, prefix + "-jobs");
  VerifyRollbackBehavior(*repo, prefix + "-rollback");

  repo.reset();
  VerifyRestartDurability(backend, prefix + "-durable");

  backend.cleanup();
}

} // namespace

int main() {
  std::vector<BackendFactory> backends;
  backends.push_back(MakeMemoryFactory());

#if LIDAR_DB_SQLITE
  backends.push_back(MakeSqliteFactory());
#endif

#if LIDAR_DB_POSTGRES
  try {
    backends.push_back(MakePostgresFactory());
  } catch (const std::exception& ex) {
    std::cout << "skipping postgres integration suite: " << ex.what() << "\n";
  }
#endif

  for (auto& backend : backends) {
    RunBackendSuite(backend);
  }

  std::cout << "lidar_integration_repository_parity: pass\n";
  return 0;
}
