#include "factory.hpp"

#include <chrono>
#include <stdexcept>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/fetch/origin_fetcher.hpp"
#include "internal/observability/logging.hpp"
#include "internal/publish/entity_graph_publisher.hpp"
#include "internal/raster/raster_io.hpp"
#include "internal/segmentation/tree_segmenter.hpp"
#include "internal/storage/object/object_arrow_store.hpp"
#include "internal/tiling/tiling_converter.hpp"
#include "internal/toolkit/pdal_toolkit.hpp"
#if LIDAR_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif
#if LIDAR_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace lidar::factory {

using observability::StringField;

std::shared_ptr<db::Repository> BuildRepository(const lidar::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if LIDAR_DB_SQLITE
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path());
    db::sqlite::BootstrapSchema(*sqlite_db);
    LIDAR_LOG_INFO("Using sqlite repository", {StringField("path", database.sqlite().path())});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if LIDAR_DB_POSTGRES
    const auto max_connections = database.postgres().max_connections() > 0 ? database.postgres().max_connections() : 8;
    auto       pool            = std::make_shared<db::postgres::PgPool>(database.postgres().connection_uri(), max_connections);
    db::postgres::BootstrapSchema(*pool);
    LIDAR_LOG_INFO("Using postgres repository");
    return std::make_shared<db::postgres::PgRepository>(std::move(pool));
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  LIDAR_LOG_WARN("Using in-memory repository; state is lost on exit");
  return std::make_shared<db::memory::MemoryRepository>();
}

/*
    Build full application dependency graph
*/
Runtime Build(const lidar::runtime::config::RuntimeConfig& config) {
  Runtime runtime;

  // ------------------------------------------------------------------
  // Persistence and storage
  // ------------------------------------------------------------------
  runtime.repository = BuildRepository(config);
  runtime.store      = storage::ObjectArrowStore::FromUri(config.storage().object_root(), config.storage().public_base_url());

  // ------------------------------------------------------------------
  // External tools
  // ------------------------------------------------------------------
  const auto& processing = config.processing();
  auto fetcher   = std::make_shared<fetch::CprOriginFetcher>(std::chrono::seconds(processing.download_timeout_seconds()));
  auto toolkit   = std::make_shared<toolkit::PdalToolkit>();
  auto raster_io = std::make_shared<raster::GdalRasterIo>();
  auto tiling    = std::make_shared<tiling::Py3dtilesConverter>(processing.tiling_command());

  publish::EntityGraphPublisherPtr publisher;
  if (config.entity_graph().url().empty()) {
    publisher = std::make_shared<publish::NullEntityGraphPublisher>();
  } else {
    publish::NgsiLdOptions options;
    options.base_url  = config.entity_graph().url();
    options.max_trees = config.entity_graph().max_trees();
    options.timeout   = std::chrono::milliseconds(config.entity_graph().timeout_ms());
    publisher         = std::make_shared<publish::NgsiLdPublisher>(options);
  }

  // ------------------------------------------------------------------
  // Core components
  // ------------------------------------------------------------------
  runtime.coverage   = std::make_shared<coverage::CoverageIndex>(runtime.repository);
  runtime.tile_cache = std::make_shared<cache::TileCache>(runtime.repository, runtime.store, fetcher,
                                                          cache::TileCacheOptions{config.storage().cache_prefix()});
  runtime.tracker    = std::make_shared<pipeline::JobTracker>(runtime.repository);

  pipeline::PipelineServices services;
  services.tracker    = runtime.tracker;
  services.coverage   = runtime.coverage;
  services.tile_cache = runtime.tile_cache;
  services.fetcher    = fetcher;
  services.toolkit    = toolkit;
  services.segmenter  = std::make_shared<segmentation::TreeSegmenter>(toolkit, raster_io);
  services.tiling     = tiling;
  services.store      = runtime.store;
  services.publisher  = publisher;

  pipeline::PipelineSettings settings;
  settings.work_root                = processing.work_root();
  settings.job_deadline             = std::chrono::seconds(processing.job_deadline_seconds());
  settings.tileset_prefix           = config.storage().tileset_prefix();
  settings.area_srs                 = processing.area_srs();
  settings.defaults.min_height      = processing.defaults().tree_min_height();
  settings.defaults.search_radius   = processing.defaults().tree_search_radius();
  settings.defaults.resolution      = processing.defaults().chm_resolution();

  runtime.orchestrator = std::make_shared<pipeline::PipelineOrchestrator>(std::move(services), std::move(settings));
  return runtime;
}

} // namespace lidar::factory
