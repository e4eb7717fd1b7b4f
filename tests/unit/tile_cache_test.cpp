#include "internal/cache/tile_cache.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <string>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/errors.hpp"
#include "tests/unit/fakes.hpp"

using lidar::cache::TileCache;
using lidar::db::memory::MemoryRepository;
using lidar::model::CacheState;
using lidar::testing::FakeFetcher;
using lidar::testing::FakeObjectStore;

namespace {

constexpr const char* kTileUrl = "https://origin.example/laz/PNOA_2023_NAV_612-4722.laz?token=abc";

struct Fixture {
  std::shared_ptr<MemoryRepository> repository = std::make_shared<MemoryRepository>();
  std::shared_ptr<FakeObjectStore>  store      = std::make_shared<FakeObjectStore>();
  std::shared_ptr<FakeFetcher>      fetcher    = std::make_shared<FakeFetcher>();
  TileCache                         cache{repository, store, fetcher, lidar::cache::TileCacheOptions{}};

  Fixture() {
    fetcher->bodies[kTileUrl] = "LASF-points";
  }

  std::optional<lidar::db::model::TileCacheRecord> Entry(const std::string& tile_name) {
    auto tx    = repository->Begin();
    auto entry = repository->GetCachedTile(*tx, tile_name);
    tx->Commit();
    return entry;
  }
};

void TestDeriveTileName() {
  assert(TileCache::DeriveTileName(kTileUrl) == "PNOA_2023_NAV_612-4722");
  assert(TileCache::DeriveTileName("/data/tiles/a.b.laz") == "a.b");
  assert(TileCache::DeriveTileName("https://origin.example/tiles/block7/") == "block7");
  assert(TileCache::DeriveTileName("file:///srv/laz/tile") == "tile");

  bool threw = false;
  try {
    (void)TileCache::DeriveTileName("?download=1");
  } catch (const lidar::util::ValidationError&) {
    threw = true;
  }
  assert(threw);
}

void TestMissThenHit() {
  Fixture    f;
  const auto first_dir  = lidar::testing::FreshDirectory("tile_cache_first");
  const auto second_dir = lidar::testing::FreshDirectory("tile_cache_second");

  const auto first = f.cache.ResolveLocalFile(kTileUrl, first_dir);
  assert(first == first_dir / "PNOA_2023_NAV_612-4722.laz");
  assert(lidar::testing::ReadText(first) == "LASF-points");
  assert(f.fetcher->fetches == 1);
  assert(f.store->Object("source-tiles/PNOA_2023_NAV_612-4722.laz") == "LASF-points");

  auto entry = f.Entry("PNOA_2023_NAV_612-4722");
  assert(entry && entry->state == CacheState::kComplete);
  assert(entry->size_bytes == 11);
  assert(entry->access_count == 1);

  const auto second = f.cache.ResolveLocalFile(kTileUrl, second_dir);
  assert(lidar::testing::ReadText(second) == "LASF-points");
  assert(f.fetcher->fetches == 1);
  assert(f.store->gets == 1);

  const auto stats = f.cache.Stats();
  assert(stats.tile_count == 1);
  assert(stats.total_bytes == 11);
  assert(stats.total_accesses == 2);
  assert(stats.downloads_avoided == 1);
}

void TestFailedDownloadIsRetried() {
  Fixture    f;
  const auto dir = lidar::testing::FreshDirectory("tile_cache_retry");

  f.fetcher->fail = true;
  bool threw      = false;
  try {
    f.cache.ResolveLocalFile(kTileUrl, dir);
  } catch (const lidar::util::TransientIoError&) {
    threw = true;
  }
  assert(threw);
  assert(f.Entry("PNOA_2023_NAV_612-4722")->state == CacheState::kFailed);
  assert(f.cache.Stats().tile_count == 0);

  f.fetcher->fail = false;
  f.cache.ResolveLocalFile(kTileUrl, dir);
  assert(f.fetcher->fetches == 2);
  assert(f.Entry("PNOA_2023_NAV_612-4722")->state == CacheState::kComplete);
  assert(f.cache.Stats().tile_count == 1);
}

void TestStoreFailureSurfacesAsTransient() {
  Fixture    f;
  const auto dir = lidar::testing::FreshDirectory("tile_cache_store_failure");

  f.store->fail_puts = true;
  bool threw         = false;
  try {
    f.cache.ResolveLocalFile(kTileUrl, dir);
  } catch (const lidar::util::TransientIoError&) {
    threw = true;
  }
  assert(threw);
  assert(f.Entry("PNOA_2023_NAV_612-4722")->state == CacheState::kFailed);
}

void TestUnreadableCachedObjectIsDownloadedAgain() {
  Fixture    f;
  const auto dir = lidar::testing::FreshDirectory("tile_cache_unreadable");

  f.cache.ResolveLocalFile(kTileUrl, dir);
  f.store->DeletePrefix("source-tiles/");

  const auto path = f.cache.ResolveLocalFile(kTileUrl, dir);
  assert(lidar::testing::ReadText(path) == "LASF-points");
  assert(f.fetcher->fetches == 2);
  assert(f.store->Exists("source-tiles/PNOA_2023_NAV_612-4722.laz"));
}

void TestInterruptedDownloadCountsAsMiss() {
  Fixture f;

  lidar::db::model::TileCacheRecord stale;
  stale.tile_name  = "PNOA_2023_NAV_612-4722";
  stale.source_url = kTileUrl;
  stale.object_key = "source-tiles/PNOA_2023_NAV_612-4722.laz";
  stale.attempt_id = "crashed-worker";
  {
    auto tx = f.repository->Begin();
    lidar::db::ThrowIfError(f.repository->BeginCachedTileDownload(*tx, stale), "seed stale entry");
    tx->Commit();
  }

  const auto dir = lidar::testing::FreshDirectory("tile_cache_interrupted");
  f.cache.ResolveLocalFile(kTileUrl, dir);
  assert(f.fetcher->fetches == 1);
  assert(f.Entry("PNOA_2023_NAV_612-4722")->state == CacheState::kComplete);
}

} // namespace

int main() {
  TestDeriveTileName();
  TestMissThenHit();
  TestFailedDownloadIsRetried();
  TestStoreFailureSurfacesAsTransient();
  TestUnreadableCachedObjectIsDownloadedAgain();
  TestInterruptedDownloadCountsAsMiss();

  std::cout << "lidar_unit_tile_cache: pass\n";
  return 0;
}
