#include "internal/coverage/coverage_index.hpp"

#include <algorithm>
#include <exception>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace lidar::coverage {

using observability::IntField;
using observability::StringField;

namespace {

// Descending with absent values last.
template <typename T>
int CompareDescending(const std::optional<T>& a, const std::optional<T>& b) {
  if (a.has_value() != b.has_value()) {
    return a.has_value() ? -1 : 1;
  }
  if (!a || *a == *b) {
    return 0;
  }
  return *a > *b ? -1 : 1;
}

} // namespace

bool CoverageOrder(const SourceTile& a, const SourceTile& b) {
  if (int c = CompareDescending(a.flight_year, b.flight_year); c != 0) {
    return c < 0;
  }
  if (int c = CompareDescending(a.point_density, b.point_density); c != 0) {
    return c < 0;
  }
  return a.tile_name < b.tile_name;
}

CoverageIndex::CoverageIndex(std::shared_ptr<db::Repository> repository) : repository_(std::move(repository)) {
}

std::vector<SourceTile> CoverageIndex::FindCoverage(const geo::Area& area, const std::optional<std::string>& source) const {
  db::model::CoverageQuery query;
  query.envelope = area.GetEnvelope();
  query.area_wkt = area.Wkt();
  query.source   = source;

  std::vector<SourceTile> candidates;
  {
    auto tx    = repository_->Begin();
    candidates = repository_->FindCoverageCandidates(*tx, query);
    tx->Commit();
  }

  std::vector<SourceTile> matches;
  matches.reserve(candidates.size());
  for (auto& tile : candidates) {
    try {
      if (geo::Area::FromWkt(tile.footprint_wkt).Intersects(area)) {
        matches.push_back(std::move(tile));
      }
    } catch (const util::ValidationError& e) {
      LIDAR_LOG_WARN("Ignoring tile with unreadable footprint", {StringField("tile", tile.tile_name), StringField("error", e.what())});
    }
  }

  std::sort(matches.begin(), matches.end(), CoverageOrder);
  return matches;
}

bool CoverageIndex::HasCoverage(const geo::Area& area) const {
  return !FindCoverage(area).empty();
}

std::optional<SourceTile> CoverageIndex::BestTile(const geo::Area& area, const std::optional<std::string>& preferred_source) const {
  auto coverage = FindCoverage(area, preferred_source);
  if (coverage.empty() && preferred_source) {
    coverage = FindCoverage(area);
  }
  if (coverage.empty()) {
    return std::nullopt;
  }
  return std::move(coverage.front());
}

std::size_t CoverageIndex::Seed(const std::vector<SeedRecord>& records, const SeedOptions& options) {
  if (options.source.empty()) {
    throw util::ValidationError("seed source label is empty");
  }
  const std::size_t batch_size = options.batch_size == 0 ? 1000 : options.batch_size;

  if (options.clear_existing) {
    auto tx = repository_->Begin();
    db::ThrowIfError(repository_->DeleteCoverageBySource(*tx, options.source), "clear coverage for " + options.source);
    tx->Commit();
    LIDAR_LOG_INFO("Cleared existing coverage", {StringField("source", options.source)});
  }

  std::size_t committed = 0;
  std::size_t in_batch  = 0;
  std::size_t skipped   = 0;
  const auto  now_ms    = util::ToUnixMillis(util::Now());

  std::unique_ptr<db::Transaction> tx;
  try {
    for (const auto& record : records) {
      if (record.laz_url.empty()) {
        LIDAR_LOG_WARN("Skipping tile without download URL", {StringField("name", record.tile_name.value_or(""))});
        ++skipped;
        continue;
      }

      SourceTile tile;
      tile.tile_name = record.tile_name.value_or("tile_" + std::to_string(committed + in_batch));

      try {
        const auto footprint = geo::Area::FromWkt(record.footprint_wkt);
        tile.footprint_wkt   = footprint.Wkt();
        tile.envelope        = footprint.GetEnvelope();
      } catch (const util::ValidationError& e) {
        LIDAR_LOG_WARN("Skipping tile with invalid footprint", {StringField("tile", tile.tile_name), StringField("error", e.what())});
        ++skipped;
        continue;
      }

      tile.source        = options.source;
      tile.flight_year   = record.flight_year;
      tile.point_density = record.point_density;
      tile.laz_url       = record.laz_url;
      tile.metadata_json = record.metadata_json.empty() ? "{}" : record.metadata_json;
      tile.created_at_ms = now_ms;

      if (!tx) {
        tx = repository_->Begin();
      }

      if (repository_->GetCoverageTile(*tx, tile.tile_name)) {
        LIDAR_LOG_INFO("Tile already indexed, skipping", {StringField("tile", tile.tile_name)});
        ++skipped;
        continue;
      }
      db::ThrowIfError(repository_->InsertCoverageTile(*tx, tile), "insert tile " + tile.tile_name);

      if (++in_batch == batch_size) {
        tx->Commit();
        tx.reset();
        committed += in_batch;
        in_batch = 0;
        LIDAR_LOG_INFO("Imported tiles", {StringField("source", options.source), IntField("count", static_cast<std::int64_t>(committed))});
      }
    }

    if (tx) {
      tx->Commit();
      tx.reset();
      committed += in_batch;
      in_batch = 0;
    }
  } catch (const std::exception& e) {
    // the open batch rolls back with the transaction
    tx.reset();
    LIDAR_LOG_ERROR("Coverage seeding failed",
                    {StringField("source", options.source), IntField("committed", static_cast<std::int64_t>(committed)), StringField("error", e.what())});
    throw util::SeedError(std::string("seeding ") + options.source + " failed: " + e.what(), committed);
  }

  LIDAR_LOG_INFO("Finished importing tiles", {StringField("source", options.source), IntField("imported", static_cast<std::int64_t>(committed)),
                                              IntField("skipped", static_cast<std::int64_t>(skipped))});
  return committed;
}

std::vector<std::pair<std::string, std::uint64_t>> CoverageIndex::Summary() const {
  auto tx     = repository_->Begin();
  auto counts = repository_->CountCoverageBySource(*tx);
  tx->Commit();
  return counts;
}

} // namespace lidar::coverage
