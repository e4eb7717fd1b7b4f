#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/db/model/coverage_tile_record.hpp"
#include "internal/geo/area.hpp"

namespace lidar::coverage {

using SourceTile = db::model::CoverageTileRecord;

// One tile to import. Fields left empty fall back to SeedOptions / defaults.
struct SeedRecord {
  std::optional<std::string>  tile_name;
  std::optional<std::int32_t> flight_year;
  std::optional<double>       point_density;
  std::string                 laz_url;
  std::string                 footprint_wkt;
  std::string                 metadata_json{"{}"};
};

struct SeedOptions {
  std::string source{"PNOA"};
  bool        clear_existing{false};
  std::size_t batch_size{1000};
};

/*
  Spatial catalog of downloadable source tiles.

  Queries prefilter through the repository and then apply the exact OGR
  intersection test. Results are ordered newest flight first, then highest
  density, tiles without year/density last, ties by tile name.
*/
class CoverageIndex {
 public:
  explicit CoverageIndex(std::shared_ptr<db::Repository> repository);

  std::vector<SourceTile> FindCoverage(const geo::Area& area, const std::optional<std::string>& source = std::nullopt) const;

  bool HasCoverage(const geo::Area& area) const;

  // Best tile from preferred_source, falling back to any source when the
  // preferred one has nothing.
  std::optional<SourceTile> BestTile(const geo::Area& area, const std::optional<std::string>& preferred_source = std::nullopt) const;

  // Imports records in batches of options.batch_size, each in its own
  // transaction. Records without a locator, with an invalid footprint or
  // with a name already in the index are skipped and logged.
  // Returns the number of tiles inserted; throws util::SeedError carrying
  // the committed count when a batch fails.
  //
  // Two concurrent seeds for the same source must not run without
  // clear_existing having completed first.
  std::size_t Seed(const std::vector<SeedRecord>& records, const SeedOptions& options);

  // (source, tile count) sorted by source
  std::vector<std::pair<std::string, std::uint64_t>> Summary() const;

 private:
  std::shared_ptr<db::Repository> repository_;
};

// Newest year, then highest density; absent values last; then tile name.
bool CoverageOrder(const SourceTile& a, const SourceTile& b);

} // namespace lidar::coverage
