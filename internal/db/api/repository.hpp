#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/coverage_tile_record.hpp"
#include "internal/db/model/job_record.hpp"
#include "internal/db/model/tile_cache_record.hpp"

namespace lidar::db {

/*
  Repository abstraction.

  GUARANTEES:

  - All reads and writes require a Transaction
  - Reads inside a transaction see its writes
  - TransitionJob is a compare-and-set on the job status; it is how a
    worker claims a job

  The DB is the source of truth for:
    coverage index
    tile cache entries
    processing jobs
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Coverage index
  // ---------------------------------------------------------------------

  // AlreadyExists when tile_name is taken.
  virtual Result InsertCoverageTile(Transaction&, const model::CoverageTileRecord&) = 0;

  virtual std::optional<model::CoverageTileRecord> GetCoverageTile(Transaction&, const std::string& tile_name) = 0;

  // Candidates whose footprint may intersect the query; callers re-check
  // exact intersection. Order is unspecified.
  virtual std::vector<model::CoverageTileRecord> FindCoverageCandidates(Transaction&, const model::CoverageQuery&) = 0;

  virtual Result DeleteCoverageBySource(Transaction&, const std::string& source) = 0;

  // (source, tile count), sorted by source
  virtual std::vector<std::pair<std::string, std::uint64_t>> CountCoverageBySource(Transaction&) = 0;

  // ---------------------------------------------------------------------
  // Tile cache
  // ---------------------------------------------------------------------

  virtual std::optional<model::TileCacheRecord> GetCachedTile(Transaction&, const std::string& tile_name) = 0;

  // Insert or reset the entry to downloading under record.attempt_id.
  // Preserves access_count of an existing entry.
  virtual Result BeginCachedTileDownload(Transaction&, const model::TileCacheRecord&) = 0;

  // Marks the entry complete and counts one access. Last writer wins.
  virtual Result CompleteCachedTile(Transaction&, const model::TileCacheRecord&) = 0;

  // Marks the entry failed if attempt_id still owns a downloading entry;
  // Conflict otherwise.
  virtual Result FailCachedTileDownload(Transaction&, const std::string& tile_name, const std::string& attempt_id, std::uint64_t at_ms) = 0;

  // Counts one access of a complete entry.
  virtual Result TouchCachedTile(Transaction&, const std::string& tile_name, std::uint64_t at_ms) = 0;

  virtual model::TileCacheTotals SumCompleteCachedTiles(Transaction&) = 0;

  // ---------------------------------------------------------------------
  // Processing jobs
  // ---------------------------------------------------------------------

  virtual Result InsertJob(Transaction&, const model::JobRecord&) = 0;

  virtual std::optional<model::JobRecord> GetJob(Transaction&, const std::string& id) = 0;

  virtual Result UpdateJob(Transaction&, const model::JobRecord&) = 0;

  // Writes the record only if the stored status still equals expected;
  // Conflict otherwise.
  virtual Result TransitionJob(Transaction&, const model::JobRecord&, lidar::model::JobStatus expected) = 0;

  // Oldest first.
  virtual std::vector<model::JobRecord> ListJobsByStatus(Transaction&, lidar::model::JobStatus, std::size_t limit) = 0;
};

} // namespace lidar::db
