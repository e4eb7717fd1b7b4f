#pragma once

#include "internal/db/api/repository.hpp"
#include "pg_pool.hpp"
#include "pg_tx.hpp"

namespace lidar::db::postgres {

/*
  PostgreSQL + PostGIS backend. Coverage queries use ST_Intersects against
  the footprint geometry, so callers receive exact matches.
*/
class PgRepository final : public db::Repository {
public:
  explicit PgRepository(std::shared_ptr<PgPool> pool);

  std::unique_ptr<Transaction> Begin() override;

  Result InsertCoverageTile(Transaction&, const model::CoverageTileRecord&) override;
  std::optional<model::CoverageTileRecord> GetCoverageTile(Transaction&, const std::string&) override;
  std::vector<model::CoverageTileRecord> FindCoverageCandidates(Transaction&, const model::CoverageQuery&) override;
  Result DeleteCoverageBySource(Transaction&, const std::string&) override;
  std::vector<std::pair<std::string, std::uint64_t>> CountCoverageBySource(Transaction&) override;

  std::optional<model::TileCacheRecord> GetCachedTile(Transaction&, const std::string&) override;
  Result BeginCachedTileDownload(Transaction&, const model::TileCacheRecord&) override;
  Result CompleteCachedTile(Transaction&, const model::TileCacheRecord&) override;
  Result FailCachedTileDownload(Transaction&, const std::string&, const std::string&, std::uint64_t) override;
  Result TouchCachedTile(Transaction&, const std::string&, std::uint64_t) override;
  model::TileCacheTotals SumCompleteCachedTiles(Transaction&) override;

  Result InsertJob(Transaction&, const model::JobRecord&) override;
  std::optional<model::JobRecord> GetJob(Transaction&, const std::string&) override;
  Result UpdateJob(Transaction&, const model::JobRecord&) override;
  Result TransitionJob(Transaction&, const model::JobRecord&, lidar::model::JobStatus) override;
  std::vector<model::JobRecord> ListJobsByStatus(Transaction&, lidar::model::JobStatus, std::size_t) override;

private:
  static PgTransaction& TX(Transaction& t);
  static Result Translate(const std::exception& e);

  std::shared_ptr<PgPool> pool_;
};

}
