#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace lidar::db::sqlite {

class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

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
  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);

  std::shared_ptr<SqliteDB> db_;
};

}
