#pragma once

#include <map>
#include <mutex>
#include <string>
#include <unordered_map>

#include "internal/db/api/repository.hpp"

namespace lidar::db::memory {

class MemoryTransaction;

class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

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
  friend class MemoryTransaction;

  struct State {
    std::map<std::string, model::CoverageTileRecord> coverage;
    std::unordered_map<std::string, model::TileCacheRecord> tile_cache;
    std::unordered_map<std::string, model::JobRecord> jobs;
  };

  std::mutex mutex_;
  State committed_;
};

}
