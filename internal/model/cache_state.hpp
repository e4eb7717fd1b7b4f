#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace lidar::model {

// Only kComplete entries are ever served from the cache.
enum class CacheState : std::uint8_t {
  kDownloading = 0,
  kComplete    = 1,
  kFailed      = 2,
};

constexpr std::string_view ToString(CacheState state) {
  switch (state) {
    case CacheState::kDownloading:
      return "downloading";
    case CacheState::kComplete:
      return "complete";
    case CacheState::kFailed:
      return "failed";
  }
  return "unknown";
}

constexpr std::optional<CacheState> ParseCacheState(std::string_view text) {
  if (text == "downloading") return CacheState::kDownloading;
  if (text == "complete") return CacheState::kComplete;
  if (text == "failed") return CacheState::kFailed;
  return std::nullopt;
}

} // namespace lidar::model
