#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>

namespace lidar::fetch {

/*
  Retrieves a locator from its origin into a local file.

  Failures throw util::TransientIoError; a partially written destination is
  removed first.
*/
class OriginFetcher {
 public:
  virtual ~OriginFetcher() = default;

  // Returns the number of bytes written to destination.
  virtual std::uint64_t Fetch(const std::string& locator, const std::filesystem::path& destination) = 0;
};

using OriginFetcherPtr = std::shared_ptr<OriginFetcher>;

/*
  http(s) locators are streamed with cpr; file:// locators and plain paths
  are copied.
*/
class CprOriginFetcher final : public OriginFetcher {
 public:
  explicit CprOriginFetcher(std::chrono::seconds timeout);

  std::uint64_t Fetch(const std::string& locator, const std::filesystem::path& destination) override;

 private:
  std::chrono::seconds timeout_;
};

bool IsRemoteLocator(const std::string& locator);

} // namespace lidar::fetch
