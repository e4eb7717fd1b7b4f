#include "internal/fetch/origin_fetcher.hpp"

#include <cpr/cpr.h>

#include <fstream>
#include <system_error>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace lidar::fetch {

using observability::IntField;
using observability::StringField;

namespace {

constexpr const char* kUserAgent = "lidar-processor/0.1";

void RemovePartial(const std::filesystem::path& destination) {
  std::error_code ec;
  std::filesystem::remove(destination, ec);
}

std::filesystem::path LocalPath(const std::string& locator) {
  constexpr std::string_view kFileScheme = "file://";
  if (locator.compare(0, kFileScheme.size(), kFileScheme) == 0) {
    return locator.substr(kFileScheme.size());
  }
  return locator;
}

} // namespace

bool IsRemoteLocator(const std::string& locator) {
  return locator.rfind("http://", 0) == 0 || locator.rfind("https://", 0) == 0;
}

CprOriginFetcher::CprOriginFetcher(std::chrono::seconds timeout) : timeout_(timeout) {
}

std::uint64_t CprOriginFetcher::Fetch(const std::string& locator, const std::filesystem::path& destination) {
  if (!IsRemoteLocator(locator)) {
    const auto      source = LocalPath(locator);
    std::error_code ec;
    std::filesystem::copy_file(source, destination, std::filesystem::copy_options::overwrite_existing, ec);
    if (ec) {
      RemovePartial(destination);
      throw util::TransientIoError("cannot copy " + source.string() + ": " + ec.message());
    }
    return std::filesystem::file_size(destination);
  }

  LIDAR_LOG_INFO("Downloading from origin", {StringField("url", locator), StringField("destination", destination.string())});

  cpr::Response response;
  {
    std::ofstream out(destination, std::ios::binary | std::ios::trunc);
    if (!out) {
      throw util::TransientIoError("cannot open " + destination.string() + " for writing");
    }
    response = cpr::Download(out, cpr::Url{locator}, cpr::Header{{"User-Agent", kUserAgent}},
                             cpr::Timeout{std::chrono::duration_cast<std::chrono::milliseconds>(timeout_)});
    out.close();
    if (!out) {
      RemovePartial(destination);
      throw util::TransientIoError("write error on " + destination.string());
    }
  }

  if (response.error) {
    RemovePartial(destination);
    throw util::TransientIoError("download of " + locator + " failed: " + response.error.message);
  }
  if (response.status_code < 200 || response.status_code >= 300) {
    RemovePartial(destination);
    throw util::TransientIoError("download of " + locator + " returned HTTP " + std::to_string(response.status_code));
  }

  const auto bytes = std::filesystem::file_size(destination);
  LIDAR_LOG_INFO("Download complete", {StringField("url", locator), IntField("bytes", static_cast<std::int64_t>(bytes))});
  return bytes;
}

} // namespace lidar::fetch
