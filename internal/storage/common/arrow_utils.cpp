#include "arrow_utils.hpp"

#include <arrow/filesystem/localfs.h>

#include <filesystem>

namespace lidar::storage::common {

arrow::Result<std::pair<std::shared_ptr<arrow::fs::FileSystem>, std::string>> ResolveFileSystem(const std::string& uri_or_path) {
  std::string resolved_path;

  // Relative local paths are not accepted by FileSystemFromUriOrPath.
  if (uri_or_path.find("://") == std::string::npos) {
    std::error_code ec;
    auto            absolute = std::filesystem::absolute(uri_or_path, ec);
    if (ec) {
      return arrow::Status::Invalid("cannot resolve storage path ", uri_or_path, ": ", ec.message());
    }
    std::filesystem::create_directories(absolute, ec);
    if (ec) {
      return arrow::Status::IOError("cannot create storage root ", absolute.string(), ": ", ec.message());
    }
    return std::make_pair(std::static_pointer_cast<arrow::fs::FileSystem>(std::make_shared<arrow::fs::LocalFileSystem>()),
                          absolute.generic_string());
  }

  ARROW_ASSIGN_OR_RAISE(auto fs, arrow::fs::FileSystemFromUriOrPath(uri_or_path, &resolved_path));
  return std::make_pair(std::move(fs), resolved_path);
}

std::string ContentTypeFor(const std::string& key) {
  const auto extension = std::filesystem::path(key).extension().string();
  if (extension == ".json") {
    return "application/json";
  }
  if (extension == ".pnts" || extension == ".b3dm" || extension == ".laz" || extension == ".las") {
    return "application/octet-stream";
  }
  if (extension == ".tif" || extension == ".tiff") {
    return "image/tiff";
  }
  return "application/octet-stream";
}

} // namespace lidar::storage::common
