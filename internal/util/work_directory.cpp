#include "work_directory.hpp"

#include <system_error>

#include "internal/observability/logging.hpp"

namespace lidar::util {

WorkDirectory::WorkDirectory(const std::filesystem::path& root, const std::string& job_id) : path_(root / job_id) {
  std::filesystem::create_directories(path_);
}

WorkDirectory::~WorkDirectory() {
  std::error_code ec;
  std::filesystem::remove_all(path_, ec);
  if (ec) {
    LIDAR_LOG_WARN("Failed to remove work directory", {observability::StringField("path", path_.string()), observability::StringField("error", ec.message())});
  }
}

} // namespace lidar::util
