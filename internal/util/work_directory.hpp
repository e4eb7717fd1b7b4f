#pragma once

#include <filesystem>
#include <string>

namespace lidar::util {

/*
  Per-job scratch directory <root>/<job_id>.

  Created on construction, removed recursively on destruction whatever the
  outcome of the job. Removal failures are logged, never thrown.
*/
class WorkDirectory {
 public:
  WorkDirectory(const std::filesystem::path& root, const std::string& job_id);
  ~WorkDirectory();

  WorkDirectory(const WorkDirectory&)            = delete;
  WorkDirectory& operator=(const WorkDirectory&) = delete;

  const std::filesystem::path& Path() const {
    return path_;
  }

 private:
  std::filesystem::path path_;
};

} // namespace lidar::util
