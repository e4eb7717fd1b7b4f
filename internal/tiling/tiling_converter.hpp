#pragma once

#include <chrono>
#include <filesystem>
#include <memory>
#include <string>

namespace lidar::tiling {

using Deadline = std::chrono::steady_clock::time_point;

/*
  Converts a point file into a streamable 3D tile set rooted at
  <out_dir>/tileset.json.

  Throws util::DeadlineExceeded when the deadline passes first and
  util::ToolFailure when the converter fails or leaves no tileset.json.
*/
class TilingConverter {
 public:
  virtual ~TilingConverter() = default;

  // Returns the path of tileset.json.
  virtual std::filesystem::path Convert(const std::filesystem::path& point_file, const std::filesystem::path& out_dir, Deadline deadline) = 0;
};

using TilingConverterPtr = std::shared_ptr<TilingConverter>;

// Runs `<command> convert <file> --out <dir> --overwrite`.
class Py3dtilesConverter final : public TilingConverter {
 public:
  explicit Py3dtilesConverter(std::string command = "py3dtiles");

  std::filesystem::path Convert(const std::filesystem::path& point_file, const std::filesystem::path& out_dir, Deadline deadline) override;

 private:
  std::string command_;
};

// Throws util::ToolFailure unless out_dir/tileset.json exists.
std::filesystem::path RequireManifest(const std::filesystem::path& out_dir);

} // namespace lidar::tiling
