#include "internal/tiling/tiling_converter.hpp"

#include <system_error>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/process.hpp"

namespace lidar::tiling {

using observability::IntField;
using observability::StringField;

namespace {

// Last part of the converter output carried in the error.
constexpr std::size_t kOutputTail = 2000;

std::string Tail(const std::string& output) {
  return output.size() <= kOutputTail ? output : output.substr(output.size() - kOutputTail);
}

} // namespace

std::filesystem::path RequireManifest(const std::filesystem::path& out_dir) {
  auto manifest = out_dir / "tileset.json";
  if (!std::filesystem::is_regular_file(manifest)) {
    throw util::ToolFailure("tiling produced no tileset.json in " + out_dir.string());
  }
  return manifest;
}

Py3dtilesConverter::Py3dtilesConverter(std::string command) : command_(std::move(command)) {
}

std::filesystem::path Py3dtilesConverter::Convert(const std::filesystem::path& point_file, const std::filesystem::path& out_dir,
                                                  Deadline deadline) {
  const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
  if (remaining.count() <= 0) {
    throw util::DeadlineExceeded("no time left for tiling");
  }

  LIDAR_LOG_INFO("Starting tiling", {StringField("input", point_file.string()), StringField("out", out_dir.string()),
                                     IntField("budget_ms", remaining.count())});

  util::ProcessResult result;
  try {
    result = util::RunProcess({command_, "convert", point_file.string(), "--out", out_dir.string(), "--overwrite"}, remaining);
  } catch (const std::system_error& e) {
    throw util::ToolFailure("cannot start " + command_ + ": " + e.what());
  }

  if (result.timed_out) {
    throw util::DeadlineExceeded("tiling exceeded the job deadline");
  }
  if (result.exit_code != 0) {
    throw util::ToolFailure(command_ + " exited with " + std::to_string(result.exit_code) + ": " + Tail(result.output));
  }
  return RequireManifest(out_dir);
}

} // namespace lidar::tiling
