#include "internal/toolkit/pdal_toolkit.hpp"

#include <pdal/Options.hpp>
#include <pdal/PipelineManager.hpp>
#include <pdal/QuickInfo.hpp>
#include <pdal/StageFactory.hpp>
#include <pdal/pdal_types.hpp>

#include <chrono>
#include <mutex>
#include <sstream>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace lidar::toolkit {

using observability::DoubleField;
using observability::IntField;
using observability::StringField;

namespace {

// Stage creation and pipeline parsing share global driver state.
std::mutex& PdalMutex() {
  static std::mutex mutex;
  return mutex;
}

} // namespace

void PdalToolkit::Execute(const PipelineSpec& spec) {
  const auto started = std::chrono::steady_clock::now();
  try {
    pdal::PipelineManager manager;
    {
      std::istringstream             json(spec.ToJson());
      std::lock_guard<std::mutex>    lock(PdalMutex());
      manager.readPipeline(json);
      manager.validateStageOptions();
    }
    const auto points = manager.execute();

    const auto elapsed = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started).count();
    LIDAR_LOG_INFO("Point-cloud pipeline finished",
                   {StringField("stages", spec.Describe()), IntField("points", static_cast<std::int64_t>(points)), DoubleField("elapsed_ms", elapsed)});
  } catch (const pdal::pdal_error& e) {
    throw util::ToolFailure(spec.Describe() + ": " + e.what());
  }
}

PointCloudInfo PdalToolkit::Inspect(const std::filesystem::path& point_file) {
  try {
    pdal::StageFactory factory;
    pdal::Stage*       reader = nullptr;
    {
      std::lock_guard<std::mutex> lock(PdalMutex());
      reader = factory.createStage("readers.las");
    }
    if (reader == nullptr) {
      throw util::ToolFailure("readers.las is not available");
    }

    pdal::Options options;
    options.add("filename", point_file.string());
    reader->setOptions(options);

    const pdal::QuickInfo quick = reader->preview();
    if (!quick.valid()) {
      throw util::ToolFailure("cannot read header of " + point_file.string());
    }

    PointCloudInfo info;
    info.point_count   = quick.m_pointCount;
    info.bounds.min_x  = quick.m_bounds.minx;
    info.bounds.min_y  = quick.m_bounds.miny;
    info.bounds.max_x  = quick.m_bounds.maxx;
    info.bounds.max_y  = quick.m_bounds.maxy;
    info.min_z         = quick.m_bounds.minz;
    info.max_z         = quick.m_bounds.maxz;
    return info;
  } catch (const pdal::pdal_error& e) {
    throw util::ToolFailure("inspect " + point_file.string() + ": " + e.what());
  }
}

} // namespace lidar::toolkit
