#include "internal/pipeline/pipeline_orchestrator.hpp"

#include <algorithm>
#include <cctype>
#include <exception>
#include <optional>
#include <utility>
#include <vector>

#include "internal/geo/area.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/toolkit/pipelines.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/util/work_directory.hpp"

namespace lidar::pipeline {

using observability::IntField;
using observability::StringField;
using Deadline = std::chrono::steady_clock::time_point;

namespace {

// Span plus duration metric for one phase.
class PhaseScope {
 public:
  PhaseScope(std::string name, const std::string& job_id)
      : name_(std::move(name)), span_("pipeline." + name_), started_(std::chrono::steady_clock::now()) {
    span_.SetAttribute("job_id", job_id);
  }

  ~PhaseScope() {
    const auto elapsed = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_).count();
    observability::Metrics::Instance().ObservePhaseDurationMs(name_, elapsed);
  }

 private:
  std::string              name_;
  observability::SpanScope span_;
  Deadline                 started_;
};

void CheckDeadline(Deadline deadline, const char* phase) {
  if (std::chrono::steady_clock::now() >= deadline) {
    throw util::DeadlineExceeded(std::string("job deadline passed before ") + phase);
  }
}

bool IsBlank(const std::string& text) {
  return std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isspace(c) != 0; });
}

std::string UploadExtension(const std::string& locator) {
  const auto path      = locator.substr(0, locator.find_first_of("?#"));
  const auto extension = std::filesystem::path(path).extension().string();
  return extension.empty() ? ".laz" : extension;
}

} // namespace

PipelineOrchestrator::PipelineOrchestrator(PipelineServices services, PipelineSettings settings)
    : services_(std::move(services)), settings_(std::move(settings)) {
}

bool PipelineOrchestrator::Run(const std::string& job_id) {
  observability::SpanScope span("pipeline.job");
  span.SetAttribute("job_id", job_id);

  auto machine = services_.tracker->Claim(job_id);
  if (!machine) {
    return false;
  }

  LIDAR_LOG_INFO("Job started", {StringField("job_id", job_id), StringField("parcel_id", machine->Job().parcel_id)});
  const Deadline deadline = std::chrono::steady_clock::now() + settings_.job_deadline;

  try {
    const auto result = Execute(*machine, deadline);

    // applied to the machine only once stored
    JobStateMachine finished = *machine;
    finished.Complete(result, util::ToUnixMillis(util::Now()));
    services_.tracker->Persist(finished);
    *machine = std::move(finished);
  } catch (const std::exception& e) {
    span.RecordException(e.what());
    LIDAR_LOG_ERROR("Job failed", {StringField("job_id", job_id), StringField("error", e.what())});
    observability::Metrics::Instance().RecordJobOutcome(false);

    if (!lidar::model::IsTerminal(machine->Job().status)) {
      machine->Fail(e.what(), util::ToUnixMillis(util::Now()));
      try {
        services_.tracker->Persist(*machine);
      } catch (const std::exception& persist_error) {
        LIDAR_LOG_ERROR("Failed to record job failure", {StringField("job_id", job_id), StringField("error", persist_error.what())});
      }
    }
    throw;
  }

  observability::Metrics::Instance().RecordJobOutcome(true);
  LIDAR_LOG_INFO("Job completed", {StringField("job_id", job_id), StringField("tileset_url", machine->Job().tileset_url),
                                   IntField("points", machine->Job().point_count.value_or(0))});
  return true;
}

JobResult PipelineOrchestrator::Execute(JobStateMachine& machine, Deadline deadline) {
  const auto job     = machine.Job();
  const auto options = ResolveProcessingOptions(ParseProcessingConfig(job.config_json), settings_.defaults);

  std::optional<geo::Area> area;
  if (job.area_wkt) {
    if (IsBlank(*job.area_wkt)) {
      throw util::ValidationError("job area is blank");
    }
    area = geo::Area::FromWkt(*job.area_wkt);
  }

  util::WorkDirectory work(settings_.work_root, job.id);
  const auto&         dir = work.Path();

  // Ingest
  CheckDeadline(deadline, "ingest");
  machine.BeginIngest();
  services_.tracker->Persist(machine);

  std::filesystem::path cleaned = dir / "cleaned.laz";
  std::string           source_label;
  {
    PhaseScope phase("ingest", job.id);

    std::filesystem::path raw;
    if (job.source_url) {
      raw = dir / ("upload" + UploadExtension(*job.source_url));
      services_.fetcher->Fetch(*job.source_url, raw);
      source_label = "user_upload";
    } else {
      if (!area) {
        throw util::ValidationError("job has neither an area nor a source file");
      }
      const auto preferred = options.preferred_source.empty() ? std::nullopt : std::optional<std::string>(options.preferred_source);
      const auto tile      = services_.coverage->BestTile(*area, preferred);
      if (!tile) {
        throw util::NoCoverage("no LiDAR coverage for the requested area");
      }
      LIDAR_LOG_INFO("Selected source tile", {StringField("job_id", job.id), StringField("tile", tile->tile_name),
                                              StringField("source", tile->source)});
      raw          = services_.tile_cache->ResolveLocalFile(tile->laz_url, dir);
      source_label = tile->source;
    }

    std::optional<toolkit::CropArea> crop;
    if (area) {
      crop = toolkit::CropArea{area->Wkt(), settings_.area_srs};
    }
    services_.toolkit->Execute(toolkit::CleanPointCloud(raw, cleaned, crop));
  }

  // Spectral fusion
  CheckDeadline(deadline, "spectral fusion");
  machine.BeginSpectralFusion();
  services_.tracker->Persist(machine);

  std::filesystem::path current = cleaned;
  if (options.color_mode == ColorMode::kNdvi && !options.ndvi_source_url.empty()) {
    PhaseScope phase("spectral_fusion", job.id);
    const auto ndvi    = dir / ("ndvi" + UploadExtension(options.ndvi_source_url));
    const auto colored = dir / "colored.laz";
    services_.fetcher->Fetch(options.ndvi_source_url, ndvi);
    services_.toolkit->Execute(toolkit::ColorizeWithNdvi(cleaned, ndvi, colored));
    current = colored;
  }

  // Tree segmentation
  std::vector<segmentation::DetectedTree> trees;
  if (options.detect_trees) {
    CheckDeadline(deadline, "tree segmentation");
    machine.BeginSegmentation();
    services_.tracker->Persist(machine);

    PhaseScope phase("segmentation", job.id);
    trees = services_.segmenter->Run(current, dir, options.segmentation);
    observability::Metrics::Instance().RecordTreesDetected(trees.size());
  }

  // Tiling
  CheckDeadline(deadline, "tiling");
  machine.BeginTiling();
  services_.tracker->Persist(machine);

  const auto tiles_dir = dir / "tiles";
  {
    PhaseScope phase("tiling", job.id);
    std::filesystem::create_directories(tiles_dir);
    services_.tiling->Convert(current, tiles_dir, deadline);
  }

  // Publish
  CheckDeadline(deadline, "publish");
  machine.BeginPublish();
  services_.tracker->Persist(machine);

  JobResult result;
  {
    PhaseScope phase("publish", job.id);
    const auto prefix  = storage::JoinKey(settings_.tileset_prefix, job.id);
    const auto files   = storage::UploadDirectory(*services_.store, tiles_dir, prefix);
    result.tileset_url = services_.store->PublicUrl(storage::JoinKey(prefix, "tileset.json"));
    result.point_count = static_cast<std::int64_t>(services_.toolkit->Inspect(current).point_count);
    result.tree_count  = static_cast<std::int64_t>(trees.size());
    LIDAR_LOG_INFO("Tile set uploaded", {StringField("job_id", job.id), IntField("files", static_cast<std::int64_t>(files)),
                                         StringField("tileset_url", result.tileset_url)});

    machine.ReportProgress(95, "Creating digital twin entities");
    services_.tracker->Persist(machine);

    publish::LayerPublication publication;
    publication.job_id      = job.id;
    publication.tenant_id   = job.tenant_id;
    publication.parcel_id   = job.parcel_id;
    publication.tileset_url = result.tileset_url;
    publication.source      = source_label;
    publication.point_count = result.point_count;
    publication.trees       = std::move(trees);
    try {
      services_.publisher->Publish(publication);
    } catch (const std::exception& e) {
      LIDAR_LOG_WARN("Entity graph publishing failed", {StringField("job_id", job.id), StringField("error", e.what())});
    }
  }
  return result;
}

} // namespace lidar::pipeline
