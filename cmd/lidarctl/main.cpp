#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/coverage/example_tiles.hpp"
#include "internal/coverage/feature_source.hpp"
#include "internal/factory.hpp"
#include "internal/geo/area.hpp"
#include "internal/model/job_status.hpp"
#include "internal/observability/logging.hpp"
#include "internal/pipeline/processing_options.hpp"
#include "internal/util/errors.hpp"

namespace {

void Usage() {
  std::cout << "Usage:\n"
            << "  lidarctl --config <path> seed --example [--source S] [--clear] [--verify]\n"
            << "  lidarctl --config <path> seed --file <dataset> [--source S] [--clear] [--verify]\n"
            << "  lidarctl --config <path> seed --wfs [url] [--source S] [--clear] [--verify]\n"
            << "  lidarctl --config <path> coverage <wkt> [source]\n"
            << "  lidarctl --config <path> best-tile <wkt> [preferred_source]\n"
            << "  lidarctl --config <path> summary\n"
            << "  lidarctl --config <path> cache-stats\n"
            << "  lidarctl --config <path> submit --tenant T --parcel P [--area wkt] [--source-url U] [--config-json J]\n"
            << "  lidarctl --config <path> status <job_id>\n"
            << "  lidarctl --config <path> cancel <job_id>\n"
            << "  lidarctl --config <path> run <job_id>\n";
}

// Splits "--flag value" pairs and bare "--switch" flags from positionals.
struct Args {
  std::vector<std::string>           positional;
  std::map<std::string, std::string> flags;

  bool Has(const std::string& name) const {
    return flags.count(name) > 0;
  }

  std::optional<std::string> Get(const std::string& name) const {
    auto it = flags.find(name);
    if (it == flags.end() || it->second.empty()) {
      return std::nullopt;
    }
    return it->second;
  }
};

bool IsSwitch(const std::string& name) {
  return name == "--example" || name == "--clear" || name == "--verify";
}

Args ParseArgs(int argc, char** argv, int first) {
  Args args;
  for (int i = first; i < argc; ++i) {
    std::string token = argv[i];
    if (token.rfind("--", 0) != 0) {
      args.positional.push_back(token);
      continue;
    }
    if (IsSwitch(token)) {
      args.flags[token] = "";
      continue;
    }
    // --wfs takes an optional url
    if (i + 1 < argc && std::string(argv[i + 1]).rfind("--", 0) != 0) {
      args.flags[token] = argv[++i];
    } else {
      args.flags[token] = "";
    }
  }
  return args;
}

std::string FormatOptional(const std::optional<std::int32_t>& value) {
  return value.has_value() ? std::to_string(*value) : "-";
}

std::string FormatOptional(const std::optional<double>& value) {
  return value.has_value() ? std::to_string(*value) : "-";
}

void PrintTile(const lidar::coverage::SourceTile& tile) {
  std::cout << tile.tile_name << " source=" << tile.source << " year=" << FormatOptional(tile.flight_year)
            << " density=" << FormatOptional(tile.point_density) << " url=" << tile.laz_url << "\n";
}

void PrintJob(const lidar::db::model::JobRecord& job) {
  std::cout << "id=" << job.id << "\n";
  std::cout << "status=" << lidar::model::ToString(job.status) << "\n";
  std::cout << "progress=" << job.progress << "\n";
  if (!job.status_message.empty()) std::cout << "message=" << job.status_message << "\n";
  if (!job.error_message.empty()) std::cout << "error=" << job.error_message << "\n";
  if (!job.tileset_url.empty()) std::cout << "tileset_url=" << job.tileset_url << "\n";
  if (job.point_count.has_value()) std::cout << "point_count=" << *job.point_count << "\n";
  if (job.tree_count.has_value()) std::cout << "tree_count=" << *job.tree_count << "\n";
}

void PrintSummary(const lidar::coverage::CoverageIndex& index) {
  for (const auto& [source, count] : index.Summary()) {
    std::cout << source << "=" << count << "\n";
  }
}

int RunSeed(lidar::factory::Runtime& runtime, const Args& args) {
  lidar::coverage::SeedOptions options;
  options.clear_existing = args.Has("--clear");

  std::vector<lidar::coverage::SeedRecord> records;
  if (args.Has("--example")) {
    options.source = lidar::coverage::kExampleSource;
    records        = lidar::coverage::ExampleTiles();
  } else if (auto file = args.Get("--file")) {
    records = lidar::coverage::ReadFeatureSource(*file);
  } else if (args.Has("--wfs")) {
    const auto url = args.Get("--wfs").value_or(lidar::coverage::kIdenaWfsUrl);
    options.source = lidar::coverage::kExampleSource;
    records        = lidar::coverage::ReadFeatureSource("WFS:" + url, lidar::coverage::IdenaWfsFields(), lidar::coverage::kIdenaWfsLayer);
  } else {
    std::cerr << "seed needs --example, --file or --wfs\n";
    return 1;
  }
  if (auto source = args.Get("--source")) {
    options.source = *source;
  }

  try {
    const auto inserted = runtime.coverage->Seed(records, options);
    std::cout << "inserted=" << inserted << " read=" << records.size() << "\n";
  } catch (const lidar::util::SeedError& e) {
    std::cerr << e.what() << " (committed=" << e.Committed() << ")\n";
    return 2;
  }

  if (args.Has("--verify")) {
    PrintSummary(*runtime.coverage);
  }
  return 0;
}

int Dispatch(lidar::factory::Runtime& runtime, const std::string& cmd, const Args& args) {
  const auto& pos = args.positional;

  // ------------------------------------------------------------

  if (cmd == "seed") {
    return RunSeed(runtime, args);
  }

  // ------------------------------------------------------------

  if (cmd == "coverage") {
    if (pos.empty()) return 1;

    auto                       area = lidar::geo::Area::FromWkt(pos[0]);
    std::optional<std::string> source;
    if (pos.size() >= 2) source = pos[1];

    const auto tiles = runtime.coverage->FindCoverage(area, source);
    for (const auto& tile : tiles) {
      PrintTile(tile);
    }
    std::cout << "tiles=" << tiles.size() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "best-tile") {
    if (pos.empty()) return 1;

    auto                       area = lidar::geo::Area::FromWkt(pos[0]);
    std::optional<std::string> preferred;
    if (pos.size() >= 2) preferred = pos[1];

    auto tile = runtime.coverage->BestTile(area, preferred);
    if (!tile.has_value()) {
      std::cerr << "no coverage for area\n";
      return 2;
    }
    PrintTile(*tile);
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "summary") {
    PrintSummary(*runtime.coverage);
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "cache-stats") {
    const auto stats = runtime.tile_cache->Stats();
    std::cout << "tiles=" << stats.tile_count << "\n";
    std::cout << "bytes=" << stats.total_bytes << "\n";
    std::cout << "accesses=" << stats.total_accesses << "\n";
    std::cout << "downloads_avoided=" << stats.downloads_avoided << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "submit") {
    auto tenant = args.Get("--tenant");
    auto parcel = args.Get("--parcel");
    if (!tenant || !parcel) {
      std::cerr << "submit needs --tenant and --parcel\n";
      return 1;
    }

    lidar::db::model::JobRecord job;
    job.tenant_id  = *tenant;
    job.parcel_id  = *parcel;
    job.area_wkt   = args.Get("--area");
    job.source_url = args.Get("--source-url");
    if (auto config_json = args.Get("--config-json")) {
      // reject bad processing config before it is queued
      lidar::pipeline::ParseProcessingConfig(*config_json);
      job.config_json = *config_json;
    }
    if (job.area_wkt.has_value()) {
      lidar::geo::Area::FromWkt(*job.area_wkt);
    }

    const auto stored = runtime.tracker->Submit(std::move(job));
    std::cout << "job=" << stored.id << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "status") {
    if (pos.empty()) return 1;

    PrintJob(runtime.tracker->Load(pos[0]));
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "cancel") {
    if (pos.empty()) return 1;

    if (!runtime.tracker->Cancel(pos[0], "cancelled by operator")) {
      std::cerr << "job already started or finished\n";
      return 2;
    }
    std::cout << "cancelled\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "run") {
    if (pos.empty()) return 1;

    if (!runtime.orchestrator->Run(pos[0])) {
      std::cerr << "job was not claimable\n";
      return 2;
    }
    PrintJob(runtime.tracker->Load(pos[0]));
    return 0;
  }

  Usage();
  return 1;
}

} // namespace

int main(int argc, char** argv) {
  if (argc < 4 || std::string(argv[1]) != "--config") {
    Usage();
    return 1;
  }

  const std::string config_path = argv[2];
  const std::string cmd         = argv[3];
  const auto        args        = ParseArgs(argc, argv, 4);

  try {
    auto config = lidar::config::ConfigLoader::LoadFromYaml(config_path);
    lidar::observability::InitializeLogging(config, lidar::observability::LogSink::kStderr);

    auto runtime = lidar::factory::Build(config);
    const int rc = Dispatch(runtime, cmd, args);

    lidar::observability::ShutdownLogging();
    return rc;
  } catch (const lidar::util::ValidationError& e) {
    std::cerr << "invalid input: " << e.what() << "\n";
    return 1;
  } catch (const lidar::util::NotFound& e) {
    std::cerr << "not found: " << e.what() << "\n";
    return 1;
  } catch (const std::exception& e) {
    std::cerr << e.what() << "\n";
    return 2;
  }
}
