#include "internal/coverage/example_tiles.hpp"

#include <string>

namespace lidar::coverage {
namespace {

SeedRecord NavarraTile(const std::string& grid, const char* footprint) {
  SeedRecord record;
  record.tile_name     = "PNOA_2023_NAV_" + grid;
  record.flight_year   = 2023;
  record.point_density = 4.0;
  record.laz_url       = "https://idena.navarra.es/descargas/lidar/LAZ/PNOA_2023_NAV_" + grid + ".laz";
  record.footprint_wkt = footprint;
  record.metadata_json = R"({"seeded":true,"origin":"example"})";
  return record;
}

} // namespace

std::vector<SeedRecord> ExampleTiles() {
  return {
      NavarraTile("569-4737", "POLYGON((-1.75 42.80, -1.70 42.80, -1.70 42.75, -1.75 42.75, -1.75 42.80))"),
      NavarraTile("570-4737", "POLYGON((-1.70 42.80, -1.65 42.80, -1.65 42.75, -1.70 42.75, -1.70 42.80))"),
      NavarraTile("571-4737", "POLYGON((-1.65 42.80, -1.60 42.80, -1.60 42.75, -1.65 42.75, -1.65 42.80))"),
      NavarraTile("569-4736", "POLYGON((-1.75 42.75, -1.70 42.75, -1.70 42.70, -1.75 42.70, -1.75 42.75))"),
      NavarraTile("570-4736", "POLYGON((-1.70 42.75, -1.65 42.75, -1.65 42.70, -1.70 42.70, -1.70 42.75))"),
      // Pamplona
      NavarraTile("612-4722", "POLYGON((-1.68 42.83, -1.63 42.83, -1.63 42.78, -1.68 42.78, -1.68 42.83))"),
  };
}

} // namespace lidar::coverage
