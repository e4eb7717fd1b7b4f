#pragma once

#include <vector>

#include "internal/coverage/coverage_index.hpp"

namespace lidar::coverage {

inline constexpr const char* kExampleSource = "IDENA";

// IDENA WFS publishing the full Navarra flight index.
inline constexpr const char* kIdenaWfsUrl   = "https://idena.navarra.es/ogc/wfs";
inline constexpr const char* kIdenaWfsLayer = "IDENA:LIDAR_Vuelo";

// Six 2023 PNOA tiles over Navarra with approximate WGS84 footprints.
std::vector<SeedRecord> ExampleTiles();

} // namespace lidar::coverage
