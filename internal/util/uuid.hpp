#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace lidar::util {

/*
  UUID helpers

  Job ids and download attempt ids are random RFC4122 v4 UUIDs in their
  canonical 36 character form.
*/

using UUID = std::array<std::uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);
UUID        FromString(const std::string& str);

inline std::string NewId() {
  return ToString(GenerateUUID());
}

} // namespace lidar::util
