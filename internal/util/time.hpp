#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace lidar::util {

/*
  Time utilities. All wall-clock reads go through Now().
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

std::uint64_t ToUnixMillis(TimePoint tp);
TimePoint     FromUnixMillis(std::uint64_t millis);

// UTC, e.g. 2024-05-01T10:15:00Z
std::string FormatIso8601(TimePoint tp);

} // namespace lidar::util
