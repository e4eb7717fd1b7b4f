#include "time.hpp"

#include <ctime>

namespace lidar::util {

TimePoint Now() {
  return Clock::now();
}

std::uint64_t ToUnixMillis(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

TimePoint FromUnixMillis(std::uint64_t millis) {
  return TimePoint{} + std::chrono::milliseconds(millis);
}

std::string FormatIso8601(TimePoint tp) {
  const std::time_t seconds = Clock::to_time_t(tp);
  std::tm           utc{};
  gmtime_r(&seconds, &utc);

  char buffer[32];
  std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%SZ", &utc);
  return buffer;
}

} // namespace lidar::util
