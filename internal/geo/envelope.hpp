#pragma once

namespace lidar::geo {

// Axis-aligned bounding box in the coordinates of the geometry it came from.
struct Envelope {
  double min_x{0.0};
  double min_y{0.0};
  double max_x{0.0};
  double max_y{0.0};

  constexpr bool Intersects(const Envelope& other) const {
    return min_x <= other.max_x && other.min_x <= max_x && min_y <= other.max_y && other.min_y <= max_y;
  }

  constexpr double Width() const {
    return max_x - min_x;
  }

  constexpr double Height() const {
    return max_y - min_y;
  }
};

} // namespace lidar::geo
