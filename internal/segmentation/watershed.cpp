#include "internal/segmentation/watershed.hpp"

#include <array>
#include <cstdint>
#include <queue>

namespace lidar::segmentation {

namespace {

struct QueueEntry {
  double        value;
  std::uint64_t age;
  Eigen::Index  row;
  Eigen::Index  col;
};

// Highest value first, then oldest.
struct FloodOrder {
  bool operator()(const QueueEntry& a, const QueueEntry& b) const {
    if (a.value != b.value) {
      return a.value < b.value;
    }
    return a.age > b.age;
  }
};

} // namespace

LabelGrid MarkerWatershed(const raster::Grid& surface, const std::vector<Peak>& markers) {
  LabelGrid labels = LabelGrid::Zero(surface.rows(), surface.cols());

  std::priority_queue<QueueEntry, std::vector<QueueEntry>, FloodOrder> queue;
  std::uint64_t                                                      age = 0;

  for (std::size_t i = 0; i < markers.size(); ++i) {
    const auto& marker = markers[i];
    if (labels(marker.row, marker.col) != 0) {
      continue;
    }
    labels(marker.row, marker.col) = static_cast<int>(i + 1);
    queue.push(QueueEntry{surface(marker.row, marker.col), age++, marker.row, marker.col});
  }

  constexpr std::array<std::array<int, 2>, 4> kNeighbours{{{-1, 0}, {1, 0}, {0, -1}, {0, 1}}};

  while (!queue.empty()) {
    const auto current = queue.top();
    queue.pop();
    const int label = labels(current.row, current.col);

    for (const auto& [dr, dc] : kNeighbours) {
      const Eigen::Index r = current.row + dr;
      const Eigen::Index c = current.col + dc;
      if (r < 0 || c < 0 || r >= surface.rows() || c >= surface.cols()) {
        continue;
      }
      if (labels(r, c) != 0 || !(surface(r, c) > 0.0)) {
        continue;
      }
      labels(r, c) = label;
      queue.push(QueueEntry{surface(r, c), age++, r, c});
    }
  }
  return labels;
}

} // namespace lidar::segmentation
