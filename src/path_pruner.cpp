#include "path_safety/path_pruner.hpp"

#include <algorithm>
#include <cmath>

#include <rclcpp/rclcpp.hpp>

namespace path_safety {

std::vector<int> startingCandidates(bool restricted_motion) {
  if (restricted_motion) return {kAdvanceCorridor};
  std::vector<int> ids(kNumCorridors);
  for (int i = 0; i < kNumCorridors; ++i) ids[i] = i;
  return ids;
}

void sortByAngle(std::vector<TransformedPoint> &points) {
  std::stable_sort(points.begin(), points.end(),
                   [](const TransformedPoint &a, const TransformedPoint &b) {
                     return a.angle_deg < b.angle_deg;
                   });
}

PathPruner::PathPruner(const CorridorLibrary &library, double half_width_robot)
  : library_(library), half_width_robot_(half_width_robot) {}

bool PathPruner::blocks(const TransformedPoint &point, const Corridor &corridor) const {
  for (const auto &s : corridor.samples) {
    const double dx = point.x - s.x;
    const double dy = point.y - s.y;
    if (std::sqrt(dx * dx + dy * dy) < half_width_robot_) return true;
  }
  return false;
}

std::vector<int> PathPruner::prune(const std::vector<TransformedPoint> &points,
                                   std::vector<int> candidates) const {
  // ids outside the library can never be valid
  candidates.erase(std::remove_if(candidates.begin(), candidates.end(),
                                  [](int id) { return id < 0 || id >= kNumCorridors; }),
                   candidates.end());

  std::vector<TransformedPoint> sorted = points;
  sortByAngle(sorted);

  for (const auto &p : sorted) {
    if (candidates.empty()) break;
    auto it = candidates.begin();
    while (it != candidates.end()) {
      if (blocks(p, library_.corridor(*it))) {
        RCLCPP_DEBUG(rclcpp::get_logger("path_safety.pruner"),
                     "removing path %d (point x=%.3f y=%.3f)", *it, p.x, p.y);
        it = candidates.erase(it);
      } else {
        ++it;
      }
    }
  }
  return candidates;
}

}  // namespace path_safety
