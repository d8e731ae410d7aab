#ifndef PATH_SAFETY__PATH_PRUNER_HPP_
#define PATH_SAFETY__PATH_PRUNER_HPP_

#include <vector>

#include "path_safety/corridor_library.hpp"
#include "path_safety/types.hpp"

namespace path_safety {

// Corridor ids to start a pruning pass with: {0..9}, or {4} for restricted motion.
std::vector<int> startingCandidates(bool restricted_motion);

// Stable sort by robot-frame angle.
void sortByAngle(std::vector<TransformedPoint> &points);

/// ======================
/// Corridor pruning
/// ======================
// A corridor is removed as soon as one of its samples is closer than
// half_width_robot (strict) to a scan point. The candidate set only shrinks.
class PathPruner {
public:
  PathPruner(const CorridorLibrary &library, double half_width_robot);

  std::vector<int> prune(const std::vector<TransformedPoint> &points,
                         std::vector<int> candidates) const;

  bool blocks(const TransformedPoint &point, const Corridor &corridor) const;

private:
  const CorridorLibrary &library_;
  double half_width_robot_;
};

}  // namespace path_safety

#endif  // PATH_SAFETY__PATH_PRUNER_HPP_
