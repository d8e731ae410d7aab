#ifndef PATH_SAFETY__CORRIDOR_LIBRARY_HPP_
#define PATH_SAFETY__CORRIDOR_LIBRARY_HPP_

#include <array>

#include "path_safety/types.hpp"

namespace path_safety {

struct Corridor {
  int id;
  MotionClass motion;
  std::array<Point2D, kSamplesPerCorridor> samples;
};

/**
 * The ten motion primitives the robot can take:
 *   0..3  turn left (0 sharpest)
 *   4     advance
 *   5..8  turn right (8 sharpest)
 *   9     retreat
 * Each is a quadratic Bezier curve from the robot origin, sampled at
 * kSamplesPerCorridor evenly spaced parameters t in [0, 1].
 * Geometry is computed once in the constructor and never changes.
 */
class CorridorLibrary {
public:
  CorridorLibrary();

  const Corridor &corridor(int id) const;  // throws std::out_of_range
  const std::array<Corridor, kNumCorridors> &corridors() const { return corridors_; }

private:
  std::array<Corridor, kNumCorridors> corridors_;
};

MotionClass motionClassOf(int id);

// B(t) = (1-t)^2 p0 + 2 (1-t) t p1 + t^2 p2
Point2D evaluateQuadraticCurve(const Point2D &p0, const Point2D &p1, const Point2D &p2, double t);

}  // namespace path_safety

#endif  // PATH_SAFETY__CORRIDOR_LIBRARY_HPP_
