#ifndef PATH_SAFETY__TYPES_HPP_
#define PATH_SAFETY__TYPES_HPP_

#include <cstddef>
#include <vector>

namespace path_safety {

constexpr int kNumCorridors = 10;
constexpr std::size_t kSamplesPerCorridor = 10;

// corridor ids by motion class
constexpr int kAdvanceCorridor = 4;
constexpr int kRetreatCorridor = 9;

// One (angle, distance) pair in the sensor frame.
struct RawReading {
  double angle_deg;   // [deg] sensor frame, 0..360
  double distance_m;  // [m]
};

using ScanBatch = std::vector<RawReading>;

// Scan point in the robot frame: +y points forwards, +x to the right.
struct TransformedPoint {
  double x;
  double y;
  double angle_deg;   // [deg] robot frame, -180..+180
  double distance_m;  // [m]
};

struct Point2D {
  double x;
  double y;
};

enum class MotionClass { kTurnLeft, kAdvance, kTurnRight, kRetreat };

}  // namespace path_safety

#endif  // PATH_SAFETY__TYPES_HPP_
