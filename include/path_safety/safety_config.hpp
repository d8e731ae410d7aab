#ifndef PATH_SAFETY__SAFETY_CONFIG_HPP_
#define PATH_SAFETY__SAFETY_CONFIG_HPP_

#include <string>
#include <vector>

namespace path_safety {

// Inclusive [min_deg, max_deg] robot-frame range that is ignored (self reflections).
struct AngleRange {
  double min_deg;
  double max_deg;
};

struct SafetyConfig {
  // ----- polling (serial) transport -----
  std::string serial_port = "/dev/ttyUSB0";
  int serial_baudrate = 115200;
  int min_scan_len = 25;           // sweeps with fewer readings are dropped
  double max_distance_mm = 1500.0; // driver-level range cut

  // ----- subscribe-latest transport -----
  bool use_subscription = false;
  std::string scan_topic = "scan";

  // ----- robot / sensor geometry -----
  double half_width_robot = 0.20;       // [m] clearance radius
  double max_relevant_distance = 1.1;   // [m]
  double sensor_mounting_angle = 180.0; // [deg] sensor zero vs robot forward
  std::vector<AngleRange> angles_blanked;

  // robot can only advance, candidate set is {4}
  bool restricted_motion = false;

  // throws std::invalid_argument naming the first bad field
  void validate() const;
};

/**
 * Builds blanked ranges from a flattened [min0, max0, min1, max1, ...] list,
 * the shape ROS parameters can carry. Throws std::invalid_argument on odd length.
 */
std::vector<AngleRange> blankedRangesFromFlat(const std::vector<double> &flat);

}  // namespace path_safety

#endif  // PATH_SAFETY__SAFETY_CONFIG_HPP_
