#ifndef PATH_SAFETY__COORDINATE_TRANSFORMER_HPP_
#define PATH_SAFETY__COORDINATE_TRANSFORMER_HPP_

#include <optional>
#include <vector>

#include "path_safety/safety_config.hpp"
#include "path_safety/types.hpp"

namespace path_safety {

/**
 * Sensor frame (angle, distance) -> robot frame cartesian points.
 *
 * Per reading: drop if farther than max_relevant_distance, rotate by the
 * sensor mounting angle into [0, 360), shift into [-180, 180) and drop it if
 * it falls inside a blanked range (both ends inclusive).
 */
class CoordinateTransformer {
public:
  explicit CoordinateTransformer(const SafetyConfig &config);
  CoordinateTransformer(double max_relevant_distance, double sensor_mounting_angle,
                        std::vector<AngleRange> angles_blanked);

  std::vector<TransformedPoint> transform(const ScanBatch &batch) const;
  std::optional<TransformedPoint> transformReading(const RawReading &reading) const;

  bool isBlanked(double robot_angle_deg) const;

private:
  double max_relevant_distance_;
  double sensor_mounting_angle_;
  std::vector<AngleRange> angles_blanked_;
};

}  // namespace path_safety

#endif  // PATH_SAFETY__COORDINATE_TRANSFORMER_HPP_
