#include "path_safety/coordinate_transformer.hpp"

#include <cmath>
#include <utility>

namespace path_safety {

CoordinateTransformer::CoordinateTransformer(const SafetyConfig &config)
  : CoordinateTransformer(config.max_relevant_distance, config.sensor_mounting_angle,
                          config.angles_blanked) {}

CoordinateTransformer::CoordinateTransformer(double max_relevant_distance,
                                             double sensor_mounting_angle,
                                             std::vector<AngleRange> angles_blanked)
  : max_relevant_distance_(max_relevant_distance),
    sensor_mounting_angle_(sensor_mounting_angle),
    angles_blanked_(std::move(angles_blanked)) {}

std::vector<TransformedPoint> CoordinateTransformer::transform(const ScanBatch &batch) const {
  std::vector<TransformedPoint> out;
  out.reserve(batch.size());
  for (const auto &r : batch) {
    if (auto p = transformReading(r)) out.push_back(*p);
  }
  return out;
}

std::optional<TransformedPoint> CoordinateTransformer::transformReading(const RawReading &reading) const {
  const double d = reading.distance_m;
  if (!std::isfinite(d) || !std::isfinite(reading.angle_deg)) return std::nullopt;

  // far objects do not matter
  if (d > max_relevant_distance_) return std::nullopt;

  // sensor zero -> robot zero, wrapped into [0, 360)
  double angle = std::fmod(reading.angle_deg + sensor_mounting_angle_, 360.0);
  if (angle < 0.0) angle += 360.0;

  // [0, 360) -> [-180, 180)
  angle -= 180.0;

  if (isBlanked(angle)) return std::nullopt;

  const double a_rad = (angle + 180.0) * M_PI / 180.0;
  const double v1 = d * std::cos(a_rad);
  const double v2 = d * std::sin(a_rad);

  TransformedPoint p;
  p.x = -v2;
  p.y = -v1;
  p.angle_deg = angle;
  p.distance_m = d;
  return p;
}

bool CoordinateTransformer::isBlanked(double robot_angle_deg) const {
  for (const auto &b : angles_blanked_) {
    if (robot_angle_deg >= b.min_deg && robot_angle_deg <= b.max_deg) return true;
  }
  return false;
}

}  // namespace path_safety
