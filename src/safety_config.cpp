#include "path_safety/safety_config.hpp"

#include <stdexcept>
#include <string>

namespace path_safety {

void SafetyConfig::validate() const {
  if (!(half_width_robot > 0.0)) {
    throw std::invalid_argument("half_width_robot must be > 0, got " +
                                std::to_string(half_width_robot));
  }
  if (!(max_relevant_distance > 0.0)) {
    throw std::invalid_argument("max_relevant_distance must be > 0, got " +
                                std::to_string(max_relevant_distance));
  }
  if (min_scan_len < 0) {
    throw std::invalid_argument("min_scan_len must be >= 0");
  }
  if (serial_baudrate <= 0) {
    throw std::invalid_argument("serial_baudrate must be > 0");
  }
  if (use_subscription && scan_topic.empty()) {
    throw std::invalid_argument("scan_topic is empty");
  }
  for (const auto &r : angles_blanked) {
    if (r.min_deg > r.max_deg) {
      throw std::invalid_argument("angles_blanked range [" + std::to_string(r.min_deg) +
                                  ", " + std::to_string(r.max_deg) + "] has min > max");
    }
  }
}

std::vector<AngleRange> blankedRangesFromFlat(const std::vector<double> &flat) {
  if (flat.size() % 2 != 0) {
    throw std::invalid_argument("angles_blanked needs [min, max] pairs, got " +
                                std::to_string(flat.size()) + " values");
  }
  std::vector<AngleRange> out;
  out.reserve(flat.size() / 2);
  for (size_t i = 0; i + 1 < flat.size(); i += 2) {
    out.push_back(AngleRange{flat[i], flat[i + 1]});
  }
  return out;
}

}  // namespace path_safety
