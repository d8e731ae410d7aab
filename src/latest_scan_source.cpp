#include "path_safety/latest_scan_source.hpp"

#include <cmath>
#include <utility>

namespace path_safety {

void LatestScanSource::onScan(sensor_msgs::msg::LaserScan::ConstSharedPtr msg) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (closed_) return;
  latest_ = std::move(msg);
}

std::optional<ScanBatch> LatestScanSource::next() {
  sensor_msgs::msg::LaserScan::ConstSharedPtr scan;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    scan = latest_;
  }
  if (!scan) return std::nullopt;
  return laserScanToReadings(*scan);
}

void LatestScanSource::close() {
  std::lock_guard<std::mutex> lock(mutex_);
  closed_ = true;
  latest_.reset();
}

bool LatestScanSource::hasReceived() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return static_cast<bool>(latest_);
}

ScanBatch laserScanToReadings(const sensor_msgs::msg::LaserScan &scan) {
  ScanBatch out;
  const size_t n = scan.ranges.size();
  if (n == 0 || scan.angle_increment == 0.0f) return out;

  out.reserve(n);
  for (size_t i = 0; i < n; ++i) {
    const float r = scan.ranges[i];
    // reading i carries the angle of beam n-1-i
    const double a = static_cast<double>(scan.angle_min) +
                     static_cast<double>(n - 1 - i) * scan.angle_increment;
    const double deg = 360.0 * (a + M_PI) / (2.0 * M_PI);
    out.push_back(RawReading{deg, static_cast<double>(r)});
  }
  return out;
}

}  // namespace path_safety
