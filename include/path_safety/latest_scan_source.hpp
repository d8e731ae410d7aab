#ifndef PATH_SAFETY__LATEST_SCAN_SOURCE_HPP_
#define PATH_SAFETY__LATEST_SCAN_SOURCE_HPP_

#include <mutex>
#include <optional>
#include <string>

#include <sensor_msgs/msg/laser_scan.hpp>

#include "path_safety/scan_source.hpp"

namespace path_safety {

/// ======================
/// Subscribe-latest transport
/// ======================
// onScan() is called from the subscription callback and overwrites a single
// slot. next() peeks at whatever is in the slot without blocking or queueing.
class LatestScanSource : public ScanSource {
public:
  void onScan(sensor_msgs::msg::LaserScan::ConstSharedPtr msg);

  std::optional<ScanBatch> next() override;
  void close() override;
  std::string name() const override { return "subscription"; }

  bool hasReceived() const;

private:
  mutable std::mutex mutex_;
  sensor_msgs::msg::LaserScan::ConstSharedPtr latest_;
  bool closed_ = false;
};

// LaserScan (radians, meters) -> RawReading (degrees, meters).
// Angles are mapped with deg = 360 (a + pi) / (2 pi) and paired with the
// ranges in reverse order, the sweep runs opposite to the serial sensor.
// Every beam becomes a reading, inf / NaN (no return) included. They are out
// of range for the transformer, so a scan of open space is a clear view.
ScanBatch laserScanToReadings(const sensor_msgs::msg::LaserScan &scan);

}  // namespace path_safety

#endif  // PATH_SAFETY__LATEST_SCAN_SOURCE_HPP_
