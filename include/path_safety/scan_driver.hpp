#ifndef PATH_SAFETY__SCAN_DRIVER_HPP_
#define PATH_SAFETY__SCAN_DRIVER_HPP_

#include <vector>

namespace path_safety {

// Driver native measurement (degrees / millimeters).
struct Measurement {
  int quality;
  double angle_deg;
  double distance_mm;
};

struct SweepOptions {
  int min_len = 25;               // sweeps with fewer measurements are skipped
  double max_distance_mm = 1500.0;
};

// Blocking sweep-oriented range sensor, e.g. a spinning serial lidar.
class ScanDriver {
public:
  virtual ~ScanDriver() = default;

  virtual void startScan() = 0;
  // Blocks until one full 360 deg sweep is assembled.
  virtual std::vector<Measurement> readSweep(const SweepOptions &options) = 0;
  virtual void stop() = 0;
  virtual void disconnect() = 0;

  // May be called from any thread. A startScan() or readSweep() in progress
  // throws shortly after, later reads throw until the driver is reconnected.
  // Does not touch the device, stop() and disconnect() still have to follow
  // on the reading thread (or after it has finished).
  virtual void cancel() = 0;
};

}  // namespace path_safety

#endif  // PATH_SAFETY__SCAN_DRIVER_HPP_
