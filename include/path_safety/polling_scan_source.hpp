#ifndef PATH_SAFETY__POLLING_SCAN_SOURCE_HPP_
#define PATH_SAFETY__POLLING_SCAN_SOURCE_HPP_

#include <atomic>
#include <memory>
#include <optional>
#include <string>

#include "path_safety/safety_config.hpp"
#include "path_safety/scan_driver.hpp"
#include "path_safety/scan_source.hpp"

namespace path_safety {

// Polling transport: pulls one sweep per next() from a blocking driver at the
// driver's own cadence (degrees / millimeters, converted to meters here).
// A failed read is reported as ScanReadError and the scan is restarted on the
// following call. Without a driver (device failed to boot) it never has data.
class PollingScanSource : public ScanSource {
public:
  PollingScanSource(std::unique_ptr<ScanDriver> driver, SweepOptions options);

  std::optional<ScanBatch> next() override;
  void interrupt() override;
  void close() override;
  std::string name() const override { return "serial"; }

  bool hasDevice() const { return static_cast<bool>(driver_); }

private:
  std::unique_ptr<ScanDriver> driver_;
  SweepOptions options_;
  bool scanning_ = false;
  std::atomic<bool> interrupted_{false};
  std::atomic<bool> closed_{false};
};

// Opens and boots an RPLidar on config.serial_port (info, health, reset).
// Boot failures are logged and give a source without a device.
std::shared_ptr<PollingScanSource> makeRPLidarSource(const SafetyConfig &config);

}  // namespace path_safety

#endif  // PATH_SAFETY__POLLING_SCAN_SOURCE_HPP_
