#ifndef PATH_SAFETY__RPLIDAR_DRIVER_HPP_
#define PATH_SAFETY__RPLIDAR_DRIVER_HPP_

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "path_safety/scan_driver.hpp"

namespace path_safety {

class RPLidarException : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

struct RPLidarInfo {
  int model = 0;
  int firmware_major = 0;
  int firmware_minor = 0;
  int hardware = 0;
  std::string serial_number;  // hex
};

struct RPLidarHealth {
  std::string status;  // "Good", "Warning", "Error"
  int error_code = 0;
};

// One decoded standard-scan measurement node.
struct ScanNode {
  bool new_sweep;
  int quality;
  double angle_deg;
  double distance_mm;
};

// Decodes a 5 byte standard scan node. Returns false if the check bits are wrong.
bool decodeScanNode(const uint8_t *raw, ScanNode &node);

struct ResponseDescriptor {
  uint32_t length;
  bool single;  // single response, otherwise a stream of length sized nodes
  uint8_t type;
};

// Decodes the 7 byte A5 5A response descriptor. Returns false on bad sync bytes.
bool decodeDescriptor(const uint8_t *raw, ResponseDescriptor &desc);

// Request packet: A5 cmd [size payload... checksum]
std::vector<uint8_t> buildRequest(uint8_t cmd, const std::vector<uint8_t> &payload = {});

// Groups decoded nodes into 360 deg sweeps. A sweep is complete when the next
// start flag arrives; it is emitted only with at least min_len kept readings.
// Readings with zero quality, zero distance or beyond max_distance_mm are not kept.
class SweepAssembler {
public:
  explicit SweepAssembler(const SweepOptions &options = SweepOptions{}) : options_(options) {}

  void setOptions(const SweepOptions &options) { options_ = options; }

  // Returns the sweep that the node completed, if any. The node itself
  // belongs to the next sweep.
  std::optional<std::vector<Measurement>> push(const ScanNode &node);

  void clear() { pending_.clear(); }
  size_t pendingSize() const { return pending_.size(); }
  size_t droppedSweeps() const { return dropped_sweeps_; }

private:
  SweepOptions options_;
  std::vector<Measurement> pending_;
  size_t dropped_sweeps_ = 0;
};

/// ======================
/// Slamtec RPLidar (A1/A2), standard scan mode over a serial port.
/// All IO errors and protocol violations throw RPLidarException.
/// ======================
class RPLidarDriver : public ScanDriver {
public:
  RPLidarDriver(const std::string &port, int baudrate = 115200);
  ~RPLidarDriver() override;

  RPLidarDriver(const RPLidarDriver &) = delete;
  RPLidarDriver &operator=(const RPLidarDriver &) = delete;

  void connect();
  void disconnect() override;
  bool isConnected() const { return fd_ >= 0; }

  RPLidarInfo getInfo();
  RPLidarHealth getHealth();
  void reset();

  void startMotor();
  void stopMotor();

  void startScan() override;
  // Throws when no sweep with enough kept readings shows up within the sweep
  // timeout, e.g. when everything in view is beyond max_distance_mm.
  std::vector<Measurement> readSweep(const SweepOptions &options) override;
  void stop() override;
  void cancel() override { cancelled_.store(true); }

private:
  void sendCommand(uint8_t cmd, const std::vector<uint8_t> &payload = {});
  void readDescriptor(uint32_t expected_len, uint8_t expected_type, bool expect_single);
  void readExact(uint8_t *buf, size_t len);
  void setPwm(uint16_t pwm);
  void setDtr(bool on);

  std::string port_;
  int baudrate_;
  int fd_ = -1;
  bool scanning_ = false;
  SweepAssembler assembler_;
  std::atomic<bool> cancelled_{false};
  int read_timeout_ms_ = 1000;
  int sweep_timeout_ms_ = 2000;
};

}  // namespace path_safety

#endif  // PATH_SAFETY__RPLIDAR_DRIVER_HPP_
