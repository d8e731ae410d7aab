#include "path_safety/rplidar_driver.hpp"

#include <fcntl.h>
#include <poll.h>
#include <sys/ioctl.h>
#include <termios.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstdio>
#include <cstring>
#include <thread>

#include <rclcpp/rclcpp.hpp>

namespace path_safety {

namespace {

constexpr uint8_t kSyncByte = 0xA5;
constexpr uint8_t kSyncByte2 = 0x5A;

constexpr uint8_t kCmdStop = 0x25;
constexpr uint8_t kCmdReset = 0x40;
constexpr uint8_t kCmdScan = 0x20;
constexpr uint8_t kCmdGetInfo = 0x50;
constexpr uint8_t kCmdGetHealth = 0x52;
constexpr uint8_t kCmdSetPwm = 0xF0;

constexpr uint8_t kInfoType = 0x04;
constexpr uint8_t kHealthType = 0x06;
constexpr uint8_t kScanType = 0x81;

constexpr uint32_t kInfoLen = 20;
constexpr uint32_t kHealthLen = 3;
constexpr uint32_t kScanNodeLen = 5;
constexpr size_t kDescriptorLen = 7;

constexpr uint16_t kDefaultMotorPwm = 660;

// upper bound on how long a cancel() can go unnoticed while waiting for bytes
constexpr int kPollSliceMs = 100;

rclcpp::Logger logger() { return rclcpp::get_logger("path_safety.rplidar"); }

speed_t baudCode(int baud) {
  switch (baud) {
    case 9600:   return B9600;
    case 19200:  return B19200;
    case 38400:  return B38400;
    case 57600:  return B57600;
    case 115200: return B115200;
    case 230400: return B230400;
    case 460800: return B460800;
    default:
      RCLCPP_WARN(logger(), "Unknown baud rate %d, using 115200", baud);
      return B115200;
  }
}

std::string errnoText(const std::string &what) {
  return what + ": " + std::strerror(errno);
}

}  // namespace

bool decodeScanNode(const uint8_t *raw, ScanNode &node) {
  const bool start = (raw[0] & 0x01) != 0;
  const bool inverse_start = (raw[0] & 0x02) != 0;
  if (start == inverse_start) return false;
  if ((raw[1] & 0x01) != 1) return false;

  node.new_sweep = start;
  node.quality = raw[0] >> 2;
  node.angle_deg = ((raw[1] >> 1) | (static_cast<uint16_t>(raw[2]) << 7)) / 64.0;
  node.distance_mm = (raw[3] | (static_cast<uint16_t>(raw[4]) << 8)) / 4.0;
  return true;
}

bool decodeDescriptor(const uint8_t *raw, ResponseDescriptor &desc) {
  if (raw[0] != kSyncByte || raw[1] != kSyncByte2) return false;

  // 30 bit length, 2 bit send mode
  const uint32_t word = static_cast<uint32_t>(raw[2]) |
                        (static_cast<uint32_t>(raw[3]) << 8) |
                        (static_cast<uint32_t>(raw[4]) << 16) |
                        (static_cast<uint32_t>(raw[5]) << 24);
  desc.length = word & 0x3FFFFFFF;
  desc.single = ((word >> 30) & 0x3) == 0;
  desc.type = raw[6];
  return true;
}

std::optional<std::vector<Measurement>> SweepAssembler::push(const ScanNode &node) {
  std::vector<Measurement> done;
  if (node.new_sweep && !pending_.empty()) done.swap(pending_);

  if (node.quality > 0 && node.distance_mm > 0.0 &&
      node.distance_mm <= options_.max_distance_mm) {
    pending_.push_back(Measurement{node.quality, node.angle_deg, node.distance_mm});
  }

  if (done.empty()) return std::nullopt;
  if (done.size() < static_cast<size_t>(std::max(0, options_.min_len))) {
    ++dropped_sweeps_;
    return std::nullopt;
  }
  return done;
}

std::vector<uint8_t> buildRequest(uint8_t cmd, const std::vector<uint8_t> &payload) {
  std::vector<uint8_t> req{kSyncByte, cmd};
  if (!payload.empty()) {
    req.push_back(static_cast<uint8_t>(payload.size()));
    req.insert(req.end(), payload.begin(), payload.end());
    uint8_t checksum = 0;
    for (uint8_t b : req) checksum ^= b;
    req.push_back(checksum);
  }
  return req;
}

RPLidarDriver::RPLidarDriver(const std::string &port, int baudrate)
  : port_(port), baudrate_(baudrate) {}

RPLidarDriver::~RPLidarDriver() {
  if (fd_ >= 0) {
    ::close(fd_);
    fd_ = -1;
  }
}

// ======================= serial port =======================
void RPLidarDriver::connect() {
  if (fd_ >= 0) return;

  fd_ = ::open(port_.c_str(), O_RDWR | O_NOCTTY | O_NONBLOCK);
  if (fd_ < 0) throw RPLidarException(errnoText("Failed to open " + port_));
  cancelled_.store(false);

  struct termios tty;
  std::memset(&tty, 0, sizeof(tty));
  if (tcgetattr(fd_, &tty) != 0) {
    const std::string msg = errnoText("tcgetattr failed on " + port_);
    ::close(fd_);
    fd_ = -1;
    throw RPLidarException(msg);
  }

  const speed_t code = baudCode(baudrate_);
  cfsetospeed(&tty, code);
  cfsetispeed(&tty, code);

  // 8N1, raw
  tty.c_cflag &= ~PARENB;
  tty.c_cflag &= ~CSTOPB;
  tty.c_cflag &= ~CSIZE;
  tty.c_cflag |= CS8;
  tty.c_cflag &= ~CRTSCTS;
  tty.c_cflag |= CREAD | CLOCAL;

  tty.c_lflag &= ~(ICANON | ECHO | ECHOE | ISIG);
  tty.c_iflag &= ~(IXON | IXOFF | IXANY);
  tty.c_iflag &= ~(IGNBRK | BRKINT | PARMRK | ISTRIP | INLCR | IGNCR | ICRNL);
  tty.c_oflag &= ~OPOST;

  tty.c_cc[VMIN] = 0;
  tty.c_cc[VTIME] = 0;

  if (tcsetattr(fd_, TCSANOW, &tty) != 0) {
    const std::string msg = errnoText("tcsetattr failed on " + port_);
    ::close(fd_);
    fd_ = -1;
    throw RPLidarException(msg);
  }
  tcflush(fd_, TCIOFLUSH);

  RCLCPP_INFO(logger(), "Opened %s at %d baud", port_.c_str(), baudrate_);
}

void RPLidarDriver::disconnect() {
  if (fd_ < 0) return;
  const int fd = fd_;
  fd_ = -1;
  scanning_ = false;
  assembler_.clear();
  if (::close(fd) != 0) throw RPLidarException(errnoText("Failed to close " + port_));
  RCLCPP_INFO(logger(), "Closed %s", port_.c_str());
}

void RPLidarDriver::setDtr(bool on) {
  int flag = TIOCM_DTR;
  if (ioctl(fd_, on ? TIOCMBIS : TIOCMBIC, &flag) != 0) {
    throw RPLidarException(errnoText("Failed to set DTR on " + port_));
  }
}

void RPLidarDriver::readExact(uint8_t *buf, size_t len) {
  const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(read_timeout_ms_);
  size_t got = 0;
  while (got < len) {
    if (cancelled_.load()) throw RPLidarException("Read on " + port_ + " was cancelled");
    if (fd_ < 0) throw RPLidarException("Device " + port_ + " is not connected");

    const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now()).count();
    if (left <= 0) throw RPLidarException("Timeout reading from " + port_);

    struct pollfd pfd;
    pfd.fd = fd_;
    pfd.events = POLLIN;
    pfd.revents = 0;
    const int rc = ::poll(&pfd, 1, static_cast<int>(std::min<long long>(left, kPollSliceMs)));
    if (rc < 0) {
      if (errno == EINTR) continue;
      throw RPLidarException(errnoText("poll failed on " + port_));
    }
    if (rc == 0) continue;
    if (pfd.revents & (POLLERR | POLLHUP | POLLNVAL)) {
      throw RPLidarException("Device " + port_ + " was closed or hung up");
    }

    const ssize_t n = ::read(fd_, buf + got, len - got);
    if (n < 0) {
      if (errno == EAGAIN || errno == EINTR) continue;
      throw RPLidarException(errnoText("read failed on " + port_));
    }
    got += static_cast<size_t>(n);
  }
}

// ======================= protocol =======================
void RPLidarDriver::sendCommand(uint8_t cmd, const std::vector<uint8_t> &payload) {
  if (fd_ < 0) throw RPLidarException("Device " + port_ + " is not connected");

  const std::vector<uint8_t> req = buildRequest(cmd, payload);
  size_t sent = 0;
  while (sent < req.size()) {
    const ssize_t n = ::write(fd_, req.data() + sent, req.size() - sent);
    if (n < 0) {
      if (errno == EAGAIN || errno == EINTR) continue;
      throw RPLidarException(errnoText("write failed on " + port_));
    }
    sent += static_cast<size_t>(n);
  }
}

void RPLidarDriver::readDescriptor(uint32_t expected_len, uint8_t expected_type, bool expect_single) {
  uint8_t d[kDescriptorLen];
  readExact(d, kDescriptorLen);
  ResponseDescriptor desc;
  if (!decodeDescriptor(d, desc)) {
    throw RPLidarException("Incorrect descriptor starting bytes");
  }

  if (desc.length != expected_len || desc.type != expected_type || desc.single != expect_single) {
    char buf[128];
    std::snprintf(buf, sizeof(buf),
                  "Unexpected descriptor (len=%u type=0x%02X single=%d), expected len=%u type=0x%02X",
                  desc.length, desc.type, desc.single ? 1 : 0, expected_len, expected_type);
    throw RPLidarException(buf);
  }
}

RPLidarInfo RPLidarDriver::getInfo() {
  sendCommand(kCmdGetInfo);
  readDescriptor(kInfoLen, kInfoType, true);

  uint8_t raw[kInfoLen];
  readExact(raw, kInfoLen);

  RPLidarInfo info;
  info.model = raw[0];
  info.firmware_minor = raw[1];
  info.firmware_major = raw[2];
  info.hardware = raw[3];
  char hex[3];
  for (size_t i = 4; i < kInfoLen; ++i) {
    std::snprintf(hex, sizeof(hex), "%02X", raw[i]);
    info.serial_number += hex;
  }
  return info;
}

RPLidarHealth RPLidarDriver::getHealth() {
  sendCommand(kCmdGetHealth);
  readDescriptor(kHealthLen, kHealthType, true);

  uint8_t raw[kHealthLen];
  readExact(raw, kHealthLen);

  RPLidarHealth health;
  switch (raw[0]) {
    case 0: health.status = "Good"; break;
    case 1: health.status = "Warning"; break;
    case 2: health.status = "Error"; break;
    default: health.status = "Unknown"; break;
  }
  health.error_code = raw[1] | (raw[2] << 8);
  return health;
}

void RPLidarDriver::reset() {
  sendCommand(kCmdReset);
  scanning_ = false;
  assembler_.clear();
  std::this_thread::sleep_for(std::chrono::milliseconds(2));
}

void RPLidarDriver::setPwm(uint16_t pwm) {
  sendCommand(kCmdSetPwm, {static_cast<uint8_t>(pwm & 0xFF), static_cast<uint8_t>(pwm >> 8)});
}

void RPLidarDriver::startMotor() {
  setDtr(false);
  setPwm(kDefaultMotorPwm);
}

void RPLidarDriver::stopMotor() {
  setPwm(0);
  setDtr(true);
}

// ======================= scanning =======================
void RPLidarDriver::startScan() {
  if (scanning_) return;
  if (fd_ < 0) throw RPLidarException("Device " + port_ + " is not connected");

  // drop boot banner / stale nodes
  tcflush(fd_, TCIFLUSH);
  startMotor();
  sendCommand(kCmdScan);
  readDescriptor(kScanNodeLen, kScanType, false);
  assembler_.clear();
  scanning_ = true;
}

std::vector<Measurement> RPLidarDriver::readSweep(const SweepOptions &options) {
  if (!scanning_) throw RPLidarException("Scan not started on " + port_);

  assembler_.setOptions(options);
  const size_t dropped_before = assembler_.droppedSweeps();
  const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(sweep_timeout_ms_);
  uint8_t raw[kScanNodeLen];
  ScanNode node;

  while (true) {
    readExact(raw, kScanNodeLen);
    if (!decodeScanNode(raw, node)) {
      // stream lost sync, caller has to restart the scan
      scanning_ = false;
      throw RPLidarException("Scan node check bits mismatch");
    }

    std::optional<std::vector<Measurement>> sweep = assembler_.push(node);
    if (sweep) return std::move(*sweep);

    if (std::chrono::steady_clock::now() >= deadline) {
      char buf[160];
      std::snprintf(buf, sizeof(buf),
                    "No sweep with %d readings within %.0f mm after %d ms on %s (%zu short sweeps dropped)",
                    options.min_len, options.max_distance_mm, sweep_timeout_ms_, port_.c_str(),
                    assembler_.droppedSweeps() - dropped_before);
      throw RPLidarException(buf);
    }
  }
}

void RPLidarDriver::stop() {
  if (fd_ < 0) return;
  sendCommand(kCmdStop);
  std::this_thread::sleep_for(std::chrono::milliseconds(1));
  scanning_ = false;
  assembler_.clear();
  stopMotor();
  tcflush(fd_, TCIFLUSH);
}

}  // namespace path_safety
