#include "path_safety/polling_scan_source.hpp"

#include <chrono>
#include <exception>
#include <thread>
#include <utility>

#include <rclcpp/rclcpp.hpp>

#include "path_safety/rplidar_driver.hpp"

namespace path_safety {

namespace {
rclcpp::Logger logger() { return rclcpp::get_logger("path_safety.serial"); }
}  // namespace

PollingScanSource::PollingScanSource(std::unique_ptr<ScanDriver> driver, SweepOptions options)
  : driver_(std::move(driver)), options_(options) {}

std::optional<ScanBatch> PollingScanSource::next() {
  if (!driver_ || closed_.load() || interrupted_.load()) return std::nullopt;

  std::vector<Measurement> sweep;
  try {
    if (!scanning_) {
      driver_->startScan();
      scanning_ = true;
    }
    sweep = driver_->readSweep(options_);
  } catch (const std::exception &e) {
    // restart on the next call
    scanning_ = false;
    if (interrupted_.load()) return std::nullopt;
    throw ScanReadError(std::string("serial read failed: ") + e.what());
  }

  ScanBatch batch;
  batch.reserve(sweep.size());
  for (const auto &m : sweep) {
    batch.push_back(RawReading{m.angle_deg, m.distance_mm / 1000.0});
  }
  return batch;
}

void PollingScanSource::interrupt() {
  if (!driver_ || interrupted_.exchange(true)) return;
  driver_->cancel();
}

void PollingScanSource::close() {
  if (!driver_ || closed_.exchange(true)) return;

  try {
    driver_->stop();
  } catch (const std::exception &e) {
    RCLCPP_WARN(logger(), "Failed to stop scanning: %s", e.what());
  }
  scanning_ = false;
  driver_->disconnect();
}

std::shared_ptr<PollingScanSource> makeRPLidarSource(const SafetyConfig &config) {
  SweepOptions options;
  options.min_len = config.min_scan_len;
  options.max_distance_mm = config.max_distance_mm;

  RCLCPP_INFO(logger(), "Booting RPLidar on %s", config.serial_port.c_str());
  auto driver = std::make_unique<RPLidarDriver>(config.serial_port, config.serial_baudrate);
  try {
    driver->connect();

    const RPLidarInfo info = driver->getInfo();
    RCLCPP_INFO(logger(), "RPLidar Info: model=%d firmware=%d.%02d hardware=%d serial=%s",
                info.model, info.firmware_major, info.firmware_minor, info.hardware,
                info.serial_number.c_str());

    const RPLidarHealth health = driver->getHealth();
    if (health.status == "Good") {
      RCLCPP_INFO(logger(), "RPLidar Health: %s", health.status.c_str());
    } else {
      RCLCPP_WARN(logger(), "There is a problem with the LIDAR: health=%s error_code=%d",
                  health.status.c_str(), health.error_code);
    }

    // reset to clear buffers
    driver->reset();
    std::this_thread::sleep_for(std::chrono::milliseconds(500));
  } catch (const std::exception &e) {
    RCLCPP_ERROR(logger(), "Error booting RPLidar on %s: %s", config.serial_port.c_str(), e.what());
    return std::make_shared<PollingScanSource>(nullptr, options);
  }
  return std::make_shared<PollingScanSource>(std::move(driver), options);
}

}  // namespace path_safety
