// path_safety_node.cpp
#include <rclcpp/rclcpp.hpp>
#include <sensor_msgs/msg/laser_scan.hpp>
#include <std_msgs/msg/string.hpp>
#include <std_msgs/msg/int32_multi_array.hpp>
#include <geometry_msgs/msg/point.hpp>
#include <visualization_msgs/msg/marker.hpp>
#include <visualization_msgs/msg/marker_array.hpp>

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "path_safety/latest_scan_source.hpp"
#include "path_safety/path_safety_engine.hpp"
#include "path_safety/polling_scan_source.hpp"
#include "path_safety/safety_config.hpp"

using path_safety::PathSafetyEngine;
using path_safety::SafetyConfig;
using path_safety::SafetySnapshot;

class PathSafetyNode : public rclcpp::Node {
public:
  PathSafetyNode() : Node("path_safety_node") {
    const SafetyConfig config = loadConfig();
    config.validate();

    frame_id_       = declare_parameter<std::string>("frame_id", "base_link");
    publish_rate_hz_ = declare_parameter<double>("publish_rate_hz", 10.0);  // [Hz]
    if (publish_rate_hz_ <= 0.0) {
      throw std::invalid_argument("publish_rate_hz must be > 0");
    }

    // ----- scan source -----
    std::shared_ptr<path_safety::ScanSource> source;
    if (config.use_subscription) {
      auto latest = std::make_shared<path_safety::LatestScanSource>();
      sub_scan_ = create_subscription<sensor_msgs::msg::LaserScan>(
          config.scan_topic, rclcpp::SensorDataQoS(),
          [latest](sensor_msgs::msg::LaserScan::SharedPtr msg){ latest->onScan(msg); });
      RCLCPP_INFO(get_logger(), "Listening for LaserScan on '%s'", config.scan_topic.c_str());
      source = latest;
    } else {
      source = path_safety::makeRPLidarSource(config);
    }

    engine_ = std::make_shared<PathSafetyEngine>(config, source);

    // ----- Publisher -----
    lidar_string_pub_ = create_publisher<std_msgs::msg::String>("~/lidar_string", 10);
    valid_paths_pub_  = create_publisher<std_msgs::msg::Int32MultiArray>("~/valid_paths", 10);
    marker_pub_       = create_publisher<visualization_msgs::msg::MarkerArray>("~/markers", 10);

    engine_->start();

    timer_ = create_wall_timer(
        std::chrono::milliseconds(static_cast<int>(1000.0 / publish_rate_hz_)),
        std::bind(&PathSafetyNode::onTimer, this));

    RCLCPP_INFO(get_logger(),
                "path_safety started (half_width=%.2f m, max_distance=%.2f m, mount=%.1f deg, "
                "blanked=%zu, restricted=%s)",
                config.half_width_robot, config.max_relevant_distance,
                config.sensor_mounting_angle, config.angles_blanked.size(),
                config.restricted_motion ? "true" : "false");
  }

  ~PathSafetyNode() override {
    if (timer_) timer_->cancel();
    if (engine_) engine_->stop();
  }

private:
  // ======================= parameters =======================
  SafetyConfig loadConfig() {
    SafetyConfig c;
    c.serial_port           = declare_parameter<std::string>("serial_port", c.serial_port);
    c.serial_baudrate       = static_cast<int>(declare_parameter<int>("serial_baudrate", c.serial_baudrate));
    c.min_scan_len          = static_cast<int>(declare_parameter<int>("min_scan_len", c.min_scan_len));
    c.max_distance_mm       = declare_parameter<double>("max_distance_mm", c.max_distance_mm);   // [mm]

    c.use_subscription      = declare_parameter<bool>("use_subscription", c.use_subscription);
    c.scan_topic            = declare_parameter<std::string>("scan_topic", c.scan_topic);

    c.half_width_robot      = declare_parameter<double>("half_width_robot", c.half_width_robot);          // [m]
    c.max_relevant_distance = declare_parameter<double>("max_relevant_distance", c.max_relevant_distance); // [m]
    c.sensor_mounting_angle = declare_parameter<double>("sensor_mounting_angle", c.sensor_mounting_angle); // [deg]
    c.restricted_motion     = declare_parameter<bool>("restricted_motion", c.restricted_motion);

    // flattened [min0, max0, min1, max1, ...] in robot frame degrees
    const auto blanked = declare_parameter<std::vector<double>>("angles_blanked", std::vector<double>{});
    c.angles_blanked = path_safety::blankedRangesFromFlat(blanked);
    return c;
  }

  // ======================= output =======================
  void onTimer() {
    const auto snap = engine_->snapshot();
    if (!snap || snap->cycle == last_published_cycle_) return;
    last_published_cycle_ = snap->cycle;

    std_msgs::msg::String text;
    text.data = snap->lidar_string;
    lidar_string_pub_->publish(text);

    std_msgs::msg::Int32MultiArray ids;
    ids.data.assign(snap->valid_paths.begin(), snap->valid_paths.end());
    valid_paths_pub_->publish(ids);

    if (!snap->has_data) {
      RCLCPP_WARN_THROTTLE(get_logger(), *get_clock(), 5000, "No scan data, reporting DO NOT MOVE");
    }

    publishMarkers(*snap);
  }

  void publishMarkers(const SafetySnapshot &snap) {
    visualization_msgs::msg::MarkerArray arr;
    const auto stamp = now();

    for (const auto &c : engine_->corridors().corridors()) {
      const bool valid = std::find(snap.valid_paths.begin(), snap.valid_paths.end(), c.id)
                         != snap.valid_paths.end();

      visualization_msgs::msg::Marker mk;
      mk.header.frame_id = frame_id_;
      mk.header.stamp = stamp;
      mk.ns = "corridors";
      mk.id = c.id;
      mk.type = visualization_msgs::msg::Marker::LINE_STRIP;
      mk.action = visualization_msgs::msg::Marker::ADD;
      mk.pose.orientation.w = 1.0;
      mk.scale.x = 0.02;

      // valid: green, pruned: red
      mk.color.r = valid ? 0.0f : 1.0f;
      mk.color.g = valid ? 1.0f : 0.0f;
      mk.color.b = 0.0f;
      mk.color.a = 0.8f;

      // robot frame (+y forwards, +x right) -> ROS base_link (+x forwards, +y left)
      for (const auto &s : c.samples) {
        geometry_msgs::msg::Point p;
        p.x = s.y;
        p.y = -s.x;
        p.z = 0.0;
        mk.points.push_back(p);
      }
      mk.lifetime = rclcpp::Duration::from_seconds(0.5);
      arr.markers.push_back(mk);
    }

    visualization_msgs::msg::Marker pts;
    pts.header.frame_id = frame_id_;
    pts.header.stamp = stamp;
    pts.ns = "scan";
    pts.id = 0;
    pts.type = visualization_msgs::msg::Marker::POINTS;
    pts.action = visualization_msgs::msg::Marker::ADD;
    pts.pose.orientation.w = 1.0;
    pts.scale.x = 0.03;
    pts.scale.y = 0.03;
    pts.color.r = 1.0f;
    pts.color.g = 1.0f;
    pts.color.b = 0.0f;
    pts.color.a = 1.0f;
    pts.points.reserve(snap.raw_scan.size());
    for (const auto &tp : snap.raw_scan) {
      geometry_msgs::msg::Point p;
      p.x = tp.y;
      p.y = -tp.x;
      p.z = 0.0;
      pts.points.push_back(p);
    }
    pts.lifetime = rclcpp::Duration::from_seconds(0.5);
    arr.markers.push_back(pts);

    marker_pub_->publish(arr);
  }

  std::string frame_id_;
  double publish_rate_hz_;
  uint64_t last_published_cycle_ = 0;

  std::shared_ptr<PathSafetyEngine> engine_;

  rclcpp::Subscription<sensor_msgs::msg::LaserScan>::SharedPtr sub_scan_;
  rclcpp::Publisher<std_msgs::msg::String>::SharedPtr lidar_string_pub_;
  rclcpp::Publisher<std_msgs::msg::Int32MultiArray>::SharedPtr valid_paths_pub_;
  rclcpp::Publisher<visualization_msgs::msg::MarkerArray>::SharedPtr marker_pub_;
  rclcpp::TimerBase::SharedPtr timer_;
};

int main(int argc, char** argv){
  rclcpp::init(argc, argv);
  int rc = 0;
  try {
    rclcpp::spin(std::make_shared<PathSafetyNode>());
  } catch (const std::invalid_argument &e) {
    RCLCPP_FATAL(rclcpp::get_logger("path_safety_node"), "Invalid configuration: %s", e.what());
    rc = 1;
  }
  rclcpp::shutdown();
  return rc;
}
