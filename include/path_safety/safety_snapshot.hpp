#ifndef PATH_SAFETY__SAFETY_SNAPSHOT_HPP_
#define PATH_SAFETY__SAFETY_SNAPSHOT_HPP_

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include "path_safety/movement_classifier.hpp"
#include "path_safety/types.hpp"

namespace path_safety {

// Result of one processing cycle. Never modified after it is published.
struct SafetySnapshot {
  std::vector<TransformedPoint> raw_scan;
  std::vector<int> valid_paths;
  std::string lidar_string;
  MovementBuckets buckets;

  uint64_t cycle = 0;
  bool has_data = false;  // false: conservative result synthesized without a scan
  std::chrono::steady_clock::time_point stamp;
};

// One writer, any number of readers. The lock only covers the pointer swap.
class SnapshotStore {
public:
  void publish(std::shared_ptr<const SafetySnapshot> snapshot) {
    std::lock_guard<std::mutex> lock(mutex_);
    latest_ = std::move(snapshot);
  }

  std::shared_ptr<const SafetySnapshot> latest() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return latest_;
  }

private:
  mutable std::mutex mutex_;
  std::shared_ptr<const SafetySnapshot> latest_;
};

}  // namespace path_safety

#endif  // PATH_SAFETY__SAFETY_SNAPSHOT_HPP_
