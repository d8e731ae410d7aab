#ifndef PATH_SAFETY__PATH_SAFETY_ENGINE_HPP_
#define PATH_SAFETY__PATH_SAFETY_ENGINE_HPP_

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <rclcpp/rclcpp.hpp>

#include "path_safety/coordinate_transformer.hpp"
#include "path_safety/corridor_library.hpp"
#include "path_safety/path_pruner.hpp"
#include "path_safety/safety_config.hpp"
#include "path_safety/safety_snapshot.hpp"
#include "path_safety/scan_source.hpp"

namespace path_safety {

/// ======================
/// Path safety engine
/// ======================
// Owns the scan -> transform -> prune -> classify pipeline and the worker
// thread that runs it. The worker is the only writer of the snapshot, any
// thread may read it. Until the first cycle completes the snapshot is the
// conservative "surrounded" result.
class PathSafetyEngine {
public:
  static constexpr std::chrono::milliseconds kPollingCyclePeriod{50};
  static constexpr std::chrono::milliseconds kSubscriptionCyclePeriod{100};
  static constexpr std::chrono::milliseconds kStopTimeout{5000};

  PathSafetyEngine(const SafetyConfig &config, std::shared_ptr<ScanSource> source);
  ~PathSafetyEngine();

  PathSafetyEngine(const PathSafetyEngine &) = delete;
  PathSafetyEngine &operator=(const PathSafetyEngine &) = delete;

  // Both are idempotent. stop() releases the scan source, so an engine runs
  // at most once and start() after stop() is refused.
  void start();
  void stop();
  bool isRunning() const { return running_.load(); }

  // One cycle: read, process, publish. Called by the worker, exposed for tests.
  void runCycle();

  // Pure pipeline for one batch, no publishing.
  SafetySnapshot evaluate(const ScanBatch &batch) const;

  std::shared_ptr<const SafetySnapshot> snapshot() const { return store_.latest(); }
  std::vector<int> validPaths() const { return snapshot()->valid_paths; }
  std::vector<TransformedPoint> rawScan() const { return snapshot()->raw_scan; }
  std::string lidarString() const { return snapshot()->lidar_string; }
  bool isDirectionSafe(const std::string &direction, std::size_t min_paths = 1) const;

  const SafetyConfig &config() const { return config_; }
  const CorridorLibrary &corridors() const { return library_; }

  void setCyclePeriod(std::chrono::milliseconds period) { cycle_period_.store(period); }

private:
  void run(std::promise<void> done);
  void publish(SafetySnapshot snapshot);
  SafetySnapshot surrounded() const;
  void releaseSource();

  const SafetyConfig config_;
  const CorridorLibrary library_;
  const CoordinateTransformer transformer_;
  const PathPruner pruner_;

  std::shared_ptr<ScanSource> source_;
  SnapshotStore store_;
  uint64_t cycle_ = 0;
  rclcpp::Clock steady_clock_{RCL_STEADY_TIME};

  std::atomic<std::chrono::milliseconds> cycle_period_;
  std::atomic<bool> running_{false};
  bool stopped_ = false;
  std::mutex lifecycle_mutex_;
  std::mutex wake_mutex_;
  std::condition_variable wake_;
  std::thread worker_;
  std::future<void> worker_done_;
  bool source_released_ = false;
  rclcpp::Logger logger_;
};

}  // namespace path_safety

#endif  // PATH_SAFETY__PATH_SAFETY_ENGINE_HPP_
