#include "path_safety/path_safety_engine.hpp"

#include <exception>
#include <optional>
#include <utility>

#include "path_safety/movement_classifier.hpp"

namespace path_safety {

PathSafetyEngine::PathSafetyEngine(const SafetyConfig &config, std::shared_ptr<ScanSource> source)
  : config_(config),
    library_(),
    transformer_(config_),
    pruner_(library_, config_.half_width_robot),
    source_(std::move(source)),
    cycle_period_(config.use_subscription ? kSubscriptionCyclePeriod : kPollingCyclePeriod),
    logger_(rclcpp::get_logger("path_safety.engine")) {
  config_.validate();
  store_.publish(std::make_shared<const SafetySnapshot>(surrounded()));
}

PathSafetyEngine::~PathSafetyEngine() {
  stop();
}

// ======================= lifecycle =======================
void PathSafetyEngine::start() {
  std::lock_guard<std::mutex> lock(lifecycle_mutex_);
  if (running_.load()) return;
  if (stopped_) {
    RCLCPP_WARN(logger_, "Path safety engine was stopped and its scan source released, not restarting");
    return;
  }

  std::promise<void> done;
  worker_done_ = done.get_future();
  running_.store(true);
  worker_ = std::thread(&PathSafetyEngine::run, this, std::move(done));
  RCLCPP_INFO(logger_, "Path safety engine started (source=%s, period=%lld ms)",
              source_ ? source_->name().c_str() : "none",
              static_cast<long long>(cycle_period_.load().count()));
}

void PathSafetyEngine::stop() {
  std::lock_guard<std::mutex> lock(lifecycle_mutex_);
  if (!worker_.joinable()) return;

  {
    std::lock_guard<std::mutex> wake_lock(wake_mutex_);
    running_.store(false);
  }
  wake_.notify_all();

  RCLCPP_INFO(logger_, "Stopping path safety engine");
  // a blocking read gives up shortly after this, the device is only touched
  // again once the worker is gone
  if (source_) source_->interrupt();
  if (worker_done_.wait_for(kStopTimeout) != std::future_status::ready) {
    RCLCPP_WARN(logger_, "Worker did not finish within %lld ms, still waiting for %s",
                static_cast<long long>(kStopTimeout.count()),
                source_ ? source_->name().c_str() : "cycle");
  }
  worker_.join();
  stopped_ = true;
  releaseSource();
}

void PathSafetyEngine::releaseSource() {
  if (!source_ || source_released_) return;
  source_released_ = true;
  try {
    source_->close();
  } catch (const std::exception &e) {
    RCLCPP_ERROR(logger_, "Failed to release scan source %s: %s",
                 source_->name().c_str(), e.what());
  }
}

void PathSafetyEngine::run(std::promise<void> done) {
  while (running_.load()) {
    runCycle();

    std::unique_lock<std::mutex> lock(wake_mutex_);
    wake_.wait_for(lock, cycle_period_.load(), [this] { return !running_.load(); });
  }
  done.set_value();
}

// ======================= processing =======================
void PathSafetyEngine::runCycle() {
  if (!source_) {
    publish(surrounded());
    return;
  }

  try {
    std::optional<ScanBatch> batch = source_->next();
    if (!batch || batch->empty()) {
      RCLCPP_INFO_THROTTLE(logger_, steady_clock_, 5000,
                           "Waiting for %s laser scan data...", source_->name().c_str());
      publish(surrounded());
      return;
    }
    publish(evaluate(*batch));
  } catch (const std::exception &e) {
    // keep the last snapshot, try again next cycle
    RCLCPP_ERROR(logger_, "Error in %s scan cycle: %s", source_->name().c_str(), e.what());
  }
}

SafetySnapshot PathSafetyEngine::evaluate(const ScanBatch &batch) const {
  SafetySnapshot s;
  s.raw_scan = transformer_.transform(batch);
  sortByAngle(s.raw_scan);
  s.valid_paths = pruner_.prune(s.raw_scan, startingCandidates(config_.restricted_motion));
  s.buckets = categorizePaths(s.valid_paths);
  s.lidar_string = describeMovement(s.buckets, config_.restricted_motion);
  s.has_data = true;
  return s;
}

void PathSafetyEngine::publish(SafetySnapshot snapshot) {
  snapshot.cycle = ++cycle_;
  snapshot.stamp = std::chrono::steady_clock::now();

  RCLCPP_DEBUG(logger_, "cycle %llu: %s (valid paths: %zu)",
               static_cast<unsigned long long>(snapshot.cycle),
               snapshot.lidar_string.c_str(), snapshot.valid_paths.size());

  store_.publish(std::make_shared<const SafetySnapshot>(std::move(snapshot)));
}

SafetySnapshot PathSafetyEngine::surrounded() const {
  SafetySnapshot s;
  s.lidar_string = kSurroundedMessage;
  s.has_data = false;
  s.stamp = std::chrono::steady_clock::now();
  return s;
}

bool PathSafetyEngine::isDirectionSafe(const std::string &direction, std::size_t min_paths) const {
  return path_safety::isDirectionSafe(snapshot()->buckets, direction, min_paths);
}

}  // namespace path_safety
