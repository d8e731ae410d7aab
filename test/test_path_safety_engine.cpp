#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <functional>
#include <limits>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "path_safety/latest_scan_source.hpp"
#include "path_safety/path_safety_engine.hpp"

using namespace path_safety;

namespace {

// Hands out a scripted batch, or no data, or an error.
class FakeSource : public ScanSource {
public:
  std::optional<ScanBatch> next() override {
    ++next_calls;
    std::lock_guard<std::mutex> lock(mutex_);
    if (fail_next) {
      fail_next = false;
      throw ScanReadError("simulated read failure");
    }
    return batch_;
  }
  void close() override {
    ++close_calls;
    if (fail_close) throw std::runtime_error("disconnect failed");
  }
  std::string name() const override { return "fake"; }

  void setBatch(std::optional<ScanBatch> batch) {
    std::lock_guard<std::mutex> lock(mutex_);
    batch_ = std::move(batch);
  }
  void failNext() {
    std::lock_guard<std::mutex> lock(mutex_);
    fail_next = true;
  }

  std::atomic<int> next_calls{0};
  std::atomic<int> close_calls{0};
  bool fail_close = false;

private:
  std::mutex mutex_;
  std::optional<ScanBatch> batch_;
  bool fail_next = false;
};

// next() blocks until interrupt(), like a device read that never completes.
class BlockingSource : public ScanSource {
public:
  std::optional<ScanBatch> next() override {
    reading = true;
    while (!interrupted.load()) std::this_thread::sleep_for(std::chrono::milliseconds(1));
    reading = false;
    return std::nullopt;
  }
  void interrupt() override { interrupted = true; }
  void close() override {
    if (reading.load()) closed_while_reading = true;
    ++close_calls;
  }
  std::string name() const override { return "blocking"; }

  std::atomic<bool> reading{false};
  std::atomic<bool> interrupted{false};
  std::atomic<bool> closed_while_reading{false};
  std::atomic<int> close_calls{0};
};

sensor_msgs::msg::LaserScan::SharedPtr openSpaceScan() {
  auto scan = std::make_shared<sensor_msgs::msg::LaserScan>();
  scan->angle_min = static_cast<float>(-M_PI);
  scan->angle_increment = static_cast<float>(2.0 * M_PI / 360.0);
  scan->angle_max = scan->angle_min + scan->angle_increment * 359.0f;
  scan->range_min = 0.15f;
  scan->range_max = 12.0f;
  scan->ranges.assign(360, std::numeric_limits<float>::infinity());
  return scan;
}

const std::vector<int> kAllPaths{0, 1, 2, 3, 4, 5, 6, 7, 8, 9};

bool waitFor(const std::function<bool()> &pred, std::chrono::milliseconds timeout) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    if (pred()) return true;
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  return pred();
}

}  // namespace

TEST(PathSafetyEngine, StartsWithConservativeSnapshot) {
  PathSafetyEngine engine(SafetyConfig{}, std::make_shared<FakeSource>());
  const auto snap = engine.snapshot();
  ASSERT_NE(snap, nullptr);
  EXPECT_EQ(snap->cycle, 0u);
  EXPECT_FALSE(snap->has_data);
  EXPECT_TRUE(snap->valid_paths.empty());
  EXPECT_TRUE(snap->raw_scan.empty());
  EXPECT_EQ(snap->lidar_string, kSurroundedMessage);
}

TEST(PathSafetyEngine, RejectsInvalidConfig) {
  SafetyConfig config;
  config.half_width_robot = -0.1;
  EXPECT_THROW(PathSafetyEngine(config, std::make_shared<FakeSource>()), std::invalid_argument);
}

TEST(PathSafetyEngine, NoDataIsTreatedAsSurrounded) {
  auto src = std::make_shared<FakeSource>();
  PathSafetyEngine engine(SafetyConfig{}, src);

  engine.runCycle();
  EXPECT_EQ(engine.snapshot()->cycle, 1u);
  EXPECT_TRUE(engine.validPaths().empty());
  EXPECT_EQ(engine.lidarString(), kSurroundedMessage);

  // an empty batch is no data as well
  src->setBatch(ScanBatch{});
  engine.runCycle();
  EXPECT_EQ(engine.snapshot()->cycle, 2u);
  EXPECT_TRUE(engine.validPaths().empty());
  EXPECT_EQ(engine.lidarString(), kSurroundedMessage);
}

TEST(PathSafetyEngine, OpenSpaceScanIsClearView) {
  auto src = std::make_shared<LatestScanSource>();
  src->onScan(openSpaceScan());
  PathSafetyEngine engine(SafetyConfig{}, src);

  engine.runCycle();
  const auto snap = engine.snapshot();
  EXPECT_TRUE(snap->has_data);
  EXPECT_TRUE(snap->raw_scan.empty());
  EXPECT_EQ(snap->valid_paths, kAllPaths);
  EXPECT_NE(snap->lidar_string, kSurroundedMessage);

  SafetyConfig restricted;
  restricted.restricted_motion = true;
  PathSafetyEngine restricted_engine(restricted, src);
  restricted_engine.runCycle();
  EXPECT_EQ(restricted_engine.validPaths(), (std::vector<int>{4}));
}

TEST(PathSafetyEngine, MissingSourceIsTreatedAsSurrounded) {
  PathSafetyEngine engine(SafetyConfig{}, nullptr);
  engine.runCycle();
  EXPECT_TRUE(engine.validPaths().empty());
  EXPECT_EQ(engine.lidarString(), kSurroundedMessage);
}

TEST(PathSafetyEngine, ObstacleStraightAheadBlocksAdvance) {
  auto src = std::make_shared<FakeSource>();
  src->setBatch(ScanBatch{{0.0, 0.5}});
  PathSafetyEngine engine(SafetyConfig{}, src);

  engine.runCycle();
  const auto snap = engine.snapshot();
  EXPECT_TRUE(snap->has_data);
  ASSERT_EQ(snap->raw_scan.size(), 1u);
  EXPECT_NEAR(snap->raw_scan[0].y, 0.5, 1e-9);
  EXPECT_EQ(snap->valid_paths, (std::vector<int>{0, 1, 7, 8, 9}));
  EXPECT_EQ(snap->lidar_string,
            "The safe movement directions are: {'turn left', 'turn right', 'move back', "
            "'stand still'}. ");
  EXPECT_EQ(snap->lidar_string.find("move forwards"), std::string::npos);

  EXPECT_FALSE(engine.isDirectionSafe("move forwards"));
  EXPECT_TRUE(engine.isDirectionSafe("turn left"));
  EXPECT_TRUE(engine.isDirectionSafe("turn right", 2));
  EXPECT_FALSE(engine.isDirectionSafe("turn right", 3));
}

TEST(PathSafetyEngine, FarReadingsHaveNoInfluence) {
  PathSafetyEngine engine(SafetyConfig{}, std::make_shared<FakeSource>());
  const auto near = engine.evaluate(ScanBatch{{0.0, 0.5}});
  const auto with_far = engine.evaluate(ScanBatch{{0.0, 0.5}, {0.0, 5.0}, {90.0, 1.11}, {200.0, 30.0}});
  EXPECT_EQ(with_far.valid_paths, near.valid_paths);
  EXPECT_EQ(with_far.lidar_string, near.lidar_string);
  EXPECT_EQ(with_far.raw_scan.size(), 1u);
}

TEST(PathSafetyEngine, RestrictedMotionWithClearView) {
  SafetyConfig config;
  config.restricted_motion = true;
  auto src = std::make_shared<FakeSource>();
  src->setBatch(ScanBatch{{0.0, 3.0}, {90.0, 2.5}});
  PathSafetyEngine engine(config, src);

  engine.runCycle();
  EXPECT_EQ(engine.validPaths(), (std::vector<int>{4}));
  EXPECT_EQ(engine.lidarString(),
            "The safe movement directions are: {'turn left', 'turn right', 'move forwards', "
            "'stand still'}. ");
}

TEST(PathSafetyEngine, RestrictedMotionNeverReportsOtherCorridors) {
  SafetyConfig config;
  config.restricted_motion = true;
  PathSafetyEngine engine(config, std::make_shared<FakeSource>());

  std::mt19937 rng(3);
  std::uniform_real_distribution<double> angle(0.0, 360.0);
  std::uniform_real_distribution<double> dist(0.1, 1.5);
  for (int trial = 0; trial < 30; ++trial) {
    ScanBatch batch;
    for (int i = 0; i < 8; ++i) batch.push_back({angle(rng), dist(rng)});
    const auto snap = engine.evaluate(batch);
    EXPECT_TRUE(snap.valid_paths.empty() || snap.valid_paths == std::vector<int>{4});
  }
}

TEST(PathSafetyEngine, BlankedReadingIsIgnored) {
  SafetyConfig config;
  config.angles_blanked.push_back(AngleRange{-5.0, 5.0});
  PathSafetyEngine blanked(config, std::make_shared<FakeSource>());
  PathSafetyEngine open(SafetyConfig{}, std::make_shared<FakeSource>());

  const ScanBatch batch{{0.0, 0.5}};
  EXPECT_EQ(blanked.evaluate(batch).valid_paths, kAllPaths);
  EXPECT_TRUE(blanked.evaluate(batch).raw_scan.empty());

  const auto unblanked = open.evaluate(batch).valid_paths;
  EXPECT_EQ(std::count(unblanked.begin(), unblanked.end(), 4), 0);
}

TEST(PathSafetyEngine, ResultIsIndependentOfReadingOrder) {
  PathSafetyEngine engine(SafetyConfig{}, std::make_shared<FakeSource>());
  ScanBatch batch{{10.0, 0.9}, {300.0, 0.6}, {45.0, 0.7}, {170.0, 0.8}, {220.0, 1.0}};
  const auto expected = engine.evaluate(batch);

  std::mt19937 rng(11);
  for (int i = 0; i < 10; ++i) {
    std::shuffle(batch.begin(), batch.end(), rng);
    const auto s = engine.evaluate(batch);
    EXPECT_EQ(s.valid_paths, expected.valid_paths);
    EXPECT_EQ(s.lidar_string, expected.lidar_string);
  }
}

TEST(PathSafetyEngine, TransientFailureKeepsLastSnapshot) {
  auto src = std::make_shared<FakeSource>();
  src->setBatch(ScanBatch{{0.0, 0.5}});
  PathSafetyEngine engine(SafetyConfig{}, src);

  engine.runCycle();
  const auto before = engine.snapshot();

  src->failNext();
  EXPECT_NO_THROW(engine.runCycle());
  EXPECT_EQ(engine.snapshot(), before);

  engine.runCycle();
  EXPECT_EQ(engine.snapshot()->cycle, before->cycle + 1);
}

TEST(PathSafetyEngine, StartStopAreIdempotent) {
  auto src = std::make_shared<FakeSource>();
  src->setBatch(ScanBatch{{90.0, 0.5}});
  PathSafetyEngine engine(SafetyConfig{}, src);
  engine.setCyclePeriod(std::chrono::milliseconds(5));

  engine.start();
  engine.start();
  EXPECT_TRUE(engine.isRunning());
  EXPECT_TRUE(waitFor([&] { return engine.snapshot()->cycle >= 3; }, std::chrono::seconds(5)));
  EXPECT_EQ(engine.validPaths(), kAllPaths);

  engine.setCyclePeriod(std::chrono::milliseconds(1));
  const uint64_t seen = engine.snapshot()->cycle;
  EXPECT_TRUE(waitFor([&] { return engine.snapshot()->cycle >= seen + 3; }, std::chrono::seconds(5)));

  engine.stop();
  engine.stop();
  EXPECT_FALSE(engine.isRunning());
  EXPECT_EQ(src->close_calls.load(), 1);

  // frozen at the last value after stop
  const auto last = engine.snapshot();
  std::this_thread::sleep_for(std::chrono::milliseconds(30));
  EXPECT_EQ(engine.snapshot(), last);
}

TEST(PathSafetyEngine, StartAfterStopIsRefused) {
  auto src = std::make_shared<FakeSource>();
  src->setBatch(ScanBatch{{90.0, 0.5}});
  PathSafetyEngine engine(SafetyConfig{}, src);
  engine.setCyclePeriod(std::chrono::milliseconds(5));

  engine.start();
  EXPECT_TRUE(waitFor([&] { return engine.snapshot()->cycle >= 1; }, std::chrono::seconds(5)));
  engine.stop();
  const auto last = engine.snapshot();
  const int reads = src->next_calls.load();

  engine.start();
  EXPECT_FALSE(engine.isRunning());
  std::this_thread::sleep_for(std::chrono::milliseconds(30));
  EXPECT_EQ(engine.snapshot(), last);
  EXPECT_EQ(src->next_calls.load(), reads);
  EXPECT_EQ(src->close_calls.load(), 1);
}

TEST(PathSafetyEngine, StopInterruptsBlockedReadBeforeRelease) {
  auto src = std::make_shared<BlockingSource>();
  PathSafetyEngine engine(SafetyConfig{}, src);
  engine.start();
  ASSERT_TRUE(waitFor([&] { return src->reading.load(); }, std::chrono::seconds(5)));

  const auto t0 = std::chrono::steady_clock::now();
  engine.stop();
  const auto took = std::chrono::steady_clock::now() - t0;

  EXPECT_LT(took, PathSafetyEngine::kStopTimeout);
  EXPECT_TRUE(src->interrupted.load());
  EXPECT_FALSE(src->closed_while_reading.load());
  EXPECT_EQ(src->close_calls.load(), 1);
  EXPECT_FALSE(engine.isRunning());
}

TEST(PathSafetyEngine, StopSurvivesFailingRelease) {
  auto src = std::make_shared<FakeSource>();
  src->fail_close = true;
  PathSafetyEngine engine(SafetyConfig{}, src);
  engine.setCyclePeriod(std::chrono::milliseconds(5));
  engine.start();
  EXPECT_NO_THROW(engine.stop());
  EXPECT_EQ(src->close_calls.load(), 1);
  EXPECT_FALSE(engine.isRunning());
}

TEST(PathSafetyEngine, ReadersSeeCompleteSnapshots) {
  auto src = std::make_shared<FakeSource>();
  PathSafetyEngine engine(SafetyConfig{}, src);
  engine.setCyclePeriod(std::chrono::milliseconds(1));
  engine.start();

  std::atomic<bool> torn{false};
  std::thread reader([&] {
    for (int i = 0; i < 2000; ++i) {
      const auto snap = engine.snapshot();
      const bool surrounded = snap->lidar_string == kSurroundedMessage;
      if (surrounded != snap->valid_paths.empty()) torn = true;
      if (snap->has_data && snap->raw_scan.empty() && snap->valid_paths != kAllPaths) torn = true;
    }
  });
  for (int i = 0; i < 50; ++i) {
    if (i % 2 == 0) {
      src->setBatch(ScanBatch{{0.0, 0.5}});
    } else {
      src->setBatch(std::nullopt);
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(1));
  }
  reader.join();
  engine.stop();
  EXPECT_FALSE(torn.load());
}
