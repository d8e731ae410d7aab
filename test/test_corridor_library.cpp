#include <gtest/gtest.h>

#include <stdexcept>

#include "path_safety/corridor_library.hpp"

using namespace path_safety;

TEST(CorridorLibrary, HasTenCorridorsWithTenSamples) {
  CorridorLibrary lib;
  ASSERT_EQ(lib.corridors().size(), 10u);
  for (int id = 0; id < kNumCorridors; ++id) {
    EXPECT_EQ(lib.corridor(id).id, id);
    EXPECT_EQ(lib.corridor(id).samples.size(), 10u);
  }
}

TEST(CorridorLibrary, MotionClassesFollowIds) {
  for (int id = 0; id <= 3; ++id) EXPECT_EQ(motionClassOf(id), MotionClass::kTurnLeft);
  EXPECT_EQ(motionClassOf(4), MotionClass::kAdvance);
  for (int id = 5; id <= 8; ++id) EXPECT_EQ(motionClassOf(id), MotionClass::kTurnRight);
  EXPECT_EQ(motionClassOf(9), MotionClass::kRetreat);
  EXPECT_THROW(motionClassOf(10), std::out_of_range);
  EXPECT_THROW(motionClassOf(-1), std::out_of_range);
}

TEST(CorridorLibrary, CurvesStartAtOriginAndEndAtControlPoint) {
  CorridorLibrary lib;
  for (const auto &c : lib.corridors()) {
    EXPECT_DOUBLE_EQ(c.samples.front().x, 0.0);
    EXPECT_DOUBLE_EQ(c.samples.front().y, 0.0);
  }
  EXPECT_DOUBLE_EQ(lib.corridor(0).samples.back().x, -0.75);
  EXPECT_DOUBLE_EQ(lib.corridor(0).samples.back().y, 0.40);
  EXPECT_DOUBLE_EQ(lib.corridor(4).samples.back().y, 1.05);
  EXPECT_DOUBLE_EQ(lib.corridor(5).samples.back().x, 0.35);
  EXPECT_DOUBLE_EQ(lib.corridor(5).samples.back().y, 1.03);
  EXPECT_DOUBLE_EQ(lib.corridor(9).samples.back().y, -1.05);
}

TEST(CorridorLibrary, AdvanceIsStraightAndRetreatMirrorsIt) {
  CorridorLibrary lib;
  const auto &fwd = lib.corridor(4);
  const auto &back = lib.corridor(9);
  for (size_t i = 0; i < kSamplesPerCorridor; ++i) {
    EXPECT_DOUBLE_EQ(fwd.samples[i].x, 0.0);
    EXPECT_NEAR(back.samples[i].y, -fwd.samples[i].y, 1e-12);
    if (i > 0) EXPECT_GT(fwd.samples[i].y, fwd.samples[i - 1].y);
  }
  // y(t) = t + 0.05 t^2
  EXPECT_NEAR(fwd.samples[4].y, 4.0 / 9.0 + 0.05 * 16.0 / 81.0, 1e-12);
}

TEST(CorridorLibrary, LeftAndRightTurnsAreMirrored) {
  CorridorLibrary lib;
  for (int left = 0; left <= 3; ++left) {
    const auto &l = lib.corridor(left);
    const auto &r = lib.corridor(8 - left);
    for (size_t i = 0; i < kSamplesPerCorridor; ++i) {
      EXPECT_NEAR(l.samples[i].x, -r.samples[i].x, 1e-12);
      EXPECT_NEAR(l.samples[i].y, r.samples[i].y, 1e-12);
    }
  }
}

TEST(QuadraticCurve, MidpointWeights) {
  const Point2D p = evaluateQuadraticCurve({0.0, 0.0}, {1.0, 2.0}, {4.0, 0.0}, 0.5);
  EXPECT_DOUBLE_EQ(p.x, 0.5 * 1.0 + 0.25 * 4.0);
  EXPECT_DOUBLE_EQ(p.y, 0.5 * 2.0);
}
