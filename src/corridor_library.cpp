#include "path_safety/corridor_library.hpp"

#include <stdexcept>
#include <string>

namespace path_safety {

namespace {

struct ControlPoints {
  Point2D mid;
  Point2D end;
};

// Achievable motion envelope. x: left(-)/right(+), y: backwards(-)/forwards(+)
constexpr std::array<ControlPoints, kNumCorridors> kControlPoints{{
  {{-0.3,  0.5}, {-0.75,  0.40}},
  {{-0.3,  0.6}, {-0.70,  0.70}},
  {{-0.2,  0.7}, {-0.60,  0.90}},
  {{-0.1,  0.7}, {-0.35,  1.03}},
  {{ 0.0,  0.5}, { 0.00,  1.05}},
  {{ 0.1,  0.7}, { 0.35,  1.03}},
  {{ 0.2,  0.7}, { 0.60,  0.90}},
  {{ 0.3,  0.6}, { 0.70,  0.70}},
  {{ 0.3,  0.5}, { 0.75,  0.40}},
  {{ 0.0, -0.5}, { 0.00, -1.05}},
}};

}  // namespace

Point2D evaluateQuadraticCurve(const Point2D &p0, const Point2D &p1, const Point2D &p2, double t) {
  const double u = 1.0 - t;
  const double b0 = u * u;
  const double b1 = 2.0 * u * t;
  const double b2 = t * t;
  return Point2D{b0 * p0.x + b1 * p1.x + b2 * p2.x,
                 b0 * p0.y + b1 * p1.y + b2 * p2.y};
}

MotionClass motionClassOf(int id) {
  if (id < 0 || id >= kNumCorridors) {
    throw std::out_of_range("corridor id out of range: " + std::to_string(id));
  }
  if (id < kAdvanceCorridor) return MotionClass::kTurnLeft;
  if (id == kAdvanceCorridor) return MotionClass::kAdvance;
  if (id < kRetreatCorridor) return MotionClass::kTurnRight;
  return MotionClass::kRetreat;
}

CorridorLibrary::CorridorLibrary() {
  const Point2D origin{0.0, 0.0};
  const double step = 1.0 / static_cast<double>(kSamplesPerCorridor - 1);

  for (int id = 0; id < kNumCorridors; ++id) {
    Corridor &c = corridors_[id];
    c.id = id;
    c.motion = motionClassOf(id);
    const auto &cp = kControlPoints[id];
    for (size_t i = 0; i < kSamplesPerCorridor; ++i) {
      // last sample pinned to t = 1 so the end point is exact
      const double t = (i + 1 == kSamplesPerCorridor) ? 1.0 : i * step;
      c.samples[i] = evaluateQuadraticCurve(origin, cp.mid, cp.end, t);
    }
  }
}

const Corridor &CorridorLibrary::corridor(int id) const {
  if (id < 0 || id >= kNumCorridors) {
    throw std::out_of_range("corridor id out of range: " + std::to_string(id));
  }
  return corridors_[id];
}

}  // namespace path_safety
