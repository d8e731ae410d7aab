#include "path_safety/movement_classifier.hpp"

#include "path_safety/types.hpp"

namespace path_safety {

const char *const kSurroundedMessage =
  "You are surrounded by objects and cannot safely move in any direction. DO NOT MOVE.";

MovementBuckets categorizePaths(const std::vector<int> &valid_paths) {
  MovementBuckets b;
  b.all = valid_paths;
  for (int id : valid_paths) {
    if (id < 0 || id >= kNumCorridors) continue;
    if (id < kAdvanceCorridor) {
      b.turn_left.push_back(id);
    } else if (id == kAdvanceCorridor) {
      b.advance.push_back(id);
    } else if (id < kRetreatCorridor) {
      b.turn_right.push_back(id);
    } else {
      b.retreat.push_back(id);
    }
  }
  return b;
}

std::string describeMovement(const MovementBuckets &buckets, bool restricted_motion) {
  if (buckets.all.empty()) return kSurroundedMessage;

  std::string s = "The safe movement directions are: {";
  auto add = [&s](const char *item) {
    s += "'";
    s += item;
    s += "', ";
  };

  if (restricted_motion) {
    add("turn left");
    add("turn right");
    if (!buckets.advance.empty()) add("move forwards");
  } else {
    if (!buckets.turn_left.empty()) add("turn left");
    if (!buckets.advance.empty()) add("move forwards");
    if (!buckets.turn_right.empty()) add("turn right");
    if (!buckets.retreat.empty()) add("move back");
  }
  s += "'stand still'}. ";
  return s;
}

std::optional<Direction> parseDirection(const std::string &name) {
  if (name == "turn left") return Direction::kTurnLeft;
  if (name == "turn right") return Direction::kTurnRight;
  if (name == "advance" || name == "move forwards") return Direction::kAdvance;
  if (name == "retreat" || name == "move back") return Direction::kRetreat;
  return std::nullopt;
}

bool isDirectionSafe(const MovementBuckets &buckets, Direction direction, std::size_t min_paths) {
  switch (direction) {
    case Direction::kTurnLeft:  return buckets.turn_left.size() >= min_paths;
    case Direction::kTurnRight: return buckets.turn_right.size() >= min_paths;
    case Direction::kAdvance:   return buckets.advance.size() >= min_paths;
    case Direction::kRetreat:   return buckets.retreat.size() >= min_paths;
  }
  return false;
}

bool isDirectionSafe(const MovementBuckets &buckets, const std::string &direction,
                     std::size_t min_paths) {
  const auto d = parseDirection(direction);
  return d ? isDirectionSafe(buckets, *d, min_paths) : false;
}

}  // namespace path_safety
