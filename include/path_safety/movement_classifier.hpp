#ifndef PATH_SAFETY__MOVEMENT_CLASSIFIER_HPP_
#define PATH_SAFETY__MOVEMENT_CLASSIFIER_HPP_

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace path_safety {

extern const char *const kSurroundedMessage;

enum class Direction { kTurnLeft, kTurnRight, kAdvance, kRetreat };

// Surviving corridor ids grouped by motion class.
struct MovementBuckets {
  std::vector<int> turn_left;
  std::vector<int> advance;
  std::vector<int> turn_right;
  std::vector<int> retreat;
  std::vector<int> all;  // every id given, in input order
};

MovementBuckets categorizePaths(const std::vector<int> &valid_paths);

/**
 * Natural language summary of the safe directions, e.g.
 *   "The safe movement directions are: {'turn left', 'stand still'}. "
 * Restricted motion robots can always spin in place, so both turns are listed.
 */
std::string describeMovement(const MovementBuckets &buckets, bool restricted_motion);

// "turn left", "turn right", "advance" / "move forwards", "retreat" / "move back"
std::optional<Direction> parseDirection(const std::string &name);

bool isDirectionSafe(const MovementBuckets &buckets, Direction direction,
                     std::size_t min_paths = 1);
// Unknown names are never safe.
bool isDirectionSafe(const MovementBuckets &buckets, const std::string &direction,
                     std::size_t min_paths = 1);

}  // namespace path_safety

#endif  // PATH_SAFETY__MOVEMENT_CLASSIFIER_HPP_
