/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef PATHFINDER_HPP
#define PATHFINDER_HPP

#include "core/GridTypes.hpp"
#include <functional>
#include <ostream>
#include <vector>

namespace BurrowSim {

enum class PathfindingResult {
  SUCCESS,
  NO_PATH_FOUND,
  INVALID_START,
  INVALID_GOAL,
  TIMEOUT
};

// Stream operator for PathfindingResult to support test output
inline std::ostream &operator<<(std::ostream &os,
                                const PathfindingResult &result) {
  switch (result) {
  case PathfindingResult::SUCCESS:
    return os << "SUCCESS";
  case PathfindingResult::NO_PATH_FOUND:
    return os << "NO_PATH_FOUND";
  case PathfindingResult::INVALID_START:
    return os << "INVALID_START";
  case PathfindingResult::INVALID_GOAL:
    return os << "INVALID_GOAL";
  case PathfindingResult::TIMEOUT:
    return os << "TIMEOUT";
  default:
    return os << "UNKNOWN";
  }
}

// Returns true when the cell may be entered by the requesting agent
using TraversalPredicate = std::function<bool(const GridCell &)>;

/**
 * @brief Route query used by every moving agent.
 *
 * On SUCCESS outWaypoints starts with the start cell and ends with the goal.
 * Consecutive waypoints may be several cells apart; AxisPath expands them
 * into single steps.
 */
class IPathfinder {
public:
  virtual ~IPathfinder() = default;

  virtual PathfindingResult findPath(const GridCell &start,
                                     const GridCell &goal,
                                     const TraversalPredicate &canTraverse,
                                     std::vector<GridCell> &outWaypoints) = 0;
};

} // namespace BurrowSim

#endif // PATHFINDER_HPP
