/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "ai/pathfinding/AxisPath.hpp"

namespace BurrowSim::AxisPath {

std::vector<GridCell> flatten(const GridCell &start,
                              const std::vector<GridCell> &waypoints) {
  std::vector<GridCell> cells;
  cells.push_back(start);
  GridCell cur = start;
  for (const GridCell &wp : waypoints) {
    while (cur.x != wp.x) {
      cur.x += (wp.x > cur.x) ? 1 : -1;
      cells.push_back(cur);
    }
    while (cur.y != wp.y) {
      cur.y += (wp.y > cur.y) ? 1 : -1;
      cells.push_back(cur);
    }
  }
  return cells;
}

std::optional<GridCell> firstStep(const GridCell &start,
                                  const std::vector<GridCell> &waypoints) {
  for (const GridCell &wp : waypoints) {
    if (wp.x != start.x) {
      return GridCell(start.x + (wp.x > start.x ? 1 : -1), start.y);
    }
    if (wp.y != start.y) {
      return GridCell(start.x, start.y + (wp.y > start.y ? 1 : -1));
    }
  }
  return std::nullopt;
}

} // namespace BurrowSim::AxisPath
