/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef AXIS_PATH_HPP
#define AXIS_PATH_HPP

#include "core/GridTypes.hpp"
#include <optional>
#include <vector>

namespace BurrowSim::AxisPath {

/**
 * @brief Expands waypoints into unit cardinal steps.
 *
 * Each waypoint leg is walked horizontally first, then vertically. The
 * result starts with `start` and never repeats a cell consecutively.
 */
std::vector<GridCell> flatten(const GridCell &start,
                              const std::vector<GridCell> &waypoints);

// First cell after `start`, or nullopt when already at the end
std::optional<GridCell> firstStep(const GridCell &start,
                                  const std::vector<GridCell> &waypoints);

} // namespace BurrowSim::AxisPath

#endif // AXIS_PATH_HPP
