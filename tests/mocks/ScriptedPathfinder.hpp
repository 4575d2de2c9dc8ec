/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef TESTS_MOCKS_SCRIPTED_PATHFINDER_HPP
#define TESTS_MOCKS_SCRIPTED_PATHFINDER_HPP

#include "ai/pathfinding/Pathfinder.hpp"
#include <vector>

// Returns a fixed answer and remembers the last request
class ScriptedPathfinder : public BurrowSim::IPathfinder {
public:
    BurrowSim::PathfindingResult findPath(
        const BurrowSim::GridCell& start, const BurrowSim::GridCell& goal,
        const BurrowSim::TraversalPredicate& canTraverse,
        std::vector<BurrowSim::GridCell>& outWaypoints) override {
        ++calls;
        lastStart = start;
        lastGoal = goal;
        hadPredicate = static_cast<bool>(canTraverse);
        outWaypoints = waypoints;
        return result;
    }

    BurrowSim::PathfindingResult result{BurrowSim::PathfindingResult::NO_PATH_FOUND};
    std::vector<BurrowSim::GridCell> waypoints;
    int calls{0};
    BurrowSim::GridCell lastStart;
    BurrowSim::GridCell lastGoal;
    bool hadPredicate{false};
};

#endif // TESTS_MOCKS_SCRIPTED_PATHFINDER_HPP
