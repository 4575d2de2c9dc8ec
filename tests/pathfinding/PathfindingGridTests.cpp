/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE PathfindingGridTests
#include <boost/test/unit_test.hpp>

#include "ai/pathfinding/AxisPath.hpp"
#include "ai/pathfinding/PathfindingGrid.hpp"
#include "core/Logger.hpp"
#include "world/TileGrid.hpp"
#include <vector>

using namespace BurrowSim;

struct PathfindingFixture {
    PathfindingFixture() : grid(5, 5), pathfinder(grid) {
        BURROW_ENABLE_BENCHMARK_MODE();
    }
    ~PathfindingFixture() { BURROW_DISABLE_BENCHMARK_MODE(); }

    TileGrid grid;
    PathfindingGrid pathfinder;
    std::vector<GridCell> path;
};

BOOST_FIXTURE_TEST_SUITE(AStarTests, PathfindingFixture)

BOOST_AUTO_TEST_CASE(TestStraightLineCollapsesToEndpoints) {
    BOOST_REQUIRE_EQUAL(pathfinder.findPath({0, 0}, {4, 0}, {}, path),
                        PathfindingResult::SUCCESS);
    BOOST_REQUIRE_EQUAL(path.size(), 2u);
    BOOST_CHECK(path.front() == GridCell(0, 0));
    BOOST_CHECK(path.back() == GridCell(4, 0));
}

BOOST_AUTO_TEST_CASE(TestRoutesAroundRock) {
    // Wall at x = 2 with a gap at the bottom row
    grid.fillRect({2, 0}, 1, 4, TileKind::Rock);

    BOOST_REQUIRE_EQUAL(pathfinder.findPath({0, 0}, {4, 0}, {}, path),
                        PathfindingResult::SUCCESS);
    BOOST_CHECK(path.front() == GridCell(0, 0));
    BOOST_CHECK(path.back() == GridCell(4, 0));

    const auto cells = AxisPath::flatten(path.front(), path);
    // 4 down, 4 across, 4 up
    BOOST_CHECK_EQUAL(cells.size(), 13u);
    for (const GridCell& cell : cells) {
        BOOST_CHECK(grid.isWalkable(cell));
    }
}

BOOST_AUTO_TEST_CASE(TestStartEqualsGoal) {
    BOOST_REQUIRE_EQUAL(pathfinder.findPath({1, 1}, {1, 1}, {}, path),
                        PathfindingResult::SUCCESS);
    BOOST_REQUIRE_EQUAL(path.size(), 1u);
    BOOST_CHECK(path.front() == GridCell(1, 1));
}

BOOST_AUTO_TEST_CASE(TestInvalidEndpoints) {
    grid.setTile({3, 3}, TileKind::Rock);
    BOOST_CHECK_EQUAL(pathfinder.findPath({-1, 0}, {2, 2}, {}, path),
                      PathfindingResult::INVALID_START);
    BOOST_CHECK_EQUAL(pathfinder.findPath({0, 0}, {3, 3}, {}, path),
                      PathfindingResult::INVALID_GOAL);
    BOOST_CHECK_EQUAL(pathfinder.findPath({0, 0}, {9, 9}, {}, path),
                      PathfindingResult::INVALID_GOAL);
    BOOST_CHECK(path.empty());
    BOOST_CHECK_EQUAL(pathfinder.getStats().invalidStarts, 1u);
    BOOST_CHECK_EQUAL(pathfinder.getStats().invalidGoals, 2u);
}

BOOST_AUTO_TEST_CASE(TestEnclosedGoalHasNoPath) {
    grid.setTile({3, 2}, TileKind::Rock);
    grid.setTile({4, 1}, TileKind::Rock);
    grid.setTile({4, 3}, TileKind::Rock);
    BOOST_CHECK_EQUAL(pathfinder.findPath({0, 0}, {4, 2}, {}, path),
                      PathfindingResult::NO_PATH_FOUND);
}

BOOST_AUTO_TEST_CASE(TestTraversalPredicateBlocksWater) {
    grid.fillRect({2, 0}, 1, 5, TileKind::Water);
    auto dryOnly = [this](const GridCell& cell) { return !grid.isWater(cell); };

    BOOST_CHECK_EQUAL(pathfinder.findPath({0, 2}, {4, 2}, dryOnly, path),
                      PathfindingResult::NO_PATH_FOUND);
    BOOST_CHECK_EQUAL(pathfinder.findPath({0, 2}, {4, 2}, {}, path),
                      PathfindingResult::SUCCESS);
}

BOOST_AUTO_TEST_CASE(TestIterationCapReportsTimeout) {
    pathfinder.setMaxIterations(1);
    BOOST_CHECK_EQUAL(pathfinder.findPath({0, 0}, {4, 4}, {}, path),
                      PathfindingResult::TIMEOUT);
    BOOST_CHECK_EQUAL(pathfinder.getStats().timeouts, 1u);
}

BOOST_AUTO_TEST_CASE(TestRepeatedRequestsAreIdentical) {
    grid.setTile({2, 2}, TileKind::Rock);
    std::vector<GridCell> first;
    std::vector<GridCell> second;
    BOOST_REQUIRE_EQUAL(pathfinder.findPath({0, 0}, {4, 4}, {}, first),
                        PathfindingResult::SUCCESS);
    BOOST_REQUIRE_EQUAL(pathfinder.findPath({0, 0}, {4, 4}, {}, second),
                        PathfindingResult::SUCCESS);
    BOOST_CHECK(first == second);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(AxisPathTests)

BOOST_AUTO_TEST_CASE(TestFlattenWalksHorizontalThenVertical) {
    const auto cells = AxisPath::flatten({0, 0}, {{0, 0}, {2, 1}});
    const std::vector<GridCell> expected{{0, 0}, {1, 0}, {2, 0}, {2, 1}};
    BOOST_CHECK(cells == expected);
}

BOOST_AUTO_TEST_CASE(TestFlattenFollowsEveryLeg) {
    const auto cells = AxisPath::flatten({3, 3}, {{3, 3}, {3, 1}, {1, 1}});
    const std::vector<GridCell> expected{{3, 3}, {3, 2}, {3, 1}, {2, 1}, {1, 1}};
    BOOST_CHECK(cells == expected);
}

BOOST_AUTO_TEST_CASE(TestFirstStep) {
    auto step = AxisPath::firstStep({2, 2}, {{2, 2}, {2, 0}});
    BOOST_REQUIRE(step.has_value());
    BOOST_CHECK(*step == GridCell(2, 1));

    step = AxisPath::firstStep({2, 2}, {{4, 5}});
    BOOST_REQUIRE(step.has_value());
    BOOST_CHECK(*step == GridCell(3, 2));

    BOOST_CHECK(!AxisPath::firstStep({2, 2}, {{2, 2}}).has_value());
    BOOST_CHECK(!AxisPath::firstStep({2, 2}, {}).has_value());
}

BOOST_AUTO_TEST_SUITE_END()
