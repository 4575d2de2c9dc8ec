/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE WorldTests
#include <boost/test/unit_test.hpp>

#include "core/Logger.hpp"
#include "managers/HideableDirectory.hpp"
#include "world/Hideable.hpp"
#include "world/TileGrid.hpp"
#include <memory>
#include <stdexcept>

using namespace BurrowSim;

struct QuietLogFixture {
    QuietLogFixture() { BURROW_ENABLE_BENCHMARK_MODE(); }
    ~QuietLogFixture() { BURROW_DISABLE_BENCHMARK_MODE(); }
};

// ============================================================================
// TILE GRID
// ============================================================================

BOOST_FIXTURE_TEST_SUITE(TileGridTests, QuietLogFixture)

BOOST_AUTO_TEST_CASE(TestRejectsBadDimensions) {
    BOOST_CHECK_THROW(TileGrid(0, 5), std::invalid_argument);
    BOOST_CHECK_THROW(TileGrid(5, -1), std::invalid_argument);
    BOOST_CHECK_THROW(TileGrid(5, 5, 0.0f), std::invalid_argument);
}

BOOST_AUTO_TEST_CASE(TestWalkabilityByTileKind) {
    TileGrid grid(4, 3);
    grid.setTile({1, 1}, TileKind::Rock);
    grid.setTile({2, 1}, TileKind::Water);
    grid.setBlocked({3, 2}, true);

    BOOST_CHECK(grid.isWalkable({0, 0}));
    BOOST_CHECK(!grid.isWalkable({1, 1}));
    // Water is walkable terrain; species rules decide who may enter it
    BOOST_CHECK(grid.isWalkable({2, 1}));
    BOOST_CHECK(grid.isWater({2, 1}));
    BOOST_CHECK(!grid.isWalkable({3, 2}));
    BOOST_CHECK(!grid.isWalkable({4, 0}));
    BOOST_CHECK(!grid.isValid({-1, 0}));
    BOOST_CHECK_EQUAL(grid.getTileKind({9, 9}), TileKind::Rock);
    BOOST_CHECK(!grid.isWater({9, 9}));

    grid.setBlocked({3, 2}, false);
    BOOST_CHECK(grid.isWalkable({3, 2}));
}

BOOST_AUTO_TEST_CASE(TestFillRectClipsToGrid) {
    TileGrid grid(3, 3);
    grid.fillRect({2, 2}, 5, 5, TileKind::Sand);
    BOOST_CHECK_EQUAL(grid.getTileKind({2, 2}), TileKind::Sand);
    BOOST_CHECK_EQUAL(grid.getTileKind({1, 1}), TileKind::Grass);
}

BOOST_AUTO_TEST_CASE(TestWorldConversions) {
    TileGrid grid(8, 8, 16.0f);
    const WorldPoint centre = grid.gridToWorld({2, 3});
    BOOST_CHECK_CLOSE(centre.x, 40.0f, 0.001f);
    BOOST_CHECK_CLOSE(centre.y, 56.0f, 0.001f);

    BOOST_CHECK(grid.worldToGrid(centre) == GridCell(2, 3));
    BOOST_CHECK(grid.worldToGrid(WorldPoint{15.9f, 0.0f}) == GridCell(0, 0));
    BOOST_CHECK(grid.worldToGrid(WorldPoint{-0.5f, 16.0f}) == GridCell(-1, 1));
}

BOOST_AUTO_TEST_SUITE_END()

// ============================================================================
// SHELTERS
// ============================================================================

BOOST_FIXTURE_TEST_SUITE(ShelterTests, QuietLogFixture)

BOOST_AUTO_TEST_CASE(TestCapacityLimitsEntry) {
    Shelter bush(HideableKind::Bush, {1, 1}, 1);
    BOOST_CHECK(bush.canEnter(7));
    bush.onEnter(7);
    BOOST_CHECK(bush.contains(7));
    BOOST_CHECK(!bush.canEnter(8));
    // Re-entry by an occupant is allowed
    BOOST_CHECK(bush.canEnter(7));

    bush.onEnter(8);
    BOOST_CHECK_EQUAL(bush.getOccupantCount(), 1u);

    bush.onLeave(7);
    BOOST_CHECK(bush.canEnter(8));
}

BOOST_AUTO_TEST_CASE(TestPredatorDenNeverShelters) {
    Shelter den(HideableKind::PredatorDen, {0, 0});
    BOOST_CHECK(!den.canEnter(3));
    den.onEnter(3);
    BOOST_CHECK_EQUAL(den.getOccupantCount(), 0u);
}

BOOST_AUTO_TEST_CASE(TestSafeDenKinds) {
    BOOST_CHECK(isSafeDenKind(HideableKind::Den));
    BOOST_CHECK(isSafeDenKind(HideableKind::Burrow));
    BOOST_CHECK(!isSafeDenKind(HideableKind::Bush));
    BOOST_CHECK(!isSafeDenKind(HideableKind::PredatorDen));
}

BOOST_AUTO_TEST_SUITE_END()

// ============================================================================
// HIDEABLE DIRECTORY
// ============================================================================

BOOST_FIXTURE_TEST_SUITE(HideableDirectoryTests, QuietLogFixture)

BOOST_AUTO_TEST_CASE(TestRegisterAndFind) {
    HideableDirectory directory;
    auto den = std::make_shared<Shelter>(HideableKind::Den, GridCell(2, 2));
    const HideableId id = directory.registerHideable(den);

    BOOST_CHECK_NE(id, INVALID_HIDEABLE_ID);
    BOOST_CHECK_EQUAL(directory.find(id), den.get());
    BOOST_CHECK(directory.find(id + 100) == nullptr);
    BOOST_CHECK_EQUAL(directory.size(), 1u);
    BOOST_CHECK_EQUAL(directory.registerHideable(nullptr), INVALID_HIDEABLE_ID);
}

BOOST_AUTO_TEST_CASE(TestExpiredHideableStopsResolving) {
    HideableDirectory directory;
    auto bush = std::make_shared<Shelter>(HideableKind::Bush, GridCell(1, 0));
    const HideableId id = directory.registerHideable(bush);

    bush.reset();
    BOOST_CHECK(directory.find(id) == nullptr);
    BOOST_CHECK(!directory.findAt({1, 0}).has_value());
}

BOOST_AUTO_TEST_CASE(TestFindAtPrefersEarliestAndFiltersKind) {
    HideableDirectory directory;
    auto bush = std::make_shared<Shelter>(HideableKind::Bush, GridCell(3, 3));
    auto burrow = std::make_shared<Shelter>(HideableKind::Burrow, GridCell(3, 3));
    const HideableId bushId = directory.registerHideable(bush);
    const HideableId burrowId = directory.registerHideable(burrow);

    BOOST_CHECK_EQUAL(*directory.findAt({3, 3}), bushId);
    BOOST_CHECK_EQUAL(*directory.findAt({3, 3}, HideableKind::Burrow), burrowId);
    BOOST_CHECK(!directory.findAt({3, 3}, HideableKind::Den).has_value());
    BOOST_CHECK(directory.isSafeDenTile({3, 3}));
    BOOST_CHECK(!directory.isSafeDenTile({0, 0}));

    directory.unregisterHideable(burrowId);
    BOOST_CHECK(!directory.isSafeDenTile({3, 3}));
    BOOST_CHECK_EQUAL(directory.getAllIds().size(), 1u);

    directory.clear();
    BOOST_CHECK_EQUAL(directory.size(), 0u);
}

BOOST_AUTO_TEST_SUITE_END()
