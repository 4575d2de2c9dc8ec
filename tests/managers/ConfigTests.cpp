/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE ConfigTests
#include <boost/test/unit_test.hpp>

#include "core/Logger.hpp"
#include "core/Season.hpp"
#include "core/SimulationConfig.hpp"
#include "managers/SpeciesCatalog.hpp"

using namespace BurrowSim;

struct QuietFixture {
    QuietFixture() { BURROW_ENABLE_BENCHMARK_MODE(); }
    ~QuietFixture() { BURROW_DISABLE_BENCHMARK_MODE(); }
};

BOOST_FIXTURE_TEST_SUITE(SpeciesCatalogTests, QuietFixture)

BOOST_AUTO_TEST_CASE(TestBuiltInDefaults) {
    SpeciesCatalog catalog;
    const auto coyote = catalog.get(Species::Coyote);
    const auto hawk = catalog.get(Species::Hawk);
    BOOST_REQUIRE(coyote && hawk);

    BOOST_CHECK_EQUAL(coyote->name, "Coyote");
    BOOST_CHECK(coyote->predatorVariant == PredatorVariant::Tiring);
    BOOST_CHECK(hawk->predatorVariant == PredatorVariant::Dashing);
    BOOST_CHECK(hawk->canCrossWater);
    BOOST_CHECK_LT(coyote->priorityTier, hawk->priorityTier);
    BOOST_CHECK_EQUAL(catalog.get(Species::Rabbit)->moveCadence, 2);
    BOOST_CHECK(catalog.get(Species::COUNT) == nullptr);
}

BOOST_AUTO_TEST_CASE(TestPartialOverride) {
    SpeciesCatalog catalog;
    const std::string json = R"({
        "species": [
            {"name": "Rabbit", "detectionRadius": 9, "targetFood": "Clover"},
            {"name": "Hawk", "predatorVariant": "Standard"}
        ]
    })";
    BOOST_REQUIRE(catalog.loadFromString(json));
    BOOST_CHECK_EQUAL(catalog.getWarningCount(), 0u);

    const auto rabbit = catalog.get(Species::Rabbit);
    BOOST_CHECK_EQUAL(rabbit->detectionRadius, 9);
    BOOST_CHECK_EQUAL(rabbit->targetFood, "Clover");
    BOOST_CHECK_EQUAL(rabbit->fleeDistance, 3);
    BOOST_CHECK(catalog.get(Species::Hawk)->predatorVariant == PredatorVariant::Standard);
}

BOOST_AUTO_TEST_CASE(TestInvalidFieldsKeepPreviousValue) {
    SpeciesCatalog catalog;
    const std::string json = R"({
        "species": [
            {"name": "Rabbit", "detectionRadius": "far", "moveCadence": 0,
             "canCrossWater": 1, "predatorVariant": "Sneaky"},
            {"name": "Dragon", "maxHunger": 500}
        ]
    })";
    BOOST_REQUIRE(catalog.loadFromString(json));
    BOOST_CHECK_EQUAL(catalog.getWarningCount(), 5u);

    const auto rabbit = catalog.get(Species::Rabbit);
    BOOST_CHECK_EQUAL(rabbit->detectionRadius, 7);
    BOOST_CHECK_EQUAL(rabbit->moveCadence, 2);
    BOOST_CHECK(!rabbit->canCrossWater);
}

BOOST_AUTO_TEST_CASE(TestWanderRadiusAndHungerAreNormalised) {
    SpeciesCatalog catalog;
    BOOST_REQUIRE(catalog.loadFromString(
        R"({"species": [{"name": "Rabbit", "wanderRadiusMin": 5, "wanderRadiusMax": 2,
                         "maxHunger": 40}]})"));
    const auto rabbit = catalog.get(Species::Rabbit);
    BOOST_CHECK_EQUAL(rabbit->wanderRadiusMax, 5);
    BOOST_CHECK_EQUAL(rabbit->initialHunger, 40);
}

BOOST_AUTO_TEST_CASE(TestMalformedDocuments) {
    SpeciesCatalog catalog;
    BOOST_CHECK(!catalog.loadFromString("{\"species\": [}"));
    BOOST_CHECK(!catalog.getLastError().empty());

    BOOST_CHECK(!catalog.loadFromString(R"({"animals": []})"));
    BOOST_CHECK(!catalog.getLastError().empty());

    BOOST_CHECK(!catalog.loadFromFile("does/not/exist.json"));
}

BOOST_AUTO_TEST_CASE(TestReloadDoesNotTouchHeldParams) {
    SpeciesCatalog catalog;
    const auto before = catalog.get(Species::Coyote);
    BOOST_REQUIRE(catalog.loadFromString(
        R"({"species": [{"name": "Coyote", "detectionRadius": 2}]})"));
    BOOST_CHECK_EQUAL(before->detectionRadius, 6);
    BOOST_CHECK_EQUAL(catalog.get(Species::Coyote)->detectionRadius, 2);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_FIXTURE_TEST_SUITE(SimulationConfigTests, QuietFixture)

BOOST_AUTO_TEST_CASE(TestDefaults) {
    SimulationConfig config;
    BOOST_CHECK_EQUAL(config.turnsPerSeason, 50);
    BOOST_CHECK_EQUAL(config.mvpWorkerGoal, 20);
    BOOST_CHECK_EQUAL(config.maxWorkersPerDen, 5);
    BOOST_CHECK(!config.fixedWorkerBonusRate.has_value());
}

BOOST_AUTO_TEST_CASE(TestOverlayFromJson) {
    SimulationConfig config;
    BOOST_REQUIRE(SimulationConfig::loadFromString(
        R"({"rngSeed": 99, "turnsPerSeason": 10, "maxWorkersPerDen": -2,
            "fixedWorkerBonusRate": 1.5, "tileSize": 16})",
        config));
    BOOST_CHECK_EQUAL(config.rngSeed, 99u);
    BOOST_CHECK_EQUAL(config.turnsPerSeason, 10);
    BOOST_CHECK_EQUAL(config.maxWorkersPerDen, 5);
    BOOST_REQUIRE(config.fixedWorkerBonusRate.has_value());
    BOOST_CHECK_CLOSE(*config.fixedWorkerBonusRate, 1.0f, 0.001f);
    BOOST_CHECK_CLOSE(config.tileSize, 16.0f, 0.001f);
}

BOOST_AUTO_TEST_CASE(TestNullClearsBonusOverride) {
    SimulationConfig config;
    config.fixedWorkerBonusRate = 0.5f;
    BOOST_REQUIRE(SimulationConfig::loadFromString(
        R"({"fixedWorkerBonusRate": null})", config));
    BOOST_CHECK(!config.fixedWorkerBonusRate.has_value());
}

BOOST_AUTO_TEST_CASE(TestUnparseableConfig) {
    SimulationConfig config;
    BOOST_CHECK(!SimulationConfig::loadFromString("not json", config));
    BOOST_CHECK_EQUAL(config.turnsPerSeason, 50);
}

BOOST_AUTO_TEST_CASE(TestSeasonForTurn) {
    BOOST_CHECK_EQUAL(seasonForTurn(0, 50), Season::Spring);
    BOOST_CHECK_EQUAL(seasonForTurn(49, 50), Season::Spring);
    BOOST_CHECK_EQUAL(seasonForTurn(50, 50), Season::Summer);
    BOOST_CHECK_EQUAL(seasonForTurn(150, 50), Season::Winter);
    BOOST_CHECK_EQUAL(seasonForTurn(200, 50), Season::Spring);
    BOOST_CHECK_EQUAL(seasonForTurn(75, 0), Season::Spring);
}

BOOST_AUTO_TEST_SUITE_END()
