/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE PredatorBehaviorTests
#include <boost/test/unit_test.hpp>

#include "../mocks/SimulationTestFixture.hpp"
#include "ai/behaviors/PredatorBehavior.hpp"

using namespace BurrowSim;

struct PredatorFixture : SimulationTestFixture {
    // One full scheduler-style step for a single predator
    void step(AgentId id) {
        auto ctx = context(++turn);
        registry.beginStep(id);
        behavior.takeTurn(ctx, agent(id));
        if (registry.isAlive(id)) {
            registry.resolveMoveConflict(id);
        }
    }

    static std::shared_ptr<const SpeciesParams> standardCoyote() {
        return params(Species::Coyote, [](SpeciesParams& p) {
            p.predatorVariant = PredatorVariant::Standard;
            p.moveCadence = 1;
        });
    }

    PredatorBehavior behavior;
    int turn{0};
};

// ============================================================================
// TARGET RULES
// ============================================================================

BOOST_FIXTURE_TEST_SUITE(TargetTests, PredatorFixture)

BOOST_AUTO_TEST_CASE(TestPriorityTiers) {
    const AgentId coyote = spawn(params(Species::Coyote), {1, 1});
    const AgentId hawk = spawn(params(Species::Hawk), {2, 2});
    const AgentId otherHawk = spawn(params(Species::Hawk), {3, 3});
    const AgentId rabbit = spawn(params(Species::Rabbit), {4, 4});
    auto ctx = context();

    BOOST_CHECK(PredatorBehavior::isValidTarget(ctx, agent(hawk), agent(coyote)));
    BOOST_CHECK(!PredatorBehavior::isValidTarget(ctx, agent(coyote), agent(hawk)));
    BOOST_CHECK(!PredatorBehavior::isValidTarget(ctx, agent(hawk), agent(otherHawk)));
    BOOST_CHECK(!PredatorBehavior::isValidTarget(ctx, agent(hawk), agent(hawk)));
    BOOST_CHECK(PredatorBehavior::isValidTarget(ctx, agent(coyote), agent(rabbit)));
}

BOOST_AUTO_TEST_CASE(TestShelteredAndDenTileTargetsAreSafe) {
    const HideableId bush = addShelter(HideableKind::Bush, {4, 4});
    addShelter(HideableKind::Burrow, {6, 6});
    const AgentId coyote = spawn(params(Species::Coyote), {1, 1});
    const AgentId hidden = spawn(params(Species::Rabbit), {4, 4});
    const AgentId onDen = spawn(params(Species::Rabbit), {6, 6});
    BOOST_REQUIRE(registry.enterHideable(hidden, bush));
    auto ctx = context();

    BOOST_CHECK(!PredatorBehavior::isValidTarget(ctx, agent(coyote), agent(hidden)));
    BOOST_CHECK(!PredatorBehavior::isValidTarget(ctx, agent(coyote), agent(onDen)));
}

BOOST_AUTO_TEST_CASE(TestHuntReducesGroupBeforeRemoving) {
    const AgentId coyote = spawn(standardCoyote(), {5, 5});
    const AgentId herd = spawn(params(Species::Rabbit, [](SpeciesParams& p) {
        p.initialGroupCount = 2;
    }), {5, 5});
    auto ctx = context();

    BOOST_CHECK(PredatorBehavior::tryHunt(ctx, agent(coyote)));
    BOOST_REQUIRE(registry.isAlive(herd));
    BOOST_CHECK_EQUAL(agent(herd).getGroupCount(), 1);

    agent(coyote).setStallTurns(0);
    BOOST_CHECK(PredatorBehavior::tryHunt(ctx, agent(coyote)));
    BOOST_CHECK(!registry.isAlive(herd));
}

BOOST_AUTO_TEST_CASE(TestHuntOnDenTileIsVoid) {
    addShelter(HideableKind::Den, {5, 5});
    const AgentId coyote = spawn(standardCoyote(), {5, 5});
    const AgentId rabbit = spawn(params(Species::Rabbit), {5, 5});
    auto ctx = context();

    BOOST_CHECK(!PredatorBehavior::tryHunt(ctx, agent(coyote)));
    BOOST_CHECK(registry.isAlive(rabbit));
    BOOST_CHECK_EQUAL(agent(coyote).getStallTurns(), 0);
}

BOOST_AUTO_TEST_SUITE_END()

// ============================================================================
// CHASE AND PREDATION
// ============================================================================

BOOST_FIXTURE_TEST_SUITE(ChaseTests, PredatorFixture)

BOOST_AUTO_TEST_CASE(TestChaseCatchesStationaryPrey) {
    const AgentId coyote = spawn(standardCoyote(), {0, 0});
    const AgentId rabbit = spawn(params(Species::Rabbit), {3, 0});
    agent(coyote).setHunger(50);

    step(coyote);
    BOOST_CHECK(agent(coyote).getPosition() == GridCell(1, 0));
    BOOST_CHECK_EQUAL(agent(coyote).getState(), BehaviorState::Hunting);
    BOOST_REQUIRE(registry.getTarget(coyote).has_value());
    BOOST_CHECK_EQUAL(*registry.getTarget(coyote), rabbit);

    step(coyote);
    BOOST_CHECK(agent(coyote).getPosition() == GridCell(2, 0));

    step(coyote);
    BOOST_CHECK(agent(coyote).getPosition() == GridCell(3, 0));
    BOOST_CHECK(!registry.isAlive(rabbit));
    BOOST_CHECK_EQUAL(agent(coyote).getState(), BehaviorState::Stalled);
    BOOST_CHECK_EQUAL(agent(coyote).getHunger(), 47 + 40);
    BOOST_CHECK_EQUAL(agent(coyote).getStallTurns(), 3);
    BOOST_CHECK(!registry.getTarget(coyote).has_value());
}

BOOST_AUTO_TEST_CASE(TestStalledPredatorOnlyCountsDown) {
    const AgentId coyote = spawn(standardCoyote(), {0, 0});
    spawn(params(Species::Rabbit), {2, 0});
    agent(coyote).setStallTurns(2);

    step(coyote);
    BOOST_CHECK(agent(coyote).getPosition() == GridCell(0, 0));
    BOOST_CHECK_EQUAL(agent(coyote).getStallTurns(), 1);
    BOOST_CHECK_EQUAL(agent(coyote).getState(), BehaviorState::Stalled);
    BOOST_CHECK_EQUAL(agent(coyote).getHunger(), 99);

    step(coyote);
    step(coyote);
    BOOST_CHECK(agent(coyote).getPosition() == GridCell(1, 0));
}

BOOST_AUTO_TEST_CASE(TestPeerPredatorBlocksTheWay) {
    const AgentId coyote = spawn(standardCoyote(), {0, 0});
    spawn(standardCoyote(), {1, 0});
    spawn(params(Species::Rabbit), {2, 0});

    step(coyote);
    BOOST_CHECK(agent(coyote).getPosition() == GridCell(0, 0));
}

BOOST_AUTO_TEST_CASE(TestPatrolStaysNearTerritory) {
    const AgentId coyote = spawn(params(Species::Coyote, [](SpeciesParams& p) {
        p.territoryRadius = 2;
        p.moveCadence = 1;
    }), {5, 5});

    for (int i = 0; i < 20; ++i) {
        step(coyote);
        BOOST_CHECK_EQUAL(agent(coyote).getState(), BehaviorState::Wandering);
        BOOST_CHECK_LE(manhattanDistance(agent(coyote).getPosition(), GridCell(5, 5)), 4);
    }
}

BOOST_AUTO_TEST_SUITE_END()

// ============================================================================
// VARIANTS
// ============================================================================

BOOST_FIXTURE_TEST_SUITE(VariantTests, PredatorFixture)

BOOST_AUTO_TEST_CASE(TestTiringCoyoteBreaksOffLongChase) {
    // A river the coyote cannot cross keeps the rabbit out of reach
    grid.fillRect({3, 0}, 1, 10, TileKind::Water);
    const AgentId coyote = spawn(params(Species::Coyote, [](SpeciesParams& p) {
        p.chaseTurnsBeforeBreak = 2;
        p.breakDurationTurns = 2;
        p.moveCadence = 1;
    }), {2, 1});
    spawn(params(Species::Rabbit), {5, 1});

    step(coyote);
    step(coyote);
    BOOST_CHECK_EQUAL(agent(coyote).getState(), BehaviorState::Hunting);
    BOOST_CHECK_EQUAL(agent(coyote).memory().chaseTurnsWithoutKill, 2);

    step(coyote);
    BOOST_CHECK_EQUAL(agent(coyote).getState(), BehaviorState::Stalled);
    BOOST_CHECK_EQUAL(agent(coyote).getStallTurns(), 2);
    BOOST_CHECK_EQUAL(agent(coyote).memory().chaseTurnsWithoutKill, 0);

    step(coyote);
    step(coyote);
    BOOST_CHECK_EQUAL(agent(coyote).getStallTurns(), 0);
    step(coyote);
    BOOST_CHECK_EQUAL(agent(coyote).getState(), BehaviorState::Hunting);
    BOOST_CHECK_EQUAL(agent(coyote).memory().chaseTurnsWithoutKill, 1);
}

BOOST_AUTO_TEST_CASE(TestHawkDashesIntoPrey) {
    const AgentId hawk = spawn(params(Species::Hawk), {0, 5});
    const AgentId rabbit = spawn(params(Species::Rabbit), {0, 8});

    step(hawk);
    BOOST_CHECK(agent(hawk).getPosition() == GridCell(0, 6));
    BOOST_CHECK_EQUAL(agent(hawk).getState(), BehaviorState::Dashing);
    BOOST_REQUIRE(agent(hawk).memory().pendingDashDirection.has_value());
    BOOST_CHECK(*agent(hawk).memory().pendingDashDirection == GridCell(0, 1));

    step(hawk);
    BOOST_CHECK(agent(hawk).getPosition() == GridCell(0, 8));
    BOOST_CHECK(!registry.isAlive(rabbit));
    BOOST_CHECK(!agent(hawk).memory().pendingDashDirection.has_value());
}

BOOST_AUTO_TEST_CASE(TestHawkRestsWithoutDash) {
    const AgentId hawk = spawn(params(Species::Hawk), {5, 5});
    step(hawk);
    BOOST_CHECK_EQUAL(agent(hawk).getStallTurns(), 1);
    BOOST_CHECK(!agent(hawk).memory().pendingDashDirection.has_value());
}

BOOST_AUTO_TEST_CASE(TestBlockedDashIsUndone) {
    const AgentId hawk = spawn(params(Species::Hawk), {0, 5});
    spawn(params(Species::Hawk), {0, 7});
    agent(hawk).memory().pendingDashDirection = GridCell(0, 1);

    step(hawk);
    BOOST_CHECK(agent(hawk).getPosition() == GridCell(0, 5));
    BOOST_CHECK_EQUAL(agent(hawk).getStallTurns(), 1);
}

BOOST_AUTO_TEST_SUITE_END()
