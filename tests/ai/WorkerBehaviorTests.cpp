/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE WorkerBehaviorTests
#include <boost/test/unit_test.hpp>

#include "../mocks/SimulationTestFixture.hpp"
#include "ai/behaviors/WorkerBehavior.hpp"
#include "managers/WorkerRoster.hpp"

using namespace BurrowSim;

struct WorkerFixture : SimulationTestFixture {
    WorkerFixture() : workers(registry, hideables, config) {
        den = addShelter(HideableKind::Den, {0, 2});
    }

    void step(AgentId id) {
        auto ctx = context(++turn);
        registry.beginStep(id);
        behavior.takeTurn(ctx, agent(id));
        if (registry.isAlive(id)) {
            registry.resolveMoveConflict(id);
        }
    }

    AgentId spawnWorker(const GridCell& cell) {
        const AgentId id = spawn(params(Species::KangRat), cell);
        BOOST_REQUIRE_EQUAL(workers.assign(id, den), RosterResult::SUCCESS);
        return id;
    }

    void loadThreeItems(AgentId id) {
        agent(id).addCarriedItem(ItemRecord::food("Grass", 20));
        agent(id).addCarriedItem(ItemRecord{"Twig", ItemKind::Material, 0});
        agent(id).addCarriedItem(ItemRecord::food("Seeds", 5));
    }

    SimulationConfig config;
    WorkerRoster workers;
    WorkerBehavior behavior;
    HideableId den{INVALID_HIDEABLE_ID};
    int turn{0};
};

// ============================================================================
// DEPOSITS
// ============================================================================

BOOST_FIXTURE_TEST_SUITE(DepositTests, WorkerFixture)

BOOST_AUTO_TEST_CASE(TestDepositWithoutBonus) {
    workers.setFixedBonusRate(0.0f);
    roster = &workers;
    const AgentId worker = spawnWorker({0, 2});
    loadThreeItems(worker);

    auto ctx = context();
    BOOST_CHECK_EQUAL(WorkerBehavior::depositCarried(ctx, agent(worker)), 3u);
    BOOST_CHECK_EQUAL(inventory.deposits.size(), 3u);
    BOOST_CHECK(!agent(worker).isCarrying());
    BOOST_CHECK_EQUAL(agent(worker).getState(), BehaviorState::Depositing);
}

BOOST_AUTO_TEST_CASE(TestDepositWithFullBonusDoublesFood) {
    workers.setFixedBonusRate(1.0f);
    roster = &workers;
    const AgentId worker = spawnWorker({0, 2});
    loadThreeItems(worker);

    auto ctx = context();
    BOOST_CHECK_EQUAL(WorkerBehavior::depositCarried(ctx, agent(worker)), 5u);
    BOOST_REQUIRE_EQUAL(inventory.deposits.size(), 5u);
    BOOST_CHECK_EQUAL(inventory.deposits[0].name, "Grass");
    BOOST_CHECK_EQUAL(inventory.deposits[1].name, "Grass");
    BOOST_CHECK_EQUAL(inventory.deposits[2].name, "Twig");
}

BOOST_AUTO_TEST_CASE(TestDepositWithoutRosterHasNoBonus) {
    const AgentId worker = spawnWorker({0, 2});
    loadThreeItems(worker);
    auto ctx = context();
    BOOST_CHECK_EQUAL(WorkerBehavior::depositCarried(ctx, agent(worker)), 3u);
}

BOOST_AUTO_TEST_CASE(TestDepositWithoutInventoryKeepsLoad) {
    const AgentId worker = spawnWorker({0, 2});
    loadThreeItems(worker);

    SimulationServices s = services();
    s.denInventory = nullptr;
    BehaviorContext ctx(registry, grid, pathfinder, s, rng, 1);
    BOOST_CHECK_EQUAL(WorkerBehavior::depositCarried(ctx, agent(worker)), 0u);
    BOOST_CHECK_EQUAL(agent(worker).getCarriedItems().size(), 3u);
}

BOOST_AUTO_TEST_SUITE_END()

// ============================================================================
// GATHER AND HAUL
// ============================================================================

BOOST_FIXTURE_TEST_SUITE(HaulTests, WorkerFixture)

BOOST_AUTO_TEST_CASE(TestGatherThenHaulHome) {
    const AgentId worker = spawnWorker({2, 2});
    forage.addPatch({3, 2}, "Grass", 20);
    agent(worker).setHunger(50);

    step(worker);
    BOOST_CHECK(agent(worker).getPosition() == GridCell(3, 2));
    BOOST_CHECK_EQUAL(agent(worker).getHunger(), 49 + 30);
    BOOST_CHECK_EQUAL(agent(worker).getState(), BehaviorState::Carrying);
    BOOST_REQUIRE_EQUAL(agent(worker).getCarriedItems().size(), 1u);
    BOOST_CHECK_EQUAL(agent(worker).getCarriedItems().front().name, "Grass");

    step(worker);
    BOOST_CHECK(agent(worker).getPosition() == GridCell(2, 2));
    step(worker);
    BOOST_CHECK(agent(worker).getPosition() == GridCell(1, 2));
    BOOST_CHECK(inventory.deposits.empty());

    step(worker);
    BOOST_CHECK(agent(worker).getPosition() == GridCell(0, 2));
    BOOST_CHECK(agent(worker).isSheltered());
    BOOST_CHECK(!agent(worker).isCarrying());
    BOOST_REQUIRE_EQUAL(inventory.deposits.size(), 1u);
    BOOST_CHECK_EQUAL(inventory.deposits.front().hungerRestored, 20);
    BOOST_CHECK_EQUAL(agent(worker).getState(), BehaviorState::Depositing);
}

BOOST_AUTO_TEST_CASE(TestNearerGroundItemWins) {
    const AgentId worker = spawnWorker({2, 2});
    forage.addPatch({6, 2}, "Grass", 20);
    forage.dropItem({3, 2}, ItemRecord::food("Berry", 10));
    agent(worker).setHunger(50);

    step(worker);
    BOOST_CHECK(agent(worker).getPosition() == GridCell(3, 2));
    BOOST_REQUIRE(agent(worker).isCarrying());
    BOOST_CHECK_EQUAL(agent(worker).getCarriedItems().front().name, "Berry");
    BOOST_CHECK_EQUAL(agent(worker).getHunger(), 49);
    BOOST_CHECK_EQUAL(forage.getGroundItemCount(), 0u);
}

BOOST_AUTO_TEST_CASE(TestCarryingWorkerIgnoresThreats) {
    const AgentId worker = spawnWorker({2, 2});
    spawn(params(Species::Coyote), {4, 2});
    agent(worker).addCarriedItem(ItemRecord::food("Grass", 20));
    agent(worker).setHunger(50);

    step(worker);
    BOOST_CHECK(agent(worker).getPosition() == GridCell(1, 2));
    BOOST_CHECK_EQUAL(agent(worker).getState(), BehaviorState::Carrying);
}

BOOST_AUTO_TEST_SUITE_END()

// ============================================================================
// STORED FOOD
// ============================================================================

BOOST_FIXTURE_TEST_SUITE(StorageTests, WorkerFixture)

BOOST_AUTO_TEST_CASE(TestCriticalWorkerEatsFromStorage) {
    const AgentId worker = spawnWorker({0, 2});
    BOOST_REQUIRE(registry.enterHideable(worker, den));
    inventory.storedFood = {30};
    agent(worker).setHunger(15);

    step(worker);
    BOOST_CHECK_EQUAL(inventory.spendCalls, 1);
    BOOST_CHECK_EQUAL(agent(worker).getHunger(), 14 + 30);
    BOOST_CHECK_EQUAL(agent(worker).getState(), BehaviorState::ConsumingStoredFood);
    BOOST_CHECK(agent(worker).isSheltered());
}

BOOST_AUTO_TEST_CASE(TestEmptyStorageSendsWorkerOut) {
    const AgentId worker = spawnWorker({0, 2});
    BOOST_REQUIRE(registry.enterHideable(worker, den));
    forage.addPatch({3, 2}, "Grass", 20);
    agent(worker).setHunger(15);

    step(worker);
    BOOST_CHECK_EQUAL(inventory.spendCalls, 0);
    BOOST_CHECK(!agent(worker).isSheltered());
    BOOST_CHECK(agent(worker).getPosition() == GridCell(1, 2));
}

BOOST_AUTO_TEST_CASE(TestBlockedWorkerStaysInDen) {
    const AgentId worker = spawnWorker({0, 2});
    BOOST_REQUIRE(registry.enterHideable(worker, den));
    spawn(params(Species::KangRat), {1, 2});
    forage.addPatch({3, 2}, "Grass", 20);
    agent(worker).setHunger(15);

    step(worker);
    BOOST_CHECK(agent(worker).getPosition() == GridCell(0, 2));
    BOOST_CHECK(agent(worker).isSheltered());
    BOOST_CHECK(shelters.front()->contains(worker));
}

BOOST_AUTO_TEST_CASE(TestShelteredWorkerDepositsLoad) {
    const AgentId worker = spawnWorker({0, 2});
    BOOST_REQUIRE(registry.enterHideable(worker, den));
    agent(worker).addCarriedItem(ItemRecord::food("Grass", 20));

    step(worker);
    BOOST_CHECK_EQUAL(inventory.deposits.size(), 1u);
    BOOST_CHECK(agent(worker).isSheltered());
}

BOOST_AUTO_TEST_SUITE_END()
