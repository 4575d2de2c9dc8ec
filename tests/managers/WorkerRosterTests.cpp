/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE WorkerRosterTests
#include <boost/test/unit_test.hpp>

#include "../mocks/SimulationTestFixture.hpp"
#include "managers/WorkerRoster.hpp"

using namespace BurrowSim;

namespace {
SimulationConfig rosterConfig() {
    SimulationConfig config;
    config.maxWorkersPerDen = 2;
    config.mvpWorkerGoal = 4;
    return config;
}
} // namespace

struct RosterFixture : SimulationTestFixture {
    RosterFixture() : config(rosterConfig()), workers(registry, hideables, config) {
        den = addShelter(HideableKind::Den, {1, 1});
    }

    AgentId spawnWorker(const GridCell& cell) {
        return spawn(params(Species::KangRat), cell);
    }

    SimulationConfig config;
    WorkerRoster workers;
    HideableId den{INVALID_HIDEABLE_ID};
};

BOOST_FIXTURE_TEST_SUITE(WorkerRosterTests, RosterFixture)

BOOST_AUTO_TEST_CASE(TestAssignmentWakesWorker) {
    const AgentId worker = spawnWorker({2, 2});
    BOOST_REQUIRE(agent(worker).isDormant());

    BOOST_CHECK_EQUAL(workers.assign(worker, den), RosterResult::SUCCESS);
    BOOST_CHECK(!agent(worker).isDormant());
    BOOST_REQUIRE(agent(worker).getHome().has_value());
    BOOST_CHECK_EQUAL(*agent(worker).getHome(), den);
    BOOST_CHECK_EQUAL(agent(worker).getState(), BehaviorState::ReturningHome);
    BOOST_CHECK_EQUAL(workers.getWorkersAssignedTo(den), 1u);

    // Re-assigning to the same den is a no-op
    BOOST_CHECK_EQUAL(workers.assign(worker, den), RosterResult::SUCCESS);
    BOOST_CHECK_EQUAL(workers.getAssignedCount(), 1u);
}

BOOST_AUTO_TEST_CASE(TestAssignRejectsNonWorkersAndBadDens) {
    const AgentId rabbit = spawn(params(Species::Rabbit), {3, 3});
    const AgentId worker = spawnWorker({2, 2});
    const HideableId bush = addShelter(HideableKind::Bush, {4, 4});

    BOOST_CHECK_EQUAL(workers.assign(rabbit, den), RosterResult::NOT_A_WORKER);
    BOOST_CHECK_EQUAL(workers.assign(999, den), RosterResult::NOT_A_WORKER);
    BOOST_CHECK_EQUAL(workers.assign(worker, bush), RosterResult::UNKNOWN_DEN);
    BOOST_CHECK_EQUAL(workers.assign(worker, 777), RosterResult::UNKNOWN_DEN);
    BOOST_CHECK(agent(worker).isDormant());
}

BOOST_AUTO_TEST_CASE(TestDenCapacity) {
    const AgentId a = spawnWorker({2, 2});
    const AgentId b = spawnWorker({2, 3});
    const AgentId c = spawnWorker({2, 4});

    BOOST_CHECK_EQUAL(workers.assign(a, den), RosterResult::SUCCESS);
    BOOST_CHECK_EQUAL(workers.assign(b, den), RosterResult::SUCCESS);
    BOOST_CHECK_EQUAL(workers.assign(c, den), RosterResult::DEN_FULL);
    BOOST_CHECK(agent(c).isDormant());

    const HideableId burrow = addShelter(HideableKind::Burrow, {6, 6});
    BOOST_CHECK_EQUAL(workers.assign(c, burrow), RosterResult::SUCCESS);
}

BOOST_AUTO_TEST_CASE(TestUnassignReturnsToDormancy) {
    const AgentId worker = spawnWorker({1, 1});
    BOOST_REQUIRE_EQUAL(workers.assign(worker, den), RosterResult::SUCCESS);
    BOOST_REQUIRE(registry.enterHideable(worker, den));

    BOOST_CHECK_EQUAL(workers.unassign(worker), RosterResult::SUCCESS);
    BOOST_CHECK(agent(worker).isDormant());
    BOOST_CHECK(!agent(worker).getHome().has_value());
    BOOST_CHECK(!agent(worker).isSheltered());
    BOOST_CHECK_EQUAL(workers.unassign(worker), RosterResult::NOT_ASSIGNED);
}

BOOST_AUTO_TEST_CASE(TestBonusRateTracksAssignments) {
    BOOST_CHECK_CLOSE(workers.getBonusFoodDropRate(), 0.0f, 0.001f);

    const AgentId a = spawnWorker({2, 2});
    workers.assign(a, den);
    BOOST_CHECK_CLOSE(workers.getBonusFoodDropRate(), 0.25f, 0.001f);

    workers.setFixedBonusRate(1.0f);
    BOOST_CHECK_CLOSE(workers.getBonusFoodDropRate(), 1.0f, 0.001f);
    workers.setFixedBonusRate(std::nullopt);
    BOOST_CHECK_CLOSE(workers.getBonusFoodDropRate(), 0.25f, 0.001f);
}

BOOST_AUTO_TEST_CASE(TestRemovedWorkerLeavesRoster) {
    const AgentId worker = spawnWorker({2, 2});
    workers.assign(worker, den);
    registry.remove(worker, RemovalCause::Predation);

    BOOST_CHECK(!workers.getAssignment(worker).has_value());
    BOOST_CHECK_EQUAL(workers.getWorkersAssignedTo(den), 0u);
}

BOOST_AUTO_TEST_SUITE_END()
