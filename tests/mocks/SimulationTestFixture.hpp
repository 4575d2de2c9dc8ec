/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef TESTS_MOCKS_SIMULATION_TEST_FIXTURE_HPP
#define TESTS_MOCKS_SIMULATION_TEST_FIXTURE_HPP

/**
 * @file SimulationTestFixture.hpp (test helper)
 * @brief One in-memory session: 10x10 grass grid, real A*, hideable
 *        directory, forage field, recording den inventory and registry.
 *        Include after <boost/test/unit_test.hpp>.
 */

#include "ai/BehaviorContext.hpp"
#include "ai/pathfinding/PathfindingGrid.hpp"
#include "core/Logger.hpp"
#include "managers/AgentRegistry.hpp"
#include "managers/ForageManager.hpp"
#include "managers/HideableDirectory.hpp"
#include "managers/SpeciesCatalog.hpp"
#include "world/Hideable.hpp"
#include "world/TileGrid.hpp"
#include "MockDenInventory.hpp"
#include <functional>
#include <memory>
#include <random>
#include <vector>

struct SimulationTestFixture {
    explicit SimulationTestFixture(int width = 10, int height = 10)
        : grid(width, height, 32.0f),
          pathfinder(grid),
          forage(7),
          registry(catalog, &grid, &hideables),
          rng(42) {
        BURROW_ENABLE_BENCHMARK_MODE();
    }

    ~SimulationTestFixture() { BURROW_DISABLE_BENCHMARK_MODE(); }

    BurrowSim::SimulationServices services() {
        BurrowSim::SimulationServices s;
        s.registry = &registry;
        s.grid = &grid;
        s.pathfinder = &pathfinder;
        s.hideables = &hideables;
        s.forage = &forage;
        s.denInventory = &inventory;
        s.roster = roster;
        return s;
    }

    BurrowSim::BehaviorContext context(int turn = 1) {
        return BurrowSim::BehaviorContext(registry, grid, pathfinder, services(), rng, turn);
    }

    // Catalog defaults for the species with `tweak` applied on top
    static std::shared_ptr<const BurrowSim::SpeciesParams> params(
        BurrowSim::Species species,
        const std::function<void(BurrowSim::SpeciesParams&)>& tweak = {}) {
        BurrowSim::SpeciesParams p = BurrowSim::SpeciesCatalog::defaultsFor(species);
        if (tweak) {
            tweak(p);
        }
        return std::make_shared<const BurrowSim::SpeciesParams>(p);
    }

    BurrowSim::AgentId spawn(std::shared_ptr<const BurrowSim::SpeciesParams> p,
                             const BurrowSim::GridCell& cell) {
        BurrowSim::AgentId id = BurrowSim::INVALID_AGENT_ID;
        BOOST_REQUIRE_EQUAL(registry.spawnWithParams(std::move(p), cell, id),
                            BurrowSim::SimulationResult::SUCCESS);
        return id;
    }

    BurrowSim::Agent& agent(BurrowSim::AgentId id) {
        BurrowSim::Agent* a = registry.getAgent(id);
        BOOST_REQUIRE(a != nullptr);
        return *a;
    }

    BurrowSim::HideableId addShelter(BurrowSim::HideableKind kind,
                                     const BurrowSim::GridCell& cell) {
        auto shelter = std::make_shared<BurrowSim::Shelter>(kind, cell);
        shelters.push_back(shelter);
        return hideables.registerHideable(shelter);
    }

    BurrowSim::SpeciesCatalog catalog;
    BurrowSim::TileGrid grid;
    BurrowSim::PathfindingGrid pathfinder;
    BurrowSim::HideableDirectory hideables;
    std::vector<std::shared_ptr<BurrowSim::Shelter>> shelters;
    BurrowSim::ForageManager forage;
    MockDenInventory inventory;
    BurrowSim::AgentRegistry registry;
    BurrowSim::WorkerRoster* roster{nullptr};
    std::mt19937 rng;
};

#endif // TESTS_MOCKS_SIMULATION_TEST_FIXTURE_HPP
