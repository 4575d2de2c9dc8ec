/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef BEHAVIOR_CONTEXT_HPP
#define BEHAVIOR_CONTEXT_HPP

#include <random>

namespace BurrowSim {

class AgentRegistry;
class IGridService;
class IPathfinder;
class HideableDirectory;
class ForageManager;
class IDenInventory;
class WorkerRoster;

/**
 * @brief Collaborators wired into a simulation session. Any pointer may be
 * null; the scheduler degrades instead of failing when one is missing.
 */
struct SimulationServices {
  AgentRegistry *registry{nullptr};
  const IGridService *grid{nullptr};
  IPathfinder *pathfinder{nullptr};
  HideableDirectory *hideables{nullptr};
  ForageManager *forage{nullptr};
  IDenInventory *denInventory{nullptr};
  WorkerRoster *roster{nullptr};
};

/**
 * @brief Everything one agent step may touch. Built per turn once the
 * required collaborators are known to be present.
 */
struct BehaviorContext {
  AgentRegistry &registry;
  const IGridService &grid;
  IPathfinder &pathfinder;
  HideableDirectory *hideables;
  ForageManager *forage;
  IDenInventory *denInventory;
  WorkerRoster *roster;
  std::mt19937 &rng;
  int turn;

  BehaviorContext(AgentRegistry &r, const IGridService &g, IPathfinder &p,
                  const SimulationServices &services, std::mt19937 &random,
                  int turnNumber)
      : registry(r), grid(g), pathfinder(p), hideables(services.hideables),
        forage(services.forage), denInventory(services.denInventory),
        roster(services.roster), rng(random), turn(turnNumber) {}
};

} // namespace BurrowSim

#endif // BEHAVIOR_CONTEXT_HPP
