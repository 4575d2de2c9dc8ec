/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef SPAWNER_MANAGER_HPP
#define SPAWNER_MANAGER_HPP

/**
 * @file SpawnerManager.hpp
 * @brief Turn-driven population sources.
 *
 * Two kinds of spawner, both counted in completed turns:
 * - agent spawners put a group of one species on their own tile, sized by
 *   season with a random spread, or grow the group already standing there
 * - item spawners drop one item on a free grass tile around them
 *
 * A spawner whose attempt fails keeps its counter and tries again next turn.
 */

#include "core/GridTypes.hpp"
#include "core/Season.hpp"
#include "entities/AgentTypes.hpp"
#include "entities/ItemRecord.hpp"
#include <cstdint>
#include <random>
#include <vector>

namespace BurrowSim {

class AgentRegistry;
class ForageManager;
class IGridService;
class TurnScheduler;

struct AgentSpawnParameters {
  Species species{Species::Rabbit};
  int turnsBetweenSpawns{10};
  int baseSpawnAmount{2};
  float spawnAmountVariance{0.25f}; // 0.25 = +/-25%
};

struct AgentSpawner {
  uint32_t id{0};
  GridCell cell;
  AgentSpawnParameters params;
  int turnsSinceLastSpawn{0};
};

struct ItemSpawnParameters {
  ItemRecord item{ItemRecord::food("Worm", 15)};
  int turnsBetweenSpawns{8};
  int spawnRadius{3};
};

struct ItemSpawner {
  uint32_t id{0};
  GridCell center;
  ItemSpawnParameters params;
  int turnsSinceLastSpawn{0};
};

class SpawnerManager {
public:
  SpawnerManager(AgentRegistry &registry, const IGridService &grid,
                 ForageManager *forage, uint32_t seed = 11);
  ~SpawnerManager();

  SpawnerManager(const SpawnerManager &) = delete;
  SpawnerManager &operator=(const SpawnerManager &) = delete;

  // Subscribes to the scheduler's turn listeners (replaces any previous)
  void attach(TurnScheduler &scheduler);
  void detach();

  uint32_t addAgentSpawner(const GridCell &cell,
                           const AgentSpawnParameters &params = {});
  uint32_t addItemSpawner(const GridCell &center,
                          const ItemSpawnParameters &params = {});

  const std::vector<AgentSpawner> &getAgentSpawners() const {
    return m_agentSpawners;
  }
  const std::vector<ItemSpawner> &getItemSpawners() const {
    return m_itemSpawners;
  }

  /**
   * @brief Advances every spawner by one completed turn.
   * Turn 0 marks a fresh level and only zeroes the counters.
   */
  void onTurnAdvanced(int turn, Season season);

  // Zeroes every spawner's counter
  void reset();
  void clear();

  static float seasonSpawnMultiplier(Season season);
  // round(base * season multiplier * randomFactor), never below 1
  static int spawnAmount(int baseAmount, float randomFactor, Season season);

private:
  bool trySpawnAgents(const AgentSpawner &spawner, int amount);
  bool trySpawnItem(const ItemSpawner &spawner);
  int rollSpawnAmount(const AgentSpawnParameters &params, Season season);

  AgentRegistry &m_registry;
  const IGridService &m_grid;
  ForageManager *mp_forage;
  TurnScheduler *mp_scheduler{nullptr};
  size_t m_listenerHandle{0};
  std::vector<AgentSpawner> m_agentSpawners;
  std::vector<ItemSpawner> m_itemSpawners;
  uint32_t m_nextId{1};
  std::mt19937 m_rng;
};

} // namespace BurrowSim

#endif // SPAWNER_MANAGER_HPP
