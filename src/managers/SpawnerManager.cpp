/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "managers/SpawnerManager.hpp"
#include "core/Logger.hpp"
#include "managers/AgentRegistry.hpp"
#include "managers/ForageManager.hpp"
#include "managers/TurnScheduler.hpp"
#include "world/GridService.hpp"
#include <algorithm>
#include <cmath>
#include <format>

namespace BurrowSim {

SpawnerManager::SpawnerManager(AgentRegistry &registry,
                               const IGridService &grid, ForageManager *forage,
                               uint32_t seed)
    : m_registry(registry), m_grid(grid), mp_forage(forage), m_rng(seed) {}

SpawnerManager::~SpawnerManager() { detach(); }

void SpawnerManager::attach(TurnScheduler &scheduler) {
  detach();
  mp_scheduler = &scheduler;
  m_listenerHandle = scheduler.addTurnListener([this](int turn) {
    onTurnAdvanced(turn, mp_scheduler->getSeason());
  });
}

void SpawnerManager::detach() {
  if (mp_scheduler) {
    mp_scheduler->removeTurnListener(m_listenerHandle);
    mp_scheduler = nullptr;
    m_listenerHandle = 0;
  }
}

uint32_t SpawnerManager::addAgentSpawner(const GridCell &cell,
                                         const AgentSpawnParameters &params) {
  AgentSpawner spawner;
  spawner.id = m_nextId++;
  spawner.cell = cell;
  spawner.params = params;
  spawner.params.spawnAmountVariance =
      std::clamp(params.spawnAmountVariance, 0.0f, 1.0f);
  m_agentSpawners.push_back(spawner);
  SPAWNER_DEBUG(std::format("{} spawner {} at ({}, {}) every {} turns",
                            AgentTraits::speciesToString(params.species),
                            spawner.id, cell.x, cell.y,
                            params.turnsBetweenSpawns));
  return spawner.id;
}

uint32_t SpawnerManager::addItemSpawner(const GridCell &center,
                                        const ItemSpawnParameters &params) {
  ItemSpawner spawner;
  spawner.id = m_nextId++;
  spawner.center = center;
  spawner.params = params;
  m_itemSpawners.push_back(spawner);
  SPAWNER_DEBUG(std::format("{} spawner {} at ({}, {}) radius {}",
                            params.item.name, spawner.id, center.x, center.y,
                            params.spawnRadius));
  return spawner.id;
}

void SpawnerManager::onTurnAdvanced(int turn, Season season) {
  if (turn == 0) {
    reset();
    return;
  }

  for (auto &spawner : m_agentSpawners) {
    if (spawner.params.turnsBetweenSpawns <= 0) {
      continue;
    }
    if (++spawner.turnsSinceLastSpawn < spawner.params.turnsBetweenSpawns) {
      continue;
    }
    const int amount = rollSpawnAmount(spawner.params, season);
    if (trySpawnAgents(spawner, amount)) {
      spawner.turnsSinceLastSpawn = 0;
    }
  }

  for (auto &spawner : m_itemSpawners) {
    if (spawner.params.turnsBetweenSpawns <= 0) {
      continue;
    }
    if (++spawner.turnsSinceLastSpawn < spawner.params.turnsBetweenSpawns) {
      continue;
    }
    if (trySpawnItem(spawner)) {
      spawner.turnsSinceLastSpawn = 0;
    }
  }
}

void SpawnerManager::reset() {
  for (auto &spawner : m_agentSpawners) {
    spawner.turnsSinceLastSpawn = 0;
  }
  for (auto &spawner : m_itemSpawners) {
    spawner.turnsSinceLastSpawn = 0;
  }
}

void SpawnerManager::clear() {
  m_agentSpawners.clear();
  m_itemSpawners.clear();
}

float SpawnerManager::seasonSpawnMultiplier(Season season) {
  switch (season) {
  case Season::Spring:
    return 1.5f;
  case Season::Summer:
    return 1.2f;
  case Season::Fall:
    return 0.8f;
  case Season::Winter:
    return 0.5f;
  }
  return 1.0f;
}

int SpawnerManager::spawnAmount(int baseAmount, float randomFactor,
                                Season season) {
  const float scaled = static_cast<float>(baseAmount) *
                       seasonSpawnMultiplier(season) * randomFactor;
  return std::max(1, static_cast<int>(std::lround(scaled)));
}

int SpawnerManager::rollSpawnAmount(const AgentSpawnParameters &params,
                                    Season season) {
  float factor = 1.0f;
  if (params.spawnAmountVariance > 0.0f) {
    std::uniform_real_distribution<float> spread(
        1.0f - params.spawnAmountVariance, 1.0f + params.spawnAmountVariance);
    factor = spread(m_rng);
  }
  return spawnAmount(params.baseSpawnAmount, factor, season);
}

bool SpawnerManager::trySpawnAgents(const AgentSpawner &spawner, int amount) {
  const GridCell &cell = spawner.cell;
  if (!m_grid.isValid(cell) || !m_grid.isWalkable(cell)) {
    SPAWNER_WARN(std::format("Spawner {} sits on unusable cell ({}, {})",
                             spawner.id, cell.x, cell.y));
    return false;
  }

  const Species species = spawner.params.species;
  const auto existing = m_registry.findAgentAt(
      cell, INVALID_AGENT_ID,
      [species](const Agent &a) { return a.getSpecies() == species; });

  // Someone else is standing on the spawner
  if (m_registry.hasOtherAgentAt(existing.value_or(INVALID_AGENT_ID), cell)) {
    return false;
  }

  if (existing) {
    if (Agent *group = m_registry.getAgent(*existing)) {
      group->increaseGroupCount(amount);
      SPAWNER_DEBUG(std::format("Spawner {} grew #{} by {} to {}", spawner.id,
                                *existing, amount, group->getGroupCount()));
      return true;
    }
    return false;
  }

  AgentId id = INVALID_AGENT_ID;
  const SimulationResult result = m_registry.spawn(species, cell, id);
  if (result != SimulationResult::SUCCESS) {
    SPAWNER_WARN(std::format("Spawner {} could not spawn: {}", spawner.id,
                             simulationResultToString(result)));
    return false;
  }
  if (Agent *group = m_registry.getAgent(id)) {
    group->setGroupCount(amount);
  }
  SPAWNER_INFO(std::format("Spawner {} spawned {} {} as #{} at ({}, {})",
                           spawner.id, amount,
                           AgentTraits::speciesToString(species), id, cell.x,
                           cell.y));
  return true;
}

bool SpawnerManager::trySpawnItem(const ItemSpawner &spawner) {
  if (!mp_forage) {
    SPAWNER_WARN(std::format("Spawner {} has no forage field to drop into",
                             spawner.id));
    return false;
  }

  const int radius = std::max(0, spawner.params.spawnRadius);
  std::vector<GridCell> candidates;
  for (int dx = -radius; dx <= radius; ++dx) {
    for (int dy = -radius; dy <= radius; ++dy) {
      const GridCell cell(spawner.center.x + dx, spawner.center.y + dy);
      if (m_grid.isValid(cell) && m_grid.isWalkable(cell) &&
          m_grid.getTileKind(cell) == TileKind::Grass) {
        candidates.push_back(cell);
      }
    }
  }
  if (candidates.empty()) {
    SPAWNER_WARN(std::format("Spawner {} has no grass around ({}, {})",
                             spawner.id, spawner.center.x, spawner.center.y));
    return false;
  }

  std::shuffle(candidates.begin(), candidates.end(), m_rng);
  for (const GridCell &cell : candidates) {
    if (mp_forage->hasGroundItemAt(cell)) {
      continue;
    }
    mp_forage->dropItem(cell, spawner.params.item);
    SPAWNER_DEBUG(std::format("Spawner {} dropped {} at ({}, {})", spawner.id,
                              spawner.params.item.name, cell.x, cell.y));
    return true;
  }
  return false;
}

} // namespace BurrowSim
