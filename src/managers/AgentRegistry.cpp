/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "managers/AgentRegistry.hpp"
#include "core/Logger.hpp"
#include "managers/HideableDirectory.hpp"
#include "managers/SpeciesCatalog.hpp"
#include "world/GridService.hpp"
#include <algorithm>
#include <format>

namespace BurrowSim {

AgentRegistry::AgentRegistry(const SpeciesCatalog &catalog,
                             const IGridService *grid,
                             HideableDirectory *hideables)
    : m_catalog(catalog), m_grid(grid), m_hideables(hideables) {}

SimulationResult AgentRegistry::spawn(Species species, const GridCell &cell,
                                      AgentId &outId) {
  return spawnWithParams(m_catalog.get(species), cell, outId);
}

SimulationResult
AgentRegistry::spawnWithParams(std::shared_ptr<const SpeciesParams> params,
                               const GridCell &cell, AgentId &outId) {
  outId = INVALID_AGENT_ID;
  if (!m_grid) {
    REGISTRY_WARN("spawn: no grid service attached");
    return SimulationResult::MISSING_COLLABORATOR;
  }
  if (!params) {
    REGISTRY_ERROR("spawn: missing species params");
    return SimulationResult::INVALID_SPAWN;
  }
  if (!m_grid->isValid(cell) || !m_grid->isWalkable(cell)) {
    REGISTRY_WARN(std::format("spawn: cell ({}, {}) is not walkable for {}",
                              cell.x, cell.y, params->name));
    return SimulationResult::INVALID_SPAWN;
  }

  const AgentId id = m_nextId++;
  auto agent = std::make_unique<Agent>(id, std::move(params), cell);
  // Workers wait for a den assignment before they act
  if (agent->getCategory() == AgentCategory::Worker) {
    agent->setDormant(true);
  }
  if (agent->getCategory() == AgentCategory::Predator) {
    agent->memory().territoryCenter = cell;
  }
  REGISTRY_DEBUG(std::format("Spawned {} #{} at ({}, {})",
                             agent->getParams().name, id, cell.x, cell.y));
  m_index.emplace(id, agent.get());
  m_agents.push_back(std::move(agent));
  outId = id;
  return SimulationResult::SUCCESS;
}

std::vector<AgentId> AgentRegistry::allAgents() const {
  std::vector<AgentId> ids;
  ids.reserve(m_agents.size());
  for (const auto &agent : m_agents) {
    if (agent->isAlive()) {
      ids.push_back(agent->getId());
    }
  }
  return ids;
}

size_t AgentRegistry::getAgentCount() const {
  return static_cast<size_t>(std::count_if(
      m_agents.begin(), m_agents.end(),
      [](const std::unique_ptr<Agent> &a) { return a->isAlive(); }));
}

Agent *AgentRegistry::getAgent(AgentId id) {
  auto it = m_index.find(id);
  if (it == m_index.end() || !it->second->isAlive()) {
    return nullptr;
  }
  return it->second;
}

const Agent *AgentRegistry::getAgent(AgentId id) const {
  auto it = m_index.find(id);
  if (it == m_index.end() || !it->second->isAlive()) {
    return nullptr;
  }
  return it->second;
}

bool AgentRegistry::isAlive(AgentId id) const { return getAgent(id) != nullptr; }

std::optional<AgentId>
AgentRegistry::nearest(const GridCell &from, const AgentPredicate &predicate,
                       std::optional<int> maxRadius) const {
  std::optional<AgentId> best;
  int bestDist = 0;
  for (const auto &agent : m_agents) {
    if (!agent->isAlive())
      continue;
    if (predicate && !predicate(*agent))
      continue;
    const int d = manhattanDistance(from, agent->getPosition());
    if (maxRadius && d > *maxRadius)
      continue;
    // Strict comparison keeps the first encountered on ties
    if (!best || d < bestDist) {
      best = agent->getId();
      bestDist = d;
    }
  }
  return best;
}

bool AgentRegistry::hasOtherAgentAt(AgentId origin, const GridCell &cell) const {
  return findAgentAt(cell, origin).has_value();
}

std::optional<AgentId>
AgentRegistry::findAgentAt(const GridCell &cell, AgentId excluding,
                           const AgentPredicate &predicate) const {
  for (const auto &agent : m_agents) {
    if (!agent->isAlive() || agent->getId() == excluding ||
        agent->isSheltered() || !(agent->getPosition() == cell)) {
      continue;
    }
    if (!predicate || predicate(*agent)) {
      return agent->getId();
    }
  }
  return std::nullopt;
}

void AgentRegistry::beginStep(AgentId id) {
  if (Agent *agent = getAgent(id)) {
    agent->m_previousPosition = agent->m_position;
    agent->m_previousHideable = agent->m_currentHideable;
    agent->m_encounteredAgent = false;
  }
}

bool AgentRegistry::moveAgent(AgentId id, const GridCell &cell) {
  Agent *agent = getAgent(id);
  if (!agent) {
    return false;
  }
  if (agent->isSheltered()) {
    leaveHideable(id);
  }
  agent->m_position = cell;
  return true;
}

bool AgentRegistry::resolveMoveConflict(AgentId mover) {
  Agent *agent = getAgent(mover);
  if (!agent) {
    return false;
  }
  const bool flagged = agent->m_encounteredAgent;
  agent->m_encounteredAgent = false;
  if (agent->isSheltered()) {
    return false;
  }
  if (!flagged && !hasOtherAgentAt(mover, agent->getPosition())) {
    return false;
  }
  REGISTRY_DEBUG(std::format(
      "Move conflict: #{} reverted from ({}, {}) to ({}, {})", mover,
      agent->m_position.x, agent->m_position.y, agent->m_previousPosition.x,
      agent->m_previousPosition.y));
  agent->m_position = agent->m_previousPosition;
  // Back on the tile it left from: slip back into the hideable it was in
  if (agent->m_previousHideable &&
      !enterHideable(mover, *agent->m_previousHideable)) {
    REGISTRY_DEBUG(std::format("#{} could not re-enter hideable {}", mover,
                               *agent->m_previousHideable));
  }
  return true;
}

void AgentRegistry::remove(AgentId id, RemovalCause cause) {
  Agent *agent = getAgent(id);
  if (!agent) {
    return;
  }
  leaveHideable(id);
  agent->m_alive = false;

  for (auto it = m_targets.begin(); it != m_targets.end();) {
    if (it->first == id || it->second == id) {
      it = m_targets.erase(it);
    } else {
      ++it;
    }
  }
  if (m_selected && *m_selected == id) {
    m_selected.reset();
  }

  REGISTRY_INFO(std::format("Removed {} #{} ({})", agent->getParams().name, id,
                            removalCauseToString(cause)));

  // Listeners may register or remove others while being notified
  const auto listeners = m_removalListeners;
  for (const auto &[handle, listener] : listeners) {
    if (listener) {
      listener(id, cause);
    }
  }

  if (m_iterationDepth == 0) {
    purgeRemoved();
  }
}

void AgentRegistry::purgeRemoved() {
  auto firstDead = std::stable_partition(
      m_agents.begin(), m_agents.end(),
      [](const std::unique_ptr<Agent> &a) { return a->isAlive(); });
  for (auto it = firstDead; it != m_agents.end(); ++it) {
    m_index.erase((*it)->getId());
  }
  m_agents.erase(firstDead, m_agents.end());
}

void AgentRegistry::clear() {
  {
    IterationGuard guard(*this);
    for (AgentId id : allAgents()) {
      remove(id, RemovalCause::Despawn);
    }
  }
  m_targets.clear();
  m_selected.reset();
}

bool AgentRegistry::enterHideable(AgentId id, HideableId hideableId) {
  Agent *agent = getAgent(id);
  if (!agent || !m_hideables) {
    return false;
  }
  IHideable *hideable = m_hideables->find(hideableId);
  if (!hideable) {
    REGISTRY_DEBUG(std::format("enterHideable: hideable {} is gone",
                               hideableId));
    return false;
  }
  if (!(hideable->getPosition() == agent->getPosition()) ||
      !hideable->canEnter(id)) {
    return false;
  }
  if (agent->m_currentHideable && *agent->m_currentHideable == hideableId) {
    return true;
  }
  leaveHideable(id);
  hideable->onEnter(id);
  agent->m_currentHideable = hideableId;
  return true;
}

void AgentRegistry::leaveHideable(AgentId id) {
  Agent *agent = getAgent(id);
  if (!agent || !agent->m_currentHideable) {
    return;
  }
  if (m_hideables) {
    if (IHideable *hideable = m_hideables->find(*agent->m_currentHideable)) {
      hideable->onLeave(id);
    }
  }
  agent->m_currentHideable.reset();
}

void AgentRegistry::setHome(AgentId id, std::optional<HideableId> home) {
  if (Agent *agent = getAgent(id)) {
    agent->m_home = home;
  }
}

void AgentRegistry::setTarget(AgentId hunter, AgentId target) {
  if (isAlive(hunter) && isAlive(target)) {
    m_targets[hunter] = target;
  }
}

std::optional<AgentId> AgentRegistry::getTarget(AgentId hunter) const {
  auto it = m_targets.find(hunter);
  if (it == m_targets.end() || !isAlive(it->second)) {
    return std::nullopt;
  }
  return it->second;
}

void AgentRegistry::clearTarget(AgentId hunter) { m_targets.erase(hunter); }

void AgentRegistry::clearTransientReferences() {
  m_targets.clear();
  m_selected.reset();
}

std::vector<AgentId>
AgentRegistry::getAgentsInViewport(const CellPredicate &inView) const {
  std::vector<AgentId> ids;
  for (const auto &agent : m_agents) {
    if (agent->isAlive() && (!inView || inView(agent->getPosition()))) {
      ids.push_back(agent->getId());
    }
  }
  return ids;
}

size_t AgentRegistry::addRemovalListener(RemovalListener listener) {
  const size_t handle = m_nextListenerHandle++;
  m_removalListeners.emplace_back(handle, std::move(listener));
  return handle;
}

void AgentRegistry::removeRemovalListener(size_t handle) {
  m_removalListeners.erase(
      std::remove_if(m_removalListeners.begin(), m_removalListeners.end(),
                     [handle](const auto &entry) { return entry.first == handle; }),
      m_removalListeners.end());
}

std::function<void()>
AgentRegistry::guardedCallback(AgentId id, std::function<void(Agent &)> fn) {
  return [this, id, fn = std::move(fn)]() {
    Agent *agent = getAgent(id);
    if (!agent) {
      REGISTRY_DEBUG(std::format("Dropped deferred callback for removed #{}",
                                 id));
      return;
    }
    if (fn) {
      fn(*agent);
    }
  };
}

} // namespace BurrowSim
