/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef AGENT_REGISTRY_HPP
#define AGENT_REGISTRY_HPP

#include "core/SimulationResult.hpp"
#include "entities/Agent.hpp"
#include <functional>
#include <memory>
#include <optional>
#include <unordered_map>
#include <utility>
#include <vector>

namespace BurrowSim {

class IGridService;
class HideableDirectory;
class SpeciesCatalog;

/**
 * @brief Owns every agent and is the only writer of agent position,
 * liveness and shelter membership.
 *
 * Iteration order is insertion order. Agents removed while an IterationGuard
 * is open are tombstoned (skipped by every query) and purged when the last
 * guard closes, so a turn in progress never sees its order perturbed.
 */
class AgentRegistry {
public:
  using AgentPredicate = std::function<bool(const Agent &)>;
  using CellPredicate = std::function<bool(const GridCell &)>;
  using RemovalListener = std::function<void(AgentId, RemovalCause)>;

  explicit AgentRegistry(const SpeciesCatalog &catalog,
                         const IGridService *grid = nullptr,
                         HideableDirectory *hideables = nullptr);

  AgentRegistry(const AgentRegistry &) = delete;
  AgentRegistry &operator=(const AgentRegistry &) = delete;

  void setGridService(const IGridService *grid) { m_grid = grid; }
  void setHideableDirectory(HideableDirectory *hideables) {
    m_hideables = hideables;
  }
  const IGridService *getGridService() const { return m_grid; }

  /**
   * @brief Creates an agent of the species at `cell`.
   * @return INVALID_SPAWN if the cell is out of range or not walkable,
   * MISSING_COLLABORATOR if no grid service is attached
   */
  SimulationResult spawn(Species species, const GridCell &cell,
                         AgentId &outId);
  // Same, with explicit params (tests and scripted scenarios)
  SimulationResult spawnWithParams(std::shared_ptr<const SpeciesParams> params,
                                   const GridCell &cell, AgentId &outId);

  // Live agents in insertion order
  std::vector<AgentId> allAgents() const;
  size_t getAgentCount() const;

  // nullptr for unknown or removed ids
  Agent *getAgent(AgentId id);
  const Agent *getAgent(AgentId id) const;
  bool isAlive(AgentId id) const;

  /**
   * @brief Minimum-Manhattan-distance live agent matching `predicate`.
   * Ties resolve to the earliest agent in iteration order.
   * @param maxRadius nullopt means unlimited range
   */
  std::optional<AgentId> nearest(const GridCell &from,
                                 const AgentPredicate &predicate,
                                 std::optional<int> maxRadius) const;

  // Live, unsheltered agent on the cell other than `origin`
  bool hasOtherAgentAt(AgentId origin, const GridCell &cell) const;
  std::optional<AgentId> findAgentAt(const GridCell &cell, AgentId excluding,
                                     const AgentPredicate &predicate = {}) const;

  // Marks the start of an agent's step: snapshots position and hideable
  void beginStep(AgentId id);
  // Applies a move immediately; leaves any hideable the agent was in
  bool moveAgent(AgentId id, const GridCell &cell);
  /**
   * @brief Last mover yields. Reverts the mover to its previous position if
   * another unsheltered agent shares its tile or it flagged an encounter
   * during the move. Sheltered movers never conflict. A reverted mover
   * re-enters the hideable it held when its step began.
   * @return true if the mover was reverted
   */
  bool resolveMoveConflict(AgentId mover);

  // Idempotent. Leaves hideables, clears trackers, notifies listeners.
  void remove(AgentId id, RemovalCause cause = RemovalCause::Despawn);
  void purgeRemoved();
  // Despawns every agent (level reset)
  void clear();

  bool enterHideable(AgentId id, HideableId hideable);
  void leaveHideable(AgentId id);
  void setHome(AgentId id, std::optional<HideableId> home);

  // Hunter -> target tracking used by predators and the demo overlay
  void setTarget(AgentId hunter, AgentId target);
  std::optional<AgentId> getTarget(AgentId hunter) const;
  void clearTarget(AgentId hunter);
  void setSelectedAgent(std::optional<AgentId> id) { m_selected = id; }
  std::optional<AgentId> getSelectedAgent() const { return m_selected; }
  void clearTransientReferences();

  std::vector<AgentId> getAgentsInViewport(const CellPredicate &inView) const;

  size_t addRemovalListener(RemovalListener listener);
  void removeRemovalListener(size_t handle);

  /**
   * @brief Wraps a deferred callback so it only runs while the agent lives.
   * The registry must outlive the returned callable.
   */
  std::function<void()> guardedCallback(AgentId id,
                                        std::function<void(Agent &)> fn);

  /**
   * @brief RAII scope that defers purging of removed agents.
   */
  class IterationGuard {
  public:
    explicit IterationGuard(AgentRegistry &registry) : m_registry(registry) {
      ++m_registry.m_iterationDepth;
    }
    ~IterationGuard() {
      if (--m_registry.m_iterationDepth == 0) {
        m_registry.purgeRemoved();
      }
    }
    IterationGuard(const IterationGuard &) = delete;
    IterationGuard &operator=(const IterationGuard &) = delete;

  private:
    AgentRegistry &m_registry;
  };

private:
  const SpeciesCatalog &m_catalog;
  const IGridService *m_grid;
  HideableDirectory *m_hideables;

  std::vector<std::unique_ptr<Agent>> m_agents;
  std::unordered_map<AgentId, Agent *> m_index;
  AgentId m_nextId{1};
  int m_iterationDepth{0};

  std::unordered_map<AgentId, AgentId> m_targets;
  std::optional<AgentId> m_selected;

  std::vector<std::pair<size_t, RemovalListener>> m_removalListeners;
  size_t m_nextListenerHandle{1};
};

} // namespace BurrowSim

#endif // AGENT_REGISTRY_HPP
