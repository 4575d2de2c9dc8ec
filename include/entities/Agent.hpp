/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef AGENT_HPP
#define AGENT_HPP

#include "core/GridTypes.hpp"
#include "entities/AgentTypes.hpp"
#include "entities/ItemRecord.hpp"
#include "entities/SpeciesParams.hpp"
#include <boost/container/small_vector.hpp>
#include <memory>
#include <optional>

namespace BurrowSim {

/**
 * @brief Per-agent scratch state owned by the behavior machines.
 */
struct BehaviorMemory {
  std::optional<GridCell> wanderDestination;
  std::optional<GridCell> fleeDestination;
  std::optional<GridCell> foodDestination;

  int cadenceCounter{0};

  // Predator bookkeeping
  AgentId chaseTarget{INVALID_AGENT_ID};
  int chaseTurnsWithoutKill{0};
  bool killedThisTurn{false};
  std::optional<GridCell> pendingDashDirection;
  GridCell lastFacing{0, 1};
  std::optional<GridCell> territoryCenter;
};

/**
 * @brief One simulated creature (or the player).
 *
 * Position, liveness and shelter membership are written by AgentRegistry so
 * that tile occupancy and hideable bookkeeping never drift apart; everything
 * else is open to the behavior machines that own the agent's turn.
 */
class Agent {
public:
  using CarriedItems = boost::container::small_vector<ItemRecord, 4>;

  /**
   * @throws std::invalid_argument if params is null or maxHunger is not
   * positive
   */
  Agent(AgentId id, std::shared_ptr<const SpeciesParams> params,
        const GridCell &position);

  AgentId getId() const { return m_id; }
  Species getSpecies() const { return m_params->species; }
  AgentCategory getCategory() const {
    return AgentTraits::categoryOf(m_params->species);
  }
  const SpeciesParams &getParams() const { return *m_params; }

  const GridCell &getPosition() const { return m_position; }
  const GridCell &getPreviousPosition() const { return m_previousPosition; }

  // Hunger is kept in [0, maxHunger]
  int getHunger() const { return m_hunger; }
  int getMaxHunger() const { return m_params->maxHunger; }
  void increaseHunger(int amount);
  // Returns true when hunger reached zero
  bool decreaseHunger(int amount);
  void setHunger(int value);
  bool isHungry() const { return m_hunger < m_params->hungerThreshold; }
  bool isCriticallyHungry() const {
    return m_hunger < m_params->criticalHungerThreshold;
  }

  int getGroupCount() const { return m_groupCount; }
  void increaseGroupCount(int amount);
  // Never below 1
  void setGroupCount(int count);
  // Returns true when the group has been wiped out
  bool reduceGroupCount();

  std::optional<HideableId> getHome() const { return m_home; }
  std::optional<HideableId> getCurrentHideable() const {
    return m_currentHideable;
  }
  bool isSheltered() const { return m_currentHideable.has_value(); }

  const CarriedItems &getCarriedItems() const { return m_carried; }
  void addCarriedItem(ItemRecord item) { m_carried.push_back(std::move(item)); }
  CarriedItems takeCarriedItems();
  bool isCarrying() const { return !m_carried.empty(); }

  int getStallTurns() const { return m_stallTurns; }
  void setStallTurns(int turns) { m_stallTurns = turns < 0 ? 0 : turns; }

  BehaviorState getState() const { return m_state; }
  void setState(BehaviorState state) { m_state = state; }

  BehaviorMemory &memory() { return m_memory; }
  const BehaviorMemory &memory() const { return m_memory; }

  bool isAlive() const { return m_alive; }

  bool isDormant() const { return m_dormant; }
  void setDormant(bool dormant) { m_dormant = dormant; }

  bool hasEncounteredAgent() const { return m_encounteredAgent; }
  void markEncounteredAgent() { m_encounteredAgent = true; }

private:
  friend class AgentRegistry;

  AgentId m_id;
  std::shared_ptr<const SpeciesParams> m_params;
  GridCell m_position;
  GridCell m_previousPosition;
  int m_hunger;
  int m_groupCount;
  std::optional<HideableId> m_home;
  std::optional<HideableId> m_currentHideable;
  // Hideable held at the start of the current step
  std::optional<HideableId> m_previousHideable;
  CarriedItems m_carried;
  int m_stallTurns{0};
  BehaviorState m_state{BehaviorState::Idle};
  BehaviorMemory m_memory;
  bool m_alive{true};
  bool m_dormant{false};
  bool m_encounteredAgent{false};
};

} // namespace BurrowSim

#endif // AGENT_HPP
