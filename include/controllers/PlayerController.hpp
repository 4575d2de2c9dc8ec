/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef PLAYER_CONTROLLER_HPP
#define PLAYER_CONTROLLER_HPP

/**
 * @file PlayerController.hpp
 * @brief Input adapter between the player's move requests and the turn loop
 *
 * Validates a requested step, applies it through the registry (shelter
 * exit/enter, food delivery, conflict resolution) and then hands control to
 * the TurnScheduler. Also owns the player's per-turn hunger and the lose
 * condition.
 *
 * Owned by the session; unsubscribes its registry and scheduler listeners on
 * destruction.
 */

#include "core/GridTypes.hpp"
#include "core/SimulationResult.hpp"
#include "entities/AgentTypes.hpp"
#include <functional>
#include <optional>
#include <utility>
#include <vector>

namespace BurrowSim {

class Agent;
class AgentRegistry;
class ForageManager;
class HideableDirectory;
class TurnScheduler;

class PlayerController {
public:
  using LoseListener = std::function<void(RemovalCause)>;

  PlayerController(AgentRegistry &registry, TurnScheduler &scheduler,
                   HideableDirectory *hideables = nullptr,
                   ForageManager *forage = nullptr);
  ~PlayerController();

  PlayerController(const PlayerController &) = delete;
  PlayerController &operator=(const PlayerController &) = delete;

  /**
   * @brief Spawns the player and shelters it if it starts on a den.
   * @return INVALID_SPAWN if a player is already alive or the cell is bad
   */
  SimulationResult spawnPlayer(const GridCell &cell);
  std::optional<AgentId> getPlayerId() const;

  /**
   * @brief Moves one tile and advances the simulation by one turn.
   *
   * Invalid, unwalkable or water tiles (for a player that cannot swim) are
   * refused with PATH_UNAVAILABLE and do not advance time.
   */
  SimulationResult requestMove(Direction direction);
  // Adjacent tiles only
  SimulationResult requestMoveToTile(const GridCell &cell);
  SimulationResult requestMoveToWorldPoint(const WorldPoint &point);

  // Ground item on the player's tile into the carried list; no time passes
  bool pickUpItem();

  size_t addLoseListener(LoseListener listener);
  void removeLoseListener(size_t handle);
  bool hasLost() const { return m_lost; }

private:
  void enterShelterHere(Agent &player);
  void deliverFood(Agent &player);
  void onTurnCompleted();
  void onAgentRemoved(AgentId id, RemovalCause cause);

  AgentRegistry &m_registry;
  TurnScheduler &m_scheduler;
  HideableDirectory *m_hideables;
  ForageManager *m_forage;

  AgentId m_playerId{INVALID_AGENT_ID};
  bool m_lost{false};

  size_t m_removalHandle{0};
  size_t m_turnHandle{0};
  std::vector<std::pair<size_t, LoseListener>> m_loseListeners;
  size_t m_nextLoseHandle{1};
};

} // namespace BurrowSim

#endif // PLAYER_CONTROLLER_HPP
