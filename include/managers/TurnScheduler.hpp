/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef TURN_SCHEDULER_HPP
#define TURN_SCHEDULER_HPP

#include "ai/BehaviorContext.hpp"
#include "ai/behaviors/PredatorBehavior.hpp"
#include "ai/behaviors/PreyBehavior.hpp"
#include "ai/behaviors/WorkerBehavior.hpp"
#include "core/Season.hpp"
#include <cstdint>
#include <functional>
#include <iostream>
#include <random>
#include <utility>
#include <vector>

namespace BurrowSim {

struct SimulationConfig;

enum class SchedulerState : uint8_t {
  Idle,   // waiting for the player's first move
  Running // one turn per player move
};

inline std::ostream &operator<<(std::ostream &os, SchedulerState state) {
  return os << (state == SchedulerState::Idle ? "Idle" : "Running");
}

/**
 * @brief What one completed turn did, handed to post-turn hooks.
 */
struct TurnSummary {
  int turn{0};
  Season season{Season::Spring};
  size_t agentsMoved{0};
  size_t agentsRemoved{0};
  size_t agentsProcessed{0};
  bool skippedDegraded{false};
};

/**
 * @brief Drives the simulation one synchronous pass per player move.
 *
 * Per turn: bump the counter (and season), step every non-player,
 * non-dormant agent in registry order with conflict resolution after each
 * move, clear transient cross-references, then fire post-turn hooks and turn
 * listeners. A missing registry or grid skips agent processing but the turn
 * still completes; a missing pathfinder skips each agent with a warning.
 */
class TurnScheduler {
public:
  using TurnListener = std::function<void(int)>;
  using PostTurnHook = std::function<void(const TurnSummary &)>;
  using SeasonListener = std::function<void(Season)>;

  TurnScheduler(const SimulationServices &services,
                const SimulationConfig &config);

  TurnScheduler(const TurnScheduler &) = delete;
  TurnScheduler &operator=(const TurnScheduler &) = delete;

  // Entry point for the player input adapter
  void notifyPlayerMoved();
  // Runs one turn regardless of state (scripted scenarios, tests)
  void advanceTurn();
  void reset();

  SchedulerState getState() const { return m_state; }
  int getTurnCount() const { return m_turn; }
  Season getSeason() const { return m_season; }
  const TurnSummary &getLastSummary() const { return m_lastSummary; }

  size_t addTurnListener(TurnListener listener);
  void removeTurnListener(size_t handle);
  size_t addPostTurnHook(PostTurnHook hook);
  void removePostTurnHook(size_t handle);
  size_t addSeasonListener(SeasonListener listener);
  void removeSeasonListener(size_t handle);

  std::mt19937 &rng() { return m_rng; }
  SimulationServices &services() { return m_services; }
  const SimulationServices &services() const { return m_services; }

private:
  void updateSeason();
  void processAgents(TurnSummary &summary);
  void notifyObservers(const TurnSummary &summary);

  SimulationServices m_services;
  uint32_t m_seed;
  int m_turnsPerSeason;
  std::mt19937 m_rng;

  SchedulerState m_state{SchedulerState::Idle};
  int m_turn{0};
  Season m_season{Season::Spring};
  bool m_processingTurn{false};
  TurnSummary m_lastSummary;

  PreyBehavior m_prey;
  PredatorBehavior m_predator;
  WorkerBehavior m_worker;

  std::vector<std::pair<size_t, TurnListener>> m_turnListeners;
  std::vector<std::pair<size_t, PostTurnHook>> m_postTurnHooks;
  std::vector<std::pair<size_t, SeasonListener>> m_seasonListeners;
  size_t m_nextHandle{1};
};

} // namespace BurrowSim

#endif // TURN_SCHEDULER_HPP
