/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "managers/TurnScheduler.hpp"
#include "core/Logger.hpp"
#include "core/SimulationConfig.hpp"
#include "managers/AgentRegistry.hpp"
#include "managers/ForageManager.hpp"
#include <algorithm>
#include <exception>
#include <format>

namespace BurrowSim {

namespace {
template <typename Entries>
void eraseHandle(Entries &entries, size_t handle) {
  entries.erase(std::remove_if(entries.begin(), entries.end(),
                               [handle](const auto &e) {
                                 return e.first == handle;
                               }),
                entries.end());
}
} // namespace

TurnScheduler::TurnScheduler(const SimulationServices &services,
                             const SimulationConfig &config)
    : m_services(services), m_seed(config.rngSeed),
      m_turnsPerSeason(config.turnsPerSeason), m_rng(config.rngSeed) {}

void TurnScheduler::notifyPlayerMoved() {
  if (m_state == SchedulerState::Idle) {
    SCHEDULER_INFO("First player move, simulation running");
    m_state = SchedulerState::Running;
  }
  advanceTurn();
}

void TurnScheduler::advanceTurn() {
  if (m_processingTurn) {
    SCHEDULER_WARN("advanceTurn called while a turn is in progress; ignored");
    return;
  }
  m_processingTurn = true;

  ++m_turn;
  updateSeason();

  TurnSummary summary;
  summary.turn = m_turn;
  summary.season = m_season;

  if (!m_services.registry || !m_services.grid) {
    SCHEDULER_WARN(std::format("Turn {}: {} missing, agents not processed",
                               m_turn,
                               m_services.registry ? "grid service"
                                                   : "agent registry"));
    summary.skippedDegraded = true;
  } else {
    processAgents(summary);
  }

  if (m_services.registry) {
    m_services.registry->clearTransientReferences();
  }
  if (m_services.forage) {
    m_services.forage->onTurnAdvanced();
  }

  m_lastSummary = summary;
  SCHEDULER_DEBUG(std::format(
      "Turn {} done ({}): processed {}, moved {}, removed {}", m_turn,
      seasonToString(m_season), summary.agentsProcessed, summary.agentsMoved,
      summary.agentsRemoved));

  notifyObservers(summary);
  m_processingTurn = false;
}

void TurnScheduler::reset() {
  m_state = SchedulerState::Idle;
  m_turn = 0;
  m_season = Season::Spring;
  m_lastSummary = TurnSummary{};
  m_rng.seed(m_seed);
  if (m_services.forage) {
    m_services.forage->onSeasonChanged(m_season);
  }
}

void TurnScheduler::updateSeason() {
  const Season season = seasonForTurn(m_turn, m_turnsPerSeason);
  if (season == m_season) {
    return;
  }
  m_season = season;
  SCHEDULER_INFO(std::format("Season changed to {} at turn {}",
                             seasonToString(season), m_turn));
  if (m_services.forage) {
    m_services.forage->onSeasonChanged(season);
  }
  const auto listeners = m_seasonListeners;
  for (const auto &[handle, listener] : listeners) {
    try {
      listener(season);
    } catch (const std::exception &e) {
      SCHEDULER_ERROR(std::format("Season listener {} threw: {}", handle,
                                  e.what()));
    }
  }
}

void TurnScheduler::processAgents(TurnSummary &summary) {
  AgentRegistry &registry = *m_services.registry;
  const size_t aliveBefore = registry.getAgentCount();

  {
    AgentRegistry::IterationGuard guard(registry);
    for (AgentId id : registry.allAgents()) {
      Agent *agent = registry.getAgent(id);
      // Removed earlier this turn
      if (!agent) {
        continue;
      }
      if (agent->getCategory() == AgentCategory::Player || agent->isDormant()) {
        continue;
      }
      if (!m_services.pathfinder) {
        SCHEDULER_WARN(std::format("Turn {}: no pathfinder, skipping #{}",
                                   m_turn, id));
        summary.skippedDegraded = true;
        continue;
      }

      BehaviorContext ctx(registry, *m_services.grid, *m_services.pathfinder,
                          m_services, m_rng, m_turn);
      registry.beginStep(id);
      const GridCell before = agent->getPosition();

      try {
        switch (agent->getCategory()) {
        case AgentCategory::Prey:
          m_prey.takeTurn(ctx, *agent);
          break;
        case AgentCategory::Predator:
          m_predator.takeTurn(ctx, *agent);
          break;
        case AgentCategory::Worker:
          m_worker.takeTurn(ctx, *agent);
          break;
        case AgentCategory::Player:
          break;
        }
      } catch (const std::exception &e) {
        SCHEDULER_ERROR(std::format("Turn {}: step for #{} failed: {}", m_turn,
                                    id, e.what()));
      }
      ++summary.agentsProcessed;

      Agent *after = registry.getAgent(id);
      if (after && !(after->getPosition() == before)) {
        registry.resolveMoveConflict(id);
        if (!(after->getPosition() == before)) {
          ++summary.agentsMoved;
        }
      }
    }
  }

  const size_t aliveAfter = registry.getAgentCount();
  summary.agentsRemoved = aliveBefore > aliveAfter ? aliveBefore - aliveAfter : 0;
}

void TurnScheduler::notifyObservers(const TurnSummary &summary) {
  // Copies: observers may add or remove observers while being notified
  const auto hooks = m_postTurnHooks;
  for (const auto &[handle, hook] : hooks) {
    try {
      hook(summary);
    } catch (const std::exception &e) {
      SCHEDULER_ERROR(std::format("Post-turn hook {} threw: {}", handle,
                                  e.what()));
    }
  }
  const auto listeners = m_turnListeners;
  for (const auto &[handle, listener] : listeners) {
    try {
      listener(summary.turn);
    } catch (const std::exception &e) {
      SCHEDULER_ERROR(std::format("Turn listener {} threw: {}", handle,
                                  e.what()));
    }
  }
}

size_t TurnScheduler::addTurnListener(TurnListener listener) {
  const size_t handle = m_nextHandle++;
  m_turnListeners.emplace_back(handle, std::move(listener));
  return handle;
}

void TurnScheduler::removeTurnListener(size_t handle) {
  eraseHandle(m_turnListeners, handle);
}

size_t TurnScheduler::addPostTurnHook(PostTurnHook hook) {
  const size_t handle = m_nextHandle++;
  m_postTurnHooks.emplace_back(handle, std::move(hook));
  return handle;
}

void TurnScheduler::removePostTurnHook(size_t handle) {
  eraseHandle(m_postTurnHooks, handle);
}

size_t TurnScheduler::addSeasonListener(SeasonListener listener) {
  const size_t handle = m_nextHandle++;
  m_seasonListeners.emplace_back(handle, std::move(listener));
  return handle;
}

void TurnScheduler::removeSeasonListener(size_t handle) {
  eraseHandle(m_seasonListeners, handle);
}

} // namespace BurrowSim
