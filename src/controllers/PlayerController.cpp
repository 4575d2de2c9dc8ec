/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "controllers/PlayerController.hpp"
#include "core/Logger.hpp"
#include "managers/AgentRegistry.hpp"
#include "managers/ForageManager.hpp"
#include "managers/HideableDirectory.hpp"
#include "managers/TurnScheduler.hpp"
#include "world/GridService.hpp"
#include "world/Hideable.hpp"
#include <algorithm>
#include <array>
#include <format>

namespace BurrowSim {

PlayerController::PlayerController(AgentRegistry &registry,
                                   TurnScheduler &scheduler,
                                   HideableDirectory *hideables,
                                   ForageManager *forage)
    : m_registry(registry), m_scheduler(scheduler), m_hideables(hideables),
      m_forage(forage) {
  m_removalHandle = m_registry.addRemovalListener(
      [this](AgentId id, RemovalCause cause) { onAgentRemoved(id, cause); });
  m_turnHandle =
      m_scheduler.addTurnListener([this](int) { onTurnCompleted(); });
}

PlayerController::~PlayerController() {
  m_registry.removeRemovalListener(m_removalHandle);
  m_scheduler.removeTurnListener(m_turnHandle);
}

SimulationResult PlayerController::spawnPlayer(const GridCell &cell) {
  if (m_registry.isAlive(m_playerId)) {
    PLAYER_WARN("spawnPlayer: a player is already alive");
    return SimulationResult::INVALID_SPAWN;
  }
  AgentId id = INVALID_AGENT_ID;
  const SimulationResult result = m_registry.spawn(Species::Player, cell, id);
  if (result != SimulationResult::SUCCESS) {
    return result;
  }
  m_playerId = id;
  m_lost = false;
  if (Agent *player = m_registry.getAgent(id)) {
    enterShelterHere(*player);
  }
  PLAYER_INFO(std::format("Player #{} spawned at ({}, {})", id, cell.x,
                          cell.y));
  return SimulationResult::SUCCESS;
}

std::optional<AgentId> PlayerController::getPlayerId() const {
  if (!m_registry.isAlive(m_playerId)) {
    return std::nullopt;
  }
  return m_playerId;
}

SimulationResult PlayerController::requestMove(Direction direction) {
  const Agent *player = m_registry.getAgent(m_playerId);
  if (!player) {
    return SimulationResult::STALE_REFERENCE;
  }
  return requestMoveToTile(player->getPosition() + directionOffset(direction));
}

SimulationResult
PlayerController::requestMoveToWorldPoint(const WorldPoint &point) {
  const IGridService *grid = m_registry.getGridService();
  if (!grid) {
    PLAYER_WARN("requestMoveToWorldPoint: no grid service");
    return SimulationResult::MISSING_COLLABORATOR;
  }
  return requestMoveToTile(grid->worldToGrid(point));
}

SimulationResult PlayerController::requestMoveToTile(const GridCell &cell) {
  Agent *player = m_registry.getAgent(m_playerId);
  if (!player) {
    return SimulationResult::STALE_REFERENCE;
  }
  const IGridService *grid = m_registry.getGridService();
  if (!grid) {
    PLAYER_WARN("requestMoveToTile: no grid service");
    return SimulationResult::MISSING_COLLABORATOR;
  }

  const GridCell from = player->getPosition();
  if (manhattanDistance(from, cell) != 1) {
    PLAYER_DEBUG(std::format("Refused non-adjacent move to ({}, {})",
                             cell.x, cell.y));
    return SimulationResult::PATH_UNAVAILABLE;
  }
  if (!grid->isValid(cell) || !grid->isWalkable(cell) ||
      (grid->isWater(cell) && !player->getParams().canCrossWater)) {
    PLAYER_DEBUG(std::format("Refused move onto blocked tile ({}, {})",
                             cell.x, cell.y));
    return SimulationResult::PATH_UNAVAILABLE;
  }

  const AgentId id = player->getId();
  m_registry.beginStep(id);
  m_registry.moveAgent(id, cell);
  player->memory().lastFacing = cell - from;

  enterShelterHere(*player);
  deliverFood(*player);
  if (m_registry.resolveMoveConflict(id)) {
    PLAYER_DEBUG(std::format("Player bumped back to ({}, {})", from.x,
                             from.y));
  }

  m_scheduler.notifyPlayerMoved();
  return SimulationResult::SUCCESS;
}

bool PlayerController::pickUpItem() {
  Agent *player = m_registry.getAgent(m_playerId);
  if (!player || !m_forage) {
    return false;
  }
  auto item = m_forage->pickUpItemAt(player->getPosition());
  if (!item) {
    return false;
  }
  PLAYER_INFO(std::format("Picked up {}", item->name));
  player->addCarriedItem(std::move(*item));
  return true;
}

void PlayerController::enterShelterHere(Agent &player) {
  if (!m_hideables) {
    return;
  }
  const GridCell pos = player.getPosition();
  const bool predatorHere =
      m_registry
          .findAgentAt(pos, player.getId(),
                       [](const Agent &other) {
                         return other.getCategory() == AgentCategory::Predator;
                       })
          .has_value();
  if (predatorHere) {
    return;
  }

  // Dens before bushes
  constexpr std::array<HideableKind, 3> order{
      HideableKind::Den, HideableKind::Burrow, HideableKind::Bush};
  for (HideableKind kind : order) {
    if (auto id = m_hideables->findAt(pos, kind)) {
      if (m_registry.enterHideable(player.getId(), *id)) {
        player.setState(BehaviorState::Hiding);
        return;
      }
    }
  }
}

void PlayerController::deliverFood(Agent &player) {
  const auto current = player.getCurrentHideable();
  if (!current || !m_hideables) {
    return;
  }
  const IHideable *shelter = m_hideables->find(*current);
  if (!shelter || !isSafeDenKind(shelter->getKind())) {
    return;
  }

  int delivered = 0;
  for (ItemRecord &item : player.takeCarriedItems()) {
    if (item.isFood()) {
      ++delivered;
    } else {
      player.addCarriedItem(std::move(item));
    }
  }
  if (delivered > 0) {
    player.increaseGroupCount(delivered);
    PLAYER_INFO(std::format("Delivered {} food, group is now {}", delivered,
                            player.getGroupCount()));
  }
}

void PlayerController::onTurnCompleted() {
  Agent *player = m_registry.getAgent(m_playerId);
  if (!player) {
    return;
  }
  if (player->decreaseHunger(1)) {
    PLAYER_INFO("Player starved");
    m_registry.remove(m_playerId, RemovalCause::Starvation);
  }
}

void PlayerController::onAgentRemoved(AgentId id, RemovalCause cause) {
  if (id != m_playerId || m_lost) {
    return;
  }
  m_lost = true;
  PLAYER_INFO(std::format("Player lost ({})", removalCauseToString(cause)));
  const auto listeners = m_loseListeners;
  for (const auto &[handle, listener] : listeners) {
    if (listener) {
      listener(cause);
    }
  }
}

size_t PlayerController::addLoseListener(LoseListener listener) {
  const size_t handle = m_nextLoseHandle++;
  m_loseListeners.emplace_back(handle, std::move(listener));
  return handle;
}

void PlayerController::removeLoseListener(size_t handle) {
  m_loseListeners.erase(
      std::remove_if(m_loseListeners.begin(), m_loseListeners.end(),
                     [handle](const auto &e) { return e.first == handle; }),
      m_loseListeners.end());
}

} // namespace BurrowSim
