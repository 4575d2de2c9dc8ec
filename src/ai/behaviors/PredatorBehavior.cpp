/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "ai/behaviors/PredatorBehavior.hpp"
#include "core/Logger.hpp"
#include <algorithm>
#include <format>

namespace BurrowSim {

namespace {
int sign(int v) { return (v > 0) - (v < 0); }
} // namespace

void PredatorBehavior::takeTurn(BehaviorContext &ctx, Agent &agent) {
  if (!applyHungerDecay(ctx, agent)) {
    return;
  }
  auto &mem = agent.memory();
  mem.killedThisTurn = false;

  if (agent.getStallTurns() > 0) {
    agent.setStallTurns(agent.getStallTurns() - 1);
    agent.setState(BehaviorState::Stalled);
    return;
  }

  // A queued dash replaces the normal step for this turn only
  if (mem.pendingDashDirection) {
    executeDash(ctx, agent);
    if (!tryHunt(ctx, agent)) {
      agent.setStallTurns(
          std::max(agent.getStallTurns(), agent.getParams().minimumRestTurns));
    }
    return;
  }

  const bool moves = consumeCadence(agent);
  const auto targetId = findTarget(ctx, agent);
  const Agent *target = targetId ? ctx.registry.getAgent(*targetId) : nullptr;
  if (target) {
    chase(ctx, agent, *target, moves);
  } else {
    ctx.registry.clearTarget(agent.getId());
    patrol(ctx, agent, moves);
  }

  tryHunt(ctx, agent);
  applyVariant(ctx, agent, target ? targetId : std::nullopt);
}

bool PredatorBehavior::isValidTarget(const BehaviorContext &ctx,
                                     const Agent &hunter,
                                     const Agent &candidate) {
  if (!candidate.isAlive() || candidate.getId() == hunter.getId() ||
      candidate.isSheltered()) {
    return false;
  }
  if (isSafeDenTile(ctx, candidate.getPosition())) {
    return false;
  }
  if (candidate.getCategory() == AgentCategory::Predator) {
    return candidate.getParams().priorityTier <
           hunter.getParams().priorityTier;
  }
  return true;
}

std::optional<AgentId> PredatorBehavior::findTarget(const BehaviorContext &ctx,
                                                    const Agent &agent) {
  return ctx.registry.nearest(
      agent.getPosition(),
      [&ctx, &agent](const Agent &other) {
        return isValidTarget(ctx, agent, other);
      },
      agent.getParams().detectionRadius);
}

void PredatorBehavior::chase(BehaviorContext &ctx, Agent &agent,
                             const Agent &target, bool moves) {
  agent.setState(BehaviorState::Hunting);
  agent.memory().wanderDestination.reset();
  ctx.registry.setTarget(agent.getId(), target.getId());
  if (!moves) {
    return;
  }
  const GridCell goal = target.getPosition();
  stepTowards(ctx, agent, goal, [&ctx, &agent](const Agent &other) {
    return isValidTarget(ctx, agent, other);
  });
}

void PredatorBehavior::patrol(BehaviorContext &ctx, Agent &agent, bool moves) {
  agent.setState(BehaviorState::Wandering);
  if (!moves) {
    return;
  }
  const auto &p = agent.getParams();
  const GridCell center =
      agent.memory().territoryCenter.value_or(agent.getPosition());
  wanderStep(ctx, agent, center, std::min(p.wanderRadiusMin, p.territoryRadius),
             p.territoryRadius, false);
}

bool PredatorBehavior::tryHunt(BehaviorContext &ctx, Agent &hunter) {
  // Standing on a den voids the hunt
  if (isSafeDenTile(ctx, hunter.getPosition())) {
    return false;
  }
  const auto victimId = ctx.registry.findAgentAt(
      hunter.getPosition(), hunter.getId(), [&ctx, &hunter](const Agent &other) {
        return isValidTarget(ctx, hunter, other);
      });
  if (!victimId) {
    return false;
  }
  Agent *victim = ctx.registry.getAgent(*victimId);
  if (!victim) {
    return false;
  }

  const auto &p = hunter.getParams();
  BEHAVIOR_INFO(std::format("{} #{} caught {} #{} at ({}, {})", p.name,
                            hunter.getId(), victim->getParams().name,
                            victim->getId(), hunter.getPosition().x,
                            hunter.getPosition().y));
  if (victim->reduceGroupCount()) {
    ctx.registry.remove(*victimId, RemovalCause::Predation);
  }

  hunter.increaseHunger(p.huntHungerRestored);
  hunter.setStallTurns(p.huntCooldownTurns);
  hunter.setState(BehaviorState::Stalled);
  ctx.registry.clearTarget(hunter.getId());

  auto &mem = hunter.memory();
  mem.killedThisTurn = true;
  mem.chaseTarget = INVALID_AGENT_ID;
  mem.chaseTurnsWithoutKill = 0;
  mem.pendingDashDirection.reset();
  return true;
}

void PredatorBehavior::applyVariant(BehaviorContext &ctx, Agent &agent,
                                    std::optional<AgentId> target) {
  switch (agent.getParams().predatorVariant) {
  case PredatorVariant::Standard:
    break;
  case PredatorVariant::Tiring:
    applyTiring(ctx, agent, target);
    break;
  case PredatorVariant::Dashing:
    applyDashing(ctx, agent, target);
    break;
  }
}

void PredatorBehavior::applyTiring(BehaviorContext &ctx, Agent &agent,
                                   std::optional<AgentId> target) {
  auto &mem = agent.memory();
  if (mem.killedThisTurn || !target) {
    mem.chaseTarget = INVALID_AGENT_ID;
    mem.chaseTurnsWithoutKill = 0;
    return;
  }

  if (mem.chaseTarget == *target) {
    ++mem.chaseTurnsWithoutKill;
  } else {
    mem.chaseTarget = *target;
    mem.chaseTurnsWithoutKill = 1;
  }

  const auto &p = agent.getParams();
  if (mem.chaseTurnsWithoutKill > p.chaseTurnsBeforeBreak) {
    BEHAVIOR_DEBUG(std::format("{} #{} gives up on #{} and rests {} turns",
                               p.name, agent.getId(), *target,
                               p.breakDurationTurns));
    agent.setStallTurns(p.breakDurationTurns);
    agent.setState(BehaviorState::Stalled);
    ctx.registry.clearTarget(agent.getId());
    mem.chaseTarget = INVALID_AGENT_ID;
    mem.chaseTurnsWithoutKill = 0;
  }
}

void PredatorBehavior::applyDashing(BehaviorContext &ctx, Agent &agent,
                                    std::optional<AgentId> target) {
  if (agent.memory().killedThisTurn) {
    return;
  }
  if (target) {
    if (const Agent *prey = ctx.registry.getAgent(*target)) {
      if (auto dir = planDash(ctx, agent, *prey)) {
        agent.memory().pendingDashDirection = dir;
        agent.setState(BehaviorState::Dashing);
        return;
      }
    }
  }
  agent.setStallTurns(
      std::max(agent.getStallTurns(), agent.getParams().minimumRestTurns));
}

std::optional<GridCell> PredatorBehavior::planDash(const BehaviorContext &ctx,
                                                   const Agent &agent,
                                                   const Agent &target) {
  const GridCell from = agent.getPosition();
  const GridCell to = target.getPosition();
  if (from.x != to.x && from.y != to.y) {
    return std::nullopt;
  }
  const int distance = manhattanDistance(from, to);
  if (distance == 0 || distance > agent.getParams().dashDistance) {
    return std::nullopt;
  }

  const GridCell dir(sign(to.x - from.x), sign(to.y - from.y));
  if (!(dir == agent.memory().lastFacing)) {
    return std::nullopt;
  }

  GridCell cell = from;
  for (int i = 1; i <= distance; ++i) {
    cell = cell + dir;
    if (!isTileTraversable(ctx, agent, cell)) {
      return std::nullopt;
    }
    if (i < distance && ctx.registry.hasOtherAgentAt(agent.getId(), cell)) {
      return std::nullopt;
    }
  }
  return dir;
}

void PredatorBehavior::executeDash(BehaviorContext &ctx, Agent &agent) {
  auto &mem = agent.memory();
  const GridCell dir = *mem.pendingDashDirection;
  mem.pendingDashDirection.reset();
  agent.setState(BehaviorState::Dashing);
  mem.lastFacing = dir;

  const int distance = std::max(1, agent.getParams().dashDistance);
  for (int i = 0; i < distance; ++i) {
    const GridCell next = agent.getPosition() + dir;
    if (!isTileTraversable(ctx, agent, next)) {
      break;
    }
    if (auto occupantId = ctx.registry.findAgentAt(next, agent.getId())) {
      const Agent *occupant = ctx.registry.getAgent(*occupantId);
      if (occupant && isValidTarget(ctx, agent, *occupant)) {
        ctx.registry.moveAgent(agent.getId(), next);
      } else {
        // Ran into something it cannot take: the whole dash is undone
        agent.markEncounteredAgent();
      }
      break;
    }
    ctx.registry.moveAgent(agent.getId(), next);
  }
}

} // namespace BurrowSim
