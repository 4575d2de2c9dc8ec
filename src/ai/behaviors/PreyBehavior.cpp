/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "ai/behaviors/PreyBehavior.hpp"
#include "core/Logger.hpp"
#include "managers/ForageManager.hpp"
#include "world/GridService.hpp"
#include "world/Hideable.hpp"
#include <algorithm>
#include <array>
#include <cmath>
#include <cstdlib>
#include <format>
#include <numbers>
#include <vector>

namespace BurrowSim {

namespace {
constexpr int FLEE_SPIRAL_RADIUS = 3;
constexpr int FLEE_RANDOM_ATTEMPTS = 5;
} // namespace

void PreyBehavior::takeTurn(BehaviorContext &ctx, Agent &agent) {
  if (!applyHungerDecay(ctx, agent)) {
    return;
  }
  const bool moves = consumeCadence(agent);

  if (agent.isSheltered() && holdInShelter(ctx, agent)) {
    return;
  }

  if (!agent.isHungry()) {
    returnHome(ctx, agent, moves);
    return;
  }

  if (evadeThreat(ctx, agent, moves)) {
    return;
  }
  forage(ctx, agent, moves);
}

bool PreyBehavior::holdInShelter(BehaviorContext &ctx, Agent &agent) {
  // Agents stay inside until they actually step off the tile; moveAgent
  // does the leaving.
  if (!isShelteredAtHome(agent)) {
    return false;
  }
  if (agent.isCriticallyHungry()) {
    BEHAVIOR_DEBUG(std::format("#{} leaves home, critically hungry ({})",
                               agent.getId(), agent.getHunger()));
    return false;
  }
  if (!agent.isHungry() || findNearestPredator(ctx, agent)) {
    agent.setState(BehaviorState::Hiding);
    return true;
  }
  return false;
}

void PreyBehavior::returnHome(BehaviorContext &ctx, Agent &agent, bool moves) {
  const IHideable *home = resolveHome(ctx, agent);
  if (!home) {
    // Homeless and sated: keep clear of danger, otherwise roam
    if (auto threat = findNearestPredator(ctx, agent)) {
      if (const Agent *t = ctx.registry.getAgent(*threat)) {
        fleeFrom(ctx, agent, t->getPosition(), moves);
        return;
      }
    }
    wanderNear(ctx, agent, moves);
    return;
  }

  if (tryHideAtHome(ctx, agent)) {
    return;
  }
  agent.setState(BehaviorState::ReturningHome);
  if (moves) {
    stepTowards(ctx, agent, home->getPosition());
    tryHideAtHome(ctx, agent);
  }
}

bool PreyBehavior::evadeThreat(BehaviorContext &ctx, Agent &agent, bool moves) {
  if (agent.isCriticallyHungry()) {
    return false;
  }
  const auto threatId = findNearestPredator(ctx, agent);
  if (!threatId) {
    return false;
  }
  const Agent *threat = ctx.registry.getAgent(*threatId);
  if (!threat) {
    return false;
  }
  const GridCell threatPos = threat->getPosition();

  // Run for home when we are closer to it than the threat is
  if (const IHideable *home = resolveHome(ctx, agent)) {
    const GridCell homePos = home->getPosition();
    if (manhattanDistance(agent.getPosition(), homePos) <
        manhattanDistance(threatPos, homePos)) {
      agent.setState(BehaviorState::Fleeing);
      agent.memory().fleeDestination = homePos;
      if (moves &&
          stepTowards(ctx, agent, homePos) == SimulationResult::SUCCESS) {
        tryHideAtHome(ctx, agent);
        return true;
      }
      if (!moves) {
        return true;
      }
    }
  }

  fleeFrom(ctx, agent, threatPos, moves);
  return true;
}

void PreyBehavior::fleeFrom(BehaviorContext &ctx, Agent &agent,
                            const GridCell &threat, bool moves) {
  agent.setState(BehaviorState::Fleeing);
  agent.memory().wanderDestination.reset();
  if (!moves) {
    agent.memory().fleeDestination =
        computeFleeDestination(ctx, agent, threat);
    return;
  }

  // First candidate whose opening step succeeds wins
  std::optional<GridCell> firstCandidate;
  auto tryStep = [&](const GridCell &cell) {
    if (!firstCandidate) {
      firstCandidate = cell;
    }
    if (stepTowards(ctx, agent, cell) != SimulationResult::SUCCESS) {
      return false;
    }
    agent.memory().fleeDestination = cell;
    return true;
  };

  if (auto spiral = spiralFleeCell(ctx, agent, threat)) {
    if (tryStep(*spiral)) {
      return;
    }
  }
  for (const GridCell &cell : cardinalFleeCells(ctx, agent, threat)) {
    if (tryStep(cell)) {
      return;
    }
  }
  for (int attempt = 0; attempt < FLEE_RANDOM_ATTEMPTS; ++attempt) {
    if (auto cell = randomFleeCell(ctx, agent)) {
      if (tryStep(*cell)) {
        return;
      }
    }
  }

  agent.memory().fleeDestination = firstCandidate;
  if (!firstCandidate) {
    BEHAVIOR_DEBUG(std::format("#{} has nowhere to flee", agent.getId()));
  } else {
    BEHAVIOR_DEBUG(std::format("#{} is boxed in, holding at ({}, {})",
                               agent.getId(), agent.getPosition().x,
                               agent.getPosition().y));
  }
}

std::optional<GridCell>
PreyBehavior::computeFleeDestination(BehaviorContext &ctx, const Agent &agent,
                                     const GridCell &threat) {
  if (auto spiral = spiralFleeCell(ctx, agent, threat)) {
    return spiral;
  }
  const auto cardinals = cardinalFleeCells(ctx, agent, threat);
  if (!cardinals.empty()) {
    return cardinals.front();
  }
  for (int attempt = 0; attempt < FLEE_RANDOM_ATTEMPTS; ++attempt) {
    if (auto cell = randomFleeCell(ctx, agent)) {
      return cell;
    }
  }
  return std::nullopt;
}

GridCell PreyBehavior::clampToGrid(const BehaviorContext &ctx, GridCell cell) {
  cell.x = std::clamp(cell.x, 0, ctx.grid.getWidth() - 1);
  cell.y = std::clamp(cell.y, 0, ctx.grid.getHeight() - 1);
  return cell;
}

std::optional<GridCell>
PreyBehavior::spiralFleeCell(BehaviorContext &ctx, const Agent &agent,
                             const GridCell &threat) {
  const GridCell self = agent.getPosition();
  const int fleeDistance = std::max(1, agent.getParams().fleeDistance);

  const GridCell away = self - threat;
  double vx = away.x;
  double vy = away.y;
  if (away.x == 0 && away.y == 0) {
    std::uniform_real_distribution<double> angleDist(0.0,
                                                     2.0 * std::numbers::pi);
    const double angle = angleDist(ctx.rng);
    vx = std::cos(angle);
    vy = std::sin(angle);
  }
  const double len = std::sqrt(vx * vx + vy * vy);
  const GridCell target = clampToGrid(
      ctx, GridCell(
               self.x + static_cast<int>(std::lround(vx / len * fleeDistance)),
               self.y + static_cast<int>(std::lround(vy / len * fleeDistance))));

  // Ring by ring around the target, nearest ring first
  for (int r = 0; r <= FLEE_SPIRAL_RADIUS; ++r) {
    for (int dy = -r; dy <= r; ++dy) {
      for (int dx = -r; dx <= r; ++dx) {
        if (std::max(std::abs(dx), std::abs(dy)) != r) {
          continue;
        }
        const GridCell cell(target.x + dx, target.y + dy);
        if (!(cell == self) && isFleeCellFree(ctx, agent, cell)) {
          return cell;
        }
      }
    }
  }
  return std::nullopt;
}

std::vector<GridCell>
PreyBehavior::cardinalFleeCells(const BehaviorContext &ctx, const Agent &agent,
                                const GridCell &threat) {
  constexpr std::array<Direction, 4> dirs{Direction::Up, Direction::Down,
                                          Direction::Left, Direction::Right};
  std::vector<GridCell> cells;
  cells.reserve(dirs.size());
  for (Direction dir : dirs) {
    const GridCell cell = agent.getPosition() + directionOffset(dir);
    if (isFleeCellFree(ctx, agent, cell)) {
      cells.push_back(cell);
    }
  }
  // Furthest from the threat first
  std::stable_sort(cells.begin(), cells.end(),
                   [&threat](const GridCell &a, const GridCell &b) {
                     return manhattanDistance(a, threat) >
                            manhattanDistance(b, threat);
                   });
  return cells;
}

std::optional<GridCell> PreyBehavior::randomFleeCell(BehaviorContext &ctx,
                                                     const Agent &agent) {
  const GridCell self = agent.getPosition();
  const int fleeDistance = std::max(1, agent.getParams().fleeDistance);
  std::uniform_real_distribution<double> angleDist(0.0,
                                                   2.0 * std::numbers::pi);
  const double angle = angleDist(ctx.rng);
  const GridCell cell = clampToGrid(
      ctx,
      GridCell(
          self.x + static_cast<int>(std::lround(std::cos(angle) * fleeDistance)),
          self.y +
              static_cast<int>(std::lround(std::sin(angle) * fleeDistance))));
  if (cell == self || !isFleeCellFree(ctx, agent, cell)) {
    return std::nullopt;
  }
  return cell;
}

bool PreyBehavior::isFleeCellFree(const BehaviorContext &ctx,
                                  const Agent &agent, const GridCell &cell) {
  if (!isTileTraversable(ctx, agent, cell)) {
    return false;
  }
  return !ctx.registry.findAgentAt(cell, agent.getId(), [](const Agent &other) {
    return AgentTraits::isForager(other.getCategory());
  });
}

bool PreyBehavior::tryHideAtHome(BehaviorContext &ctx, Agent &agent) {
  const IHideable *home = resolveHome(ctx, agent);
  if (!home || !(home->getPosition() == agent.getPosition())) {
    return false;
  }
  if (!ctx.registry.enterHideable(agent.getId(), *agent.getHome())) {
    return false;
  }
  agent.setState(BehaviorState::Hiding);
  agent.memory().wanderDestination.reset();
  agent.memory().fleeDestination.reset();
  return true;
}

void PreyBehavior::wanderNear(BehaviorContext &ctx, Agent &agent, bool moves) {
  agent.setState(BehaviorState::Wandering);
  if (!moves) {
    return;
  }
  const auto &p = agent.getParams();
  wanderStep(ctx, agent, agent.getPosition(), p.wanderRadiusMin,
             p.wanderRadiusMax, true);
}

void PreyBehavior::forage(BehaviorContext &ctx, Agent &agent, bool moves) {
  if (!ctx.forage) {
    wanderNear(ctx, agent, moves);
    return;
  }
  if (harvestHere(ctx, agent)) {
    return;
  }

  const auto &p = agent.getParams();
  const std::optional<int> radius =
      agent.isCriticallyHungry() ? std::nullopt
                                 : std::optional<int>(p.foodDetectionRadius);
  const auto food =
      ctx.forage->nearestFullPatch(agent.getPosition(), p.targetFood, radius);
  agent.memory().foodDestination = food;
  if (!food) {
    wanderNear(ctx, agent, moves);
    return;
  }

  agent.setState(BehaviorState::Foraging);
  agent.memory().wanderDestination.reset();
  if (moves && stepTowards(ctx, agent, *food) == SimulationResult::SUCCESS) {
    harvestHere(ctx, agent);
  }
}

bool PreyBehavior::harvestHere(BehaviorContext &ctx, Agent &agent) {
  if (!ctx.forage || !ctx.forage->isFullPatchAt(agent.getPosition(),
                                                agent.getParams().targetFood)) {
    return false;
  }
  const int restored = ctx.forage->harvest(agent.getPosition());
  agent.increaseHunger(restored);
  agent.setState(BehaviorState::Foraging);
  agent.memory().foodDestination.reset();
  BEHAVIOR_DEBUG(std::format("#{} ate {} (+{}, now {})", agent.getId(),
                             agent.getParams().targetFood, restored,
                             agent.getHunger()));
  return true;
}

} // namespace BurrowSim
