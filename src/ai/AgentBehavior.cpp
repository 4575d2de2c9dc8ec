/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "ai/AgentBehavior.hpp"
#include "ai/pathfinding/AxisPath.hpp"
#include "core/Logger.hpp"
#include "managers/HideableDirectory.hpp"
#include "world/GridService.hpp"
#include <algorithm>
#include <cmath>
#include <format>
#include <numbers>

namespace BurrowSim {

namespace {
constexpr int WANDER_ATTEMPTS = 30;
constexpr int WANDER_ANYWHERE_ATTEMPTS = 20;
} // namespace

bool AgentBehavior::isTileTraversable(const BehaviorContext &ctx,
                                      const Agent &agent,
                                      const GridCell &cell) {
  if (!ctx.grid.isValid(cell) || !ctx.grid.isWalkable(cell)) {
    return false;
  }
  return agent.getParams().canCrossWater || !ctx.grid.isWater(cell);
}

TraversalPredicate AgentBehavior::traversalFor(const BehaviorContext &ctx,
                                               const Agent &agent) {
  const IGridService *grid = &ctx.grid;
  const bool crossWater = agent.getParams().canCrossWater;
  return [grid, crossWater](const GridCell &cell) {
    return crossWater || !grid->isWater(cell);
  };
}

SimulationResult
AgentBehavior::stepTowards(BehaviorContext &ctx, Agent &agent,
                           const GridCell &destination,
                           const AgentRegistry::AgentPredicate &mayShareWith) {
  const GridCell start = agent.getPosition();
  if (start == destination) {
    return SimulationResult::SUCCESS;
  }

  std::vector<GridCell> waypoints;
  const PathfindingResult result = ctx.pathfinder.findPath(
      start, destination, traversalFor(ctx, agent), waypoints);
  if (result != PathfindingResult::SUCCESS) {
    BEHAVIOR_DEBUG(std::format("#{} has no route to ({}, {}): {}",
                               agent.getId(), destination.x, destination.y,
                               static_cast<int>(result)));
    return SimulationResult::PATH_UNAVAILABLE;
  }

  const auto next = AxisPath::firstStep(start, waypoints);
  if (!next) {
    return SimulationResult::SUCCESS;
  }
  if (!isTileTraversable(ctx, agent, *next)) {
    return SimulationResult::PATH_UNAVAILABLE;
  }
  if (auto occupant = ctx.registry.findAgentAt(*next, agent.getId())) {
    const Agent *other = ctx.registry.getAgent(*occupant);
    if (!other || !mayShareWith || !mayShareWith(*other)) {
      return SimulationResult::PATH_UNAVAILABLE;
    }
  }

  ctx.registry.moveAgent(agent.getId(), *next);
  agent.memory().lastFacing = *next - start;
  return SimulationResult::SUCCESS;
}

bool AgentBehavior::applyHungerDecay(BehaviorContext &ctx, Agent &agent) {
  if (agent.decreaseHunger(1)) {
    BEHAVIOR_INFO(std::format("{} #{} starved", agent.getParams().name,
                              agent.getId()));
    ctx.registry.remove(agent.getId(), RemovalCause::Starvation);
    return false;
  }
  return true;
}

bool AgentBehavior::consumeCadence(Agent &agent) {
  const int cadence = std::max(1, agent.getParams().moveCadence);
  int &counter = agent.memory().cadenceCounter;
  const bool moves = (counter % cadence) == 0;
  counter = (counter + 1) % cadence;
  return moves;
}

std::optional<GridCell>
AgentBehavior::chooseWanderDestination(BehaviorContext &ctx, const Agent &agent,
                                       const GridCell &center, int minRadius,
                                       int maxRadius,
                                       bool allowAnywhereFallback) {
  const int lo = std::max(0, std::min(minRadius, maxRadius));
  const int hi = std::max(lo, maxRadius);
  std::uniform_real_distribution<double> angleDist(0.0,
                                                   2.0 * std::numbers::pi);
  std::uniform_int_distribution<int> radiusDist(lo, hi);

  const int w = ctx.grid.getWidth();
  const int h = ctx.grid.getHeight();
  for (int attempt = 0; attempt < WANDER_ATTEMPTS; ++attempt) {
    const double angle = angleDist(ctx.rng);
    const int r = radiusDist(ctx.rng);
    GridCell cell(center.x + static_cast<int>(std::lround(std::cos(angle) * r)),
                  center.y + static_cast<int>(std::lround(std::sin(angle) * r)));
    cell.x = std::clamp(cell.x, 0, w - 1);
    cell.y = std::clamp(cell.y, 0, h - 1);
    if (!(cell == agent.getPosition()) && isTileTraversable(ctx, agent, cell)) {
      return cell;
    }
  }

  if (allowAnywhereFallback) {
    std::uniform_int_distribution<int> xDist(0, w - 1);
    std::uniform_int_distribution<int> yDist(0, h - 1);
    for (int attempt = 0; attempt < WANDER_ANYWHERE_ATTEMPTS; ++attempt) {
      const GridCell cell(xDist(ctx.rng), yDist(ctx.rng));
      if (!(cell == agent.getPosition()) &&
          isTileTraversable(ctx, agent, cell)) {
        return cell;
      }
    }
  }
  return std::nullopt;
}

void AgentBehavior::wanderStep(BehaviorContext &ctx, Agent &agent,
                               const GridCell &center, int minRadius,
                               int maxRadius, bool allowAnywhereFallback) {
  auto &dest = agent.memory().wanderDestination;
  if (dest && (*dest == agent.getPosition() ||
               !isTileTraversable(ctx, agent, *dest))) {
    dest.reset();
  }
  if (!dest) {
    dest = chooseWanderDestination(ctx, agent, center, minRadius, maxRadius,
                                   allowAnywhereFallback);
  }
  if (!dest) {
    return;
  }
  if (stepTowards(ctx, agent, *dest) != SimulationResult::SUCCESS) {
    // Blocked or unreachable: pick somewhere else next time
    dest.reset();
  } else if (*dest == agent.getPosition()) {
    dest.reset();
  }
}

std::optional<AgentId>
AgentBehavior::findNearestPredator(const BehaviorContext &ctx,
                                   const Agent &agent) {
  const AgentId self = agent.getId();
  return ctx.registry.nearest(
      agent.getPosition(),
      [self](const Agent &other) {
        return other.getId() != self &&
               other.getCategory() == AgentCategory::Predator;
      },
      agent.getParams().detectionRadius);
}

IHideable *AgentBehavior::resolveHome(BehaviorContext &ctx,
                                      const Agent &agent) {
  const auto home = agent.getHome();
  if (!home || !ctx.hideables) {
    return nullptr;
  }
  IHideable *hideable = ctx.hideables->find(*home);
  if (!hideable) {
    BEHAVIOR_DEBUG(std::format("#{} lost its home {}", agent.getId(), *home));
    ctx.registry.setHome(agent.getId(), std::nullopt);
  }
  return hideable;
}

bool AgentBehavior::isShelteredAtHome(const Agent &agent) {
  const auto current = agent.getCurrentHideable();
  const auto home = agent.getHome();
  return current && home && *current == *home;
}

bool AgentBehavior::isSafeDenTile(const BehaviorContext &ctx,
                                  const GridCell &cell) {
  return ctx.hideables && ctx.hideables->isSafeDenTile(cell);
}

} // namespace BurrowSim
