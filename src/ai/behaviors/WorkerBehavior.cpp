/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "ai/behaviors/WorkerBehavior.hpp"
#include "core/Logger.hpp"
#include "managers/DenInventory.hpp"
#include "managers/ForageManager.hpp"
#include "managers/WorkerRoster.hpp"
#include "world/Hideable.hpp"
#include <cmath>
#include <format>

namespace BurrowSim {

void WorkerBehavior::takeTurn(BehaviorContext &ctx, Agent &agent) {
  if (!applyHungerDecay(ctx, agent)) {
    return;
  }
  const bool moves = consumeCadence(agent);

  if (agent.isSheltered()) {
    if (isShelteredAtHome(agent)) {
      if (agent.isCriticallyHungry() && eatFromStorage(ctx, agent)) {
        return;
      }
      if (agent.isCarrying()) {
        depositCarried(ctx, agent);
      }
    }
    if (holdInShelter(ctx, agent)) {
      return;
    }
  }

  if (agent.isCarrying()) {
    haulHome(ctx, agent, moves);
    return;
  }

  if (!agent.isHungry()) {
    returnHome(ctx, agent, moves);
    return;
  }

  if (evadeThreat(ctx, agent, moves)) {
    return;
  }
  gather(ctx, agent, moves);
}

bool WorkerBehavior::eatFromStorage(BehaviorContext &ctx, Agent &agent) {
  if (!ctx.denInventory) {
    BEHAVIOR_WARN("Worker has no den inventory to eat from");
    return false;
  }
  if (!ctx.denInventory->availableStoredFood()) {
    return false;
  }
  const int restored = ctx.denInventory->spendStoredFood();
  agent.increaseHunger(restored);
  agent.setState(BehaviorState::ConsumingStoredFood);
  BEHAVIOR_DEBUG(std::format("Worker #{} ate stored food (+{}, now {})",
                             agent.getId(), restored, agent.getHunger()));
  return true;
}

size_t WorkerBehavior::depositCarried(BehaviorContext &ctx, Agent &agent) {
  if (!agent.isCarrying()) {
    return 0;
  }
  if (!ctx.denInventory) {
    BEHAVIOR_WARN(std::format("Worker #{} cannot deposit: no den inventory",
                              agent.getId()));
    return 0;
  }

  const float bonusRate = ctx.roster ? ctx.roster->getBonusFoodDropRate() : 0.0f;
  std::uniform_real_distribution<float> roll(0.0f, 1.0f);
  size_t deposits = 0;
  for (const ItemRecord &item : agent.takeCarriedItems()) {
    ctx.denInventory->deposit(item);
    ++deposits;
    if (item.isFood() && bonusRate > 0.0f && roll(ctx.rng) < bonusRate) {
      ctx.denInventory->deposit(item);
      ++deposits;
    }
  }
  agent.setState(BehaviorState::Depositing);
  DEN_DEBUG(std::format("Worker #{} made {} deposits", agent.getId(),
                        deposits));
  return deposits;
}

void WorkerBehavior::haulHome(BehaviorContext &ctx, Agent &agent, bool moves) {
  const IHideable *home = resolveHome(ctx, agent);
  if (!home) {
    // Nowhere to deliver to; keep the load and roam
    wanderNear(ctx, agent, moves);
    agent.setState(BehaviorState::Carrying);
    return;
  }

  agent.setState(BehaviorState::Carrying);
  agent.memory().wanderDestination.reset();
  if (!(agent.getPosition() == home->getPosition()) && moves) {
    stepTowards(ctx, agent, home->getPosition());
  }
  if (agent.getPosition() == home->getPosition()) {
    tryHideAtHome(ctx, agent);
    depositCarried(ctx, agent);
  }
}

void WorkerBehavior::gather(BehaviorContext &ctx, Agent &agent, bool moves) {
  if (!ctx.forage) {
    wanderAroundHome(ctx, agent, moves);
    return;
  }
  if (collectHere(ctx, agent)) {
    return;
  }

  const auto &p = agent.getParams();
  const GridCell pos = agent.getPosition();
  const std::optional<int> radius =
      agent.isCriticallyHungry() ? std::nullopt
                                 : std::optional<int>(p.foodDetectionRadius);
  const auto patch = ctx.forage->nearestFullPatch(pos, p.targetFood, radius);
  const auto item = ctx.forage->nearestGroundItem(pos, radius);

  std::optional<GridCell> goal = patch;
  if (item && (!patch || manhattanDistance(pos, *item) <
                             manhattanDistance(pos, *patch))) {
    goal = item;
  }
  agent.memory().foodDestination = goal;
  if (!goal) {
    wanderAroundHome(ctx, agent, moves);
    return;
  }

  agent.setState(BehaviorState::Foraging);
  agent.memory().wanderDestination.reset();
  if (moves && stepTowards(ctx, agent, *goal) == SimulationResult::SUCCESS) {
    collectHere(ctx, agent);
  }
}

bool WorkerBehavior::collectHere(BehaviorContext &ctx, Agent &agent) {
  const GridCell pos = agent.getPosition();
  const auto &p = agent.getParams();

  if (ctx.forage->isFullPatchAt(pos, p.targetFood)) {
    const int restored = ctx.forage->harvest(pos);
    agent.increaseHunger(static_cast<int>(
        std::lround(static_cast<float>(restored) * p.workerHungerMultiplier)));
    agent.addCarriedItem(ItemRecord::food(p.targetFood, restored));
    agent.setState(BehaviorState::Carrying);
    agent.memory().foodDestination.reset();
    return true;
  }

  if (auto item = ctx.forage->pickUpItemAt(pos)) {
    BEHAVIOR_DEBUG(std::format("Worker #{} picked up {}", agent.getId(),
                               item->name));
    agent.addCarriedItem(std::move(*item));
    agent.setState(BehaviorState::Carrying);
    agent.memory().foodDestination.reset();
    return true;
  }
  return false;
}

void WorkerBehavior::wanderAroundHome(BehaviorContext &ctx, Agent &agent,
                                      bool moves) {
  const IHideable *home = resolveHome(ctx, agent);
  if (!home) {
    wanderNear(ctx, agent, moves);
    return;
  }
  agent.setState(BehaviorState::Wandering);
  if (moves) {
    const auto &p = agent.getParams();
    wanderStep(ctx, agent, home->getPosition(), p.wanderRadiusMin,
               p.wanderRadiusMax, false);
  }
}

} // namespace BurrowSim
