/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef AGENT_BEHAVIOR_HPP
#define AGENT_BEHAVIOR_HPP

#include "ai/BehaviorContext.hpp"
#include "ai/pathfinding/Pathfinder.hpp"
#include "core/SimulationResult.hpp"
#include "managers/AgentRegistry.hpp"
#include <optional>

namespace BurrowSim {

class IHideable;

/**
 * @brief Shared movement, sensing and shelter helpers for the species
 * machines. Machines derive from this for access to the helpers only; there
 * is no virtual dispatch, the scheduler picks the machine by category.
 */
class AgentBehavior {
protected:
  // Valid, walkable, and not water unless the species may cross it
  static bool isTileTraversable(const BehaviorContext &ctx, const Agent &agent,
                                const GridCell &cell);
  static TraversalPredicate traversalFor(const BehaviorContext &ctx,
                                         const Agent &agent);

  /**
   * @brief Takes one cardinal step along a route to `destination`.
   *
   * The next cell is refused if an unsheltered agent stands on it, unless
   * `mayShareWith` accepts that agent.
   * @return SUCCESS if the agent moved (or already stands on the
   * destination), PATH_UNAVAILABLE otherwise
   */
  static SimulationResult
  stepTowards(BehaviorContext &ctx, Agent &agent, const GridCell &destination,
              const AgentRegistry::AgentPredicate &mayShareWith = {});

  // Hunger -1. Returns false if the agent starved and was removed.
  static bool applyHungerDecay(BehaviorContext &ctx, Agent &agent);

  // Move-cadence gate: true on the 1st, (N+1)th, ... call
  static bool consumeCadence(Agent &agent);

  static std::optional<GridCell>
  chooseWanderDestination(BehaviorContext &ctx, const Agent &agent,
                          const GridCell &center, int minRadius, int maxRadius,
                          bool allowAnywhereFallback);

  // Wander step with destination memory; re-rolls on arrival or failure
  static void wanderStep(BehaviorContext &ctx, Agent &agent,
                         const GridCell &center, int minRadius, int maxRadius,
                         bool allowAnywhereFallback);

  static std::optional<AgentId> findNearestPredator(const BehaviorContext &ctx,
                                                    const Agent &agent);

  // Home hideable, or nullptr (a vanished home is cleared from the agent)
  static IHideable *resolveHome(BehaviorContext &ctx, const Agent &agent);
  static bool isShelteredAtHome(const Agent &agent);
  static bool isSafeDenTile(const BehaviorContext &ctx, const GridCell &cell);
};

} // namespace BurrowSim

#endif // AGENT_BEHAVIOR_HPP
