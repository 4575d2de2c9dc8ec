/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef PREY_BEHAVIOR_HPP
#define PREY_BEHAVIOR_HPP

#include "ai/AgentBehavior.hpp"
#include <vector>

namespace BurrowSim {

/**
 * @brief Turn step for prey: hunger, hiding at home, fleeing predators,
 * foraging and wandering.
 *
 * Per turn: hunger -1 (starve at 0); if hidden at home decide whether to stay;
 * a sated prey heads home and hides; a hungry prey flees a detected predator
 * unless critically hungry, otherwise forages, otherwise wanders.
 */
class PreyBehavior : public AgentBehavior {
public:
  void takeTurn(BehaviorContext &ctx, Agent &agent);

  /**
   * @brief Flee target: threat-to-self vector scaled to fleeDistance and
   * clamped to the grid, refined by a small spiral search, then the best
   * cardinal neighbour, then a few random angles.
   *
   * fleeFrom walks the same candidates in the same order and keeps going
   * when the opening step toward one is blocked.
   */
  static std::optional<GridCell> computeFleeDestination(BehaviorContext &ctx,
                                                        const Agent &agent,
                                                        const GridCell &threat);

protected:
  /**
   * @brief Decides whether a sheltered agent stays inside this turn.
   * A false return does not leave the hideable; the agent is only drawn out
   * once it steps off the tile.
   * @return true if the agent stays hidden (turn over)
   */
  static bool holdInShelter(BehaviorContext &ctx, Agent &agent);

  // Sated: go home and hide, or roam if homeless
  static void returnHome(BehaviorContext &ctx, Agent &agent, bool moves);

  // Returns true if a threat was handled this turn
  static bool evadeThreat(BehaviorContext &ctx, Agent &agent, bool moves);

  static void fleeFrom(BehaviorContext &ctx, Agent &agent,
                       const GridCell &threat, bool moves);

  // Enters the home hideable if standing on it
  static bool tryHideAtHome(BehaviorContext &ctx, Agent &agent);

  static void wanderNear(BehaviorContext &ctx, Agent &agent, bool moves);

private:
  static void forage(BehaviorContext &ctx, Agent &agent, bool moves);
  static bool harvestHere(BehaviorContext &ctx, Agent &agent);
  static bool isFleeCellFree(const BehaviorContext &ctx, const Agent &agent,
                             const GridCell &cell);
  static GridCell clampToGrid(const BehaviorContext &ctx, GridCell cell);
  static std::optional<GridCell> spiralFleeCell(BehaviorContext &ctx,
                                                const Agent &agent,
                                                const GridCell &threat);
  // Free cardinal neighbours, furthest from the threat first
  static std::vector<GridCell> cardinalFleeCells(const BehaviorContext &ctx,
                                                 const Agent &agent,
                                                 const GridCell &threat);
  static std::optional<GridCell> randomFleeCell(BehaviorContext &ctx,
                                                const Agent &agent);
};

} // namespace BurrowSim

#endif // PREY_BEHAVIOR_HPP
