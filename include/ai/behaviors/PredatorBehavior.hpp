/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef PREDATOR_BEHAVIOR_HPP
#define PREDATOR_BEHAVIOR_HPP

#include "ai/AgentBehavior.hpp"

namespace BurrowSim {

/**
 * @brief Turn step shared by every predator species.
 *
 * Stalled predators only count down. Otherwise the predator steps toward the
 * nearest valid target within detection range, or patrols its territory, and
 * hunts whatever valid target shares its tile afterwards. The species'
 * PredatorVariant then adds its rule: Tiring rests after a long fruitless
 * chase, Dashing queues a straight-line dash for the next turn.
 */
class PredatorBehavior : public AgentBehavior {
public:
  void takeTurn(BehaviorContext &ctx, Agent &agent);

  /**
   * @brief Unsheltered, off-den, living agent that is either not a predator
   * or a predator of a strictly lower priority tier.
   */
  static bool isValidTarget(const BehaviorContext &ctx, const Agent &hunter,
                            const Agent &candidate);

  // Predation on the hunter's tile; returns true on a kill
  static bool tryHunt(BehaviorContext &ctx, Agent &hunter);

private:
  static std::optional<AgentId> findTarget(const BehaviorContext &ctx,
                                           const Agent &agent);
  static void chase(BehaviorContext &ctx, Agent &agent, const Agent &target,
                    bool moves);
  static void patrol(BehaviorContext &ctx, Agent &agent, bool moves);

  static void applyVariant(BehaviorContext &ctx, Agent &agent,
                           std::optional<AgentId> target);
  static void applyTiring(BehaviorContext &ctx, Agent &agent,
                          std::optional<AgentId> target);
  static void applyDashing(BehaviorContext &ctx, Agent &agent,
                           std::optional<AgentId> target);

  // Unit direction of a clear straight run to the target, if one exists
  static std::optional<GridCell> planDash(const BehaviorContext &ctx,
                                          const Agent &agent,
                                          const Agent &target);
  static void executeDash(BehaviorContext &ctx, Agent &agent);
};

} // namespace BurrowSim

#endif // PREDATOR_BEHAVIOR_HPP
