/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef WORKER_BEHAVIOR_HPP
#define WORKER_BEHAVIOR_HPP

#include "ai/behaviors/PreyBehavior.hpp"

namespace BurrowSim {

/**
 * @brief Prey machine plus hauling: a worker carrying anything heads home and
 * deposits it into the den inventory; a hungry worker gathers from the nearer
 * of a full patch or a ground item. A critically hungry worker hidden at home
 * eats from den storage before it considers leaving.
 */
class WorkerBehavior : public PreyBehavior {
public:
  void takeTurn(BehaviorContext &ctx, Agent &agent);

  /**
   * @brief Deposits every carried item into the den inventory. Each food item
   * is duplicated when a roll falls under the roster's bonus rate.
   * @return number of deposit calls made
   */
  static size_t depositCarried(BehaviorContext &ctx, Agent &agent);

private:
  static bool eatFromStorage(BehaviorContext &ctx, Agent &agent);
  static void haulHome(BehaviorContext &ctx, Agent &agent, bool moves);
  static void gather(BehaviorContext &ctx, Agent &agent, bool moves);
  static bool collectHere(BehaviorContext &ctx, Agent &agent);
  static void wanderAroundHome(BehaviorContext &ctx, Agent &agent, bool moves);
};

} // namespace BurrowSim

#endif // WORKER_BEHAVIOR_HPP
