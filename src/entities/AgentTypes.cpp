/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "entities/AgentTypes.hpp"

namespace BurrowSim {

const char *behaviorStateToString(BehaviorState state) {
  switch (state) {
  case BehaviorState::Idle:
    return "Idle";
  case BehaviorState::Wandering:
    return "Wandering";
  case BehaviorState::Fleeing:
    return "Fleeing";
  case BehaviorState::Foraging:
    return "Foraging";
  case BehaviorState::Hiding:
    return "Hiding";
  case BehaviorState::ReturningHome:
    return "ReturningHome";
  case BehaviorState::Hunting:
    return "Hunting";
  case BehaviorState::Stalled:
    return "Stalled";
  case BehaviorState::Dashing:
    return "Dashing";
  case BehaviorState::Carrying:
    return "Carrying";
  case BehaviorState::Depositing:
    return "Depositing";
  case BehaviorState::ConsumingStoredFood:
    return "ConsumingStoredFood";
  default:
    return "Unknown";
  }
}

const char *removalCauseToString(RemovalCause cause) {
  switch (cause) {
  case RemovalCause::Starvation:
    return "Starvation";
  case RemovalCause::Predation:
    return "Predation";
  case RemovalCause::Despawn:
    return "Despawn";
  default:
    return "Unknown";
  }
}

} // namespace BurrowSim
