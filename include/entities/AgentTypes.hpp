/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef AGENT_TYPES_HPP
#define AGENT_TYPES_HPP

#include <cstdint>
#include <ostream>
#include <string_view>

namespace BurrowSim {

// Unique per registry, never reused; 0 is the invalid id
using AgentId = uint64_t;
constexpr AgentId INVALID_AGENT_ID = 0;

using HideableId = uint32_t;
constexpr HideableId INVALID_HIDEABLE_ID = 0;

enum class AgentCategory : uint8_t { Player, Prey, Predator, Worker };

enum class Species : uint8_t {
  Player = 0,
  Rabbit = 1,
  Coyote = 2,
  Hawk = 3,
  KangRat = 4,
  COUNT = 5
};

enum class BehaviorState : uint8_t {
  Idle,
  Wandering,
  Fleeing,
  Foraging,
  Hiding,
  ReturningHome,
  Hunting,
  Stalled,
  Dashing,
  Carrying,
  Depositing,
  ConsumingStoredFood
};

enum class RemovalCause : uint8_t { Starvation, Predation, Despawn };

/**
 * @brief Static per-species facts. Tunable numbers live in SpeciesParams.
 */
namespace AgentTraits {

constexpr AgentCategory categoryOf(Species species) noexcept {
  switch (species) {
  case Species::Player:
    return AgentCategory::Player;
  case Species::Coyote:
  case Species::Hawk:
    return AgentCategory::Predator;
  case Species::KangRat:
    return AgentCategory::Worker;
  case Species::Rabbit:
  default:
    return AgentCategory::Prey;
  }
}

// Prey and workers share the forage/flee/hide machinery
constexpr bool isForager(AgentCategory category) noexcept {
  return category == AgentCategory::Prey || category == AgentCategory::Worker;
}

constexpr bool isPredator(Species species) noexcept {
  return categoryOf(species) == AgentCategory::Predator;
}

constexpr const char *speciesToString(Species species) noexcept {
  switch (species) {
  case Species::Player:
    return "Player";
  case Species::Rabbit:
    return "Rabbit";
  case Species::Coyote:
    return "Coyote";
  case Species::Hawk:
    return "Hawk";
  case Species::KangRat:
    return "KangRat";
  default:
    return "Unknown";
  }
}

constexpr const char *categoryToString(AgentCategory category) noexcept {
  switch (category) {
  case AgentCategory::Player:
    return "Player";
  case AgentCategory::Prey:
    return "Prey";
  case AgentCategory::Predator:
    return "Predator";
  case AgentCategory::Worker:
    return "Worker";
  default:
    return "Unknown";
  }
}

constexpr bool speciesFromString(std::string_view name, Species &out) noexcept {
  for (uint8_t i = 0; i < static_cast<uint8_t>(Species::COUNT); ++i) {
    const auto candidate = static_cast<Species>(i);
    if (name == speciesToString(candidate)) {
      out = candidate;
      return true;
    }
  }
  return false;
}

} // namespace AgentTraits

const char *behaviorStateToString(BehaviorState state);
const char *removalCauseToString(RemovalCause cause);

inline std::ostream &operator<<(std::ostream &os, Species species) {
  return os << AgentTraits::speciesToString(species);
}
inline std::ostream &operator<<(std::ostream &os, AgentCategory category) {
  return os << AgentTraits::categoryToString(category);
}
inline std::ostream &operator<<(std::ostream &os, BehaviorState state) {
  return os << behaviorStateToString(state);
}
inline std::ostream &operator<<(std::ostream &os, RemovalCause cause) {
  return os << removalCauseToString(cause);
}

} // namespace BurrowSim

#endif // AGENT_TYPES_HPP
