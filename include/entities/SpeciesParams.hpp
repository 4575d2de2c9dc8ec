/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef SPECIES_PARAMS_HPP
#define SPECIES_PARAMS_HPP

#include "entities/AgentTypes.hpp"
#include <string>

namespace BurrowSim {

// Variant hook applied after a predator's standard turn
enum class PredatorVariant : uint8_t {
  Standard, // no extra rule
  Tiring,   // rests after a long fruitless chase
  Dashing   // lines up straight dashes at targets it is facing
};

/**
 * @brief Tunable numbers for one species. Shared read-only by every agent of
 * that species; loaded from res/data/species.json with per-field fallback to
 * the defaults below.
 */
struct SpeciesParams {
  Species species{Species::Rabbit};
  std::string name{"Rabbit"};

  // Hunger
  int maxHunger{100};
  int initialHunger{100};
  int hungerThreshold{70};         // hungry below this
  int criticalHungerThreshold{20}; // ignores predators below this

  // Senses and movement
  int detectionRadius{5};
  int fleeDistance{3};
  int foodDetectionRadius{10};
  std::string targetFood{"Grass"};
  int moveCadence{1}; // moves on 1 of every N eligible turns
  int wanderRadiusMin{2};
  int wanderRadiusMax{6};
  bool canCrossWater{false};

  // Predation
  int priorityTier{0};
  int huntCooldownTurns{2};
  int huntHungerRestored{40};
  int territoryRadius{8};
  PredatorVariant predatorVariant{PredatorVariant::Standard};
  int chaseTurnsBeforeBreak{8};
  int breakDurationTurns{2};
  int dashDistance{3};
  int minimumRestTurns{0};

  // Group and worker tuning
  int initialGroupCount{1};
  float workerHungerMultiplier{1.5f};
};

} // namespace BurrowSim

#endif // SPECIES_PARAMS_HPP
