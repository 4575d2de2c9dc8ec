/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef SIMULATION_CONFIG_HPP
#define SIMULATION_CONFIG_HPP

#include <cstdint>
#include <optional>
#include <string>

namespace BurrowSim {

/**
 * @brief Session-wide settings, read from res/data/simulation.json.
 */
struct SimulationConfig {
  uint32_t rngSeed{1337};
  int turnsPerSeason{50};
  int mvpWorkerGoal{20};
  int maxWorkersPerDen{5};
  std::optional<float> fixedWorkerBonusRate;

  // Demo map
  int gridWidth{32};
  int gridHeight{24};
  float tileSize{24.0f};

  /**
   * @brief Overlays values from a JSON file onto `out`. Missing or mistyped
   * fields keep their current value.
   * @return false if the file cannot be read or parsed
   */
  static bool loadFromFile(const std::string &path, SimulationConfig &out);
  static bool loadFromString(const std::string &json, SimulationConfig &out);
};

} // namespace BurrowSim

#endif // SIMULATION_CONFIG_HPP
