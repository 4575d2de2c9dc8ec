/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef SIMULATION_RESULT_HPP
#define SIMULATION_RESULT_HPP

#include <cstdint>
#include <ostream>

namespace BurrowSim {

enum class SimulationResult : uint8_t {
  SUCCESS,
  INVALID_SPAWN,
  PATH_UNAVAILABLE,
  MISSING_COLLABORATOR,
  STALE_REFERENCE
};

inline const char *simulationResultToString(SimulationResult result) {
  switch (result) {
  case SimulationResult::SUCCESS:
    return "SUCCESS";
  case SimulationResult::INVALID_SPAWN:
    return "INVALID_SPAWN";
  case SimulationResult::PATH_UNAVAILABLE:
    return "PATH_UNAVAILABLE";
  case SimulationResult::MISSING_COLLABORATOR:
    return "MISSING_COLLABORATOR";
  case SimulationResult::STALE_REFERENCE:
    return "STALE_REFERENCE";
  default:
    return "UNKNOWN";
  }
}

// Stream operator for test output
inline std::ostream &operator<<(std::ostream &os, SimulationResult result) {
  return os << simulationResultToString(result);
}

} // namespace BurrowSim

#endif // SIMULATION_RESULT_HPP
