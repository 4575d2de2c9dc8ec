/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef SEASON_HPP
#define SEASON_HPP

#include <cstdint>
#include <ostream>

namespace BurrowSim {

enum class Season : uint8_t { Spring = 0, Summer = 1, Fall = 2, Winter = 3 };

inline const char *seasonToString(Season season) {
  switch (season) {
  case Season::Spring:
    return "Spring";
  case Season::Summer:
    return "Summer";
  case Season::Fall:
    return "Fall";
  case Season::Winter:
    return "Winter";
  default:
    return "Unknown";
  }
}

inline std::ostream &operator<<(std::ostream &os, Season season) {
  return os << seasonToString(season);
}

/**
 * @brief Season for a turn number: (turn / turnsPerSeason) mod 4.
 * A non-positive turnsPerSeason pins the clock to Spring.
 */
constexpr Season seasonForTurn(int turn, int turnsPerSeason) {
  if (turnsPerSeason <= 0 || turn < 0) {
    return Season::Spring;
  }
  return static_cast<Season>((turn / turnsPerSeason) % 4);
}

} // namespace BurrowSim

#endif // SEASON_HPP
