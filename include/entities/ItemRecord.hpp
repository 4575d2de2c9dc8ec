/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef ITEM_RECORD_HPP
#define ITEM_RECORD_HPP

#include <cstdint>
#include <string>
#include <utility>

namespace BurrowSim {

enum class ItemKind : uint8_t { Food, Material };

// Lightweight value carried by workers and the player, stored in dens
struct ItemRecord {
  std::string name;
  ItemKind kind{ItemKind::Food};
  int hungerRestored{0};

  bool isFood() const { return kind == ItemKind::Food; }

  static ItemRecord food(std::string foodName, int restores) {
    return ItemRecord{std::move(foodName), ItemKind::Food, restores};
  }
};

} // namespace BurrowSim

#endif // ITEM_RECORD_HPP
