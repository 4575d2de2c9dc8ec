/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "managers/DenInventory.hpp"
#include "core/Logger.hpp"
#include <format>

namespace BurrowSim {

void DenInventory::deposit(const ItemRecord &item) {
  if (item.isFood()) {
    m_food.push_back(item);
  } else {
    m_other.push_back(item);
  }
  ++m_totalDeposited;
  DEN_DEBUG(std::format("Deposited {} (food stored: {})", item.name,
                        m_food.size()));
}

int DenInventory::spendStoredFood() {
  if (m_food.empty()) {
    return 0;
  }
  const int restored = m_food.front().hungerRestored;
  m_food.pop_front();
  return restored;
}

void DenInventory::clear() {
  m_food.clear();
  m_other.clear();
  m_totalDeposited = 0;
}

} // namespace BurrowSim
