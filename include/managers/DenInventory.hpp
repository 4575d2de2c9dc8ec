/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef DEN_INVENTORY_HPP
#define DEN_INVENTORY_HPP

#include "entities/ItemRecord.hpp"
#include <deque>
#include <vector>

namespace BurrowSim {

/**
 * @brief Shared store behind the player's den. Workers deposit into it and
 * eat from it while sheltered.
 */
class IDenInventory {
public:
  virtual ~IDenInventory() = default;

  virtual void deposit(const ItemRecord &item) = 0;
  // Consumes the oldest stored food; returns its restore value or 0
  virtual int spendStoredFood() = 0;
  virtual bool availableStoredFood() const = 0;
};

class DenInventory : public IDenInventory {
public:
  DenInventory() = default;

  void deposit(const ItemRecord &item) override;
  int spendStoredFood() override;
  bool availableStoredFood() const override { return !m_food.empty(); }

  size_t getFoodCount() const { return m_food.size(); }
  size_t getOtherCount() const { return m_other.size(); }
  size_t getTotalDeposited() const { return m_totalDeposited; }
  const std::deque<ItemRecord> &getFood() const { return m_food; }

  void clear();

private:
  std::deque<ItemRecord> m_food;
  std::vector<ItemRecord> m_other;
  size_t m_totalDeposited{0};
};

} // namespace BurrowSim

#endif // DEN_INVENTORY_HPP
