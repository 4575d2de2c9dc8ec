/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef FORAGE_MANAGER_HPP
#define FORAGE_MANAGER_HPP

#include "core/GridTypes.hpp"
#include "core/Season.hpp"
#include "entities/ItemRecord.hpp"
#include <cstdint>
#include <optional>
#include <random>
#include <string>
#include <vector>

namespace BurrowSim {

enum class PatchState : uint8_t { Growing, Full };

struct FoodPatch {
  uint32_t id{0};
  GridCell cell;
  std::string foodName{"Grass"};
  PatchState state{PatchState::Full};
  int hungerRestored{20};
  int averageTurnsBetweenGrowth{10};
  float growthVariance{0.25f};
  int turnsSinceGrowth{0};
  int turnsUntilGrowth{0};
};

/**
 * @brief Edible world state: regrowing food patches plus loose items lying on
 * tiles. Ticked once per completed turn by the scheduler.
 */
class ForageManager {
public:
  explicit ForageManager(uint32_t seed = 7);

  uint32_t addPatch(const GridCell &cell, const std::string &foodName,
                    int hungerRestored, bool startFull = true,
                    int averageTurnsBetweenGrowth = 10,
                    float growthVariance = 0.25f);

  const FoodPatch *getPatch(uint32_t id) const;
  const FoodPatch *patchAt(const GridCell &cell) const;
  const std::vector<FoodPatch> &getPatches() const { return m_patches; }

  bool isFullPatchAt(const GridCell &cell, const std::string &foodName) const;

  // Returns the restore value, or 0 if no full patch is on the cell
  int harvest(const GridCell &cell);

  /**
   * @brief Closest full patch of the given food (case-insensitive) by
   * Manhattan distance. Ties go to the patch registered first.
   * @param maxRadius nullopt searches the whole field
   */
  std::optional<GridCell> nearestFullPatch(const GridCell &from,
                                           const std::string &foodName,
                                           std::optional<int> maxRadius) const;

  void dropItem(const GridCell &cell, const ItemRecord &item);
  std::optional<ItemRecord> pickUpItemAt(const GridCell &cell);
  bool hasGroundItemAt(const GridCell &cell) const;
  std::optional<GridCell> nearestGroundItem(const GridCell &from,
                                            std::optional<int> maxRadius) const;
  size_t getGroundItemCount() const { return m_groundItems.size(); }

  void onTurnAdvanced();
  void onSeasonChanged(Season season);
  Season getSeason() const { return m_season; }

  static float seasonGrowthMultiplier(Season season);
  // round(avg * (1 + offset) / multiplier), never below 1
  static int growthInterval(int averageTurns, float varianceOffset,
                            Season season);

  void clear();

private:
  struct GroundItem {
    GridCell cell;
    ItemRecord item;
  };

  std::vector<FoodPatch> m_patches;
  std::vector<GroundItem> m_groundItems;
  uint32_t m_nextPatchId{1};
  Season m_season{Season::Spring};
  std::mt19937 m_rng;

  void startGrowing(FoodPatch &patch);
  static bool sameFood(const std::string &a, const std::string &b);
};

} // namespace BurrowSim

#endif // FORAGE_MANAGER_HPP
