/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "managers/ForageManager.hpp"
#include "core/Logger.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <format>

namespace BurrowSim {

namespace {
// Share of full patches that die back when winter starts
constexpr float WINTER_DIEBACK_CHANCE = 0.5f;
} // namespace

ForageManager::ForageManager(uint32_t seed) : m_rng(seed) {}

uint32_t ForageManager::addPatch(const GridCell &cell,
                                 const std::string &foodName,
                                 int hungerRestored, bool startFull,
                                 int averageTurnsBetweenGrowth,
                                 float growthVariance) {
  FoodPatch patch;
  patch.id = m_nextPatchId++;
  patch.cell = cell;
  patch.foodName = foodName;
  patch.hungerRestored = std::max(0, hungerRestored);
  patch.averageTurnsBetweenGrowth = std::max(1, averageTurnsBetweenGrowth);
  patch.growthVariance = std::clamp(growthVariance, 0.0f, 0.95f);
  if (startFull) {
    patch.state = PatchState::Full;
  } else {
    startGrowing(patch);
  }
  m_patches.push_back(patch);
  return patch.id;
}

const FoodPatch *ForageManager::getPatch(uint32_t id) const {
  for (const auto &patch : m_patches) {
    if (patch.id == id)
      return &patch;
  }
  return nullptr;
}

const FoodPatch *ForageManager::patchAt(const GridCell &cell) const {
  for (const auto &patch : m_patches) {
    if (patch.cell == cell)
      return &patch;
  }
  return nullptr;
}

bool ForageManager::isFullPatchAt(const GridCell &cell,
                                  const std::string &foodName) const {
  for (const auto &patch : m_patches) {
    if (patch.cell == cell && patch.state == PatchState::Full &&
        sameFood(patch.foodName, foodName)) {
      return true;
    }
  }
  return false;
}

int ForageManager::harvest(const GridCell &cell) {
  for (auto &patch : m_patches) {
    if (patch.cell == cell && patch.state == PatchState::Full) {
      const int restored = patch.hungerRestored;
      startGrowing(patch);
      WORLD_DEBUG(std::format("Harvested {} at ({}, {})", patch.foodName,
                              cell.x, cell.y));
      return restored;
    }
  }
  return 0;
}

std::optional<GridCell>
ForageManager::nearestFullPatch(const GridCell &from,
                                const std::string &foodName,
                                std::optional<int> maxRadius) const {
  std::optional<GridCell> best;
  int bestDist = 0;
  for (const auto &patch : m_patches) {
    if (patch.state != PatchState::Full || !sameFood(patch.foodName, foodName))
      continue;
    const int d = manhattanDistance(from, patch.cell);
    if (maxRadius && d > *maxRadius)
      continue;
    if (!best || d < bestDist) {
      best = patch.cell;
      bestDist = d;
    }
  }
  return best;
}

void ForageManager::dropItem(const GridCell &cell, const ItemRecord &item) {
  m_groundItems.push_back(GroundItem{cell, item});
}

std::optional<ItemRecord> ForageManager::pickUpItemAt(const GridCell &cell) {
  auto it = std::find_if(m_groundItems.begin(), m_groundItems.end(),
                         [&cell](const GroundItem &g) { return g.cell == cell; });
  if (it == m_groundItems.end()) {
    return std::nullopt;
  }
  ItemRecord item = std::move(it->item);
  m_groundItems.erase(it);
  return item;
}

bool ForageManager::hasGroundItemAt(const GridCell &cell) const {
  return std::any_of(m_groundItems.begin(), m_groundItems.end(),
                     [&cell](const GroundItem &g) { return g.cell == cell; });
}

std::optional<GridCell>
ForageManager::nearestGroundItem(const GridCell &from,
                                 std::optional<int> maxRadius) const {
  std::optional<GridCell> best;
  int bestDist = 0;
  for (const auto &g : m_groundItems) {
    const int d = manhattanDistance(from, g.cell);
    if (maxRadius && d > *maxRadius)
      continue;
    if (!best || d < bestDist) {
      best = g.cell;
      bestDist = d;
    }
  }
  return best;
}

void ForageManager::onTurnAdvanced() {
  for (auto &patch : m_patches) {
    if (patch.state != PatchState::Growing)
      continue;
    ++patch.turnsSinceGrowth;
    if (patch.turnsSinceGrowth >= patch.turnsUntilGrowth) {
      patch.state = PatchState::Full;
      patch.turnsSinceGrowth = 0;
    }
  }
}

void ForageManager::onSeasonChanged(Season season) {
  m_season = season;
  if (season != Season::Winter) {
    return;
  }
  std::uniform_real_distribution<float> roll(0.0f, 1.0f);
  int diedBack = 0;
  for (auto &patch : m_patches) {
    if (patch.state == PatchState::Full && roll(m_rng) < WINTER_DIEBACK_CHANCE) {
      startGrowing(patch);
      ++diedBack;
    }
  }
  WORLD_INFO(std::format("Winter die-back reset {} patches", diedBack));
}

float ForageManager::seasonGrowthMultiplier(Season season) {
  switch (season) {
  case Season::Spring:
    return 1.5f;
  case Season::Summer:
    return 1.2f;
  case Season::Fall:
    return 0.8f;
  case Season::Winter:
    return 0.5f;
  }
  return 1.0f;
}

int ForageManager::growthInterval(int averageTurns, float varianceOffset,
                                  Season season) {
  const float scaled = static_cast<float>(averageTurns) *
                       (1.0f + varianceOffset) / seasonGrowthMultiplier(season);
  return std::max(1, static_cast<int>(std::lround(scaled)));
}

void ForageManager::clear() {
  m_patches.clear();
  m_groundItems.clear();
}

void ForageManager::startGrowing(FoodPatch &patch) {
  patch.state = PatchState::Growing;
  patch.turnsSinceGrowth = 0;
  std::uniform_real_distribution<float> offset(-patch.growthVariance,
                                               patch.growthVariance);
  const float roll = patch.growthVariance > 0.0f ? offset(m_rng) : 0.0f;
  patch.turnsUntilGrowth =
      growthInterval(patch.averageTurnsBetweenGrowth, roll, m_season);
}

bool ForageManager::sameFood(const std::string &a, const std::string &b) {
  return a.size() == b.size() &&
         std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
           return std::tolower(static_cast<unsigned char>(x)) ==
                  std::tolower(static_cast<unsigned char>(y));
         });
}

} // namespace BurrowSim
