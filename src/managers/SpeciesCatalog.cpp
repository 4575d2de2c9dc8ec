/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "managers/SpeciesCatalog.hpp"
#include "core/Logger.hpp"
#include "utils/JsonReader.hpp"
#include <algorithm>
#include <format>

namespace BurrowSim {

namespace {

bool parseVariant(const std::string &text, PredatorVariant &out) {
  if (text == "Standard") {
    out = PredatorVariant::Standard;
  } else if (text == "Tiring") {
    out = PredatorVariant::Tiring;
  } else if (text == "Dashing") {
    out = PredatorVariant::Dashing;
  } else {
    return false;
  }
  return true;
}

} // namespace

SpeciesCatalog::SpeciesCatalog() {
  for (size_t i = 0; i < m_params.size(); ++i) {
    m_params[i] = std::make_shared<const SpeciesParams>(
        defaultsFor(static_cast<Species>(i)));
  }
}

SpeciesParams SpeciesCatalog::defaultsFor(Species species) {
  SpeciesParams p;
  p.species = species;
  p.name = AgentTraits::speciesToString(species);

  switch (species) {
  case Species::Player:
    p.hungerThreshold = 30;
    p.criticalHungerThreshold = 10;
    p.initialGroupCount = 1;
    break;
  case Species::Rabbit:
    p.hungerThreshold = 50;
    p.criticalHungerThreshold = 20;
    p.detectionRadius = 7;
    p.fleeDistance = 3;
    p.foodDetectionRadius = 10;
    p.moveCadence = 2;
    p.wanderRadiusMin = 2;
    p.wanderRadiusMax = 6;
    break;
  case Species::KangRat:
    p.hungerThreshold = 70;
    p.criticalHungerThreshold = 20;
    p.detectionRadius = 5;
    p.fleeDistance = 3;
    p.foodDetectionRadius = 12;
    p.targetFood = "Grass";
    p.wanderRadiusMin = 1;
    p.wanderRadiusMax = 4;
    p.workerHungerMultiplier = 1.5f;
    break;
  case Species::Coyote:
    p.hungerThreshold = 60;
    p.criticalHungerThreshold = 15;
    p.detectionRadius = 6;
    p.priorityTier = 1;
    p.huntCooldownTurns = 3;
    p.huntHungerRestored = 40;
    p.territoryRadius = 5;
    p.predatorVariant = PredatorVariant::Tiring;
    p.chaseTurnsBeforeBreak = 8;
    p.breakDurationTurns = 2;
    break;
  case Species::Hawk:
    p.hungerThreshold = 60;
    p.criticalHungerThreshold = 15;
    p.detectionRadius = 5;
    p.priorityTier = 2;
    p.huntCooldownTurns = 2;
    p.huntHungerRestored = 30;
    p.territoryRadius = 7;
    p.canCrossWater = true;
    p.predatorVariant = PredatorVariant::Dashing;
    p.dashDistance = 3;
    p.minimumRestTurns = 1;
    break;
  default:
    break;
  }
  return p;
}

std::shared_ptr<const SpeciesParams> SpeciesCatalog::get(Species species) const {
  const auto idx = static_cast<size_t>(species);
  if (idx >= m_params.size()) {
    return nullptr;
  }
  return m_params[idx];
}

void SpeciesCatalog::set(const SpeciesParams &params) {
  const auto idx = static_cast<size_t>(params.species);
  if (idx >= m_params.size()) {
    CONFIG_ERROR("SpeciesCatalog::set called with out of range species");
    return;
  }
  m_params[idx] = std::make_shared<const SpeciesParams>(params);
}

bool SpeciesCatalog::loadFromFile(const std::string &path) {
  JsonReader reader;
  if (!reader.loadFromFile(path)) {
    m_lastError = reader.getLastError();
    CONFIG_ERROR(std::format("Failed to load species file {}: {}", path,
                             m_lastError));
    return false;
  }
  return applyDocument(reader.getRoot());
}

bool SpeciesCatalog::loadFromString(const std::string &json) {
  JsonReader reader;
  if (!reader.parse(json)) {
    m_lastError = reader.getLastError();
    CONFIG_ERROR(std::format("Failed to parse species data: {}", m_lastError));
    return false;
  }
  return applyDocument(reader.getRoot());
}

bool SpeciesCatalog::applyDocument(const JsonValue &root) {
  m_lastError.clear();
  m_warningCount = 0;

  const JsonArray *entries = root["species"].tryAsArray();
  if (!entries) {
    m_lastError = "Species data must contain a \"species\" array";
    CONFIG_ERROR(m_lastError);
    return false;
  }

  for (const JsonValue &entry : *entries) {
    const auto name = entry["name"].tryAsString();
    Species species{};
    if (!name || !AgentTraits::speciesFromString(*name, species)) {
      CONFIG_WARN(std::format("Skipping species entry with unknown name '{}'",
                              name.value_or("<missing>")));
      ++m_warningCount;
      continue;
    }
    SpeciesParams params = *get(species);
    applyEntry(entry, params);
    set(params);
    CONFIG_DEBUG(std::format("Loaded species params for {}", *name));
  }
  return true;
}

void SpeciesCatalog::applyEntry(const JsonValue &entry,
                                SpeciesParams &params) {
  auto readInt = [&](const char *key, int &field, int minValue) {
    if (!entry.hasKey(key))
      return;
    const auto v = entry[key].tryAsInt();
    if (!v || *v < minValue) {
      CONFIG_WARN(std::format("{}.{} is invalid, keeping {}", params.name, key,
                              field));
      ++m_warningCount;
      return;
    }
    field = *v;
  };
  auto readBool = [&](const char *key, bool &field) {
    if (!entry.hasKey(key))
      return;
    const auto v = entry[key].tryAsBool();
    if (!v) {
      CONFIG_WARN(std::format("{}.{} is not a boolean", params.name, key));
      ++m_warningCount;
      return;
    }
    field = *v;
  };

  readInt("maxHunger", params.maxHunger, 1);
  readInt("initialHunger", params.initialHunger, 0);
  readInt("hungerThreshold", params.hungerThreshold, 0);
  readInt("criticalHungerThreshold", params.criticalHungerThreshold, 0);
  readInt("detectionRadius", params.detectionRadius, 0);
  readInt("fleeDistance", params.fleeDistance, 1);
  readInt("foodDetectionRadius", params.foodDetectionRadius, 0);
  readInt("moveCadence", params.moveCadence, 1);
  readInt("wanderRadiusMin", params.wanderRadiusMin, 0);
  readInt("wanderRadiusMax", params.wanderRadiusMax, 0);
  readInt("priorityTier", params.priorityTier, 0);
  readInt("huntCooldownTurns", params.huntCooldownTurns, 0);
  readInt("huntHungerRestored", params.huntHungerRestored, 0);
  readInt("territoryRadius", params.territoryRadius, 0);
  readInt("chaseTurnsBeforeBreak", params.chaseTurnsBeforeBreak, 1);
  readInt("breakDurationTurns", params.breakDurationTurns, 0);
  readInt("dashDistance", params.dashDistance, 1);
  readInt("minimumRestTurns", params.minimumRestTurns, 0);
  readInt("initialGroupCount", params.initialGroupCount, 1);
  readBool("canCrossWater", params.canCrossWater);

  if (entry.hasKey("targetFood")) {
    if (auto food = entry["targetFood"].tryAsString()) {
      params.targetFood = *food;
    } else {
      CONFIG_WARN(std::format("{}.targetFood is not a string", params.name));
      ++m_warningCount;
    }
  }
  if (entry.hasKey("workerHungerMultiplier")) {
    const auto v = entry["workerHungerMultiplier"].tryAsNumber();
    if (v && *v >= 0.0) {
      params.workerHungerMultiplier = static_cast<float>(*v);
    } else {
      CONFIG_WARN(std::format("{}.workerHungerMultiplier is invalid",
                              params.name));
      ++m_warningCount;
    }
  }
  if (entry.hasKey("predatorVariant")) {
    const auto text = entry["predatorVariant"].tryAsString();
    if (!text || !parseVariant(*text, params.predatorVariant)) {
      CONFIG_WARN(std::format("{}.predatorVariant is not one of "
                              "Standard/Tiring/Dashing",
                              params.name));
      ++m_warningCount;
    }
  }

  params.wanderRadiusMax = std::max(params.wanderRadiusMin,
                                    params.wanderRadiusMax);
  params.initialHunger = std::min(params.initialHunger, params.maxHunger);
}

} // namespace BurrowSim
