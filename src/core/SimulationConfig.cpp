/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "core/SimulationConfig.hpp"
#include "core/Logger.hpp"
#include "utils/JsonReader.hpp"
#include <algorithm>
#include <format>

namespace BurrowSim {

namespace {

void applyConfig(const JsonValue &root, SimulationConfig &out) {
  if (!root.isObject()) {
    CONFIG_WARN("Simulation config root is not an object, using defaults");
    return;
  }

  if (auto seed = root["rngSeed"].tryAsNumber()) {
    out.rngSeed = static_cast<uint32_t>(std::max(0.0, *seed));
  }
  auto readPositive = [&root](const char *key, int &field) {
    if (!root.hasKey(key))
      return;
    const auto v = root[key].tryAsInt();
    if (v && *v > 0) {
      field = *v;
    } else {
      CONFIG_WARN(std::format("simulation.{} must be a positive integer", key));
    }
  };
  readPositive("turnsPerSeason", out.turnsPerSeason);
  readPositive("mvpWorkerGoal", out.mvpWorkerGoal);
  readPositive("maxWorkersPerDen", out.maxWorkersPerDen);
  readPositive("gridWidth", out.gridWidth);
  readPositive("gridHeight", out.gridHeight);

  if (auto tile = root["tileSize"].tryAsNumber(); tile && *tile > 0.0) {
    out.tileSize = static_cast<float>(*tile);
  }

  const JsonValue &bonus = root["fixedWorkerBonusRate"];
  if (bonus.isNumber()) {
    out.fixedWorkerBonusRate =
        std::clamp(static_cast<float>(bonus.asNumber()), 0.0f, 1.0f);
  } else if (root.hasKey("fixedWorkerBonusRate") && bonus.isNull()) {
    out.fixedWorkerBonusRate.reset();
  }
}

} // namespace

bool SimulationConfig::loadFromFile(const std::string &path,
                                    SimulationConfig &out) {
  JsonReader reader;
  if (!reader.loadFromFile(path)) {
    CONFIG_ERROR(std::format("Failed to load simulation config {}: {}", path,
                             reader.getLastError()));
    return false;
  }
  applyConfig(reader.getRoot(), out);
  CONFIG_INFO(std::format("Loaded simulation config from {}", path));
  return true;
}

bool SimulationConfig::loadFromString(const std::string &json,
                                      SimulationConfig &out) {
  JsonReader reader;
  if (!reader.parse(json)) {
    CONFIG_ERROR(std::format("Failed to parse simulation config: {}",
                             reader.getLastError()));
    return false;
  }
  applyConfig(reader.getRoot(), out);
  return true;
}

} // namespace BurrowSim
