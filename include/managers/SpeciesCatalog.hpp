/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef SPECIES_CATALOG_HPP
#define SPECIES_CATALOG_HPP

#include "entities/SpeciesParams.hpp"
#include <array>
#include <memory>
#include <string>

namespace BurrowSim {

class JsonValue;

/**
 * @brief Species tunables, one immutable SpeciesParams per species.
 *
 * Starts from built-in defaults. Data files may override any subset of
 * fields; a field with the wrong type keeps its previous value and is
 * reported as a warning rather than failing the whole load. Agents hold the
 * params they were spawned with, so reloading only affects later spawns.
 */
class SpeciesCatalog {
public:
  SpeciesCatalog();

  static SpeciesParams defaultsFor(Species species);

  std::shared_ptr<const SpeciesParams> get(Species species) const;
  void set(const SpeciesParams &params);

  // Expects {"species": [{"name": "Rabbit", ...}, ...]}
  bool loadFromFile(const std::string &path);
  bool loadFromString(const std::string &json);

  const std::string &getLastError() const { return m_lastError; }
  size_t getWarningCount() const { return m_warningCount; }

private:
  std::array<std::shared_ptr<const SpeciesParams>,
             static_cast<size_t>(Species::COUNT)>
      m_params;
  std::string m_lastError;
  size_t m_warningCount{0};

  bool applyDocument(const JsonValue &root);
  void applyEntry(const JsonValue &entry, SpeciesParams &params);
};

} // namespace BurrowSim

#endif // SPECIES_CATALOG_HPP
