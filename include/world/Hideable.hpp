/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef HIDEABLE_HPP
#define HIDEABLE_HPP

#include "core/GridTypes.hpp"
#include "entities/AgentTypes.hpp"
#include <ostream>
#include <vector>

namespace BurrowSim {

enum class HideableKind : uint8_t {
  Den,        // player den, safe tile
  Burrow,     // prey/worker home, safe tile
  Bush,       // hides occupants, predators may still stand on it
  PredatorDen // anchors a predator territory, never shelters
};

constexpr bool isSafeDenKind(HideableKind kind) noexcept {
  return kind == HideableKind::Den || kind == HideableKind::Burrow;
}

inline std::ostream &operator<<(std::ostream &os, HideableKind kind) {
  switch (kind) {
  case HideableKind::Den:
    return os << "Den";
  case HideableKind::Burrow:
    return os << "Burrow";
  case HideableKind::Bush:
    return os << "Bush";
  case HideableKind::PredatorDen:
    return os << "PredatorDen";
  default:
    return os << "Unknown";
  }
}

/**
 * @brief Shelter occupying a tile. Occupants are agent ids; the registry keeps
 * the agent side (currentHideable) in step with onEnter/onLeave.
 */
class IHideable {
public:
  virtual ~IHideable() = default;

  virtual HideableKind getKind() const = 0;
  virtual GridCell getPosition() const = 0;
  virtual bool canEnter(AgentId agent) const = 0;
  virtual void onEnter(AgentId agent) = 0;
  virtual void onLeave(AgentId agent) = 0;
  virtual bool contains(AgentId agent) const = 0;
  virtual size_t getOccupantCount() const = 0;
};

/**
 * @brief Default hideable: a tile with an occupant list and optional
 * capacity (0 means unlimited). Predator dens report canEnter() false.
 */
class Shelter : public IHideable {
public:
  Shelter(HideableKind kind, const GridCell &position, size_t capacity = 0);

  HideableKind getKind() const override { return m_kind; }
  GridCell getPosition() const override { return m_position; }
  bool canEnter(AgentId agent) const override;
  void onEnter(AgentId agent) override;
  void onLeave(AgentId agent) override;
  bool contains(AgentId agent) const override;
  size_t getOccupantCount() const override { return m_occupants.size(); }

  const std::vector<AgentId> &getOccupants() const { return m_occupants; }

private:
  HideableKind m_kind;
  GridCell m_position;
  size_t m_capacity;
  std::vector<AgentId> m_occupants;
};

} // namespace BurrowSim

#endif // HIDEABLE_HPP
