/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "world/Hideable.hpp"
#include "core/Logger.hpp"
#include <algorithm>
#include <format>

namespace BurrowSim {

Shelter::Shelter(HideableKind kind, const GridCell &position, size_t capacity)
    : m_kind(kind), m_position(position), m_capacity(capacity) {}

bool Shelter::canEnter(AgentId agent) const {
  if (m_kind == HideableKind::PredatorDen || agent == INVALID_AGENT_ID) {
    return false;
  }
  if (contains(agent)) {
    return true;
  }
  return m_capacity == 0 || m_occupants.size() < m_capacity;
}

void Shelter::onEnter(AgentId agent) {
  if (!canEnter(agent)) {
    DEN_WARN(std::format("Agent {} refused entry to shelter at ({}, {})",
                         agent, m_position.x, m_position.y));
    return;
  }
  if (!contains(agent)) {
    m_occupants.push_back(agent);
  }
}

void Shelter::onLeave(AgentId agent) {
  auto it = std::find(m_occupants.begin(), m_occupants.end(), agent);
  if (it != m_occupants.end()) {
    m_occupants.erase(it);
  }
}

bool Shelter::contains(AgentId agent) const {
  return std::find(m_occupants.begin(), m_occupants.end(), agent) !=
         m_occupants.end();
}

} // namespace BurrowSim
