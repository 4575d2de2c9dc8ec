/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "entities/Agent.hpp"
#include <algorithm>
#include <stdexcept>

namespace BurrowSim {

Agent::Agent(AgentId id, std::shared_ptr<const SpeciesParams> params,
             const GridCell &position)
    : m_id(id), m_params(std::move(params)), m_position(position),
      m_previousPosition(position) {
  if (!m_params) {
    throw std::invalid_argument("Agent requires species params");
  }
  if (m_params->maxHunger <= 0) {
    throw std::invalid_argument("Agent maxHunger must be positive");
  }
  m_hunger = std::clamp(m_params->initialHunger, 0, m_params->maxHunger);
  m_groupCount = std::max(1, m_params->initialGroupCount);
}

void Agent::increaseHunger(int amount) {
  if (amount <= 0)
    return;
  m_hunger = std::min(m_params->maxHunger, m_hunger + amount);
}

bool Agent::decreaseHunger(int amount) {
  if (amount > 0) {
    m_hunger = std::max(0, m_hunger - amount);
  }
  return m_hunger == 0;
}

void Agent::setHunger(int value) {
  m_hunger = std::clamp(value, 0, m_params->maxHunger);
}

void Agent::increaseGroupCount(int amount) {
  if (amount > 0) {
    m_groupCount += amount;
  }
}

void Agent::setGroupCount(int count) { m_groupCount = std::max(1, count); }

bool Agent::reduceGroupCount() {
  if (m_groupCount > 0) {
    --m_groupCount;
  }
  return m_groupCount == 0;
}

Agent::CarriedItems Agent::takeCarriedItems() {
  CarriedItems items;
  items.swap(m_carried);
  return items;
}

} // namespace BurrowSim
