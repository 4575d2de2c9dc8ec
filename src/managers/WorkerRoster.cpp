/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "managers/WorkerRoster.hpp"
#include "core/Logger.hpp"
#include "managers/AgentRegistry.hpp"
#include "managers/HideableDirectory.hpp"
#include <algorithm>
#include <format>

namespace BurrowSim {

WorkerRoster::WorkerRoster(AgentRegistry &registry,
                           HideableDirectory &hideables,
                           const SimulationConfig &config)
    : m_registry(registry), m_hideables(hideables),
      m_maxWorkersPerDen(config.maxWorkersPerDen),
      m_workerGoal(config.mvpWorkerGoal),
      m_fixedRate(config.fixedWorkerBonusRate) {
  m_listenerHandle = m_registry.addRemovalListener(
      [this](AgentId id, RemovalCause) { m_assignments.erase(id); });
}

WorkerRoster::~WorkerRoster() {
  m_registry.removeRemovalListener(m_listenerHandle);
}

RosterResult WorkerRoster::assign(AgentId worker, HideableId den) {
  Agent *agent = m_registry.getAgent(worker);
  if (!agent || agent->getCategory() != AgentCategory::Worker) {
    return RosterResult::NOT_A_WORKER;
  }
  const IHideable *hideable = m_hideables.find(den);
  if (!hideable || !isSafeDenKind(hideable->getKind())) {
    return RosterResult::UNKNOWN_DEN;
  }

  auto current = m_assignments.find(worker);
  if (current != m_assignments.end() && current->second == den) {
    return RosterResult::SUCCESS;
  }
  if (static_cast<int>(getWorkersAssignedTo(den)) >= m_maxWorkersPerDen) {
    DEN_INFO(std::format("Den {} is full ({} workers)", den,
                         m_maxWorkersPerDen));
    return RosterResult::DEN_FULL;
  }
  if (current != m_assignments.end()) {
    // Moving dens: drop out of the old one first
    m_registry.leaveHideable(worker);
  }

  m_assignments[worker] = den;
  m_registry.setHome(worker, den);
  agent->setDormant(false);
  agent->setState(BehaviorState::ReturningHome);
  DEN_INFO(std::format("Worker #{} assigned to den {}", worker, den));
  return RosterResult::SUCCESS;
}

RosterResult WorkerRoster::unassign(AgentId worker) {
  auto it = m_assignments.find(worker);
  if (it == m_assignments.end()) {
    return RosterResult::NOT_ASSIGNED;
  }
  m_assignments.erase(it);
  if (Agent *agent = m_registry.getAgent(worker)) {
    m_registry.leaveHideable(worker);
    m_registry.setHome(worker, std::nullopt);
    agent->setDormant(true);
    agent->setState(BehaviorState::Idle);
  }
  DEN_INFO(std::format("Worker #{} unassigned", worker));
  return RosterResult::SUCCESS;
}

std::optional<HideableId> WorkerRoster::getAssignment(AgentId worker) const {
  auto it = m_assignments.find(worker);
  if (it == m_assignments.end()) {
    return std::nullopt;
  }
  return it->second;
}

size_t WorkerRoster::getWorkersAssignedTo(HideableId den) const {
  return static_cast<size_t>(
      std::count_if(m_assignments.begin(), m_assignments.end(),
                    [den](const auto &entry) { return entry.second == den; }));
}

float WorkerRoster::getBonusFoodDropRate() const {
  if (m_fixedRate) {
    return std::clamp(*m_fixedRate, 0.0f, 1.0f);
  }
  if (m_workerGoal <= 0) {
    return 0.0f;
  }
  const float rate = static_cast<float>(m_assignments.size()) /
                     static_cast<float>(m_workerGoal);
  return std::clamp(rate, 0.0f, 1.0f);
}

} // namespace BurrowSim
