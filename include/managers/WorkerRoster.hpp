/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef WORKER_ROSTER_HPP
#define WORKER_ROSTER_HPP

#include "core/SimulationConfig.hpp"
#include "entities/AgentTypes.hpp"
#include <optional>
#include <ostream>
#include <unordered_map>

namespace BurrowSim {

class AgentRegistry;
class HideableDirectory;

enum class RosterResult : uint8_t {
  SUCCESS,
  NOT_A_WORKER,
  UNKNOWN_DEN,
  DEN_FULL,
  NOT_ASSIGNED
};

inline std::ostream &operator<<(std::ostream &os, RosterResult result) {
  switch (result) {
  case RosterResult::SUCCESS:
    return os << "SUCCESS";
  case RosterResult::NOT_A_WORKER:
    return os << "NOT_A_WORKER";
  case RosterResult::UNKNOWN_DEN:
    return os << "UNKNOWN_DEN";
  case RosterResult::DEN_FULL:
    return os << "DEN_FULL";
  case RosterResult::NOT_ASSIGNED:
    return os << "NOT_ASSIGNED";
  default:
    return os << "UNKNOWN";
  }
}

/**
 * @brief Tracks which den each worker serves. Assignment wakes a worker;
 * unassignment sends it back to dormancy. The assigned count drives the
 * bonus food-drop rate applied on deposit.
 */
class WorkerRoster {
public:
  WorkerRoster(AgentRegistry &registry, HideableDirectory &hideables,
               const SimulationConfig &config);
  ~WorkerRoster();

  WorkerRoster(const WorkerRoster &) = delete;
  WorkerRoster &operator=(const WorkerRoster &) = delete;

  RosterResult assign(AgentId worker, HideableId den);
  RosterResult unassign(AgentId worker);

  std::optional<HideableId> getAssignment(AgentId worker) const;
  size_t getWorkersAssignedTo(HideableId den) const;
  size_t getAssignedCount() const { return m_assignments.size(); }

  // assigned / goal clamped to [0, 1], or the configured override
  float getBonusFoodDropRate() const;
  void setFixedBonusRate(std::optional<float> rate) { m_fixedRate = rate; }

private:
  AgentRegistry &m_registry;
  HideableDirectory &m_hideables;
  int m_maxWorkersPerDen;
  int m_workerGoal;
  std::optional<float> m_fixedRate;
  std::unordered_map<AgentId, HideableId> m_assignments;
  size_t m_listenerHandle{0};
};

} // namespace BurrowSim

#endif // WORKER_ROSTER_HPP
