/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef PATHFINDING_GRID_HPP
#define PATHFINDING_GRID_HPP

#include "ai/pathfinding/Pathfinder.hpp"
#include "world/GridService.hpp"
#include <cstdint>
#include <vector>

namespace BurrowSim {

/**
 * @brief Four-connected A* over an IGridService.
 *
 * Terrain walkability comes from the grid; the per-request predicate adds the
 * agent's own rules (water crossing). Ties are broken by heuristic and then by
 * insertion order so identical requests always produce identical paths.
 */
class PathfindingGrid : public IPathfinder {
public:
  explicit PathfindingGrid(const IGridService &grid);

  PathfindingResult findPath(const GridCell &start, const GridCell &goal,
                             const TraversalPredicate &canTraverse,
                             std::vector<GridCell> &outWaypoints) override;

  void setMaxIterations(int maxIters) { m_maxIterations = maxIters; }
  int getMaxIterations() const { return m_maxIterations; }

  struct PathfindingStats {
    uint64_t totalRequests{0};
    uint64_t successfulPaths{0};
    uint64_t timeouts{0};
    uint64_t invalidStarts{0};
    uint64_t invalidGoals{0};
    uint64_t totalIterations{0};
  };

  void resetStats() { m_stats = PathfindingStats{}; }
  const PathfindingStats &getStats() const { return m_stats; }

private:
  const IGridService &m_grid;
  int m_maxIterations{20000};
  PathfindingStats m_stats{};

  struct Node {
    int x;
    int y;
    int f;
    int h;
    uint32_t order;
  };
  struct Cmp {
    bool operator()(const Node &a, const Node &b) const {
      if (a.f != b.f)
        return a.f > b.f;
      if (a.h != b.h)
        return a.h > b.h;
      return a.order > b.order;
    }
  };

  // Scratch buffers reused across requests
  std::vector<int> m_gScore;
  std::vector<int> m_parent;
  std::vector<uint8_t> m_closed;

  bool canEnter(const GridCell &cell, const TraversalPredicate &canTraverse) const;
  static void collapseCollinear(std::vector<GridCell> &path);
};

} // namespace BurrowSim

#endif // PATHFINDING_GRID_HPP
