/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "ai/pathfinding/PathfindingGrid.hpp"
#include "core/Logger.hpp"
#include <algorithm>
#include <cstdlib>
#include <format>
#include <limits>
#include <queue>

namespace BurrowSim {

PathfindingGrid::PathfindingGrid(const IGridService &grid) : m_grid(grid) {}

bool PathfindingGrid::canEnter(const GridCell &cell,
                               const TraversalPredicate &canTraverse) const {
  if (!m_grid.isValid(cell) || !m_grid.isWalkable(cell)) {
    return false;
  }
  return !canTraverse || canTraverse(cell);
}

PathfindingResult PathfindingGrid::findPath(
    const GridCell &start, const GridCell &goal,
    const TraversalPredicate &canTraverse,
    std::vector<GridCell> &outWaypoints) {
  outWaypoints.clear();
  m_stats.totalRequests++;

  if (!m_grid.isValid(start)) {
    PATHFIND_DEBUG(std::format("findPath: INVALID_START ({},{})", start.x,
                               start.y));
    m_stats.invalidStarts++;
    return PathfindingResult::INVALID_START;
  }
  if (!canEnter(goal, canTraverse)) {
    PATHFIND_DEBUG(std::format("findPath: INVALID_GOAL ({},{})", goal.x,
                               goal.y));
    m_stats.invalidGoals++;
    return PathfindingResult::INVALID_GOAL;
  }

  if (start == goal) {
    outWaypoints.push_back(start);
    m_stats.successfulPaths++;
    return PathfindingResult::SUCCESS;
  }

  const int W = m_grid.getWidth();
  const int H = m_grid.getHeight();
  const size_t gridSize = static_cast<size_t>(W) * static_cast<size_t>(H);
  auto idx = [W](int x, int y) { return y * W + x; };
  auto heuristic = [&goal](int x, int y) {
    return std::abs(x - goal.x) + std::abs(y - goal.y);
  };

  m_gScore.assign(gridSize, std::numeric_limits<int>::max());
  m_parent.assign(gridSize, -1);
  m_closed.assign(gridSize, 0);

  std::priority_queue<Node, std::vector<Node>, Cmp> open;
  uint32_t order = 0;
  const int sIndex = idx(start.x, start.y);
  m_gScore[static_cast<size_t>(sIndex)] = 0;
  const int hStart = heuristic(start.x, start.y);
  open.push(Node{start.x, start.y, hStart, hStart, order++});

  // Up, Down, Left, Right
  constexpr int dx4[4] = {0, 0, -1, 1};
  constexpr int dy4[4] = {-1, 1, 0, 0};

  int iterations = 0;
  while (!open.empty() && iterations++ < m_maxIterations) {
    const Node cur = open.top();
    open.pop();

    const int cIndex = idx(cur.x, cur.y);
    if (m_closed[static_cast<size_t>(cIndex)])
      continue;
    m_closed[static_cast<size_t>(cIndex)] = 1;

    if (cur.x == goal.x && cur.y == goal.y) {
      std::vector<GridCell> rev;
      int p = cIndex;
      while (p >= 0) {
        rev.emplace_back(p % W, p / W);
        if (p == sIndex)
          break;
        p = m_parent[static_cast<size_t>(p)];
      }
      outWaypoints.assign(rev.rbegin(), rev.rend());
      collapseCollinear(outWaypoints);

      m_stats.successfulPaths++;
      m_stats.totalIterations += static_cast<uint64_t>(iterations);
      return PathfindingResult::SUCCESS;
    }

    const int gCur = m_gScore[static_cast<size_t>(cIndex)];
    for (int i = 0; i < 4; ++i) {
      const GridCell next(cur.x + dx4[i], cur.y + dy4[i]);
      if (next.x < 0 || next.y < 0 || next.x >= W || next.y >= H)
        continue;
      const size_t nIndex = static_cast<size_t>(idx(next.x, next.y));
      if (m_closed[nIndex] || !canEnter(next, canTraverse))
        continue;

      const int tentative = gCur + 1;
      if (tentative < m_gScore[nIndex]) {
        m_parent[nIndex] = cIndex;
        m_gScore[nIndex] = tentative;
        const int h = heuristic(next.x, next.y);
        open.push(Node{next.x, next.y, tentative + h, h, order++});
      }
    }
  }

  m_stats.totalIterations += static_cast<uint64_t>(iterations);
  if (!open.empty()) {
    m_stats.timeouts++;
    PATHFIND_DEBUG(std::format("findPath: TIMEOUT after {} iterations",
                               m_maxIterations));
    return PathfindingResult::TIMEOUT;
  }
  return PathfindingResult::NO_PATH_FOUND;
}

void PathfindingGrid::collapseCollinear(std::vector<GridCell> &path) {
  if (path.size() < 3)
    return;
  std::vector<GridCell> out;
  out.reserve(path.size());
  out.push_back(path.front());
  for (size_t i = 1; i + 1 < path.size(); ++i) {
    const GridCell in = path[i] - path[i - 1];
    const GridCell outDir = path[i + 1] - path[i];
    if (!(in == outDir)) {
      out.push_back(path[i]);
    }
  }
  out.push_back(path.back());
  path.swap(out);
}

} // namespace BurrowSim
