/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "world/TileGrid.hpp"
#include "core/Logger.hpp"
#include <cmath>
#include <format>
#include <stdexcept>

namespace BurrowSim {

TileGrid::TileGrid(int width, int height, float tileSize, TileKind fill)
    : m_width(width), m_height(height), m_tileSize(tileSize) {
  if (width <= 0 || height <= 0) {
    throw std::invalid_argument(
        std::format("TileGrid dimensions must be positive, got {}x{}", width,
                    height));
  }
  if (!(tileSize > 0.0f)) {
    throw std::invalid_argument("TileGrid tile size must be positive");
  }
  const size_t count =
      static_cast<size_t>(width) * static_cast<size_t>(height);
  m_tiles.assign(count, fill);
  m_blocked.assign(count, 0);
}

bool TileGrid::isValid(const GridCell &cell) const {
  return cell.x >= 0 && cell.y >= 0 && cell.x < m_width && cell.y < m_height;
}

bool TileGrid::isWalkable(const GridCell &cell) const {
  if (!isValid(cell)) {
    return false;
  }
  const size_t idx = indexOf(cell);
  return m_blocked[idx] == 0 && m_tiles[idx] != TileKind::Rock;
}

TileKind TileGrid::getTileKind(const GridCell &cell) const {
  if (!isValid(cell)) {
    return TileKind::Rock;
  }
  return m_tiles[indexOf(cell)];
}

WorldPoint TileGrid::gridToWorld(const GridCell &cell) const {
  return WorldPoint{(static_cast<float>(cell.x) + 0.5f) * m_tileSize,
                    (static_cast<float>(cell.y) + 0.5f) * m_tileSize};
}

GridCell TileGrid::worldToGrid(const WorldPoint &point) const {
  return GridCell(static_cast<int>(std::floor(point.x / m_tileSize)),
                  static_cast<int>(std::floor(point.y / m_tileSize)));
}

void TileGrid::setTile(const GridCell &cell, TileKind kind) {
  if (!isValid(cell)) {
    WORLD_WARN(std::format("setTile ignored for out of range cell ({}, {})",
                           cell.x, cell.y));
    return;
  }
  m_tiles[indexOf(cell)] = kind;
}

void TileGrid::fillRect(const GridCell &topLeft, int width, int height,
                        TileKind kind) {
  for (int y = topLeft.y; y < topLeft.y + height; ++y) {
    for (int x = topLeft.x; x < topLeft.x + width; ++x) {
      const GridCell cell(x, y);
      if (isValid(cell)) {
        m_tiles[indexOf(cell)] = kind;
      }
    }
  }
}

void TileGrid::setBlocked(const GridCell &cell, bool blocked) {
  if (!isValid(cell)) {
    return;
  }
  m_blocked[indexOf(cell)] = blocked ? 1 : 0;
}

} // namespace BurrowSim
