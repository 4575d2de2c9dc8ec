/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef TILE_GRID_HPP
#define TILE_GRID_HPP

#include "world/GridService.hpp"
#include <vector>

namespace BurrowSim {

/**
 * @brief Dense rectangular tile map.
 *
 * Water is walkable terrain (traversal rules decide who may cross it); rock
 * is never walkable. Cell (0,0) covers the pixel rectangle
 * [0, tileSize) x [0, tileSize).
 */
class TileGrid : public IGridService {
public:
  /**
   * @throws std::invalid_argument if width, height or tileSize are not
   * positive
   */
  TileGrid(int width, int height, float tileSize = 32.0f,
           TileKind fill = TileKind::Grass);

  bool isValid(const GridCell &cell) const override;
  bool isWalkable(const GridCell &cell) const override;
  TileKind getTileKind(const GridCell &cell) const override;

  int getWidth() const override { return m_width; }
  int getHeight() const override { return m_height; }
  float getTileSize() const { return m_tileSize; }

  WorldPoint gridToWorld(const GridCell &cell) const override;
  GridCell worldToGrid(const WorldPoint &point) const override;

  // Out of range writes are ignored and reported
  void setTile(const GridCell &cell, TileKind kind);
  void fillRect(const GridCell &topLeft, int width, int height, TileKind kind);

  // Extra per-cell block used by tests to carve walls without changing terrain
  void setBlocked(const GridCell &cell, bool blocked);

private:
  int m_width;
  int m_height;
  float m_tileSize;
  std::vector<TileKind> m_tiles;
  std::vector<uint8_t> m_blocked;

  size_t indexOf(const GridCell &cell) const {
    return static_cast<size_t>(cell.y) * static_cast<size_t>(m_width) +
           static_cast<size_t>(cell.x);
  }
};

} // namespace BurrowSim

#endif // TILE_GRID_HPP
