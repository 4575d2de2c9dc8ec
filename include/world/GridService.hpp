/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef GRID_SERVICE_HPP
#define GRID_SERVICE_HPP

#include "core/GridTypes.hpp"

namespace BurrowSim {

/**
 * @brief Read-only view of the tile map used by agents, the registry and the
 * player controller. Implementations own terrain; the simulation never edits
 * it.
 */
class IGridService {
public:
  virtual ~IGridService() = default;

  virtual bool isValid(const GridCell &cell) const = 0;
  virtual bool isWalkable(const GridCell &cell) const = 0;
  virtual TileKind getTileKind(const GridCell &cell) const = 0;

  virtual int getWidth() const = 0;
  virtual int getHeight() const = 0;

  virtual WorldPoint gridToWorld(const GridCell &cell) const = 0;
  virtual GridCell worldToGrid(const WorldPoint &point) const = 0;

  bool isWater(const GridCell &cell) const {
    return isValid(cell) && getTileKind(cell) == TileKind::Water;
  }
};

} // namespace BurrowSim

#endif // GRID_SERVICE_HPP
