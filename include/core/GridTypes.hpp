/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef GRID_TYPES_HPP
#define GRID_TYPES_HPP

#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <functional>
#include <ostream>

namespace BurrowSim {

/**
 * @brief Integer tile coordinate. Origin is the top-left tile, y grows down.
 */
struct GridCell {
  int x{0};
  int y{0};

  constexpr GridCell() = default;
  constexpr GridCell(int cx, int cy) : x(cx), y(cy) {}

  constexpr bool operator==(const GridCell &other) const = default;

  constexpr GridCell operator+(const GridCell &o) const {
    return GridCell(x + o.x, y + o.y);
  }
  constexpr GridCell operator-(const GridCell &o) const {
    return GridCell(x - o.x, y - o.y);
  }
  constexpr GridCell operator*(int s) const { return GridCell(x * s, y * s); }
};

inline std::ostream &operator<<(std::ostream &os, const GridCell &cell) {
  return os << "(" << cell.x << ", " << cell.y << ")";
}

constexpr int manhattanDistance(const GridCell &a, const GridCell &b) {
  return (a.x > b.x ? a.x - b.x : b.x - a.x) +
         (a.y > b.y ? a.y - b.y : b.y - a.y);
}

struct GridCellHash {
  size_t operator()(const GridCell &cell) const noexcept {
    const uint64_t packed =
        (static_cast<uint64_t>(static_cast<uint32_t>(cell.x)) << 32) |
        static_cast<uint32_t>(cell.y);
    return std::hash<uint64_t>{}(packed);
  }
};

// Pixel-space point used by the demo and the world-point move request
struct WorldPoint {
  float x{0.0f};
  float y{0.0f};
};

enum class Direction : uint8_t { Up, Down, Left, Right };

constexpr GridCell directionOffset(Direction dir) {
  switch (dir) {
  case Direction::Up:
    return GridCell(0, -1);
  case Direction::Down:
    return GridCell(0, 1);
  case Direction::Left:
    return GridCell(-1, 0);
  case Direction::Right:
    return GridCell(1, 0);
  }
  return GridCell(0, 0);
}

inline std::ostream &operator<<(std::ostream &os, Direction dir) {
  switch (dir) {
  case Direction::Up:
    return os << "Up";
  case Direction::Down:
    return os << "Down";
  case Direction::Left:
    return os << "Left";
  case Direction::Right:
    return os << "Right";
  default:
    return os << "Unknown";
  }
}

enum class TileKind : uint8_t { Grass, Dirt, Sand, Water, Rock };

inline const char *tileKindToString(TileKind kind) {
  switch (kind) {
  case TileKind::Grass:
    return "Grass";
  case TileKind::Dirt:
    return "Dirt";
  case TileKind::Sand:
    return "Sand";
  case TileKind::Water:
    return "Water";
  case TileKind::Rock:
    return "Rock";
  default:
    return "Unknown";
  }
}

inline std::ostream &operator<<(std::ostream &os, TileKind kind) {
  return os << tileKindToString(kind);
}

} // namespace BurrowSim

#endif // GRID_TYPES_HPP
