/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef HIDEABLE_DIRECTORY_HPP
#define HIDEABLE_DIRECTORY_HPP

#include "world/Hideable.hpp"
#include <memory>
#include <optional>
#include <unordered_map>
#include <vector>

namespace BurrowSim {

/**
 * @brief Id-keyed lookup for every hideable in the world.
 *
 * Agents reference homes and shelters by HideableId; the directory holds weak
 * references so a hideable destroyed by its owner simply stops resolving.
 */
class HideableDirectory {
public:
  HideableDirectory() = default;

  HideableId registerHideable(const std::shared_ptr<IHideable> &hideable);
  void unregisterHideable(HideableId id);

  // nullptr when the id is unknown or the hideable has been destroyed
  IHideable *find(HideableId id) const;

  // Earliest registered live hideable on the tile, optionally of one kind
  std::optional<HideableId> findAt(
      const GridCell &cell,
      std::optional<HideableKind> kind = std::nullopt) const;

  // Den or burrow present on the tile
  bool isSafeDenTile(const GridCell &cell) const;

  std::vector<HideableId> getAllIds() const;
  size_t size() const { return m_order.size(); }
  void clear();

private:
  std::unordered_map<HideableId, std::weak_ptr<IHideable>> m_entries;
  std::vector<HideableId> m_order;
  HideableId m_nextId{1};
};

} // namespace BurrowSim

#endif // HIDEABLE_DIRECTORY_HPP
