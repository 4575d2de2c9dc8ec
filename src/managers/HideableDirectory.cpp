/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "managers/HideableDirectory.hpp"
#include "core/Logger.hpp"
#include <algorithm>
#include <format>

namespace BurrowSim {

HideableId
HideableDirectory::registerHideable(const std::shared_ptr<IHideable> &hideable) {
  if (!hideable) {
    DEN_ERROR("registerHideable called with null hideable");
    return INVALID_HIDEABLE_ID;
  }
  const HideableId id = m_nextId++;
  m_entries.emplace(id, hideable);
  m_order.push_back(id);
  const GridCell pos = hideable->getPosition();
  DEN_DEBUG(std::format("Registered hideable {} at ({}, {})", id, pos.x,
                        pos.y));
  return id;
}

void HideableDirectory::unregisterHideable(HideableId id) {
  m_entries.erase(id);
  m_order.erase(std::remove(m_order.begin(), m_order.end(), id),
                m_order.end());
}

IHideable *HideableDirectory::find(HideableId id) const {
  auto it = m_entries.find(id);
  if (it == m_entries.end()) {
    return nullptr;
  }
  // The owner keeps the hideable alive; lock only to test expiry
  auto locked = it->second.lock();
  return locked.get();
}

std::optional<HideableId>
HideableDirectory::findAt(const GridCell &cell,
                          std::optional<HideableKind> kind) const {
  for (HideableId id : m_order) {
    const IHideable *h = find(id);
    if (!h || !(h->getPosition() == cell)) {
      continue;
    }
    if (!kind || h->getKind() == *kind) {
      return id;
    }
  }
  return std::nullopt;
}

bool HideableDirectory::isSafeDenTile(const GridCell &cell) const {
  for (HideableId id : m_order) {
    const IHideable *h = find(id);
    if (h && h->getPosition() == cell && isSafeDenKind(h->getKind())) {
      return true;
    }
  }
  return false;
}

std::vector<HideableId> HideableDirectory::getAllIds() const {
  return m_order;
}

void HideableDirectory::clear() {
  m_entries.clear();
  m_order.clear();
}

} // namespace BurrowSim
