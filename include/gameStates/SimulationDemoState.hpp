/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef SIMULATION_DEMO_STATE_HPP
#define SIMULATION_DEMO_STATE_HPP

#include "core/GridTypes.hpp"
#include "core/SimulationConfig.hpp"
#include "entities/AgentTypes.hpp"
#include "gameStates/GameState.hpp"
#include "world/Hideable.hpp"
#include <memory>
#include <optional>
#include <vector>

struct SDL_Window;

namespace BurrowSim {

class AgentRegistry;
class DenInventory;
class ForageManager;
class HideableDirectory;
class PathfindingGrid;
class PlayerController;
class SpawnerManager;
class SpeciesCatalog;
class TileGrid;
class TurnScheduler;
class WorkerRoster;

/**
 * @brief Playable sandbox: one fixed map, every species, flat-colour
 * rendering. The simulation only advances when the player moves.
 */
class SimulationDemoState : public GameState {
public:
  SimulationDemoState(SDL_Window *window, const SimulationConfig &config);
  ~SimulationDemoState() override;

  bool enter() override;
  void update(float deltaTime) override;
  void render(SDL_Renderer *renderer) override;
  void handleEvent(const SDL_Event &event) override;
  bool exit() override;
  std::string getName() const override { return "SimulationDemoState"; }

  bool wantsQuit() const { return m_quit; }

private:
  void buildWorld();
  void populate();
  void spawnSpecies(Species species, const GridCell &cell,
                    std::optional<HideableId> home = std::nullopt);
  HideableId addShelter(HideableKind kind, const GridCell &cell,
                        size_t capacity = 0);
  GridCell clampToMap(int x, int y) const;
  void refreshTitle();

  SDL_Window *mp_window;
  SimulationConfig m_config;
  bool m_quit{false};
  bool m_titleDirty{true};

  // Declaration order is teardown order in reverse: controllers go first
  std::unique_ptr<SpeciesCatalog> mp_catalog;
  std::unique_ptr<TileGrid> mp_grid;
  std::unique_ptr<PathfindingGrid> mp_pathfinder;
  std::unique_ptr<HideableDirectory> mp_hideables;
  std::vector<std::shared_ptr<Shelter>> m_shelters;
  std::unique_ptr<ForageManager> mp_forage;
  std::unique_ptr<DenInventory> mp_inventory;
  std::unique_ptr<AgentRegistry> mp_registry;
  std::unique_ptr<WorkerRoster> mp_roster;
  std::unique_ptr<TurnScheduler> mp_scheduler;
  std::unique_ptr<SpawnerManager> mp_spawners;
  std::unique_ptr<PlayerController> mp_player;

  std::optional<HideableId> m_playerDen;
};

} // namespace BurrowSim

#endif // SIMULATION_DEMO_STATE_HPP
