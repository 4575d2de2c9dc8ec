/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "gameStates/SimulationDemoState.hpp"
#include "ai/pathfinding/PathfindingGrid.hpp"
#include "controllers/PlayerController.hpp"
#include "core/Logger.hpp"
#include "managers/AgentRegistry.hpp"
#include "managers/DenInventory.hpp"
#include "managers/ForageManager.hpp"
#include "managers/HideableDirectory.hpp"
#include "managers/SpawnerManager.hpp"
#include "managers/SpeciesCatalog.hpp"
#include "managers/TurnScheduler.hpp"
#include "managers/WorkerRoster.hpp"
#include "world/TileGrid.hpp"
#include <SDL3/SDL.h>
#include <algorithm>
#include <format>

namespace BurrowSim {

namespace {

const std::string SPECIES_DATA_PATH{"res/data/species.json"};

struct Rgb {
  Uint8 r, g, b;
};

Rgb tileColor(TileKind kind) {
  switch (kind) {
  case TileKind::Grass:
    return {70, 120, 55};
  case TileKind::Dirt:
    return {115, 85, 55};
  case TileKind::Sand:
    return {195, 180, 120};
  case TileKind::Water:
    return {45, 85, 160};
  case TileKind::Rock:
    return {95, 95, 100};
  }
  return {0, 0, 0};
}

Rgb shelterColor(HideableKind kind) {
  switch (kind) {
  case HideableKind::Den:
    return {150, 100, 60};
  case HideableKind::Burrow:
    return {100, 70, 45};
  case HideableKind::Bush:
    return {35, 85, 35};
  case HideableKind::PredatorDen:
    return {90, 30, 30};
  }
  return {0, 0, 0};
}

Rgb speciesColor(Species species) {
  switch (species) {
  case Species::Player:
    return {245, 245, 245};
  case Species::Rabbit:
    return {210, 200, 170};
  case Species::KangRat:
    return {230, 170, 90};
  case Species::Coyote:
    return {200, 60, 40};
  case Species::Hawk:
    return {120, 60, 160};
  case Species::COUNT:
    break;
  }
  return {255, 0, 255};
}

void fillCell(SDL_Renderer *renderer, const GridCell &cell, float tileSize,
              float inset, const Rgb &color, Uint8 alpha = 255) {
  SDL_SetRenderDrawColor(renderer, color.r, color.g, color.b, alpha);
  const SDL_FRect rect{cell.x * tileSize + inset, cell.y * tileSize + inset,
                       tileSize - 2.0f * inset, tileSize - 2.0f * inset};
  SDL_RenderFillRect(renderer, &rect);
}

} // namespace

SimulationDemoState::SimulationDemoState(SDL_Window *window,
                                         const SimulationConfig &config)
    : mp_window(window), m_config(config) {}

SimulationDemoState::~SimulationDemoState() { exit(); }

bool SimulationDemoState::enter() {
  DEMO_INFO("Entering SimulationDemoState");
  try {
    mp_catalog = std::make_unique<SpeciesCatalog>();
    if (!mp_catalog->loadFromFile(SPECIES_DATA_PATH)) {
      DEMO_WARN(std::format("Using built-in species defaults: {}",
                            mp_catalog->getLastError()));
    }
    mp_grid = std::make_unique<TileGrid>(m_config.gridWidth,
                                         m_config.gridHeight,
                                         m_config.tileSize);
  } catch (const std::exception &e) {
    DEMO_CRITICAL(std::format("Failed to build the demo map: {}", e.what()));
    return false;
  }

  mp_pathfinder = std::make_unique<PathfindingGrid>(*mp_grid);
  mp_hideables = std::make_unique<HideableDirectory>();
  mp_forage = std::make_unique<ForageManager>(m_config.rngSeed);
  mp_inventory = std::make_unique<DenInventory>();
  mp_registry = std::make_unique<AgentRegistry>(*mp_catalog, mp_grid.get(),
                                                mp_hideables.get());
  mp_roster =
      std::make_unique<WorkerRoster>(*mp_registry, *mp_hideables, m_config);

  SimulationServices services;
  services.registry = mp_registry.get();
  services.grid = mp_grid.get();
  services.pathfinder = mp_pathfinder.get();
  services.hideables = mp_hideables.get();
  services.forage = mp_forage.get();
  services.denInventory = mp_inventory.get();
  services.roster = mp_roster.get();
  mp_scheduler = std::make_unique<TurnScheduler>(services, m_config);
  mp_spawners = std::make_unique<SpawnerManager>(
      *mp_registry, *mp_grid, mp_forage.get(), m_config.rngSeed + 1);
  mp_spawners->attach(*mp_scheduler);
  mp_player = std::make_unique<PlayerController>(
      *mp_registry, *mp_scheduler, mp_hideables.get(), mp_forage.get());

  mp_player->addLoseListener([](RemovalCause cause) {
    DEMO_INFO(std::format("Game over: {}", removalCauseToString(cause)));
  });
  mp_scheduler->addTurnListener([this](int) { m_titleDirty = true; });

  buildWorld();
  populate();
  refreshTitle();
  return true;
}

void SimulationDemoState::update([[maybe_unused]] float deltaTime) {
  if (m_titleDirty) {
    refreshTitle();
  }
}

void SimulationDemoState::render(SDL_Renderer *renderer) {
  if (!mp_grid) {
    return;
  }
  const float ts = mp_grid->getTileSize();

  for (int y = 0; y < mp_grid->getHeight(); ++y) {
    for (int x = 0; x < mp_grid->getWidth(); ++x) {
      const GridCell cell(x, y);
      fillCell(renderer, cell, ts, 0.0f, tileColor(mp_grid->getTileKind(cell)));
    }
  }

  for (const FoodPatch &patch : mp_forage->getPatches()) {
    const Rgb color = patch.state == PatchState::Full ? Rgb{140, 210, 90}
                                                      : Rgb{95, 140, 70};
    fillCell(renderer, patch.cell, ts, ts * 0.3f, color);
  }

  for (const auto &shelter : m_shelters) {
    fillCell(renderer, shelter->getPosition(), ts, ts * 0.1f,
             shelterColor(shelter->getKind()));
  }

  SDL_SetRenderDrawBlendMode(renderer, SDL_BLENDMODE_BLEND);
  for (AgentId id : mp_registry->allAgents()) {
    const Agent *agent = mp_registry->getAgent(id);
    if (!agent) {
      continue;
    }
    // Hidden agents show as a faint marker on their shelter
    const Uint8 alpha = agent->isSheltered() ? 90 : 255;
    fillCell(renderer, agent->getPosition(), ts, ts * 0.2f,
             speciesColor(agent->getSpecies()), alpha);
  }
}

void SimulationDemoState::handleEvent(const SDL_Event &event) {
  if (event.type == SDL_EVENT_QUIT) {
    m_quit = true;
    return;
  }
  if (!mp_player || mp_player->hasLost()) {
    if (event.type == SDL_EVENT_KEY_DOWN && event.key.key == SDLK_ESCAPE) {
      m_quit = true;
    }
    return;
  }

  if (event.type == SDL_EVENT_KEY_DOWN && !event.key.repeat) {
    switch (event.key.key) {
    case SDLK_ESCAPE:
      m_quit = true;
      break;
    case SDLK_UP:
    case SDLK_W:
      mp_player->requestMove(Direction::Up);
      break;
    case SDLK_DOWN:
    case SDLK_S:
      mp_player->requestMove(Direction::Down);
      break;
    case SDLK_LEFT:
    case SDLK_A:
      mp_player->requestMove(Direction::Left);
      break;
    case SDLK_RIGHT:
    case SDLK_D:
      mp_player->requestMove(Direction::Right);
      break;
    case SDLK_E:
      if (mp_player->pickUpItem()) {
        m_titleDirty = true;
      }
      break;
    default:
      break;
    }
  } else if (event.type == SDL_EVENT_MOUSE_BUTTON_DOWN &&
             event.button.button == SDL_BUTTON_LEFT) {
    const SimulationResult result =
        mp_player->requestMoveToWorldPoint(WorldPoint{event.button.x,
                                                      event.button.y});
    if (result != SimulationResult::SUCCESS) {
      DEMO_DEBUG(std::format("Click move refused: {}",
                             simulationResultToString(result)));
    }
  }
}

bool SimulationDemoState::exit() {
  if (!mp_registry) {
    return true;
  }
  DEMO_INFO("Exiting SimulationDemoState");
  mp_player.reset();
  mp_spawners.reset();
  mp_scheduler.reset();
  mp_roster.reset();
  mp_registry->clear();
  mp_registry.reset();
  mp_inventory.reset();
  mp_forage.reset();
  m_shelters.clear();
  mp_hideables.reset();
  mp_pathfinder.reset();
  mp_grid.reset();
  mp_catalog.reset();
  return true;
}

GridCell SimulationDemoState::clampToMap(int x, int y) const {
  return GridCell(std::clamp(x, 0, mp_grid->getWidth() - 1),
                  std::clamp(y, 0, mp_grid->getHeight() - 1));
}

HideableId SimulationDemoState::addShelter(HideableKind kind,
                                           const GridCell &cell,
                                           size_t capacity) {
  auto shelter = std::make_shared<Shelter>(kind, cell, capacity);
  m_shelters.push_back(shelter);
  // Shelters always stand on open ground
  mp_grid->setTile(cell, TileKind::Dirt);
  return mp_hideables->registerHideable(shelter);
}

void SimulationDemoState::buildWorld() {
  const int w = mp_grid->getWidth();
  const int h = mp_grid->getHeight();

  // River down the middle, with a ford in the lower half
  mp_grid->fillRect(clampToMap(w / 2, 0), 2, h, TileKind::Water);
  mp_grid->fillRect(clampToMap(w / 2, (h * 2) / 3), 2, 2, TileKind::Sand);

  mp_grid->fillRect(clampToMap(5, h - 9), 4, 1, TileKind::Rock);
  mp_grid->fillRect(clampToMap(w - 10, 5), 1, 4, TileKind::Rock);
  mp_grid->fillRect(clampToMap(2, 1), 3, 2, TileKind::Sand);

  m_playerDen = addShelter(HideableKind::Den, clampToMap(3, 3));
  addShelter(HideableKind::Burrow, clampToMap(7, h - 5));
  addShelter(HideableKind::Bush, clampToMap(10, 8));
  addShelter(HideableKind::Bush, clampToMap(w - 8, h - 10));
  addShelter(HideableKind::PredatorDen, clampToMap(w - 5, 3));
  addShelter(HideableKind::PredatorDen, clampToMap(w / 2 + 4, h - 3));

  const std::vector<GridCell> grass{
      clampToMap(5, 10),     clampToMap(9, 5),      clampToMap(12, h - 8),
      clampToMap(w - 9, 8),  clampToMap(w - 7, 14), clampToMap(w - 4, h - 4),
      clampToMap(6, h - 3),  clampToMap(w / 2 - 3, 3)};
  for (const GridCell &cell : grass) {
    if (mp_grid->isWalkable(cell) && !mp_grid->isWater(cell)) {
      mp_forage->addPatch(cell, "Grass", 25);
    }
  }
  mp_forage->dropItem(clampToMap(11, 11), ItemRecord::food("Berry", 15));

  // Rabbits trickle in near the burrow; worms surface around the player's den
  mp_spawners->addAgentSpawner(clampToMap(10, h - 5));
  mp_spawners->addItemSpawner(clampToMap(5, 6));
  mp_forage->dropItem(clampToMap(4, 12), ItemRecord::food("Seeds", 10));
}

void SimulationDemoState::spawnSpecies(Species species, const GridCell &cell,
                                       std::optional<HideableId> home) {
  AgentId id = INVALID_AGENT_ID;
  const SimulationResult result = mp_registry->spawn(species, cell, id);
  if (result != SimulationResult::SUCCESS) {
    DEMO_WARN(std::format("Could not spawn {} at ({}, {}): {}",
                          AgentTraits::speciesToString(species), cell.x,
                          cell.y, simulationResultToString(result)));
    return;
  }
  if (home && AgentTraits::categoryOf(species) == AgentCategory::Worker) {
    const RosterResult assigned = mp_roster->assign(id, *home);
    if (assigned != RosterResult::SUCCESS) {
      DEMO_WARN(std::format("Worker #{} left unassigned", id));
    }
  } else if (home) {
    mp_registry->setHome(id, home);
  }
}

void SimulationDemoState::populate() {
  const int w = mp_grid->getWidth();
  const int h = mp_grid->getHeight();

  if (mp_player->spawnPlayer(clampToMap(3, 3)) != SimulationResult::SUCCESS) {
    DEMO_ERROR("Player could not be placed");
  }

  const auto burrow = mp_hideables->findAt(clampToMap(7, h - 5));
  spawnSpecies(Species::Rabbit, clampToMap(6, h - 6), burrow);
  spawnSpecies(Species::Rabbit, clampToMap(9, h - 4), burrow);
  spawnSpecies(Species::Rabbit, clampToMap(12, 6), std::nullopt);

  spawnSpecies(Species::KangRat, clampToMap(4, 5), m_playerDen);
  spawnSpecies(Species::KangRat, clampToMap(5, 4), m_playerDen);
  spawnSpecies(Species::KangRat, clampToMap(2, 5), m_playerDen);

  spawnSpecies(Species::Coyote, clampToMap(w - 5, 3));
  spawnSpecies(Species::Hawk, clampToMap(w / 2 + 4, h - 3));
}

void SimulationDemoState::refreshTitle() {
  m_titleDirty = false;
  if (!mp_window || !mp_scheduler) {
    return;
  }
  std::string hunger = "-";
  if (auto id = mp_player->getPlayerId()) {
    if (const Agent *player = mp_registry->getAgent(*id)) {
      hunger = std::format("{}/{}", player->getHunger(),
                           player->getMaxHunger());
    }
  }
  const std::string title = std::format(
      "BurrowSim - Turn {} | {} | Hunger {}{}", mp_scheduler->getTurnCount(),
      seasonToString(mp_scheduler->getSeason()), hunger,
      mp_player->hasLost() ? " | GAME OVER" : "");
  SDL_SetWindowTitle(mp_window, title.c_str());
}

} // namespace BurrowSim
