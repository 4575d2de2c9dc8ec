/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "core/Logger.hpp"
#include "core/SimulationConfig.hpp"
#include "gameStates/SimulationDemoState.hpp"
#include <SDL3/SDL.h>
#include <SDL3/SDL_video.h>
#include <cmath>
#include <format>
#include <string>

const std::string GAME_NAME{"BurrowSim"};
const std::string CONFIG_PATH{"res/data/simulation.json"};

int main([[maybe_unused]] int argc, [[maybe_unused]] char *argv[]) {
  using namespace BurrowSim;

  SimulationConfig config;
  if (!SimulationConfig::loadFromFile(CONFIG_PATH, config)) {
    DEMO_WARN(std::format("Failed to load {} - using defaults", CONFIG_PATH));
  }

  if (!SDL_Init(SDL_INIT_VIDEO | SDL_INIT_EVENTS)) {
    DEMO_CRITICAL(std::format("SDL could not initialize: {}", SDL_GetError()));
    return 1;
  }

  const int windowWidth =
      static_cast<int>(std::lround(config.gridWidth * config.tileSize));
  const int windowHeight =
      static_cast<int>(std::lround(config.gridHeight * config.tileSize));
  SDL_Window *window =
      SDL_CreateWindow(GAME_NAME.c_str(), windowWidth, windowHeight, 0);
  if (!window) {
    DEMO_CRITICAL(std::format("Window could not be created: {}",
                              SDL_GetError()));
    SDL_Quit();
    return 1;
  }

  SDL_Renderer *renderer = SDL_CreateRenderer(window, nullptr);
  if (!renderer) {
    DEMO_CRITICAL(std::format("Renderer could not be created: {}",
                              SDL_GetError()));
    SDL_DestroyWindow(window);
    SDL_Quit();
    return 1;
  }

  int exitCode = 0;
  {
    SimulationDemoState state(window, config);
    if (!state.enter()) {
      DEMO_CRITICAL("Demo state failed to start");
      exitCode = 1;
    } else {
      DEMO_INFO("Starting main loop");
      SDL_Event event;
      while (!state.wantsQuit()) {
        while (SDL_PollEvent(&event)) {
          state.handleEvent(event);
        }
        state.update(1.0f / 60.0f);

        SDL_SetRenderDrawColor(renderer, 0, 0, 0, 255);
        SDL_RenderClear(renderer);
        state.render(renderer);
        SDL_RenderPresent(renderer);

        // Turn-based: nothing moves between inputs, no need to spin
        SDL_Delay(16);
      }
      state.exit();
    }
  }

  SDL_DestroyRenderer(renderer);
  SDL_DestroyWindow(window);
  SDL_Quit();
  DEMO_INFO("Quitting");
  return exitCode;
}
