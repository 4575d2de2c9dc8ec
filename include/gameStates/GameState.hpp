/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef GAME_STATE_HPP
#define GAME_STATE_HPP

#include <string>

// Forward declarations
struct SDL_Renderer;
union SDL_Event;

namespace BurrowSim {

// pure virtual for inheritance
class GameState {
public:
  virtual bool enter() = 0;
  virtual void update(float deltaTime) = 0;
  virtual void render(SDL_Renderer *renderer) = 0;
  virtual void handleEvent(const SDL_Event &event) = 0;
  virtual bool exit() = 0;
  virtual std::string getName() const = 0;
  virtual ~GameState() = default;
};

} // namespace BurrowSim

#endif // GAME_STATE_HPP
