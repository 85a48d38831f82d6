/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include <SDL3/SDL.h>
#include <format>
#include <memory>
#include <string>
#include "core/GameEngine.hpp"
#include "core/GameLoop.hpp"
#include "core/Logger.hpp"
#include "managers/SettingsManager.hpp"

const int WINDOW_WIDTH{1280};
const int WINDOW_HEIGHT{720};
const float TARGET_FPS{60.0f};
const float FIXED_TIMESTEP{1.0f / 60.0f};
const std::string GAME_NAME{"Tinsel Tree"};
const std::string SETTINGS_PATH{"res/settings.json"};

// maybe_unused is just a hint to the compiler that the variable is not used.
// with -Wall -Wextra flags
int main([[maybe_unused]] int argc, [[maybe_unused]] char* argv[]) {
  GAMEENGINE_INFO(std::format("Initializing {}", GAME_NAME));

  // Settings first: window size, VSync and the tree shape come from here
  auto& settingsManager = TinselEngine::SettingsManager::Instance();
  if (!settingsManager.loadFromFile(SETTINGS_PATH)) {
    GAMEENGINE_WARN(std::format("Failed to load {} - using defaults", SETTINGS_PATH));
  } else {
    GAMEENGINE_INFO(std::format("Settings loaded from {}", SETTINGS_PATH));
  }

  const int windowWidth = settingsManager.get<int>("graphics", "resolution_width", WINDOW_WIDTH);
  const int windowHeight = settingsManager.get<int>("graphics", "resolution_height", WINDOW_HEIGHT);
  const bool fullscreen = settingsManager.get<bool>("graphics", "fullscreen", false);

  GAMELOOP_INFO("Initializing Game Loop");
  auto gameLoop = std::make_shared<GameLoop>(TARGET_FPS, FIXED_TIMESTEP);

  GameEngine& gameEngine = GameEngine::Instance();
  // Before init() so VSync verification can configure frame limiting
  gameEngine.setGameLoop(gameLoop);

  if (!gameEngine.init(GAME_NAME, windowWidth, windowHeight, fullscreen)) {
    GAMEENGINE_CRITICAL(std::format("Init {} Failed: {}", GAME_NAME, SDL_GetError()));

    // Always clean up on init failure so partially created SDL objects go
    // before static destruction
    gameEngine.clean();
    return -1;
  }

  GAMEENGINE_INFO(std::format("Frame timing configured: {}",
                              gameEngine.isUsingSoftwareFrameLimiting()
                              ? "software frame limiting"
                              : "hardware VSync"));

  gameEngine.getGameStateManager()->pushState("TreeSceneState");
  if (!gameEngine.getGameStateManager()->isStateActive("TreeSceneState")) {
    GAMEENGINE_CRITICAL("Could not enter the tree scene");
    gameEngine.clean();
    return -1;
  }

  gameLoop->setEventHandler([&gameEngine]() {
    gameEngine.handleEvents();
  });

  gameLoop->setUpdateHandler([&gameEngine](float deltaTime) {
    gameEngine.update(deltaTime);
  });

  gameLoop->setRenderHandler([&gameEngine]() {
    gameEngine.render();
  });

  GAMELOOP_INFO("Starting Game Loop");
  bool const loopOk = gameLoop->run();
  if (!loopOk) {
    GAMELOOP_ERROR("Game loop exited with an error");
  }

  GAMEENGINE_INFO(std::format("Game {} shutting down", GAME_NAME));
  gameEngine.clean();

  return loopOk ? 0 : 1;
}
