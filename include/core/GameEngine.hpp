/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef GAME_ENGINE_HPP
#define GAME_ENGINE_HPP

#include "managers/GameStateManager.hpp"
#include <SDL3/SDL.h>
#include <memory>
#include <string_view>

// Forward declarations
class GameLoop;

class GameEngine {
public:
  ~GameEngine() = default;

  /**
   * @brief Gets the singleton instance of GameEngine
   * @return Reference to the GameEngine singleton instance
   */
  static GameEngine &Instance() {
    static GameEngine instance;
    return instance;
  }

  /**
   * @brief Initializes SDL, the window, the renderer and the game states
   * @param title Window title
   * @param width Initial window width (0 for the 1280x720 default)
   * @param height Initial window height (0 for the 1280x720 default)
   * @param fullscreen Whether to start in fullscreen mode
   * @return true if initialization successful, false otherwise
   *
   * @details Initialization order:
   *   - SDL video, window, renderer (a failure here is fatal)
   *   - VSync from SettingsManager, falling back to software frame limiting
   *     on the GameLoop's TimestepManager
   *   - InputManager gesture thresholds from the "interaction" settings
   *   - GameStateManager with TreeSceneState and PhotoRevealState registered
   *
   * The tree itself is built when TreeSceneState is entered.
   * Call setGameLoop() first so frame limiting can be configured.
   */
  bool init(const std::string_view title, const int width, const int height,
            bool fullscreen);

  /**
   * @brief Polls SDL events, routes input, then lets the top state react
   */
  void handleEvents();

  /**
   * @brief Advances every active state by one fixed step
   * @param deltaTime Fixed timestep in seconds
   */
  void update(float deltaTime);

  /**
   * @brief Clears to the scene background, renders the state stack, presents
   */
  void render();

  /**
   * @brief Tears down states, particles, renderer and window, then SDL
   */
  void clean();

  GameStateManager *getGameStateManager() const {
    return mp_gameStateManager.get();
  }

  /**
   * @brief Sets the game loop reference for delegation
   * @param gameLoop Shared pointer to the GameLoop instance
   */
  void setGameLoop(std::shared_ptr<GameLoop> gameLoop) {
    m_gameLoop = gameLoop;
  }

  std::shared_ptr<GameLoop> getGameLoop() const {
    return m_gameLoop.lock();
  }

  /**
   * @brief Sets the running state; false also stops the GameLoop
   */
  void setRunning(bool running);
  bool isRunning() const { return m_running; }

  SDL_Renderer *getRenderer() const noexcept { return mp_renderer.get(); }
  SDL_Window *getWindow() const noexcept { return mp_window.get(); }

  float getCurrentFPS() const;

  int getWindowWidth() const noexcept { return m_windowWidth; }
  int getWindowHeight() const noexcept { return m_windowHeight; }

  /**
   * @brief Logical rendering size, used for the camera aspect and UI layout
   */
  int getLogicalWidth() const noexcept { return m_logicalWidth; }
  int getLogicalHeight() const noexcept { return m_logicalHeight; }

  bool isVSyncEnabled() const noexcept;
  bool isUsingSoftwareFrameLimiting() const;

private:
  std::unique_ptr<GameStateManager> mp_gameStateManager{nullptr};
  std::unique_ptr<SDL_Window, decltype(&SDL_DestroyWindow)> mp_window{
      nullptr, SDL_DestroyWindow};
  std::unique_ptr<SDL_Renderer, decltype(&SDL_DestroyRenderer)> mp_renderer{
      nullptr, SDL_DestroyRenderer};
  std::weak_ptr<GameLoop> m_gameLoop{}; // Non-owning weak reference to GameLoop
  int m_windowWidth{0};
  int m_windowHeight{0};
  int m_logicalWidth{1280};
  int m_logicalHeight{720};
  bool m_running{false};
  bool m_cleaned{false};

  /**
   * @brief Reads back the VSync mode and picks hardware or software limiting
   * @return true if the renderer reports the requested state
   */
  bool verifyVSyncState(bool requested);

  /**
   * @brief Resize pipeline: window size, native logical size, state notify
   */
  void onWindowResize(const SDL_Event &event);

  // Delete copy constructor and assignment operator
  GameEngine(const GameEngine &) = delete;            // Prevent copying
  GameEngine &operator=(const GameEngine &) = delete; // Prevent assignment

  GameEngine() : m_windowWidth{1280}, m_windowHeight{720} {}
};
#endif // GAME_ENGINE_HPP
