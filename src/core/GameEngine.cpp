/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "core/GameEngine.hpp"
#include "core/GameLoop.hpp"
#include "core/Logger.hpp"
#include "gameStates/PhotoRevealState.hpp"
#include "gameStates/TreeSceneState.hpp"
#include "managers/InputManager.hpp"
#include "managers/ParticleManager.hpp"
#include "managers/SettingsManager.hpp"
#include "world/MaterialPalette.hpp"
#include <format>
#include <string>

namespace {
constexpr Uint8 channel(uint32_t hex, int shift) {
  return static_cast<Uint8>((hex >> shift) & 0xFF);
}
} // namespace

#define TINSEL_BACKGROUND                                                    \
  channel(TinselEngine::MaterialPalette::BACKGROUND_HEX, 16),                \
      channel(TinselEngine::MaterialPalette::BACKGROUND_HEX, 8),             \
      channel(TinselEngine::MaterialPalette::BACKGROUND_HEX, 0), 255

bool GameEngine::init(const std::string_view title, const int width,
                      const int height, bool fullscreen) {
  GAMEENGINE_INFO("Initializing SDL Video");

  if (!SDL_Init(SDL_INIT_VIDEO)) {
    GAMEENGINE_CRITICAL(std::format("SDL initialization failed: {}", SDL_GetError()));
    return false;
  }

  GAMEENGINE_INFO("SDL Video online");

  SDL_SetHint("SDL_MOUSE_AUTO_CAPTURE", "0"); // Prevent mouse capture issues
  SDL_SetHint("SDL_RENDER_BATCHING", "1");

  if (width <= 0 || height <= 0) {
    m_windowWidth = 1280;
    m_windowHeight = 720;
    GAMEENGINE_INFO(std::format("Using default window size: {}x{}", m_windowWidth, m_windowHeight));
  } else {
    m_windowWidth = width;
    m_windowHeight = height;
    GAMEENGINE_INFO(std::format("Using requested window size: {}x{}", m_windowWidth, m_windowHeight));
  }

  SDL_WindowFlags flags = SDL_WINDOW_RESIZABLE;
  if (fullscreen) {
    flags |= SDL_WINDOW_FULLSCREEN | SDL_WINDOW_HIGH_PIXEL_DENSITY;
  }

  mp_window.reset(
      SDL_CreateWindow(std::string(title).c_str(), m_windowWidth, m_windowHeight, flags));

  if (!mp_window) {
    GAMEENGINE_ERROR(std::format("Failed to create window: {}", SDL_GetError()));
    return false;
  }

  GAMEENGINE_DEBUG("Window creation system online");

  // Let SDL3 choose the best available backend
  mp_renderer.reset(SDL_CreateRenderer(mp_window.get(), nullptr));

  if (!mp_renderer) {
    GAMEENGINE_ERROR(std::format("Failed to create renderer: {}", SDL_GetError()));
    return false;
  }

#ifdef DEBUG
  const char *rendererName = SDL_GetRendererName(mp_renderer.get());
  if (rendererName) {
    GAMEENGINE_INFO(std::format("SDL3 selected renderer backend: {}", rendererName));
  } else {
    GAMEENGINE_WARN("Could not determine selected renderer backend");
  }
#endif

  auto &settings = TinselEngine::SettingsManager::Instance();
  bool vsyncRequested = settings.get<bool>("graphics", "vsync", true);
  GAMEENGINE_INFO(std::format("VSync setting from SettingsManager: {}", vsyncRequested ? "enabled" : "disabled"));

  bool vsyncSetSuccessfully = SDL_SetRenderVSync(mp_renderer.get(), vsyncRequested ? 1 : 0);
  if (vsyncSetSuccessfully) {
    verifyVSyncState(vsyncRequested);
  } else {
    GAMEENGINE_WARN(std::format("Failed to {} VSync: {}",
                                vsyncRequested ? "enable" : "disable", SDL_GetError()));
    if (auto gameLoop = m_gameLoop.lock()) {
      gameLoop->getTimestepManager().setSoftwareFrameLimiting(true);
    }
  }

  // Render at native pixel resolution; the camera and overlay lay out in pixels
  int pixelWidth = m_windowWidth;
  int pixelHeight = m_windowHeight;
  if (!SDL_GetWindowSizeInPixels(mp_window.get(), &pixelWidth, &pixelHeight)) {
    GAMEENGINE_ERROR(std::format("Failed to get window pixel size: {}", SDL_GetError()));
  }
  m_logicalWidth = pixelWidth;
  m_logicalHeight = pixelHeight;

  if (!SDL_SetRenderLogicalPresentation(mp_renderer.get(), m_logicalWidth,
                                        m_logicalHeight,
                                        SDL_LOGICAL_PRESENTATION_DISABLED)) {
    GAMEENGINE_ERROR(std::format("Failed to set render logical presentation: {}", SDL_GetError()));
  }

  GAMEENGINE_INFO(std::format("Using native resolution: {}x{}", m_logicalWidth, m_logicalHeight));

  if (!SDL_SetRenderDrawColor(mp_renderer.get(), TINSEL_BACKGROUND)) {
    GAMEENGINE_ERROR(std::format("Failed to set initial render draw color: {}", SDL_GetError()));
  }
  SDL_SetRenderDrawBlendMode(mp_renderer.get(), SDL_BLENDMODE_BLEND);

  // Gesture thresholds
  TinselEngine::GestureRecognizer::Config gestureConfig;
  int longPressMs = settings.get<int>("interaction", "long_press_ms",
                                      static_cast<int>(gestureConfig.longPressMs));
  int doubleClickMs = settings.get<int>("interaction", "double_click_ms",
                                        static_cast<int>(gestureConfig.doubleClickMs));
  if (longPressMs > 0) {
    gestureConfig.longPressMs = static_cast<uint64_t>(longPressMs);
  }
  if (doubleClickMs > 0) {
    gestureConfig.doubleClickMs = static_cast<uint64_t>(doubleClickMs);
  }
  InputManager::Instance().setGestureConfig(gestureConfig);
  GAMEENGINE_INFO(std::format("Gestures: long press {}ms, double click {}ms",
                              gestureConfig.longPressMs, gestureConfig.doubleClickMs));

  try {
    mp_gameStateManager = std::make_unique<GameStateManager>();
    mp_gameStateManager->addState(std::make_unique<TreeSceneState>());
    mp_gameStateManager->addState(std::make_unique<PhotoRevealState>());
  } catch (const std::exception &e) {
    GAMEENGINE_CRITICAL(std::format("Failed to register game states: {}", e.what()));
    return false;
  }

  GAMEENGINE_INFO(std::format("Game {} initialized successfully!", title));

  m_running = true;
  return true;
}

void GameEngine::handleEvents() {
  InputManager &inputMgr = InputManager::Instance();

  // Clear previous frame's pressed keys before processing new events
  inputMgr.clearFrameInput();

  SDL_Event event;
  while (SDL_PollEvent(&event)) {
    // Convert window coordinates to logical coordinates for mouse events
    SDL_ConvertEventToRenderCoordinates(mp_renderer.get(), &event);

    switch (event.type) {
      case SDL_EVENT_QUIT:
        GAMEENGINE_INFO("Shutting down!");
        setRunning(false);
        break;

      case SDL_EVENT_KEY_DOWN:
        inputMgr.onKeyDown(event);
        break;
      case SDL_EVENT_KEY_UP:
        inputMgr.onKeyUp(event);
        break;
      case SDL_EVENT_MOUSE_BUTTON_DOWN:
        inputMgr.onMouseButtonDown(event);
        break;
      case SDL_EVENT_MOUSE_BUTTON_UP:
        inputMgr.onMouseButtonUp(event);
        break;

      case SDL_EVENT_WINDOW_RESIZED:
      case SDL_EVENT_WINDOW_PIXEL_SIZE_CHANGED:
        onWindowResize(event);
        break;
      case SDL_EVENT_WINDOW_FOCUS_LOST:
        // A release outside the window would otherwise turn into a long press
        inputMgr.reset();
        break;

      default:
        break;
    }
  }

  inputMgr.update(SDL_GetTicks());

  if (mp_gameStateManager) {
    mp_gameStateManager->handleInput();
  }
}

void GameEngine::setRunning(bool running) {
  m_running = running;
  if (!running) {
    if (auto gameLoop = m_gameLoop.lock()) {
      gameLoop->stop();
    }
  }
}

float GameEngine::getCurrentFPS() const {
  if (auto gameLoop = m_gameLoop.lock()) {
    return gameLoop->getCurrentFPS();
  }
  return 0.0f;
}

void GameEngine::update(float deltaTime) {
  // ParticleManager is driven by TreeSceneState, which owns the layout flag
  if (mp_gameStateManager) {
    mp_gameStateManager->update(deltaTime);
  }
}

void GameEngine::render() {
  float interpolationAlpha = 1.0f;
  if (auto gameLoop = m_gameLoop.lock()) {
    interpolationAlpha = static_cast<float>(gameLoop->getTimestepManager().getInterpolationAlpha());
  }

  SDL_SetRenderDrawColor(mp_renderer.get(), TINSEL_BACKGROUND);
  SDL_RenderClear(mp_renderer.get());

  if (mp_gameStateManager) {
    mp_gameStateManager->render(mp_renderer.get(), interpolationAlpha);
  }

  SDL_RenderPresent(mp_renderer.get());
}

bool GameEngine::isVSyncEnabled() const noexcept {
  if (!mp_renderer) {
    return false;
  }

  int vsync = 0;
  if (SDL_GetRenderVSync(mp_renderer.get(), &vsync)) {
    return (vsync > 0); // Any positive value means VSync is enabled
  }

  return false;
}

bool GameEngine::isUsingSoftwareFrameLimiting() const {
  if (auto gameLoop = m_gameLoop.lock()) {
    return gameLoop->getTimestepManager().isUsingSoftwareFrameLimiting();
  }
  return false;
}

void GameEngine::clean() {
  if (m_cleaned) {
    return;
  }
  GAMEENGINE_INFO("Starting shutdown sequence...");
  m_running = false;

  // Nothing may call back into a manager once teardown starts
  if (auto gameLoop = m_gameLoop.lock()) {
    gameLoop->stop();
    gameLoop->clearHandlers();
  }

  auto window_to_destroy = std::move(mp_window);
  auto renderer_to_destroy = std::move(mp_renderer);

  // 1. Exit every active state
  if (mp_gameStateManager) {
    GAMEENGINE_INFO("Exiting game states...");
    mp_gameStateManager->clearAllStates();
  }

  // 2. Bulk release of the tree instances
  GAMEENGINE_INFO("Cleaning up Particle Manager...");
  ParticleManager::Instance().clean();

  // 3. States own the photo texture; it must go before the renderer
  GAMEENGINE_INFO("Cleaning up GameState manager...");
  mp_gameStateManager.reset();

  GAMEENGINE_INFO("Cleaning up Input Manager...");
  InputManager::Instance().clean();

  // 4. SDL resources
  GAMEENGINE_INFO("Destroying renderer...");
  renderer_to_destroy.reset();

  GAMEENGINE_INFO("Destroying window...");
  window_to_destroy.reset();

  GAMEENGINE_INFO("Calling SDL_Quit...");
  SDL_Quit();

  m_cleaned = true;
  GAMEENGINE_INFO("Shutdown complete!");
}

bool GameEngine::verifyVSyncState(bool requested) {
  int vsyncState = 0;
  bool vsyncVerified = false;

  if (SDL_GetRenderVSync(mp_renderer.get(), &vsyncState)) {
    vsyncVerified = requested ? (vsyncState > 0) : (vsyncState == 0);
#ifdef DEBUG
    if (vsyncVerified) {
      GAMEENGINE_INFO(std::format("VSync {} and verified (mode: {})",
                                  requested ? "enabled" : "disabled", vsyncState));
    } else {
      GAMEENGINE_WARN(std::format("VSync verification failed (reported mode: {})", vsyncState));
    }
#endif
  } else {
    GAMEENGINE_WARN(std::format("Could not verify VSync state: {}", SDL_GetError()));
  }

  // Software limiting when VSync should be on but isn't, or is intentionally off
  bool useSoftwareLimiting = requested ? !vsyncVerified : true;
  if (auto gameLoop = m_gameLoop.lock()) {
    gameLoop->getTimestepManager().setSoftwareFrameLimiting(useSoftwareLimiting);
  }

  return vsyncVerified;
}

void GameEngine::onWindowResize(const SDL_Event &event) {
  if (event.type == SDL_EVENT_WINDOW_RESIZED) {
    m_windowWidth = event.window.data1;
    m_windowHeight = event.window.data2;
  }

  int actualWidth = m_windowWidth;
  int actualHeight = m_windowHeight;
  if (!SDL_GetWindowSizeInPixels(mp_window.get(), &actualWidth, &actualHeight)) {
    GAMEENGINE_ERROR(std::format("Failed to get actual window pixel size: {}", SDL_GetError()));
    actualWidth = m_windowWidth;
    actualHeight = m_windowHeight;
  }

  if (actualWidth == m_logicalWidth && actualHeight == m_logicalHeight) {
    return;
  }

  SDL_SetRenderLogicalPresentation(mp_renderer.get(), actualWidth, actualHeight,
                                   SDL_LOGICAL_PRESENTATION_DISABLED);
  m_logicalWidth = actualWidth;
  m_logicalHeight = actualHeight;

  GAMEENGINE_INFO(std::format("Window resized, rendering at {}x{}", actualWidth, actualHeight));

  if (mp_gameStateManager) {
    mp_gameStateManager->notifyResize(m_logicalWidth, m_logicalHeight);
  }
}
