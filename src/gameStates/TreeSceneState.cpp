/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "gameStates/TreeSceneState.hpp"
#include "core/GameEngine.hpp"
#include "core/Logger.hpp"
#include "managers/GameStateManager.hpp"
#include "managers/InputManager.hpp"
#include "managers/ParticleManager.hpp"
#include "world/TreeSceneConfig.hpp"
#include <SDL3/SDL.h>
#include <algorithm>
#include <cmath>
#include <format>
#include <string_view>

namespace {

constexpr std::string_view TITLE_TEXT{"Merry Christmas"};
constexpr std::string_view SUBTITLE_TEXT{"Luxury Holiday Experience"};
constexpr std::string_view DISPERSE_HINT{"Click to disperse"};
constexpr std::string_view RESTORE_HINT{"Click to restore"};
constexpr std::string_view SURPRISE_HINT{"Double Click / Long Press for Surprise"};

// Debug font glyphs are 8x8 at scale 1
constexpr float GLYPH = static_cast<float>(SDL_DEBUG_TEXT_FONT_CHARACTER_SIZE);

void drawCentered(SDL_Renderer* renderer, std::string_view text, float y,
                  float scale, float logicalWidth) {
  SDL_SetRenderScale(renderer, scale, scale);
  float width = GLYPH * static_cast<float>(text.size());
  float x = (logicalWidth / scale - width) * 0.5f;
  SDL_RenderDebugText(renderer, x, y / scale, std::string(text).c_str());
  SDL_SetRenderScale(renderer, 1.0f, 1.0f);
}

Uint8 toAlpha(float opacity) {
  return static_cast<Uint8>(std::clamp(opacity, 0.0f, 1.0f) * 255.0f);
}

} // namespace

bool TreeSceneState::enter() {
  const auto& gameEngine = GameEngine::Instance();
  m_camera.setViewport(static_cast<float>(gameEngine.getLogicalWidth()),
                       static_cast<float>(gameEngine.getLogicalHeight()));

  m_sceneState.setLayout(TinselEngine::TreeLayout::Assembled);
  m_showOverlay = true;
  m_photoOpen = false;
  m_overlayOpacity = 0.0f;
  m_elapsed = 0.0f;

  auto config = TinselEngine::TreeSceneConfig::fromSettings();
  if (!ParticleManager::Instance().init(config)) {
    SCENE_ERROR("Failed to build the tree");
    return false;
  }

  InputManager::Instance().reset();
  SCENE_INFO(std::format("Entered with {} particles",
                         ParticleManager::Instance().getParticleCount()));
  return true;
}

void TreeSceneState::update(float deltaTime) {
  m_elapsed += deltaTime;

  // Layout is read once per step and handed over by value
  ParticleManager::Instance().update(deltaTime, m_sceneState.getLayout());

  float target = (m_showOverlay && !m_photoOpen) ? 1.0f : 0.0f;
  float step = deltaTime / OVERLAY_FADE_SECONDS;
  if (m_overlayOpacity < target) {
    m_overlayOpacity = std::min(target, m_overlayOpacity + step);
  } else {
    m_overlayOpacity = std::max(target, m_overlayOpacity - step);
  }
}

void TreeSceneState::render(SDL_Renderer* renderer, [[maybe_unused]] float interpolationAlpha) {
  ParticleManager::Instance().render(renderer, m_camera);

  if (m_overlayOpacity > 0.0f) {
    renderOverlay(renderer);
  }
}

void TreeSceneState::renderOverlay(SDL_Renderer* renderer) const {
  const auto& viewport = m_camera.getViewport();
  const float width = viewport.width;
  const float height = viewport.height;
  const float opacity = m_overlayOpacity;

  SDL_SetRenderDrawBlendMode(renderer, SDL_BLENDMODE_BLEND);

  // Title
  SDL_SetRenderDrawColor(renderer, 250, 204, 21, toAlpha(opacity));
  drawCentered(renderer, TITLE_TEXT, 48.0f, 4.0f, width);

  SDL_SetRenderDrawColor(renderer, 234, 179, 8, toAlpha(opacity * 0.8f));
  drawCentered(renderer, SUBTITLE_TEXT, 48.0f + GLYPH * 4.0f + 12.0f, 1.5f, width);

  // Hints; the first one pulses
  float pulse = 0.75f + 0.25f * std::sin(m_elapsed * 2.0f);
  std::string_view hint = m_sceneState.isAssembled() ? DISPERSE_HINT : RESTORE_HINT;
  SDL_SetRenderDrawColor(renderer, 254, 249, 195, toAlpha(opacity * 0.4f * pulse + 0.1f * opacity));
  drawCentered(renderer, hint, height - 64.0f, 1.5f, width);

  SDL_SetRenderDrawColor(renderer, 234, 179, 8, toAlpha(opacity * 0.3f));
  drawCentered(renderer, SURPRISE_HINT, height - 40.0f, 1.0f, width);
}

void TreeSceneState::handleInput() {
  auto& inputMgr = InputManager::Instance();

  if (inputMgr.wasKeyPressed(SDL_SCANCODE_ESCAPE)) {
    GameEngine::Instance().setRunning(false);
    return;
  }

  if (inputMgr.wasKeyPressed(SDL_SCANCODE_H)) {
    m_showOverlay = !m_showOverlay;
    SCENE_DEBUG(std::format("Overlay {}", m_showOverlay ? "shown" : "hidden"));
  }

  TinselEngine::GestureEvents gestures = inputMgr.consumeGestures();
  if (!gestures.any()) {
    return;
  }

  if (gestures.click) {
    TinselEngine::TreeLayout layout = m_sceneState.toggle();
    SCENE_INFO(std::format("Layout -> {}", TinselEngine::getLayoutName(layout)));
  }

  if ((gestures.doubleClick || gestures.longPress) && mp_stateManager) {
    SCENE_INFO(gestures.longPress ? "Long press: opening photo" : "Double click: opening photo");
    mp_stateManager->pushState("PhotoRevealState");
  }
}

bool TreeSceneState::exit() {
  ParticleManager::Instance().clean();
  SCENE_INFO("Exited, particles released");
  return true;
}

void TreeSceneState::pause() {
  m_photoOpen = true;
}

void TreeSceneState::resume() {
  m_photoOpen = false;
  // Drop the click that closed the overlay above us
  InputManager::Instance().consumeGestures();
}

void TreeSceneState::onWindowResize(int logicalWidth, int logicalHeight) {
  if (!m_camera.setViewport(static_cast<float>(logicalWidth),
                            static_cast<float>(logicalHeight))) {
    SCENE_WARN(std::format("Ignoring viewport {}x{}", logicalWidth, logicalHeight));
  }
}
