/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "gameStates/PhotoRevealState.hpp"
#include "core/GameEngine.hpp"
#include "core/Logger.hpp"
#include "managers/GameStateManager.hpp"
#include "managers/InputManager.hpp"
#include "managers/SettingsManager.hpp"
#include <SDL3_image/SDL_image.h>
#include <algorithm>
#include <format>
#include <iterator>

namespace {
constexpr float FRAME_PADDING = 8.0f;
constexpr float BRACKET_LENGTH = 32.0f;
constexpr float BRACKET_THICKNESS = 2.0f;
constexpr float RISE_DISTANCE = 40.0f;  // Frame slides up this far while fading in
constexpr float START_SCALE = 0.9f;

// Photo box: 90% of the width, 75% of the height
constexpr float MAX_WIDTH_FRACTION = 0.9f;
constexpr float MAX_HEIGHT_FRACTION = 0.75f;

Uint8 toAlpha(float opacity) {
  return static_cast<Uint8>(std::clamp(opacity, 0.0f, 1.0f) * 255.0f);
}
} // namespace

bool PhotoRevealState::enter() {
  m_elapsed = 0.0f;

  auto& gameEngine = GameEngine::Instance();
  const std::string path = TinselEngine::SettingsManager::Instance().get<std::string>(
      "photo", "path", "res/img/photo.jpg");

  if (!mp_photo || path != m_loadedPath) {
    // A missing photo still opens the overlay with an empty frame
    if (!loadPhoto(gameEngine.getRenderer(), path)) {
      TEXTURE_WARN(std::format("Could not load photo '{}': {}", path, SDL_GetError()));
    }
  }

  GAMESTATE_INFO("Photo reveal opened");
  return true;
}

bool PhotoRevealState::loadPhoto(SDL_Renderer* renderer, const std::string& path) {
  if (!renderer) {
    return false;
  }

  mp_photo.reset(IMG_LoadTexture(renderer, path.c_str()));
  if (!mp_photo) {
    m_loadedPath.clear();
    return false;
  }

  SDL_SetTextureBlendMode(mp_photo.get(), SDL_BLENDMODE_BLEND);
  m_loadedPath = path;

  float width = 0.0f;
  float height = 0.0f;
  SDL_GetTextureSize(mp_photo.get(), &width, &height);
  TEXTURE_INFO(std::format("Loaded photo '{}' ({}x{})", path, width, height));
  return true;
}

void PhotoRevealState::update(float deltaTime) {
  m_elapsed += deltaTime;
}

float PhotoRevealState::getRevealProgress() const {
  return std::clamp(m_elapsed / FADE_SECONDS, 0.0f, 1.0f);
}

SDL_FRect PhotoRevealState::frameRect(float viewWidth, float viewHeight) const {
  float maxWidth = viewWidth * MAX_WIDTH_FRACTION;
  float maxHeight = viewHeight * MAX_HEIGHT_FRACTION;

  float photoWidth = maxWidth * 0.6f;
  float photoHeight = maxHeight * 0.8f;
  if (mp_photo) {
    float textureWidth = 0.0f;
    float textureHeight = 0.0f;
    if (SDL_GetTextureSize(mp_photo.get(), &textureWidth, &textureHeight) &&
        textureWidth > 0.0f && textureHeight > 0.0f) {
      // Contain: shrink to fit, never upscale
      float fit = std::min({maxWidth / textureWidth, maxHeight / textureHeight, 1.0f});
      photoWidth = textureWidth * fit;
      photoHeight = textureHeight * fit;
    }
  }

  return SDL_FRect{(viewWidth - photoWidth) * 0.5f, (viewHeight - photoHeight) * 0.5f,
                   photoWidth, photoHeight};
}

void PhotoRevealState::render(SDL_Renderer* renderer, [[maybe_unused]] float interpolationAlpha) {
  const auto& gameEngine = GameEngine::Instance();
  const float viewWidth = static_cast<float>(gameEngine.getLogicalWidth());
  const float viewHeight = static_cast<float>(gameEngine.getLogicalHeight());

  const float progress = getRevealProgress();
  // Ease out
  const float eased = 1.0f - (1.0f - progress) * (1.0f - progress);

  SDL_SetRenderDrawBlendMode(renderer, SDL_BLENDMODE_BLEND);

  // Backdrop
  SDL_SetRenderDrawColor(renderer, 0, 0, 0, toAlpha(BACKDROP_OPACITY * eased));
  SDL_FRect backdrop{0.0f, 0.0f, viewWidth, viewHeight};
  SDL_RenderFillRect(renderer, &backdrop);

  // Photo rect, scaled and lifted toward its resting place
  SDL_FRect photo = frameRect(viewWidth, viewHeight);
  const float scale = START_SCALE + (1.0f - START_SCALE) * eased;
  const float centerX = photo.x + photo.w * 0.5f;
  const float centerY = photo.y + photo.h * 0.5f + RISE_DISTANCE * (1.0f - eased);
  photo.w *= scale;
  photo.h *= scale;
  photo.x = centerX - photo.w * 0.5f;
  photo.y = centerY - photo.h * 0.5f;

  SDL_FRect frame{photo.x - FRAME_PADDING, photo.y - FRAME_PADDING,
                  photo.w + FRAME_PADDING * 2.0f, photo.h + FRAME_PADDING * 2.0f};

  // Gold mat
  SDL_SetRenderDrawColor(renderer, 202, 138, 4, toAlpha(0.4f * eased));
  SDL_RenderFillRect(renderer, &frame);

  SDL_SetRenderDrawColor(renderer, 0, 0, 0, toAlpha(eased));
  SDL_RenderFillRect(renderer, &photo);

  if (mp_photo) {
    SDL_SetTextureAlphaModFloat(mp_photo.get(), eased);
    SDL_RenderTexture(renderer, mp_photo.get(), nullptr, &photo);
  }

  SDL_SetRenderDrawColor(renderer, 234, 179, 8, toAlpha(0.2f * eased));
  SDL_RenderRect(renderer, &photo);

  // Corner brackets
  SDL_SetRenderDrawColor(renderer, 250, 204, 21, toAlpha(eased));
  const float left = frame.x;
  const float top = frame.y;
  const float right = frame.x + frame.w;
  const float bottom = frame.y + frame.h;
  const SDL_FRect brackets[] = {
      {left, top, BRACKET_LENGTH, BRACKET_THICKNESS},
      {left, top, BRACKET_THICKNESS, BRACKET_LENGTH},
      {right - BRACKET_LENGTH, top, BRACKET_LENGTH, BRACKET_THICKNESS},
      {right - BRACKET_THICKNESS, top, BRACKET_THICKNESS, BRACKET_LENGTH},
      {left, bottom - BRACKET_THICKNESS, BRACKET_LENGTH, BRACKET_THICKNESS},
      {left, bottom - BRACKET_LENGTH, BRACKET_THICKNESS, BRACKET_LENGTH},
      {right - BRACKET_LENGTH, bottom - BRACKET_THICKNESS, BRACKET_LENGTH, BRACKET_THICKNESS},
      {right - BRACKET_THICKNESS, bottom - BRACKET_LENGTH, BRACKET_THICKNESS, BRACKET_LENGTH},
  };
  SDL_RenderFillRects(renderer, brackets, static_cast<int>(std::size(brackets)));
}

void PhotoRevealState::handleInput() {
  auto& inputMgr = InputManager::Instance();

  if (inputMgr.wasKeyPressed(SDL_SCANCODE_ESCAPE)) {
    GameEngine::Instance().setRunning(false);
    return;
  }

  // Any click closes, and it never reaches the tree below
  TinselEngine::GestureEvents gestures = inputMgr.consumeGestures();
  if (gestures.click && mp_stateManager) {
    mp_stateManager->popState();
  }
}

bool PhotoRevealState::exit() {
  GAMESTATE_INFO("Photo reveal closed");
  return true;
}
