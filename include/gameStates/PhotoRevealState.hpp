/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef PHOTO_REVEAL_STATE_HPP
#define PHOTO_REVEAL_STATE_HPP

#include "gameStates/GameState.hpp"
#include <SDL3/SDL.h>
#include <memory>
#include <string>

/**
 * Overlay pushed over the tree: dims the scene and shows a framed photo.
 * Any click closes it. The texture is loaded on first entry and kept for
 * the life of the state.
 */
class PhotoRevealState : public GameState {
 public:
  bool enter() override;
  void update(float deltaTime) override;
  void render(SDL_Renderer* renderer, float interpolationAlpha = 1.0f) override;
  void handleInput() override;
  bool exit() override;
  std::string getName() const override { return "PhotoRevealState"; }

  static constexpr float FADE_SECONDS = 0.7f;
  static constexpr float BACKDROP_OPACITY = 0.9f;

  bool hasPhoto() const { return mp_photo != nullptr; }

  // 0 when just opened, 1 once fully faded in
  float getRevealProgress() const;

 private:
  std::unique_ptr<SDL_Texture, decltype(&SDL_DestroyTexture)> mp_photo{
      nullptr, SDL_DestroyTexture};
  std::string m_loadedPath{};
  float m_elapsed{0.0f};

  bool loadPhoto(SDL_Renderer* renderer, const std::string& path);
  SDL_FRect frameRect(float viewWidth, float viewHeight) const;
};

#endif  // PHOTO_REVEAL_STATE_HPP
