/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef TREE_SCENE_STATE_HPP
#define TREE_SCENE_STATE_HPP

#include "gameStates/GameState.hpp"
#include "utils/Camera.hpp"
#include "world/SceneState.hpp"

/**
 * The tree scene: owns the layout flag and the camera, drives
 * ParticleManager, and draws the greeting overlay.
 *
 * Controls:
 *   click                     toggle assembled/dispersed
 *   double click, long press  open PhotoRevealState
 *   H                         show/hide the overlay text
 *   Escape                    quit
 */
class TreeSceneState : public GameState {
 public:
  bool enter() override;
  void update(float deltaTime) override;
  void render(SDL_Renderer* renderer, float interpolationAlpha = 1.0f) override;
  void handleInput() override;
  bool exit() override;
  void pause() override;
  void resume() override;
  void onWindowResize(int logicalWidth, int logicalHeight) override;
  std::string getName() const override { return "TreeSceneState"; }

  const TinselEngine::SceneState& getSceneState() const { return m_sceneState; }
  const TinselEngine::Camera& getCamera() const { return m_camera; }
  bool isOverlayVisible() const { return m_showOverlay; }

 private:
  TinselEngine::SceneState m_sceneState{};
  TinselEngine::Camera m_camera{};

  bool m_showOverlay{true};
  bool m_photoOpen{false};  // Set while an overlay state sits on top
  float m_overlayOpacity{0.0f};
  float m_elapsed{0.0f};

  // Overlay fades toward its target over this many seconds
  static constexpr float OVERLAY_FADE_SECONDS = 1.0f;

  void renderOverlay(SDL_Renderer* renderer) const;
};

#endif  // TREE_SCENE_STATE_HPP
