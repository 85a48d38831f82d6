/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "managers/InputManager.hpp"
#include "core/Logger.hpp"
#include <algorithm>
#include <format>

InputManager::InputManager() {
  m_pressedThisFrame.reserve(16);
  m_mouseButtonStates.assign(3, false);
}

void InputManager::update(uint64_t nowMs) {
  m_gestures.update(nowMs);
}

void InputManager::reset() {
  std::fill(m_mouseButtonStates.begin(), m_mouseButtonStates.end(), false);
  m_pressedThisFrame.clear();
  m_gestures.reset();
}

void InputManager::clean() {
  if (m_isShutdown) {
    return;
  }
  reset();
  m_keystates = nullptr;
  m_isShutdown = true;
  INPUT_INFO("InputManager shut down");
}

bool InputManager::isKeyDown(SDL_Scancode key) const {
  if (m_keystates != nullptr) {
    return m_keystates[key];
  }
  return false;
}

bool InputManager::wasKeyPressed(SDL_Scancode key) const {
  return std::any_of(m_pressedThisFrame.begin(), m_pressedThisFrame.end(),
                     [key](SDL_Scancode pressedKey) { return pressedKey == key; });
}

void InputManager::clearFrameInput() {
  m_pressedThisFrame.clear();
}

bool InputManager::getMouseButtonState(int buttonNumber) const {
  if (buttonNumber < 0 ||
      buttonNumber >= static_cast<int>(m_mouseButtonStates.size())) {
    return false;
  }
  return m_mouseButtonStates[buttonNumber];
}

uint64_t InputManager::eventTimeMs(const SDL_Event& event) {
  // SDL timestamps are nanoseconds on the SDL_GetTicksNS() clock
  return event.common.timestamp / 1000000ULL;
}

void InputManager::onKeyDown(const SDL_Event& event) {
  m_keystates = SDL_GetKeyboardState(nullptr);

  // Key repeat doesn't count as a new press
  if (event.key.repeat) {
    return;
  }

  if (!wasKeyPressed(event.key.scancode)) {
    m_pressedThisFrame.push_back(event.key.scancode);
  }
}

void InputManager::onKeyUp(const SDL_Event& /*event*/) {
  m_keystates = SDL_GetKeyboardState(nullptr);
}

void InputManager::onMouseButtonDown(const SDL_Event& event) {
  switch (event.button.button) {
  case SDL_BUTTON_LEFT:
    m_mouseButtonStates[LEFT] = true;
    m_gestures.pointerDown(eventTimeMs(event), event.button.clicks);
    INPUT_DEBUG(std::format("Left press ({} clicks)", static_cast<int>(event.button.clicks)));
    break;
  case SDL_BUTTON_MIDDLE:
    m_mouseButtonStates[MIDDLE] = true;
    break;
  case SDL_BUTTON_RIGHT:
    m_mouseButtonStates[RIGHT] = true;
    break;
  default:
    break;
  }
}

void InputManager::onMouseButtonUp(const SDL_Event& event) {
  switch (event.button.button) {
  case SDL_BUTTON_LEFT:
    m_mouseButtonStates[LEFT] = false;
    m_gestures.pointerUp(eventTimeMs(event));
    break;
  case SDL_BUTTON_MIDDLE:
    m_mouseButtonStates[MIDDLE] = false;
    break;
  case SDL_BUTTON_RIGHT:
    m_mouseButtonStates[RIGHT] = false;
    break;
  default:
    break;
  }
}
