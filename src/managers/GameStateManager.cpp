/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "managers/GameStateManager.hpp"
#include "core/Logger.hpp"
#include <algorithm>
#include <stdexcept>

GameStateManager::GameStateManager() {
  m_registeredStates.reserve(4);
  m_activeStates.reserve(2);
}

void GameStateManager::addState(std::unique_ptr<GameState> state) {
  const std::string name = state->getName();
  if (hasState(name)) {
    GAMESTATE_ERROR("State with name " + name + " already exists");
    throw std::runtime_error("Tinsel Engine - State with name " + name +
                             " already exists");
  }
  state->setStateManager(this);
  m_registeredStates[name] = std::move(state);
}

void GameStateManager::pushState(const std::string &stateName) {
  auto it = m_registeredStates.find(stateName);
  if (it == m_registeredStates.end()) {
    GAMESTATE_ERROR("State not found: " + stateName);
    return;
  }

  if (isStateActive(stateName)) {
    GAMESTATE_WARN("State already active: " + stateName);
    return;
  }

  if (!m_activeStates.empty()) {
    m_activeStates.back()->pause();
  }

  std::shared_ptr<GameState> state = it->second;
  m_activeStates.push_back(state);
  if (!state->enter()) {
    GAMESTATE_ERROR("Failed to enter state: " + stateName);
    m_activeStates.pop_back();
    if (!m_activeStates.empty()) {
      m_activeStates.back()->resume();
    }
    return;
  }
  GAMESTATE_INFO("Pushed state: " + stateName);
}

void GameStateManager::popState() {
  if (m_activeStates.empty()) {
    return;
  }

  // Keep the state alive through exit() even if it was removed from the registry
  std::shared_ptr<GameState> top = m_activeStates.back();
  m_activeStates.pop_back();
  top->exit();
  GAMESTATE_INFO("Popped state: " + top->getName());

  if (!m_activeStates.empty()) {
    m_activeStates.back()->resume();
  }
}

void GameStateManager::changeState(const std::string &stateName) {
  if (!m_activeStates.empty()) {
    popState();
  }
  pushState(stateName);
}

void GameStateManager::update(float deltaTime) {
  // Index loop: a state may push or pop during its update
  for (size_t i = 0; i < m_activeStates.size(); ++i) {
    std::shared_ptr<GameState> state = m_activeStates[i];
    state->update(deltaTime);
  }
}

void GameStateManager::render(SDL_Renderer *renderer, float interpolationAlpha) {
  for (size_t i = 0; i < m_activeStates.size(); ++i) {
    std::shared_ptr<GameState> state = m_activeStates[i];
    state->render(renderer, interpolationAlpha);
  }
}

void GameStateManager::handleInput() {
  // Only the top state handles input
  if (!m_activeStates.empty()) {
    std::shared_ptr<GameState> top = m_activeStates.back();
    top->handleInput();
  }
}

void GameStateManager::notifyResize(int newLogicalWidth, int newLogicalHeight) {
  for (const auto &state : m_activeStates) {
    state->onWindowResize(newLogicalWidth, newLogicalHeight);
  }
}

bool GameStateManager::hasState(const std::string &stateName) const {
  return m_registeredStates.find(stateName) != m_registeredStates.end();
}

bool GameStateManager::isStateActive(const std::string &stateName) const {
  return std::any_of(m_activeStates.begin(), m_activeStates.end(),
                     [&](const std::shared_ptr<GameState> &state) {
                       return state->getName() == stateName;
                     });
}

std::shared_ptr<GameState>
GameStateManager::getState(const std::string &stateName) const {
  auto it = m_registeredStates.find(stateName);
  return it != m_registeredStates.end() ? it->second : nullptr;
}

std::shared_ptr<GameState> GameStateManager::getTopState() const {
  return m_activeStates.empty() ? nullptr : m_activeStates.back();
}

void GameStateManager::removeState(const std::string &stateName) {
  bool wasTop = !m_activeStates.empty() &&
                m_activeStates.back()->getName() == stateName;

  m_activeStates.erase(
      std::remove_if(m_activeStates.begin(), m_activeStates.end(),
                     [&](const std::shared_ptr<GameState> &state) {
                       if (state->getName() == stateName) {
                         state->exit();
                         return true;
                       }
                       return false;
                     }),
      m_activeStates.end());

  if (wasTop && !m_activeStates.empty()) {
    m_activeStates.back()->resume();
  }

  m_registeredStates.erase(stateName);
}

void GameStateManager::clearAllStates() {
  // Top of the stack exits first
  while (!m_activeStates.empty()) {
    std::shared_ptr<GameState> top = m_activeStates.back();
    m_activeStates.pop_back();
    top->exit();
  }
  m_registeredStates.clear();
}
