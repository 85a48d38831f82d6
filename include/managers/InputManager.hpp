/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef INPUT_MANAGER_HPP
#define INPUT_MANAGER_HPP

#include <SDL3/SDL.h>
#include <boost/container/small_vector.hpp>
#include <cstdint>
#include "utils/GestureRecognizer.hpp"

enum mouse_buttons { LEFT = 0, MIDDLE = 1, RIGHT = 2 };

/**
 * Keyboard, mouse and gesture state for the current frame.
 *
 * GameEngine polls SDL and routes events to the on* handlers. Left mouse
 * presses also feed the GestureRecognizer, so states can ask for clicks,
 * double clicks and long presses without tracking timestamps themselves.
 */
class InputManager {
 public:
    ~InputManager() = default;

    static InputManager& Instance(){
        static InputManager instance;
        return instance;
    }

    // Once per frame, after events are polled: advances long-press timing
    void update(uint64_t nowMs);

    // Drop held buttons and pending gestures (state changes, focus loss)
    void reset();

    void clean();
    bool isShutdown() const { return m_isShutdown; }

    // Keyboard
    bool isKeyDown(SDL_Scancode key) const;
    bool wasKeyPressed(SDL_Scancode key) const;  // True once per press
    void clearFrameInput();  // Call once per frame before polling

    // Mouse
    bool getMouseButtonState(int buttonNumber) const;

    // Gestures from the left mouse button
    TinselEngine::GestureEvents consumeGestures() { return m_gestures.consume(); }
    const TinselEngine::GestureEvents& peekGestures() const { return m_gestures.peek(); }
    void setGestureConfig(const TinselEngine::GestureRecognizer::Config& config) { m_gestures.setConfig(config); }

    // Event routing from GameEngine::handleEvents()
    void onKeyDown(const SDL_Event& event);
    void onKeyUp(const SDL_Event& event);
    void onMouseButtonDown(const SDL_Event& event);
    void onMouseButtonUp(const SDL_Event& event);

 private:
    const bool* m_keystates{nullptr}; // Owned by SDL, don't delete
    boost::container::small_vector<SDL_Scancode, 16> m_pressedThisFrame{};

    boost::container::small_vector<bool, 3> m_mouseButtonStates{};

    TinselEngine::GestureRecognizer m_gestures{};

    bool m_isShutdown{false};

    static uint64_t eventTimeMs(const SDL_Event& event);

    InputManager(const InputManager&) = delete;
    InputManager& operator=(const InputManager&) = delete;

    InputManager();
};

#endif  // INPUT_MANAGER_HPP
