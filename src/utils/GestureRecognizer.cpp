/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "utils/GestureRecognizer.hpp"

namespace TinselEngine {

void GestureRecognizer::pointerDown(uint64_t timeMs, int clicks) {
    m_pressed = true;
    m_longPressFired = false;
    m_suppressNextClick = false;
    m_pressStartMs = timeMs;
    m_platformClicks = clicks;
}

void GestureRecognizer::pointerUp(uint64_t timeMs) {
    if (!m_pressed) {
        return;
    }

    // Held past the threshold without an update() in between
    update(timeMs);
    m_pressed = false;

    if (m_suppressNextClick) {
        m_suppressNextClick = false;
        m_hasLastClick = false;
        return;
    }

    m_pending.click = true;

    bool isDouble = false;
    if (m_platformClicks > 0) {
        isDouble = m_platformClicks >= 2;
    } else {
        isDouble = m_hasLastClick && timeMs - m_lastClickMs <= m_config.doubleClickMs;
    }

    if (isDouble) {
        m_pending.doubleClick = true;
        // A third quick click starts a new pair
        m_hasLastClick = false;
    } else {
        m_hasLastClick = true;
        m_lastClickMs = timeMs;
    }
}

void GestureRecognizer::update(uint64_t timeMs) {
    if (!m_pressed || m_longPressFired) {
        return;
    }
    if (timeMs >= m_pressStartMs && timeMs - m_pressStartMs >= m_config.longPressMs) {
        m_longPressFired = true;
        m_suppressNextClick = true;
        m_pending.longPress = true;
    }
}

GestureEvents GestureRecognizer::consume() {
    GestureEvents events = m_pending;
    m_pending = GestureEvents{};
    return events;
}

void GestureRecognizer::reset() {
    m_pending = GestureEvents{};
    m_pressed = false;
    m_longPressFired = false;
    m_suppressNextClick = false;
    m_hasLastClick = false;
    m_pressStartMs = 0;
    m_lastClickMs = 0;
    m_platformClicks = 0;
}

} // namespace TinselEngine
