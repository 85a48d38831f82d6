/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef GESTURE_RECOGNIZER_HPP
#define GESTURE_RECOGNIZER_HPP

#include <cstdint>

namespace TinselEngine {

/**
 * @brief Gestures recognized since the last consume()
 */
struct GestureEvents {
    bool click{false};
    bool doubleClick{false};
    bool longPress{false};

    bool any() const { return click || doubleClick || longPress; }
};

/**
 * @brief Turns pointer down/up timestamps into click, double click and long press
 *
 * Pure timing logic in milliseconds; InputManager feeds it from SDL events.
 *
 * - click: reported on release
 * - double click: a second release within doubleClickMs of the previous
 *   click. The second release also reports a click. When the platform
 *   supplies a click count (SDL's `clicks`) that count wins.
 * - long press: reported once when the pointer has been held for
 *   longPressMs. The release that ends a long press is not a click.
 */
class GestureRecognizer {
public:
    struct Config {
        uint64_t longPressMs{600};
        uint64_t doubleClickMs{300};
    };

    GestureRecognizer() = default;
    explicit GestureRecognizer(const Config& config) : m_config(config) {}

    /**
     * @param clicks platform click count for this press, 0 if unknown
     */
    void pointerDown(uint64_t timeMs, int clicks = 0);
    void pointerUp(uint64_t timeMs);

    /**
     * @brief Call once per frame to detect a long press while held
     */
    void update(uint64_t timeMs);

    /**
     * @brief Returns and clears the pending gestures
     */
    GestureEvents consume();

    const GestureEvents& peek() const { return m_pending; }
    bool isPressed() const { return m_pressed; }

    void setConfig(const Config& config) { m_config = config; }
    const Config& getConfig() const { return m_config; }

    void reset();

private:
    Config m_config{};
    GestureEvents m_pending{};

    bool m_pressed{false};
    bool m_longPressFired{false};
    bool m_suppressNextClick{false};
    bool m_hasLastClick{false};
    uint64_t m_pressStartMs{0};
    uint64_t m_lastClickMs{0};
    int m_platformClicks{0};
};

} // namespace TinselEngine

#endif // GESTURE_RECOGNIZER_HPP
