/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef TIMESTEP_MANAGER_HPP
#define TIMESTEP_MANAGER_HPP

#include <chrono>
#include <cstdint>

/**
 * TimestepManager drives the fixed-step update cadence of the scene.
 *
 * Frame deltas feed an accumulator that is drained in fixed steps, so the
 * particle animator always sees the same deltaTime. The accumulator is capped
 * at MAX_ACCUMULATOR: after a stall (window drag, debugger break) at most
 * 0.25 s worth of steps run, which keeps the per-step lerp factor bounded.
 */
class TimestepManager {
public:
    /**
     * Constructor
     * @param targetFPS Target frames per second for rendering (e.g., 60.0f)
     * @param fixedTimestep Fixed timestep for updates in seconds (e.g., 1.0f/60.0f)
     */
    explicit TimestepManager(float targetFPS = 60.0f, float fixedTimestep = 1.0f/60.0f);

    /**
     * Call this at the start of each frame
     */
    void startFrame();

    /**
     * Returns true if an update should be performed with fixed timestep.
     * May return true multiple times per frame for catch-up.
     */
    bool shouldUpdate();

    bool shouldRender() const;

    /**
     * Gets the fixed delta time for updates.
     * @return fixed timestep in seconds
     */
    float getUpdateDeltaTime() const;

    /**
     * Fraction of the next fixed step already accumulated, clamped to [0, 1].
     */
    double getInterpolationAlpha() const;

    /**
     * Call this at the end of each frame.
     * Sleeps the remainder of the frame when software limiting is active.
     */
    void endFrame();

    float getCurrentFPS() const;
    float getTargetFPS() const;
    uint32_t getFrameTimeMs() const;

    void setTargetFPS(float fps);
    void setFixedTimestep(float timestep);

    /**
     * Feed a frame delta directly instead of measuring wall time.
     * Used by tests and by startFrame() itself.
     * @param deltaSeconds elapsed time since the previous frame
     */
    void advance(double deltaSeconds);

    /**
     * Reset timing state (after the window regains focus, on loop start)
     */
    void reset();

    /**
     * Switch between VSync pacing and SDL_DelayPrecise pacing
     * @param useSoftwareLimiting true when VSync is unavailable or disabled
     */
    void setSoftwareFrameLimiting(bool useSoftwareLimiting);

    bool isUsingSoftwareFrameLimiting() const { return m_usingSoftwareFrameLimiting; }

    static constexpr double MAX_ACCUMULATOR = 0.25;

private:
    float m_targetFPS;
    float m_fixedTimestep;
    float m_targetFrameTime;

    std::chrono::high_resolution_clock::time_point m_frameStart;
    std::chrono::high_resolution_clock::time_point m_lastFrameTime;

    double m_accumulator;

    // Frame statistics
    uint32_t m_lastFrameTimeMs;
    double m_lastDeltaSeconds;
    float m_currentFPS;                 // EMA smoothed
    float m_smoothingAlpha;

    bool m_shouldRender;
    bool m_firstFrame;
    bool m_usingSoftwareFrameLimiting{false};

    void updateFPS();
    void limitFrameRate() const;
};

#endif // TIMESTEP_MANAGER_HPP
