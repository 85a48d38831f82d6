/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef GAME_LOOP_HPP
#define GAME_LOOP_HPP

#include "core/TimestepManager.hpp"
#include <functional>
#include <memory>

/**
 * GameLoop runs the frame loop on the SDL main thread.
 *
 * Callback-based:
 * - the event handler runs once per frame
 * - the update handler runs once per fixed step (zero or more per frame)
 * - the render handler runs once per frame
 *
 * Everything is single-threaded. Handlers are registered before run() and
 * removed with clearHandlers() after stop().
 */
class GameLoop {
public:
    using EventHandler = std::function<void()>;
    using UpdateHandler = std::function<void(float deltaTime)>;
    using RenderHandler = std::function<void()>;

    /**
     * @param targetFPS Target frames per second for rendering
     * @param fixedTimestep Fixed timestep for updates in seconds
     */
    explicit GameLoop(float targetFPS = 60.0f, float fixedTimestep = 1.0f/60.0f);

    ~GameLoop();

    void setEventHandler(EventHandler handler);
    void setUpdateHandler(UpdateHandler handler);
    void setRenderHandler(RenderHandler handler);

    /**
     * Drop all registered callbacks. Called during teardown so nothing
     * reaches a manager that has already been cleaned.
     */
    void clearHandlers();

    /**
     * Start the main loop. Blocks until stop() is called.
     * @return true if loop completed successfully, false on error
     */
    bool run();

    /**
     * Run exactly one frame: events, pending fixed updates, render.
     * run() is a loop over this.
     */
    void runFrame();

    void stop();
    bool isRunning() const;

    float getCurrentFPS() const;
    uint32_t getFrameTimeMs() const;
    void setTargetFPS(float fps);
    float getTargetFPS() const;
    void setFixedTimestep(float timestep);

    TimestepManager& getTimestepManager();

private:
    std::unique_ptr<TimestepManager> m_timestepManager;

    EventHandler m_eventHandler;
    UpdateHandler m_updateHandler;
    RenderHandler m_renderHandler;

    bool m_running;
    bool m_stopRequested;

    void processEvents();
    void processUpdates();
    void processRender();

    GameLoop(const GameLoop&) = delete;
    GameLoop& operator=(const GameLoop&) = delete;
};

#endif // GAME_LOOP_HPP
