/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "core/GameLoop.hpp"
#include "core/Logger.hpp"
#include <exception>
#include <format>

GameLoop::GameLoop(float targetFPS, float fixedTimestep)
    : m_timestepManager(std::make_unique<TimestepManager>(targetFPS, fixedTimestep))
    , m_running(false)
    , m_stopRequested(false)
{
}

GameLoop::~GameLoop() {
    if (m_running) {
        stop();
    }
    clearHandlers();
}

void GameLoop::setEventHandler(EventHandler handler) {
    m_eventHandler = std::move(handler);
}

void GameLoop::setUpdateHandler(UpdateHandler handler) {
    m_updateHandler = std::move(handler);
}

void GameLoop::setRenderHandler(RenderHandler handler) {
    m_renderHandler = std::move(handler);
}

void GameLoop::clearHandlers() {
    m_eventHandler = nullptr;
    m_updateHandler = nullptr;
    m_renderHandler = nullptr;
}

bool GameLoop::run() {
    if (m_running) {
        GAMELOOP_WARN("GameLoop already running");
        return false;
    }

    m_running = true;
    m_stopRequested = false;

    m_timestepManager->reset();
    GAMELOOP_INFO(std::format("GameLoop started: {} FPS target, {:.4f}s fixed step",
                              m_timestepManager->getTargetFPS(),
                              m_timestepManager->getUpdateDeltaTime()));

    try {
        while (!m_stopRequested) {
            runFrame();
        }
    } catch (const std::exception& e) {
        GAMELOOP_CRITICAL("Exception in main loop: " + std::string(e.what()));
        m_running = false;
        return false;
    }

    m_running = false;
    GAMELOOP_INFO("GameLoop stopped");
    return true;
}

void GameLoop::runFrame() {
    m_timestepManager->startFrame();

    processEvents();

    // A stop requested by the event handler skips the rest of the frame
    if (m_stopRequested) {
        return;
    }

    processUpdates();
    processRender();

    m_timestepManager->endFrame();
}

void GameLoop::stop() {
    m_stopRequested = true;
}

bool GameLoop::isRunning() const {
    return m_running;
}

float GameLoop::getCurrentFPS() const {
    return m_timestepManager->getCurrentFPS();
}

uint32_t GameLoop::getFrameTimeMs() const {
    return m_timestepManager->getFrameTimeMs();
}

void GameLoop::setTargetFPS(float fps) {
    m_timestepManager->setTargetFPS(fps);
}

float GameLoop::getTargetFPS() const {
    return m_timestepManager->getTargetFPS();
}

void GameLoop::setFixedTimestep(float timestep) {
    m_timestepManager->setFixedTimestep(timestep);
}

TimestepManager& GameLoop::getTimestepManager() {
    return *m_timestepManager;
}

void GameLoop::processEvents() {
    if (m_eventHandler) {
        m_eventHandler();
    }
}

void GameLoop::processUpdates() {
    while (m_timestepManager->shouldUpdate()) {
        if (m_updateHandler) {
            m_updateHandler(m_timestepManager->getUpdateDeltaTime());
        }
    }
}

void GameLoop::processRender() {
    if (m_timestepManager->shouldRender() && m_renderHandler) {
        m_renderHandler();
    }
}
