/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "core/TimestepManager.hpp"
#include <SDL3/SDL.h>
#include <algorithm>

TimestepManager::TimestepManager(float targetFPS, float fixedTimestep)
    : m_targetFPS(targetFPS)
    , m_fixedTimestep(fixedTimestep)
    , m_targetFrameTime(1.0f / targetFPS)
    , m_accumulator(0.0)
    , m_lastFrameTimeMs(0)
    , m_lastDeltaSeconds(0.0)
    , m_currentFPS(0.0f)
    , m_smoothingAlpha(0.03f)
    , m_shouldRender(true)
    , m_firstFrame(true)
{
    auto currentTime = std::chrono::high_resolution_clock::now();
    m_frameStart = currentTime;
    m_lastFrameTime = currentTime;
}

void TimestepManager::startFrame() {
    auto currentTime = std::chrono::high_resolution_clock::now();

    if (m_firstFrame) {
        m_firstFrame = false;
        m_lastFrameTime = currentTime;
        m_frameStart = currentTime;
        m_shouldRender = true;
        return;
    }

    auto deltaTimeNs = std::chrono::duration_cast<std::chrono::nanoseconds>(currentTime - m_lastFrameTime);
    m_lastFrameTime = currentTime;
    m_frameStart = currentTime;

    advance(static_cast<double>(deltaTimeNs.count()) / 1e9);
}

void TimestepManager::advance(double deltaSeconds) {
    deltaSeconds = std::max(deltaSeconds, 0.0);
    m_lastFrameTimeMs = static_cast<uint32_t>(deltaSeconds * 1000.0);
    m_lastDeltaSeconds = deltaSeconds;

    // Clamp to avoid the spiral of death after a stall
    m_accumulator = std::min(m_accumulator + deltaSeconds, MAX_ACCUMULATOR);

    m_shouldRender = true;
    updateFPS();
}

bool TimestepManager::shouldUpdate() {
    if (m_accumulator >= m_fixedTimestep) {
        m_accumulator -= m_fixedTimestep;
        return true;
    }
    return false;
}

bool TimestepManager::shouldRender() const {
    return m_shouldRender;
}

float TimestepManager::getUpdateDeltaTime() const {
    return m_fixedTimestep;
}

double TimestepManager::getInterpolationAlpha() const {
    if (m_fixedTimestep > 0.0f) {
        return std::clamp(m_accumulator / m_fixedTimestep, 0.0, 1.0);
    }
    return 1.0;
}

void TimestepManager::endFrame() {
    m_shouldRender = false;
    limitFrameRate();
}

float TimestepManager::getCurrentFPS() const {
    return m_currentFPS;
}

float TimestepManager::getTargetFPS() const {
    return m_targetFPS;
}

uint32_t TimestepManager::getFrameTimeMs() const {
    return m_lastFrameTimeMs;
}

void TimestepManager::setTargetFPS(float fps) {
    if (fps > 0.0f) {
        m_targetFPS = fps;
        m_targetFrameTime = 1.0f / fps;
    }
}

void TimestepManager::setFixedTimestep(float timestep) {
    if (timestep > 0.0f) {
        m_fixedTimestep = timestep;
    }
}

void TimestepManager::reset() {
    m_accumulator = 0.0;
    m_firstFrame = true;
    m_shouldRender = true;
    m_currentFPS = 0.0f;
    m_lastDeltaSeconds = 0.0;

    auto currentTime = std::chrono::high_resolution_clock::now();
    m_frameStart = currentTime;
    m_lastFrameTime = currentTime;
}

void TimestepManager::setSoftwareFrameLimiting(bool useSoftwareLimiting) {
    m_usingSoftwareFrameLimiting = useSoftwareLimiting;
}

void TimestepManager::updateFPS() {
    if (m_lastDeltaSeconds > 0.0) {
        float instantFPS = static_cast<float>(1.0 / m_lastDeltaSeconds);
        instantFPS = std::clamp(instantFPS, 0.1f, 1000.0f);

        if (m_currentFPS <= 0.0f) {
            m_currentFPS = instantFPS;
        } else {
            m_currentFPS = m_smoothingAlpha * instantFPS + (1.0f - m_smoothingAlpha) * m_currentFPS;
        }
    }
}

void TimestepManager::limitFrameRate() const {
    // VSync paces the frame inside SDL_RenderPresent()
    if (!m_usingSoftwareFrameLimiting) {
        return;
    }

    int64_t targetFrameNs = static_cast<int64_t>(m_targetFrameTime * 1e9);
    auto targetEndTime = m_frameStart + std::chrono::nanoseconds(targetFrameNs);

    auto now = std::chrono::high_resolution_clock::now();
    auto remainingNs = std::chrono::duration_cast<std::chrono::nanoseconds>(targetEndTime - now);

    if (remainingNs.count() > 0) {
        SDL_DelayPrecise(static_cast<Uint64>(remainingNs.count()));
    }
}
