/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "sim/TimestepManager.hpp"
#include <SDL3/SDL.h>
#include <algorithm>

TimestepManager::TimestepManager(float frameRate, float physicsRate, bool realtime)
    : m_frameStep(1.0f / std::max(frameRate, 1.0f))
    , m_physicsStep(1.0f / std::max(physicsRate, 1.0f))
    , m_realtime(realtime)
{
    m_lastFrameNs = SDL_GetTicksNS();
    m_frameStartNs = m_lastFrameNs;
}

float TimestepManager::startFrame() {
    ++m_frameCount;

    if (!m_realtime) {
        m_accumulator += m_frameStep;
        return m_frameStep;
    }

    const uint64_t now = SDL_GetTicksNS();
    double deltaTime = static_cast<double>(now - m_lastFrameNs) / 1e9;
    m_lastFrameNs = now;
    m_frameStartNs = now;

    // First frame has no meaningful delta
    if (m_frameCount == 1) {
        deltaTime = m_frameStep;
    }
    deltaTime = std::min(deltaTime, MAX_FRAME_DELTA);
    m_accumulator += deltaTime;
    return static_cast<float>(deltaTime);
}

bool TimestepManager::shouldPhysicsStep() {
    if (m_accumulator >= m_physicsStep) {
        m_accumulator -= m_physicsStep;
        return true;
    }
    return false;
}

double TimestepManager::getInterpolationAlpha() const {
    return std::clamp(m_accumulator / m_physicsStep, 0.0, 1.0);
}

void TimestepManager::endFrame() const {
    if (!m_realtime) {
        return;
    }

    const uint64_t targetEnd = m_frameStartNs + static_cast<uint64_t>(m_frameStep * 1e9);
    const uint64_t now = SDL_GetTicksNS();
    if (targetEnd > now) {
        SDL_DelayPrecise(targetEnd - now);
    }
}
