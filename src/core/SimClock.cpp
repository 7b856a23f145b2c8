/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "core/SimClock.hpp"
#include "core/Logger.hpp"

#include <cmath>
#include <format>

namespace Riposte {

SimClock::SimClock(double startTime) : m_now(startTime) {}

bool SimClock::advance(float deltaTime) {
    if (!std::isfinite(deltaTime) || deltaTime < 0.0f) {
        SIM_ERROR(std::format("SimClock rejected delta time {}", deltaTime));
        return false;
    }

    m_now += static_cast<double>(deltaTime);
    m_lastDelta = deltaTime;
    ++m_frameCount;
    return true;
}

void SimClock::reset(double startTime) {
    m_now = startTime;
    m_lastDelta = 0.0f;
    m_frameCount = 0;
}

} // namespace Riposte
