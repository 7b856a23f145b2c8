/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "combat/PoiseLedger.hpp"
#include "core/Logger.hpp"
#include "core/SimClock.hpp"

#include <algorithm>
#include <cmath>
#include <format>
#include <stdexcept>

PoiseLedger::PoiseLedger(const Riposte::SimClock& clock, float maxPoise,
                         float decayRate, float graceWindow)
    : m_clock(clock), m_max(maxPoise), m_decayRate(decayRate),
      m_graceWindow(graceWindow) {
    if (!std::isfinite(maxPoise) || maxPoise <= 0.0f) {
        throw std::invalid_argument(std::format("max poise must be positive, got {}", maxPoise));
    }
    if (!std::isfinite(decayRate) || decayRate < 0.0f ||
        !std::isfinite(graceWindow) || graceWindow < 0.0f) {
        throw std::invalid_argument("poise decay rate and grace window must be non-negative");
    }
}

PoiseHitResult PoiseLedger::applyPoiseDamage(float amount) {
    if (!std::isfinite(amount)) {
        POISE_ERROR("Rejected non-finite poise damage");
        return {};
    }
    if (amount < 0.0f) {
        POISE_WARN(std::format("Negative poise damage {} clamped to 0", amount));
        amount = 0.0f;
    }

    m_lastHitTime = m_clock.now();
    m_current += amount;

    PoiseHitResult result{amount, false};
    if (m_current >= m_max) {
        // Break and reset are one step
        m_current = 0.0f;
        ++m_breakCount;
        result.broke = true;
        POISE_DEBUG(std::format("Poise broken (break #{})", m_breakCount));
    }
    return result;
}

void PoiseLedger::resetPoise() {
    m_current = 0.0f;
}

void PoiseLedger::forceBreak() {
    m_current = 0.0f;
    m_lastHitTime = m_clock.now();
    ++m_breakCount;
}

void PoiseLedger::tick(float deltaTime) {
    if (!std::isfinite(deltaTime) || deltaTime <= 0.0f || m_current <= 0.0f) {
        return;
    }
    if (m_lastHitTime && m_clock.now() - *m_lastHitTime < m_graceWindow) {
        return;
    }
    m_current = std::max(0.0f, m_current - m_decayRate * deltaTime);
}

bool PoiseLedger::wouldBreak(float amount) const {
    return std::isfinite(amount) && amount > 0.0f && m_current + amount >= m_max;
}

bool PoiseLedger::isInDangerZone() const {
    return getNormalized() >= DANGER_ZONE_THRESHOLD;
}
