/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "combat/HealthLedger.hpp"
#include "core/Logger.hpp"

#include <algorithm>
#include <format>
#include <stdexcept>

HealthLedger::HealthLedger(int maxHealth) : m_current(maxHealth), m_max(maxHealth) {
    if (maxHealth <= 0) {
        throw std::invalid_argument(std::format("max health must be positive, got {}", maxHealth));
    }
}

int HealthLedger::applyDamage(int amount) {
    if (amount < 0) {
        HEALTH_WARN(std::format("Rejected negative damage {}", amount));
        return 0;
    }
    const int before = m_current;
    m_current = std::max(0, m_current - amount);
    return m_current - before;
}

int HealthLedger::heal(int amount) {
    if (amount < 0) {
        HEALTH_WARN(std::format("Rejected negative heal {}", amount));
        return 0;
    }
    if (m_current <= 0) {
        // Dead actors stay dead
        return 0;
    }
    const int before = m_current;
    m_current = std::min(m_max, m_current + amount);
    return m_current - before;
}

void HealthLedger::setCurrent(int current) {
    m_current = std::clamp(current, 0, m_max);
}
