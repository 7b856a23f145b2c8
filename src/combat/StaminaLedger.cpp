/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "combat/StaminaLedger.hpp"
#include "core/Logger.hpp"

#include <algorithm>
#include <cmath>
#include <format>
#include <stdexcept>

StaminaLedger::StaminaLedger(float maxStamina, float regenRate, float regenDelay)
    : m_current(maxStamina), m_max(maxStamina), m_regenRate(regenRate),
      m_regenDelay(regenDelay) {
    if (!std::isfinite(maxStamina) || maxStamina <= 0.0f) {
        throw std::invalid_argument(std::format("max stamina must be positive, got {}", maxStamina));
    }
    if (!std::isfinite(regenRate) || regenRate < 0.0f ||
        !std::isfinite(regenDelay) || regenDelay < 0.0f) {
        throw std::invalid_argument("stamina regen rate and delay must be non-negative");
    }
}

bool StaminaLedger::tryConsume(float amount) {
    if (!std::isfinite(amount) || amount < 0.0f) {
        STAMINA_WARN(std::format("Rejected stamina cost {}", amount));
        return false;
    }
    if (amount == 0.0f) {
        return true;
    }
    if (m_current < amount) {
        return false;
    }

    m_current -= amount;
    m_delayRemaining = m_regenDelay;
    return true;
}

float StaminaLedger::drain(float amount) {
    if (!std::isfinite(amount) || amount <= 0.0f) {
        if (!std::isfinite(amount) || amount < 0.0f) {
            STAMINA_WARN(std::format("Rejected stamina drain {}", amount));
        }
        return 0.0f;
    }

    const float removed = std::min(amount, m_current);
    m_current -= removed;
    m_delayRemaining = m_regenDelay;
    return removed;
}

float StaminaLedger::drainContinuous(float ratePerSecond, float deltaTime) {
    if (!std::isfinite(ratePerSecond) || !std::isfinite(deltaTime) ||
        ratePerSecond < 0.0f || deltaTime < 0.0f) {
        STAMINA_WARN("Rejected continuous drain with invalid rate or delta");
        return 0.0f;
    }
    return drain(ratePerSecond * deltaTime);
}

void StaminaLedger::restore(float amount) {
    if (!std::isfinite(amount) || amount < 0.0f) {
        STAMINA_WARN(std::format("Rejected stamina restore {}", amount));
        return;
    }
    m_current = std::min(m_max, m_current + amount);
}

void StaminaLedger::reset() {
    m_current = m_max;
    m_delayRemaining = 0.0f;
}

void StaminaLedger::tick(float deltaTime) {
    if (!std::isfinite(deltaTime) || deltaTime <= 0.0f) {
        return;
    }

    if (m_delayRemaining > 0.0f) {
        m_delayRemaining = std::max(0.0f, m_delayRemaining - deltaTime);
        return;
    }

    if (m_current < m_max) {
        m_current = std::min(m_max, m_current + m_regenRate * m_regenMultiplier * deltaTime);
    }
}

void StaminaLedger::setRegenRateMultiplier(float multiplier) {
    if (!std::isfinite(multiplier) || multiplier < 0.0f) {
        STAMINA_WARN(std::format("Rejected regen multiplier {}", multiplier));
        return;
    }
    m_regenMultiplier = multiplier;
}
