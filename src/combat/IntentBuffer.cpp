/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "combat/IntentBuffer.hpp"
#include "core/Logger.hpp"
#include "core/SimClock.hpp"

#include <cmath>
#include <format>

const char* toString(CombatAction action) {
    switch (action) {
    case CombatAction::LightAttack: return "LightAttack";
    case CombatAction::HeavyAttack: return "HeavyAttack";
    case CombatAction::Parry: return "Parry";
    case CombatAction::Block: return "Block";
    case CombatAction::Dodge: return "Dodge";
    case CombatAction::LockOn: return "LockOn";
    default: return "Unknown";
    }
}

IntentBuffer::IntentBuffer(const Riposte::SimClock& clock) : m_clock(clock) {}

bool IntentBuffer::push(CombatAction action, std::optional<Vector3D> direction) {
    const auto index = static_cast<size_t>(action);
    if (index >= ACTION_COUNT) {
        INTENT_ERROR(std::format("Rejected intent with invalid action index {}", index));
        return false;
    }

    if (direction.has_value()) {
        if (!direction->isFinite()) {
            INTENT_WARN(std::format("Rejected {} intent with non-finite direction",
                                    toString(action)));
            return false;
        }
        direction = direction->isZero() ? std::nullopt
                                        : std::optional<Vector3D>(direction->normalized());
    }

    Slot& slot = m_slots[index];
    slot.intent.action = action;
    slot.intent.timestamp = m_clock.now();
    slot.intent.direction = direction;
    slot.intent.consumed = false;
    slot.occupied = true;

    INTENT_DEBUG(std::format("Buffered {} at t={:.3f}", toString(action),
                             slot.intent.timestamp));
    return true;
}

std::optional<BufferedIntent> IntentBuffer::tryConsume(CombatAction action,
                                                       float window) {
    const auto index = static_cast<size_t>(action);
    if (index >= ACTION_COUNT || !std::isfinite(window) || window < 0.0f) {
        INTENT_WARN("tryConsume called with invalid action or window");
        return std::nullopt;
    }

    Slot& slot = m_slots[index];
    if (!isLive(slot, window)) {
        return std::nullopt;
    }

    slot.intent.consumed = true;
    return slot.intent;
}

bool IntentBuffer::hasBuffered(CombatAction action, float window) const {
    const auto index = static_cast<size_t>(action);
    if (index >= ACTION_COUNT || !std::isfinite(window) || window < 0.0f) {
        return false;
    }
    return isLive(m_slots[index], window);
}

void IntentBuffer::clear() {
    for (auto& slot : m_slots) {
        slot = Slot{};
    }
}

bool IntentBuffer::isLive(const Slot& slot, float window) const {
    if (!slot.occupied || slot.intent.consumed) {
        return false;
    }
    const double age = m_clock.now() - slot.intent.timestamp;
    return age >= 0.0 && age <= static_cast<double>(window);
}
