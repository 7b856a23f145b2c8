/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "events/CombatEvent.hpp"

const char* toString(CombatEventType type) {
    switch (type) {
    case CombatEventType::HealthChanged: return "HealthChanged";
    case CombatEventType::DamageApplied: return "DamageApplied";
    case CombatEventType::Death: return "Death";
    case CombatEventType::PoiseBroken: return "PoiseBroken";
    case CombatEventType::ParryOccurred: return "ParryOccurred";
    default: return "Unknown";
    }
}
