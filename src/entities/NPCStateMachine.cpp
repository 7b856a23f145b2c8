/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "entities/NPCStateMachine.hpp"
#include "core/Logger.hpp"

#include <cmath>
#include <format>

NPCStateMachine::NPCStateMachine(const Registry& registry)
    : CombatStateMachine<NPCStateId>(registry) {}

void NPCStateMachine::setPerception(const AIPerception& perception) {
    if (!std::isfinite(perception.distanceToTarget) || !perception.directionToTarget.isFinite()) {
        AI_WARN("Rejected non-finite perception");
        m_perception = AIPerception{};
        return;
    }
    m_perception = perception;
    m_perception.directionToTarget = perception.directionToTarget.horizontal().normalized();
}

bool NPCStateMachine::setAttackPattern(std::span<const AttackKind> pattern) {
    if (pattern.empty() || pattern.size() > MAX_PATTERN_LENGTH) {
        AI_WARN(std::format("Rejected attack pattern of length {}", pattern.size()));
        return false;
    }
    m_pattern.assign(pattern.begin(), pattern.end());
    return true;
}
