/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "entities/npcStates/NPCAttackPatternState.hpp"
#include "core/Logger.hpp"

#include <format>

namespace {

float swingCost(const CombatStats& stats, AttackKind kind) {
    return kind == AttackKind::Heavy ? stats.heavyAttackStaminaCost
                                     : stats.lightAttackStaminaCost;
}

AttackData attackFor(AttackKind kind, size_t index) {
    return kind == AttackKind::Heavy ? AttackData::createHeavyAttack()
                                     : AttackData::createLightAttack(static_cast<uint8_t>(index));
}

} // namespace

void NPCAttackPatternState::enter() {
    getContext().setLocomotionIntent(Vector3D());
    m_finished = false;
    faceTarget();
    startSwing(0);
}

void NPCAttackPatternState::execute(float deltaTime) {
    (void)deltaTime;
    CombatActor& actor = getContext();
    const float t = getSwingNormalizedTime();

    actor.setHitboxActive(m_attack.isHitboxActive(t));

    if (isLastSwing() && m_attack.isInRecovery(t) && tryStartReaction()) {
        return;
    }

    if (t < 1.0f) {
        return;
    }
    if (canContinue()) {
        faceTarget();
        startSwing(m_swingIndex + 1);
        return;
    }
    m_finished = true;
    changeState(NPCStateId::Alert);
}

void NPCAttackPatternState::exit() {
    CombatActor& actor = getContext();
    actor.endSwing();
    actor.setActionDirection(std::nullopt);
}

bool NPCAttackPatternState::canTransitionTo(NPCStateId target) const {
    switch (target) {
    case NPCStateId::Stagger:
    case NPCStateId::Death:
        return true;
    case NPCStateId::Alert:
        return m_finished;
    case NPCStateId::Dodge:
    case NPCStateId::Parry:
    case NPCStateId::Block:
        return isLastSwing() && m_attack.isInRecovery(getSwingNormalizedTime());
    default:
        return false;
    }
}

bool NPCAttackPatternState::canBeInterrupted() const {
    return !(m_attack.hasSuperArmor && getSwingNormalizedTime() <= m_attack.activeEnd);
}

float NPCAttackPatternState::getSwingNormalizedTime() const {
    if (m_attack.duration <= 0.0f) {
        return 1.0f;
    }
    return (getStateTime() - m_swingStart) / m_attack.duration;
}

void NPCAttackPatternState::startSwing(size_t index) {
    CombatActor& actor = getContext();
    const AttackKind kind = getNPCMachine().getAttackPattern()[index];

    if (!actor.getStamina().tryConsume(swingCost(actor.getStats(), kind))) {
        AI_DEBUG(std::format("NPC {} swings without enough stamina", actor.getId()));
    }
    m_swingIndex = index;
    m_attack = attackFor(kind, index);
    m_swingStart = getStateTime();
    actor.beginSwing(m_attack);
    AI_DEBUG(std::format("NPC {} swing {} ({})", actor.getId(), index + 1,
                         kind == AttackKind::Heavy ? "heavy" : "light"));
}

bool NPCAttackPatternState::canContinue() const {
    if (isLastSwing() || !getPerception().targetDetected) {
        return false;
    }
    const CombatActor& actor = getContext();
    const AttackKind next = getNPCMachine().getAttackPattern()[m_swingIndex + 1];
    return actor.getStamina().canAfford(swingCost(actor.getStats(), next));
}

bool NPCAttackPatternState::isLastSwing() const {
    return m_swingIndex + 1 >= getNPCMachine().getAttackPattern().size();
}
