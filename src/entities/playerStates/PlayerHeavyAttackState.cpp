/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "entities/playerStates/PlayerHeavyAttackState.hpp"
#include "core/Logger.hpp"

#include <format>

void PlayerHeavyAttackState::enter() {
    CombatActor& actor = getContext();
    actor.setLocomotionIntent(Vector3D());
    if (actor.getActionDirection()) {
        actor.setFacing(*actor.getActionDirection());
    }
    if (!actor.getStamina().tryConsume(actor.getStats().heavyAttackStaminaCost)) {
        STAMINA_DEBUG(std::format("Actor {} started a heavy attack without full stamina",
                                  actor.getId()));
    }

    m_attack = AttackData::createHeavyAttack();
    actor.beginSwing(m_attack);
    COMBAT_DEBUG(std::format("Actor {} heavy attack", actor.getId()));
}

void PlayerHeavyAttackState::execute(float deltaTime) {
    (void)deltaTime;
    CombatActor& actor = getContext();
    const float t = getNormalizedTime();

    actor.setHitboxActive(m_attack.isHitboxActive(t));

    if (m_attack.isInRecovery(t) &&
        tryIntentTransition(actor, getMachine(), CombatAction::Dodge, PlayerStateId::Dodge)) {
        return;
    }
    if (t >= 1.0f) {
        changeState(PlayerStateId::Idle);
    }
}

void PlayerHeavyAttackState::exit() {
    CombatActor& actor = getContext();
    actor.endSwing();
    actor.setActionDirection(std::nullopt);
}

bool PlayerHeavyAttackState::canTransitionTo(PlayerStateId target) const {
    const float t = getNormalizedTime();
    switch (target) {
    case PlayerStateId::Stagger:
    case PlayerStateId::Death:
        return true;
    case PlayerStateId::Dodge:
        return m_attack.isInRecovery(t);
    case PlayerStateId::Idle:
        return t >= 1.0f;
    default:
        return false;
    }
}

bool PlayerHeavyAttackState::canBeInterrupted() const {
    return !(m_attack.hasSuperArmor && getNormalizedTime() <= m_attack.activeEnd);
}
