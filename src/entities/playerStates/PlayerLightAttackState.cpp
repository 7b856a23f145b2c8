/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "entities/playerStates/PlayerLightAttackState.hpp"
#include "core/Logger.hpp"

#include <format>

void PlayerLightAttackState::enter() {
    CombatActor& actor = getContext();
    actor.setLocomotionIntent(Vector3D());
    if (actor.getActionDirection()) {
        actor.setFacing(*actor.getActionDirection());
    }
    if (!actor.getStamina().tryConsume(actor.getStats().lightAttackStaminaCost)) {
        STAMINA_DEBUG(std::format("Actor {} started a light attack without full stamina",
                                  actor.getId()));
    }
    startSwing(0);
}

void PlayerLightAttackState::execute(float deltaTime) {
    (void)deltaTime;
    CombatActor& actor = getContext();
    const float t = getSwingNormalizedTime();

    actor.setHitboxActive(m_attack.isHitboxActive(t));

    if (m_attack.isInComboWindow(t) && tryChainCombo()) {
        return;
    }

    if (m_attack.isInRecovery(t)) {
        PlayerMachine& machine = getMachine();
        if (tryIntentTransition(actor, machine, CombatAction::Dodge, PlayerStateId::Dodge) ||
            tryIntentTransition(actor, machine, CombatAction::HeavyAttack,
                                PlayerStateId::HeavyAttack)) {
            return;
        }
    }

    if (t >= 1.0f) {
        changeState(PlayerStateId::Idle);
    }
}

void PlayerLightAttackState::exit() {
    CombatActor& actor = getContext();
    actor.endSwing();
    actor.setActionDirection(std::nullopt);
}

bool PlayerLightAttackState::canTransitionTo(PlayerStateId target) const {
    const float t = getSwingNormalizedTime();
    switch (target) {
    case PlayerStateId::Stagger:
    case PlayerStateId::Death:
        return true;
    case PlayerStateId::Dodge:
    case PlayerStateId::HeavyAttack:
        return m_attack.isInRecovery(t);
    case PlayerStateId::Idle:
        return t >= 1.0f;
    default:
        return false;
    }
}

float PlayerLightAttackState::getSwingNormalizedTime() const {
    if (m_attack.duration <= 0.0f) {
        return 1.0f;
    }
    return (getStateTime() - m_swingStart) / m_attack.duration;
}

void PlayerLightAttackState::startSwing(uint8_t comboIndex) {
    m_attack = AttackData::createLightAttack(comboIndex);
    m_swingStart = getStateTime();
    const uint32_t swingId = getContext().beginSwing(m_attack);
    COMBAT_DEBUG(std::format("Actor {} light attack {} (swing {})", getContext().getId(),
                             comboIndex + 1, swingId));
    (void)swingId;
}

bool PlayerLightAttackState::tryChainCombo() {
    if (m_attack.comboIndex + 1 >= MAX_COMBO) {
        return false;
    }
    CombatActor& actor = getContext();
    const CombatStats& stats = actor.getStats();
    if (!actor.getIntents().hasBuffered(CombatAction::LightAttack, stats.inputBufferWindow) ||
        !actor.getStamina().tryConsume(stats.lightAttackStaminaCost)) {
        return false;
    }

    const auto intent = actor.getIntents().tryConsume(CombatAction::LightAttack,
                                                      stats.inputBufferWindow);
    if (intent && intent->direction) {
        actor.setFacing(*intent->direction);
    }
    startSwing(static_cast<uint8_t>(m_attack.comboIndex + 1));
    return true;
}
