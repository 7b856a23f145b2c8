/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "entities/npcStates/NPCChaseState.hpp"

void NPCChaseState::enter() {
    m_velocity = Vector3D();
}

void NPCChaseState::execute(float deltaTime) {
    (void)deltaTime;
    CombatActor& actor = getContext();
    m_velocity = Vector3D();

    if (tryStartReaction()) {
        return;
    }
    const AIPerception& perception = getPerception();
    if (!perception.targetDetected) {
        changeState(NPCStateId::Idle);
        return;
    }

    faceTarget();
    if (isInAttackRange()) {
        tryIntentTransition(actor, getNPCMachine(), CombatAction::LightAttack,
                            NPCStateId::AttackPattern);
        return;
    }
    m_velocity = perception.directionToTarget * actor.getStats().moveSpeed;
}

void NPCChaseState::physicsExecute(float fixedDeltaTime) {
    (void)fixedDeltaTime;
    getContext().setLocomotionIntent(m_velocity);
}

void NPCChaseState::exit() {
    m_velocity = Vector3D();
    getContext().setLocomotionIntent(Vector3D());
}

bool NPCChaseState::isInAttackRange() const {
    const AIPerception& perception = getPerception();
    return perception.targetDetected &&
           perception.distanceToTarget <= getContext().getStats().attackRange;
}
