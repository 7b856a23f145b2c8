/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "entities/playerStates/PlayerLocomotionState.hpp"
#include "core/Logger.hpp"

#include <format>

void PlayerLocomotionState::enter() {
    m_mode = LocomotionMode::Run;
    m_velocity = Vector3D();
    m_sprintExhausted = false;
}

void PlayerLocomotionState::execute(float deltaTime) {
    CombatActor& actor = getContext();
    if (tryStartPlayerAction(actor, getMachine())) {
        return;
    }

    const ControlInput& input = actor.getControlInput();
    if (!input.hasMoveInput()) {
        changeState(PlayerStateId::Idle);
        return;
    }

    if (!input.sprintHeld) {
        m_sprintExhausted = false;
    }

    const CombatStats& stats = actor.getStats();
    LocomotionMode mode = LocomotionMode::Run;
    if (input.walkHeld) {
        mode = LocomotionMode::Walk;
    } else if (input.sprintHeld && !m_sprintExhausted) {
        actor.getStamina().drainContinuous(stats.sprintStaminaPerSecond, deltaTime);
        if (actor.getStamina().isEmpty()) {
            m_sprintExhausted = true;
            STATEMACHINE_DEBUG(std::format("Actor {} out of stamina, sprint -> run",
                                           actor.getId()));
        } else {
            mode = LocomotionMode::Sprint;
        }
    }
    m_mode = mode;

    float speed = stats.moveSpeed;
    if (m_mode == LocomotionMode::Walk) {
        speed = stats.walkSpeed;
    } else if (m_mode == LocomotionMode::Sprint) {
        speed = stats.moveSpeed * stats.sprintMultiplier;
    }

    m_velocity = input.move * speed;
    // Locked on: strafe facing the target, except while sprinting
    if (m_mode == LocomotionMode::Sprint || !faceLockOnTarget(actor)) {
        actor.setFacing(input.move);
    }
}

void PlayerLocomotionState::physicsExecute(float fixedDeltaTime) {
    (void)fixedDeltaTime;
    getContext().setLocomotionIntent(m_velocity);
}

void PlayerLocomotionState::exit() {
    m_velocity = Vector3D();
    getContext().setLocomotionIntent(Vector3D());
}
