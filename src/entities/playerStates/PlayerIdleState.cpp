/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "entities/playerStates/PlayerIdleState.hpp"

void PlayerIdleState::enter() {
    getContext().setLocomotionIntent(Vector3D());
}

void PlayerIdleState::execute(float deltaTime) {
    (void)deltaTime;
    CombatActor& actor = getContext();
    if (tryStartPlayerAction(actor, getMachine())) {
        return;
    }
    if (actor.getControlInput().hasMoveInput()) {
        changeState(PlayerStateId::Locomotion);
        return;
    }
    faceLockOnTarget(actor);
}
