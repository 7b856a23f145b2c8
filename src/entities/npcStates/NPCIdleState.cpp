/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "entities/npcStates/NPCIdleState.hpp"

void NPCIdleState::enter() {
    getContext().setLocomotionIntent(Vector3D());
}

void NPCIdleState::execute(float deltaTime) {
    (void)deltaTime;
    if (getPerception().targetDetected) {
        changeState(NPCStateId::Alert);
    }
}
