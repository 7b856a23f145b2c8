/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "entities/npcStates/NPCAlertState.hpp"

void NPCAlertState::enter() {
    getContext().setLocomotionIntent(Vector3D());
    faceTarget();
}

void NPCAlertState::execute(float deltaTime) {
    (void)deltaTime;
    if (tryStartReaction()) {
        return;
    }
    if (!getPerception().targetDetected) {
        changeState(NPCStateId::Idle);
        return;
    }
    faceTarget();
    if (getStateTime() >= getDuration()) {
        changeState(NPCStateId::Chase);
    }
}

float NPCAlertState::getDuration() const {
    return getContext().getStats().alertDuration;
}
