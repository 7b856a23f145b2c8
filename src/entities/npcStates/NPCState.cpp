/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "entities/npcStates/NPCState.hpp"

bool NPCState::tryStartReaction() {
    CombatActor& actor = getContext();
    NPCStateMachine& machine = getNPCMachine();
    tryToggleLockOn(actor);
    if (tryIntentTransition(actor, machine, CombatAction::Dodge, NPCStateId::Dodge) ||
        tryIntentTransition(actor, machine, CombatAction::Parry, NPCStateId::Parry)) {
        return true;
    }
    if (actor.getStamina().isEmpty()) {
        return false;
    }
    if (tryIntentTransition(actor, machine, CombatAction::Block, NPCStateId::Block)) {
        return true;
    }
    if (actor.getControlInput().blockHeld && machine.wouldAccept(NPCStateId::Block)) {
        return isAccepted(machine.changeState(NPCStateId::Block));
    }
    return false;
}

void NPCState::faceTarget() {
    if (faceLockOnTarget(getContext())) {
        return;
    }
    const AIPerception& perception = getPerception();
    if (perception.targetDetected) {
        getContext().setFacing(perception.directionToTarget);
    }
}
