/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "entities/playerStates/PlayerActions.hpp"

bool tryStartPlayerAction(CombatActor& actor, PlayerMachine& machine) {
    // Lock-on is a toggle, not a transition
    tryToggleLockOn(actor);

    if (tryIntentTransition(actor, machine, CombatAction::Dodge, PlayerStateId::Dodge) ||
        tryIntentTransition(actor, machine, CombatAction::Parry, PlayerStateId::Parry) ||
        tryIntentTransition(actor, machine, CombatAction::HeavyAttack, PlayerStateId::HeavyAttack) ||
        tryIntentTransition(actor, machine, CombatAction::LightAttack, PlayerStateId::LightAttack)) {
        return true;
    }

    if (actor.getStamina().isEmpty()) {
        return false;
    }
    if (tryIntentTransition(actor, machine, CombatAction::Block, PlayerStateId::Block)) {
        return true;
    }
    if (actor.getControlInput().blockHeld && machine.wouldAccept(PlayerStateId::Block)) {
        return isAccepted(machine.changeState(PlayerStateId::Block));
    }
    return false;
}
