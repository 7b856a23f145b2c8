/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef NPC_STATE_HPP
#define NPC_STATE_HPP

#include "entities/NPCStateMachine.hpp"
#include "entities/combatStates/CombatStateUtils.hpp"

// Base for NPC-only states: typed access to perception and the attack pattern
class NPCState : public CombatState<NPCStateId> {
protected:
    NPCStateMachine& getNPCMachine() const {
        return static_cast<NPCStateMachine&>(getMachine());
    }

    const AIPerception& getPerception() const { return getNPCMachine().getPerception(); }

    // Defensive intents an aware NPC reacts to: Dodge, Parry, Block, then a held block.
    // Also spends a LockOn intent.
    bool tryStartReaction();

    // Locked target first, then the perceived one
    void faceTarget();
};

#endif // NPC_STATE_HPP
