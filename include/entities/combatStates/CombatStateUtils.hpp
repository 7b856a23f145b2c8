/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef COMBAT_STATE_UTILS_HPP
#define COMBAT_STATE_UTILS_HPP

#include "combat/CombatStats.hpp"
#include "combat/IntentBuffer.hpp"
#include "entities/CombatActor.hpp"
#include "entities/CombatStateIds.hpp"
#include "states/MachineState.hpp"
#include "states/StateMachine.hpp"

template <typename TStateId>
using CombatState = MachineState<CombatActor, TStateId>;

// Stamina needed to start an action; parry and block are free to enter
inline float actionStaminaCost(const CombatStats& stats, CombatAction action) {
    switch (action) {
    case CombatAction::LightAttack:
        return stats.lightAttackStaminaCost;
    case CombatAction::HeavyAttack:
        return stats.heavyAttackStaminaCost;
    case CombatAction::Dodge:
        return stats.dodgeStaminaCost;
    case CombatAction::Parry:
    case CombatAction::Block:
    case CombatAction::LockOn:
    case CombatAction::COUNT:
        break;
    }
    return 0.0f;
}

/**
 * @brief Consumes a buffered intent and requests the matching transition.
 *
 * The intent is only consumed when the actor can pay for the action and the
 * machine would take the transition, so a rejected attempt leaves the input
 * buffered for a later state. The consumed direction becomes the actor's
 * action direction.
 *
 * @return true if the transition was accepted or queued
 */
template <typename TStateId>
bool tryIntentTransition(CombatActor& actor, StateMachine<CombatActor, TStateId>& machine,
                         CombatAction action, TStateId target) {
    const float window = actor.getStats().inputBufferWindow;
    if (!actor.getIntents().hasBuffered(action, window)) {
        return false;
    }
    if (!actor.getStamina().canAfford(actionStaminaCost(actor.getStats(), action))) {
        return false;
    }
    if (!machine.wouldAccept(target)) {
        return false;
    }

    const auto intent = actor.getIntents().tryConsume(action, window);
    if (!intent) {
        return false;
    }
    actor.setActionDirection(intent->direction);
    return isAccepted(machine.changeState(target));
}

// Spends a buffered LockOn intent on toggling the lock, even with no target
inline bool tryToggleLockOn(CombatActor& actor) {
    if (!actor.getIntents().tryConsume(CombatAction::LockOn, actor.getStats().inputBufferWindow)) {
        return false;
    }
    return actor.toggleLockOn();
}

// Faces the locked target, if any
inline bool faceLockOnTarget(CombatActor& actor) {
    const auto direction = actor.getLockOnDirection();
    if (!direction) {
        return false;
    }
    actor.setFacing(*direction);
    return true;
}

#endif // COMBAT_STATE_UTILS_HPP
