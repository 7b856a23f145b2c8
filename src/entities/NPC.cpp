/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "entities/NPC.hpp"
#include "core/Logger.hpp"
#include "entities/combatStates/BlockState.hpp"
#include "entities/combatStates/DeathState.hpp"
#include "entities/combatStates/DodgeState.hpp"
#include "entities/combatStates/ParryState.hpp"
#include "entities/combatStates/StaggerState.hpp"
#include "entities/npcStates/NPCAlertState.hpp"
#include "entities/npcStates/NPCAttackPatternState.hpp"
#include "entities/npcStates/NPCChaseState.hpp"
#include "entities/npcStates/NPCIdleState.hpp"

#include <format>

NPC::NPC(ActorId id, Faction faction, const CombatStats& stats, const Riposte::SimClock& clock)
    : Combatant(id, faction, stats, clock), m_stateMachine(getStateRegistry()) {
    m_stateMachine.initialize(m_actor);
    m_actor.bindInterruptTarget(&m_stateMachine);
    m_stateMachine.setStateChangedCallback(
        [id]([[maybe_unused]] NPCStateId from, [[maybe_unused]] NPCStateId to) {
            // Release builds compile the log call out, leaving the capture unread
            (void)id;
            AI_DEBUG(std::format("NPC {}: {} -> {}", id, toString(from), toString(to)));
        });
    m_stateMachine.start(NPCStateId::Idle);
}

const NPCStateMachine::Registry& NPC::getStateRegistry() {
    static const NPCStateMachine::Registry registry =
        NPCStateMachine::Registry::Builder()
            .add<NPCIdleState>()
            .add<NPCAlertState>()
            .add<NPCChaseState>()
            .add<NPCAttackPatternState>()
            .add<ParryState<NPCStateId>>()
            .add<BlockState<NPCStateId>>()
            .add<DodgeState<NPCStateId>>()
            .add<StaggerState<NPCStateId>>()
            .add<DeathState<NPCStateId>>()
            .build();
    return registry;
}

void NPC::executeMachine(float deltaTime) {
    if (mp_driver && isAlive()) {
        mp_driver->think(*this, getPerception(), deltaTime);
    }
    m_stateMachine.execute(deltaTime);
}
