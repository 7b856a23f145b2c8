/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "entities/Player.hpp"
#include "core/Logger.hpp"
#include "entities/combatStates/BlockState.hpp"
#include "entities/combatStates/DeathState.hpp"
#include "entities/combatStates/DodgeState.hpp"
#include "entities/combatStates/ParryState.hpp"
#include "entities/combatStates/StaggerState.hpp"
#include "entities/playerStates/PlayerHeavyAttackState.hpp"
#include "entities/playerStates/PlayerIdleState.hpp"
#include "entities/playerStates/PlayerLightAttackState.hpp"
#include "entities/playerStates/PlayerLocomotionState.hpp"

#include <format>

Player::Player(ActorId id, const CombatStats& stats, const Riposte::SimClock& clock)
    : Combatant(id, Faction::Player, stats, clock), m_stateMachine(getStateRegistry()) {
    m_stateMachine.initialize(m_actor);
    m_actor.bindInterruptTarget(&m_stateMachine);
    m_stateMachine.setStateChangedCallback(
        [id]([[maybe_unused]] PlayerStateId from, [[maybe_unused]] PlayerStateId to) {
            // Release builds compile the log call out, leaving the capture unread
            (void)id;
            ACTOR_DEBUG(std::format("Player {}: {} -> {}", id, toString(from), toString(to)));
        });
    m_stateMachine.start(PlayerStateId::Idle);
}

const PlayerStateMachine::Registry& Player::getStateRegistry() {
    static const PlayerStateMachine::Registry registry =
        PlayerStateMachine::Registry::Builder()
            .add<PlayerIdleState>()
            .add<PlayerLocomotionState>()
            .add<PlayerLightAttackState>()
            .add<PlayerHeavyAttackState>()
            .add<ParryState<PlayerStateId>>()
            .add<BlockState<PlayerStateId>>()
            .add<DodgeState<PlayerStateId>>()
            .add<StaggerState<PlayerStateId>>()
            .add<DeathState<PlayerStateId>>()
            .build();
    return registry;
}
