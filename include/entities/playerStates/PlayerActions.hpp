/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef PLAYER_ACTIONS_HPP
#define PLAYER_ACTIONS_HPP

#include "entities/combatStates/CombatStateUtils.hpp"

using PlayerState = CombatState<PlayerStateId>;
using PlayerMachine = StateMachine<CombatActor, PlayerStateId>;

/**
 * @brief Starts the highest-priority action the player has asked for.
 *
 * A buffered LockOn toggles the lock first. Action intents are then polled
 * as Dodge, Parry, HeavyAttack, LightAttack, Block; a held block is checked
 * last.
 *
 * @return true if a transition was accepted or queued
 */
bool tryStartPlayerAction(CombatActor& actor, PlayerMachine& machine);

#endif // PLAYER_ACTIONS_HPP
