/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef PLAYER_IDLE_STATE_HPP
#define PLAYER_IDLE_STATE_HPP

#include "entities/playerStates/PlayerActions.hpp"

class PlayerIdleState : public PlayerState {
public:
    static constexpr PlayerStateId ID{PlayerStateId::Idle};

    void enter() override;
    void execute(float deltaTime) override;
};

#endif // PLAYER_IDLE_STATE_HPP
