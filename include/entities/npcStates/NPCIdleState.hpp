/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef NPC_IDLE_STATE_HPP
#define NPC_IDLE_STATE_HPP

#include "entities/npcStates/NPCState.hpp"

class NPCIdleState : public NPCState {
public:
    static constexpr NPCStateId ID{NPCStateId::Idle};

    void enter() override;
    void execute(float deltaTime) override;
};

#endif // NPC_IDLE_STATE_HPP
