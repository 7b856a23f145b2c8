/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef NPC_ALERT_STATE_HPP
#define NPC_ALERT_STATE_HPP

#include "entities/npcStates/NPCState.hpp"

// Target spotted: turns to face it for alertDuration, then gives chase
class NPCAlertState : public NPCState {
public:
    static constexpr NPCStateId ID{NPCStateId::Alert};

    void enter() override;
    void execute(float deltaTime) override;

    [[nodiscard]] float getDuration() const override;
};

#endif // NPC_ALERT_STATE_HPP
