/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef NPC_CHASE_STATE_HPP
#define NPC_CHASE_STATE_HPP

#include "entities/npcStates/NPCState.hpp"

/**
 * @brief Closes distance to the target.
 *
 * Stops at attackRange; a buffered light attack inside that range starts the
 * attack pattern.
 */
class NPCChaseState : public NPCState {
public:
    static constexpr NPCStateId ID{NPCStateId::Chase};

    void enter() override;
    void execute(float deltaTime) override;
    void physicsExecute(float fixedDeltaTime) override;
    void exit() override;

    [[nodiscard]] bool isInAttackRange() const;

private:
    Vector3D m_velocity;
};

#endif // NPC_CHASE_STATE_HPP
