/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef PLAYER_HEAVY_ATTACK_STATE_HPP
#define PLAYER_HEAVY_ATTACK_STATE_HPP

#include "combat/AttackData.hpp"
#include "entities/playerStates/PlayerActions.hpp"

// Single heavy swing; hyper armor (no stagger) until its active frames end
class PlayerHeavyAttackState : public PlayerState {
public:
    static constexpr PlayerStateId ID{PlayerStateId::HeavyAttack};

    void enter() override;
    void execute(float deltaTime) override;
    void exit() override;

    [[nodiscard]] bool canTransitionTo(PlayerStateId target) const override;
    [[nodiscard]] bool canBeInterrupted() const override;
    [[nodiscard]] float getDuration() const override { return m_attack.duration; }

    [[nodiscard]] const AttackData& getAttack() const { return m_attack; }

private:
    AttackData m_attack{AttackData::createHeavyAttack()};
};

#endif // PLAYER_HEAVY_ATTACK_STATE_HPP
