/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef PLAYER_LIGHT_ATTACK_STATE_HPP
#define PLAYER_LIGHT_ATTACK_STATE_HPP

#include "combat/AttackData.hpp"
#include "entities/playerStates/PlayerActions.hpp"

#include <cstdint>

/**
 * @brief Three-hit light combo, chained inside one state activation.
 *
 * A buffered light attack during a swing's combo window starts the next
 * swing; the third swing is the finisher. Recovery may cancel into a dodge or
 * a heavy attack.
 */
class PlayerLightAttackState : public PlayerState {
public:
    static constexpr PlayerStateId ID{PlayerStateId::LightAttack};
    static constexpr uint8_t MAX_COMBO{3};

    void enter() override;
    void execute(float deltaTime) override;
    void exit() override;

    [[nodiscard]] bool canTransitionTo(PlayerStateId target) const override;

    [[nodiscard]] uint8_t getComboIndex() const { return m_attack.comboIndex; }
    [[nodiscard]] const AttackData& getAttack() const { return m_attack; }
    // Progress through the current swing, 0..1
    [[nodiscard]] float getSwingNormalizedTime() const;

private:
    void startSwing(uint8_t comboIndex);
    bool tryChainCombo();

    AttackData m_attack;
    float m_swingStart{0.0f};
};

#endif // PLAYER_LIGHT_ATTACK_STATE_HPP
