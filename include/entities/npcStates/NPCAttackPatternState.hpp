/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef NPC_ATTACK_PATTERN_STATE_HPP
#define NPC_ATTACK_PATTERN_STATE_HPP

#include "combat/AttackData.hpp"
#include "entities/npcStates/NPCState.hpp"

#include <cstddef>

/**
 * @brief Plays the NPC's swing sequence back to back.
 *
 * The sequence stops early when the target is lost or the next swing cannot
 * be paid for. Heavy swings carry hyper armor until their active frames end.
 * During the recovery of the last swing the NPC may dodge or parry.
 */
class NPCAttackPatternState : public NPCState {
public:
    static constexpr NPCStateId ID{NPCStateId::AttackPattern};

    void enter() override;
    void execute(float deltaTime) override;
    void exit() override;

    [[nodiscard]] bool canTransitionTo(NPCStateId target) const override;
    [[nodiscard]] bool canBeInterrupted() const override;

    [[nodiscard]] size_t getSwingIndex() const { return m_swingIndex; }
    [[nodiscard]] const AttackData& getAttack() const { return m_attack; }
    [[nodiscard]] float getSwingNormalizedTime() const;

private:
    void startSwing(size_t index);
    bool canContinue() const;
    bool isLastSwing() const;

    AttackData m_attack;
    size_t m_swingIndex{0};
    float m_swingStart{0.0f};
    bool m_finished{false};
};

#endif // NPC_ATTACK_PATTERN_STATE_HPP
