/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef ATTACK_DATA_HPP
#define ATTACK_DATA_HPP

#include <cstdint>

enum class AttackKind : uint8_t {
    Light,
    Heavy
};

/**
 * @brief Timing and damage profile of a single swing.
 *
 * Frame windows are normalized to the swing duration (0 = start, 1 = end).
 */
struct AttackData {
    AttackKind kind{AttackKind::Light};
    float damageMultiplier{1.0f};
    float poiseDamage{10.0f};
    float range{2.0f};
    float duration{0.6f};
    float activeStart{0.2f};
    float activeEnd{0.4f};
    float comboWindowStart{0.5f};
    float recoveryStart{0.8f};
    bool canBeParried{true};
    bool hasSuperArmor{false};   // uninterruptible until the active frames end
    uint8_t comboIndex{0};

    [[nodiscard]] bool isHitboxActive(float normalizedTime) const {
        return normalizedTime >= activeStart && normalizedTime <= activeEnd;
    }

    [[nodiscard]] bool isInComboWindow(float normalizedTime) const {
        return normalizedTime >= comboWindowStart && normalizedTime < recoveryStart;
    }

    [[nodiscard]] bool isInRecovery(float normalizedTime) const {
        return normalizedTime >= recoveryStart;
    }

    static AttackData createLightAttack(uint8_t comboIndex = 0);
    static AttackData createHeavyAttack();
};

#endif // ATTACK_DATA_HPP
