/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "combat/AttackData.hpp"

AttackData AttackData::createLightAttack(uint8_t comboIndex) {
    AttackData attack;
    attack.kind = AttackKind::Light;
    attack.damageMultiplier = 1.0f;
    attack.poiseDamage = 10.0f;
    attack.range = 2.0f;
    attack.duration = 0.6f;
    attack.activeStart = 0.2f;
    attack.activeEnd = 0.4f;
    attack.comboWindowStart = 0.5f;
    attack.recoveryStart = 0.8f;
    attack.canBeParried = true;
    attack.hasSuperArmor = false;
    attack.comboIndex = comboIndex;
    // Combo finisher hits harder
    if (comboIndex >= 2) {
        attack.damageMultiplier = 1.3f;
        attack.poiseDamage = 15.0f;
    }
    return attack;
}

AttackData AttackData::createHeavyAttack() {
    AttackData attack;
    attack.kind = AttackKind::Heavy;
    // Kind scaling comes from CombatStats::heavyAttackMultiplier
    attack.damageMultiplier = 1.0f;
    attack.poiseDamage = 25.0f;
    attack.range = 2.5f;
    attack.duration = 1.0f;
    attack.activeStart = 0.35f;
    attack.activeEnd = 0.5f;
    attack.comboWindowStart = 1.0f;
    attack.recoveryStart = 0.8f;
    attack.canBeParried = true;
    attack.hasSuperArmor = true;
    return attack;
}
