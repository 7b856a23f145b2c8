/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "combat/CombatStats.hpp"

CombatStats CombatStats::createDefaultPlayer() {
    return CombatStats{};
}

CombatStats CombatStats::createDefaultEnemy() {
    CombatStats stats;
    stats.maxHealth = 50;
    stats.maxStamina = 100.0f;
    stats.staminaRegenRate = 100.0f;
    stats.staminaRegenDelay = 0.0f;
    stats.maxPoise = 30.0f;
    stats.poiseRegenRate = 10.0f;
    stats.poiseRegenDelay = 5.0f;
    stats.baseDamage = 15.0f;
    stats.heavyAttackMultiplier = 1.5f;
    stats.physicalDefense = 0.05f;
    stats.partialParryDamageFactor = 0.7f;
    stats.sprintStaminaPerSecond = 0.0f;
    stats.dodgeStaminaCost = 0.0f;
    stats.lightAttackStaminaCost = 0.0f;
    stats.heavyAttackStaminaCost = 0.0f;
    stats.parryFailStaminaCost = 0.0f;
    stats.staggerRecoveryTime = 2.0f;
    stats.moveSpeed = 3.0f;
    stats.sprintMultiplier = 1.0f;
    stats.dodgeDistance = 3.0f;
    return stats;
}
