/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef COMBAT_STATS_HPP
#define COMBAT_STATS_HPP

/**
 * @brief Read-only tuning for one actor profile.
 *
 * Values are consumed at actor creation; nothing writes back into a profile
 * at run time. Member defaults are the player profile.
 */
struct CombatStats {
    // Health / stamina / poise pools
    int maxHealth{100};
    float maxStamina{100.0f};
    float staminaRegenRate{30.0f};
    float staminaRegenDelay{0.8f};
    float maxPoise{50.0f};
    float poiseRegenRate{20.0f};
    float poiseRegenDelay{3.0f};

    // Offense
    float baseDamage{20.0f};
    float lightAttackMultiplier{1.0f};
    float heavyAttackMultiplier{1.8f};

    // Defense
    float physicalDefense{0.1f};
    float partialParryDamageFactor{0.5f};
    float partialParryPoiseFactor{0.5f};
    float blockDamageFactor{0.5f};
    float blockStaminaCostOnHit{15.0f};
    float blockStaminaDrainPerSecond{10.0f};
    float blockParryWindow{0.15f};
    float blockPerfectParryWindow{0.08f};
    float parryWindowDuration{0.2f};
    float perfectParryWindow{0.1f};
    float parryStateDuration{0.5f};
    float parryFailStaminaCost{20.0f};

    // Action costs
    float sprintStaminaPerSecond{15.0f};
    float dodgeStaminaCost{20.0f};
    float lightAttackStaminaCost{15.0f};
    float heavyAttackStaminaCost{30.0f};

    // Dodge (i-frame bounds normalized to dodge duration)
    float dodgeDuration{0.6f};
    float dodgeIFrameStart{0.05f};
    float dodgeIFrameEnd{0.4f};
    float dodgeDistance{4.0f};

    // Stagger
    float staggerRecoveryTime{1.5f};
    float staggerKnockbackDistance{1.5f};

    // Movement
    float walkSpeed{2.0f};
    float moveSpeed{5.0f};
    float sprintMultiplier{1.6f};

    // Input
    float inputBufferWindow{0.15f};

    // AI only
    float alertDuration{0.5f};
    float attackRange{2.0f};

    static CombatStats createDefaultPlayer();
    static CombatStats createDefaultEnemy();
};

#endif // COMBAT_STATS_HPP
