/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef COMBAT_RESOLVER_HPP
#define COMBAT_RESOLVER_HPP

#include "combat/DamageInfo.hpp"

#include <optional>

class CombatActor;

/**
 * @brief Authoritative outcome of one connecting hit.
 *
 * Branches are evaluated in a fixed order: invulnerable (dodged), parry
 * window, block, plain hit. Parry is checked before block, so a guard that is
 * still inside its opening parry window parries.
 *
 * Within one resolution the defender's ledgers are updated first, then the
 * forced transitions are issued (Death supersedes Stagger), then the
 * notifications fire in the order HealthChanged, DamageApplied, PoiseBroken,
 * ParryOccurred, Death.
 *
 * Rounding: final damage is floored, with a minimum of 1 for any hit that is
 * not fully parried or dodged.
 */
class CombatResolver {
public:
    static constexpr float HITSTOP_BASE{0.05f};
    static constexpr float HITSTOP_PER_DAMAGE{0.001f};

    /**
     * @brief Resolves a hit against a defender.
     * @param attacker context of the attacking actor, if known; staggered on a
     *        perfect parry and used for the friendly fire check
     * @return std::nullopt if the defender is already dead or the two actors
     *         are allies
     */
    static std::optional<DamageResult> resolve(const DamageInfo& damage, CombatActor& defender,
                                               CombatActor* attacker = nullptr);

    // Suggested hit pause for presentation, in seconds; 0 for no-damage hits
    [[nodiscard]] static float computeHitstop(const DamageResult& result);
};

#endif // COMBAT_RESOLVER_HPP
