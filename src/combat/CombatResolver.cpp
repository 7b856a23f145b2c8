/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "combat/CombatResolver.hpp"
#include "core/Logger.hpp"
#include "entities/CombatActor.hpp"
#include "entities/IInterruptTarget.hpp"

#include <algorithm>
#include <cmath>
#include <format>

namespace {

// Successful parries cost nothing but still go through the stamina gate
constexpr float PARRY_STAMINA_COST{0.0f};

void chargeParry(CombatActor& defender) {
    if (!defender.getStamina().tryConsume(PARRY_STAMINA_COST)) {
        COMBAT_WARN(std::format("Actor {} could not pay for a parry", defender.getId()));
    }
    defender.markParrySucceeded();
}

int roundFinalDamage(float amount) {
    return std::max(1, static_cast<int>(std::floor(amount)));
}

void forceReaction(CombatActor& actor, bool death) {
    IInterruptTarget* target = actor.getInterruptTarget();
    if (target == nullptr) {
        COMBAT_ERROR(std::format("Actor {} has no interrupt target bound", actor.getId()));
        return;
    }
    const TransitionResult result = death ? target->forceDeath() : target->forceStagger();
    COMBAT_DEBUG(std::format("Actor {} forced {}: {}", actor.getId(),
                             death ? "Death" : "Stagger", toString(result)));
    (void)result;
}

} // namespace

std::optional<DamageResult> CombatResolver::resolve(const DamageInfo& damage,
                                                    CombatActor& defender,
                                                    CombatActor* attacker) {
    if (!defender.isAlive()) {
        COMBAT_DEBUG(std::format("Hit on dead actor {} ignored", defender.getId()));
        return std::nullopt;
    }
    if (attacker != nullptr) {
        if (attacker == &defender || areAllies(attacker->getFaction(), defender.getFaction())) {
            COMBAT_DEBUG(std::format("Friendly hit {} -> {} ignored", attacker->getId(),
                                     defender.getId()));
            return std::nullopt;
        }
        if (damage.getSource() && *damage.getSource() != attacker->getId()) {
            COMBAT_WARN(std::format("Damage source {} does not match attacker {}",
                                    *damage.getSource(), attacker->getId()));
        }
    }

    const CombatStats& stats = defender.getStats();
    const std::optional<ActorId> source = damage.getSource();
    DamageResult result;

    // 1. I-frames
    if (defender.isInvulnerable()) {
        result.dodged = true;
        COMBAT_DEBUG(std::format("Actor {} dodged", defender.getId()));
        defender.notifyDamageApplied(damage, result);
        return result;
    }

    // 2. Parry window, graded by timing
    float amount = damage.getAmount();
    float poiseDamage = damage.getPoiseDamage();
    bool defended = false;
    bool parryOccurred = false;

    if (defender.isParrying() && damage.canBeParried()) {
        const TimingQuality quality = defender.getParryWindow()->evaluate(defender.now());
        if (quality == TimingQuality::Perfect) {
            result.parried = true;
            chargeParry(defender);
            COMBAT_INFO(std::format("Actor {} perfect parry", defender.getId()));
            if (attacker != nullptr) {
                forceReaction(*attacker, false);
            }
            defender.notifyDamageApplied(damage, result);
            defender.notifyParry(source, true);
            return result;
        }
        if (quality == TimingQuality::Partial) {
            result.partiallyParried = true;
            amount *= stats.partialParryDamageFactor;
            poiseDamage *= stats.partialParryPoiseFactor;
            chargeParry(defender);
            defended = true;
            parryOccurred = true;
        }
    }

    // 3. Guard, then 4. plain hit
    const float defenseFactor = 1.0f - std::clamp(stats.physicalDefense, 0.0f, 1.0f);
    if (!defended && defender.isBlocking() && damage.canBeBlocked()) {
        result.blocked = true;
        amount *= defenseFactor * stats.blockDamageFactor;
        defender.getStamina().drain(stats.blockStaminaCostOnHit);
    } else if (!defended) {
        amount *= defenseFactor;
    }
    result.finalDamage = roundFinalDamage(amount);

    // 5. Poise before health
    const PoiseHitResult poiseHit = defender.getPoise().applyPoiseDamage(poiseDamage);
    result.finalPoiseDamage = poiseHit.applied;
    result.poiseBroken = poiseHit.broke;
    if (result.poiseBroken) {
        defender.getForces().addKnockback(damage.getHitDirection(),
                                          stats.staggerKnockbackDistance);
    }

    // 6. Health
    defender.applyHealthDamage(result.finalDamage);
    result.causedDeath = !defender.isAlive();
    defender.setLastHitDirection(damage.getHitDirection());

    COMBAT_DEBUG(std::format("Actor {} took {} damage, {} poise{}{}{}", defender.getId(),
                             result.finalDamage, result.finalPoiseDamage,
                             result.blocked ? " (blocked)" : "",
                             result.partiallyParried ? " (partial parry)" : "",
                             result.poiseBroken ? " (poise broken)" : ""));

    if (result.causedDeath) {
        forceReaction(defender, true);
    } else if (result.poiseBroken) {
        forceReaction(defender, false);
    }

    defender.notifyDamageApplied(damage, result);
    if (result.poiseBroken) {
        defender.notifyPoiseBroken(source);
    }
    if (parryOccurred) {
        defender.notifyParry(source, false);
    }
    if (result.causedDeath) {
        defender.notifyDeath(source);
    }
    return result;
}

float CombatResolver::computeHitstop(const DamageResult& result) {
    if (result.finalDamage <= 0) {
        return 0.0f;
    }
    return HITSTOP_BASE + static_cast<float>(result.finalDamage) * HITSTOP_PER_DAMAGE;
}
