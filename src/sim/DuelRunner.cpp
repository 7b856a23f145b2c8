/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "sim/DuelRunner.hpp"
#include "combat/CombatResolver.hpp"
#include "combat/DamageInfo.hpp"
#include "core/Logger.hpp"

#include <format>
#include <memory>
#include <optional>

namespace {

DuelistProfile makePlayerProfile() {
    DuelistProfile profile;
    profile.attackCooldown = 1.0f;
    profile.heavyEvery = 3;
    profile.steers = true;
    return profile;
}

DuelistProfile makeEnemyProfile() {
    DuelistProfile profile;
    profile.attackCooldown = 1.6f;
    profile.reactions = {DuelistReaction::Block, DuelistReaction::None,
                         DuelistReaction::Parry, DuelistReaction::Dodge};
    return profile;
}

} // namespace

DuelRunner::DuelRunner(const DuelConfig& config)
    : m_config(config)
    , m_player(PLAYER_ID, config.playerStats, m_clock)
    , m_npc(ENEMY_ID, Faction::Enemy, config.enemyStats, m_clock)
    , m_playerBrain(makePlayerProfile())
{
    m_player.setPosition(Vector3D(0.0f, 0.0f, 0.0f));
    m_npc.setPosition(Vector3D(0.0f, 0.0f, config.startDistance));
    m_npc.setDriver(std::make_unique<DuelistDriver>(makeEnemyProfile(), m_player));

    subscribe(m_player, m_playerTally);
    subscribe(m_npc, m_enemyTally);

    SIM_INFO(std::format("Duel set up: player {} vs {} {}, {:.1f}s",
                         PLAYER_ID, m_npc.getDriver()->getName(), ENEMY_ID,
                         config.durationSeconds));
}

void DuelRunner::subscribe(Combatant& combatant, DuelistTally& tally) {
    CombatEventHub& hub = combatant.getActor().getEvents();

    m_subscriptions.emplace_back(hub, CombatEventType::DamageApplied,
        [&tally](const CombatEventData& event) {
            const auto* applied = event.get<DamageAppliedEvent>();
            if (applied == nullptr) {
                return;
            }
            const DamageResult& result = applied->result;
            ++tally.hitsTaken;
            tally.damageTaken += result.finalDamage;
            if (result.parried) {
                ++tally.hitsParried;
            } else if (result.dodged) {
                ++tally.hitsDodged;
            } else if (result.blocked) {
                ++tally.hitsBlocked;
            }
        });

    m_subscriptions.emplace_back(hub, CombatEventType::PoiseBroken,
        [&tally](const CombatEventData&) { ++tally.poiseBreaks; });

    m_subscriptions.emplace_back(hub, CombatEventType::Death,
        [&tally](const CombatEventData& event) {
            tally.died = true;
            SIM_INFO(std::format("Actor {} died", event.actorId));
            (void)event;
        });
}

bool DuelRunner::frameUpdate(float deltaTime) {
    if (!m_clock.advance(deltaTime)) {
        SIM_ERROR(std::format("Rejected frame delta {}", deltaTime));
        return false;
    }

    updatePerception();
    m_playerBrain.drive(m_player, m_npc, deltaTime);

    m_player.update(deltaTime);
    m_npc.update(deltaTime);

    detectHit(m_player, m_npc, m_playerLastHitSwing);
    detectHit(m_npc, m_player, m_enemyLastHitSwing);
    return true;
}

void DuelRunner::physicsUpdate(float fixedDeltaTime) {
    m_player.physicsUpdate(fixedDeltaTime);
    m_npc.physicsUpdate(fixedDeltaTime);
}

void DuelRunner::updatePerception() {
    const Vector3D offset = (m_player.getPosition() - m_npc.getPosition()).horizontal();
    const float distance = offset.length();

    AIPerception perception;
    perception.targetDetected = m_player.isAlive() && distance <= DETECTION_RANGE;
    perception.distanceToTarget = distance;
    perception.directionToTarget = offset.normalized();
    m_npc.setPerception(perception);

    // One opponent each, so lock-on target selection is trivial
    m_player.setLockOnTarget(m_npc.isAlive() ? std::optional<Vector3D>(m_npc.getPosition())
                                             : std::nullopt);
    m_npc.setLockOnTarget(m_player.isAlive() ? std::optional<Vector3D>(m_player.getPosition())
                                             : std::nullopt);
}

void DuelRunner::detectHit(Combatant& attacker, Combatant& defender, uint32_t& lastHitSwing) {
    const ActiveAttack* attack = attacker.getActor().getActiveAttack();
    if (attack == nullptr || attack->swingId == lastHitSwing || !defender.isAlive()) {
        return;
    }

    const Vector3D offset = (defender.getPosition() - attacker.getPosition()).horizontal();
    if (offset.length() > attack->data.range) {
        return;
    }
    const Vector3D direction = offset.normalized();
    if (!direction.isZero() && direction.dot(attacker.getActor().getFacing()) < HIT_CONE_DOT) {
        return;
    }

    lastHitSwing = attack->swingId;

    auto damage = DamageInfo::create(attacker.getActor().computeAttackDamage(attack->data),
                                     attack->data.poiseDamage, DamageType::Physical,
                                     attacker.getId(), defender.getPosition(), direction,
                                     attack->data.canBeParried, m_clock.now());
    if (!damage) {
        SIM_WARN(std::format("Swing {} of actor {} produced no valid damage",
                             attack->swingId, attacker.getId()));
        return;
    }

    auto result = CombatResolver::resolve(*damage, defender.getActor(), &attacker.getActor());
    if (!result) {
        return;
    }
    SIM_DEBUG(std::format("t={:.2f} {} hits {}: {} damage{}{}{}", m_clock.now(),
                          attacker.getId(), defender.getId(), result->finalDamage,
                          result->parried ? " (parried)" : "",
                          result->blocked ? " (blocked)" : "",
                          result->dodged ? " (dodged)" : ""));
}

bool DuelRunner::isFinished() const {
    return !m_player.isAlive() || !m_npc.isAlive() ||
           m_clock.now() >= static_cast<double>(m_config.durationSeconds);
}

DuelSummary DuelRunner::getSummary() const {
    DuelSummary summary;
    summary.player = m_playerTally;
    summary.enemy = m_enemyTally;
    summary.player.finalHealth = m_player.getActor().getHealth().getCurrent();
    summary.enemy.finalHealth = m_npc.getActor().getHealth().getCurrent();
    summary.elapsed = m_clock.now();

    if (m_player.isAlive() && !m_npc.isAlive()) {
        summary.winner = "player";
    } else if (!m_player.isAlive() && m_npc.isAlive()) {
        summary.winner = "enemy";
    } else if (m_player.isAlive() && m_npc.isAlive()) {
        summary.winner = "none (time)";
    }
    return summary;
}
