/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "entities/CombatActor.hpp"
#include "core/Logger.hpp"
#include "core/SimClock.hpp"

#include <cmath>
#include <format>

CombatActor::CombatActor(ActorId id, Faction faction, const CombatStats& stats,
                         const Riposte::SimClock& clock)
    : m_id(id), m_faction(faction), m_stats(stats), m_clock(clock),
      m_health(stats.maxHealth),
      m_poise(clock, stats.maxPoise, stats.poiseRegenRate, stats.poiseRegenDelay),
      m_stamina(stats.maxStamina, stats.staminaRegenRate, stats.staminaRegenDelay),
      m_intents(clock) {}

double CombatActor::now() const {
    return m_clock.now();
}

bool CombatActor::openParryWindow(float duration, float perfectDuration) {
    m_parryWindow = TimingWindow::create(m_clock.now(), duration, perfectDuration);
    m_parrySucceeded = false;
    return m_parryWindow.has_value();
}

bool CombatActor::isParrying() const {
    return m_parryWindow.has_value() && !m_parryWindow->isExpired(m_clock.now());
}

void CombatActor::setControlInput(const ControlInput& input) {
    if (!input.move.isFinite()) {
        ACTOR_WARN(std::format("Actor {} rejected non-finite move input", m_id));
        m_controlInput = ControlInput{Vector3D(), input.blockHeld, input.sprintHeld,
                                      input.walkHeld};
        return;
    }
    m_controlInput = input;
    if (m_controlInput.move.lengthSquared() > 1.0f) {
        m_controlInput.move = m_controlInput.move.normalized();
    }
}

void CombatActor::setFacing(const Vector3D& facing) {
    const Vector3D flat = facing.horizontal();
    if (!flat.isFinite() || flat.isZero()) {
        return;
    }
    m_facing = flat.normalized();
}

void CombatActor::setLockOnCandidate(const std::optional<Vector3D>& targetPosition) {
    if (targetPosition && !targetPosition->isFinite()) {
        ACTOR_WARN(std::format("Actor {} rejected non-finite lock-on target", m_id));
        m_lockOnCandidate.reset();
    } else {
        m_lockOnCandidate = targetPosition;
    }
    if (!m_lockOnCandidate) {
        m_lockOnDirection.reset();
        if (m_lockedOn) {
            m_lockedOn = false;
            ACTOR_DEBUG(std::format("Actor {} lost its lock-on target", m_id));
        }
    }
}

bool CombatActor::toggleLockOn() {
    if (m_lockedOn) {
        m_lockedOn = false;
        ACTOR_DEBUG(std::format("Actor {} released lock-on", m_id));
        return true;
    }
    if (!m_lockOnCandidate) {
        return false;
    }
    m_lockedOn = true;
    ACTOR_DEBUG(std::format("Actor {} locked on", m_id));
    return true;
}

void CombatActor::refreshLockOn(const Vector3D& ownPosition) {
    if (!m_lockOnCandidate) {
        m_lockOnDirection.reset();
        return;
    }
    const Vector3D toTarget = (*m_lockOnCandidate - ownPosition).horizontal();
    // Standing on the target keeps the last direction
    if (toTarget.isFinite() && !toTarget.isZero()) {
        m_lockOnDirection = toTarget.normalized();
    }
}

std::optional<Vector3D> CombatActor::getLockOnDirection() const {
    if (!m_lockedOn) {
        return std::nullopt;
    }
    return m_lockOnDirection;
}

uint32_t CombatActor::beginSwing(const AttackData& attack) {
    m_swing = ActiveAttack{attack, m_nextSwingId++};
    m_hitboxActive = false;
    return m_swing->swingId;
}

void CombatActor::endSwing() {
    m_swing.reset();
    m_hitboxActive = false;
}

const ActiveAttack* CombatActor::getActiveAttack() const {
    if (!m_hitboxActive || !m_swing) {
        return nullptr;
    }
    return &*m_swing;
}

float CombatActor::computeAttackDamage(const AttackData& attack) const {
    const float kindMultiplier = attack.kind == AttackKind::Heavy
                                     ? m_stats.heavyAttackMultiplier
                                     : m_stats.lightAttackMultiplier;
    return m_stats.baseDamage * kindMultiplier * attack.damageMultiplier;
}

int CombatActor::applyHealthDamage(int amount) {
    if (!isAlive()) {
        return 0;
    }

    const int delta = m_health.applyDamage(amount);
    if (delta != 0) {
        m_events.dispatch(CombatEventData{
            CombatEventType::HealthChanged, m_id,
            HealthChangedEvent{m_health.getCurrent(), m_health.getMax(), delta}});
    }
    return delta;
}

int CombatActor::heal(int amount) {
    const int delta = m_health.heal(amount);
    if (delta != 0) {
        m_events.dispatch(CombatEventData{
            CombatEventType::HealthChanged, m_id,
            HealthChangedEvent{m_health.getCurrent(), m_health.getMax(), delta}});
    }
    return delta;
}

void CombatActor::notifyDamageApplied(const DamageInfo& damage, const DamageResult& result) {
    m_events.dispatch(CombatEventData{CombatEventType::DamageApplied, m_id,
                                      DamageAppliedEvent{damage, result}});
}

void CombatActor::notifyPoiseBroken(std::optional<ActorId> source) {
    m_events.dispatch(CombatEventData{CombatEventType::PoiseBroken, m_id,
                                      PoiseBrokenEvent{source}});
}

void CombatActor::notifyParry(std::optional<ActorId> attacker, bool perfect) {
    m_events.dispatch(CombatEventData{CombatEventType::ParryOccurred, m_id,
                                      ParryOccurredEvent{attacker, perfect}});
}

bool CombatActor::notifyDeath(std::optional<ActorId> killer) {
    if (m_deathNotified || isAlive()) {
        return false;
    }
    m_deathNotified = true;
    ACTOR_INFO(std::format("Actor {} died", m_id));
    m_events.dispatch(CombatEventData{CombatEventType::Death, m_id, DeathEvent{killer}});
    return true;
}

void CombatActor::onDeathEntered() {
    m_invulnerable = false;
    m_blocking = false;
    m_parryWindow.reset();
    m_parrySucceeded = false;
    m_locomotion = Vector3D();
    m_actionDirection.reset();
    m_lockedOn = false;
    endSwing();
    m_intents.clear();
}

void CombatActor::tickLedgers(float deltaTime) {
    if (!std::isfinite(deltaTime) || deltaTime <= 0.0f) {
        return;
    }
    if (!isAlive()) {
        return;
    }
    m_stamina.tick(deltaTime);
    m_poise.tick(deltaTime);
}

Vector3D CombatActor::tickForces(float fixedDeltaTime) {
    return m_forces.tick(fixedDeltaTime);
}
