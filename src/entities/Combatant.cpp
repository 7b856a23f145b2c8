/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "entities/Combatant.hpp"
#include "core/Logger.hpp"

#include <cmath>
#include <format>

Combatant::Combatant(ActorId id, Faction faction, const CombatStats& stats,
                     const Riposte::SimClock& clock)
    : m_actor(id, faction, stats, clock) {}

void Combatant::update(float deltaTime) {
    if (!std::isfinite(deltaTime) || deltaTime < 0.0f) {
        ACTOR_ERROR(std::format("Actor {} rejected frame delta {}", getId(), deltaTime));
        return;
    }
    m_actor.refreshLockOn(m_position);
    executeMachine(deltaTime);
    m_actor.tickLedgers(deltaTime);
}

void Combatant::physicsUpdate(float fixedDeltaTime) {
    if (!std::isfinite(fixedDeltaTime) || fixedDeltaTime <= 0.0f) {
        ACTOR_ERROR(std::format("Actor {} rejected physics delta {}", getId(), fixedDeltaTime));
        return;
    }
    m_actor.refreshLockOn(m_position);
    physicsExecuteMachine(fixedDeltaTime);
    const Vector3D force = m_actor.tickForces(fixedDeltaTime);
    const Vector3D velocity = m_actor.getLocomotionIntent() + force;
    if (velocity.isFinite()) {
        m_position += velocity * fixedDeltaTime;
    }
}

bool Combatant::requestAction(CombatAction action, std::optional<Vector3D> direction) {
    if (!isAlive()) {
        return false;
    }
    return m_actor.getIntents().push(action, direction);
}

void Combatant::setLockOnTarget(const std::optional<Vector3D>& targetPosition) {
    m_actor.setLockOnCandidate(targetPosition);
    m_actor.refreshLockOn(m_position);
}

void Combatant::setPosition(const Vector3D& position) {
    if (!position.isFinite()) {
        ACTOR_WARN(std::format("Actor {} rejected non-finite position", getId()));
        return;
    }
    m_position = position;
    m_actor.refreshLockOn(m_position);
}
