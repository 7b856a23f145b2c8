/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "combat/ExternalForcesManager.hpp"
#include "core/Logger.hpp"

#include <algorithm>
#include <cmath>
#include <format>

float ExternalForcesManager::ActiveForce::currentMagnitude() const {
    if (kind != ForceKind::Impulse) {
        return magnitude;
    }
    const float t = duration > 0.0f ? elapsed / duration : 1.0f;
    return magnitude * evaluateDecay(curve, t);
}

bool ExternalForcesManager::ActiveForce::isExpired() const {
    if (kind == ForceKind::Instant) {
        return elapsed > 0.0f;
    }
    return elapsed >= duration;
}

bool ExternalForcesManager::addForce(const ExternalForce& force) {
    if (!force.direction.isFinite() || !std::isfinite(force.magnitude) ||
        !std::isfinite(force.duration)) {
        FORCES_ERROR("Rejected force with non-finite direction, magnitude or duration");
        return false;
    }
    if (force.magnitude < 0.0f || force.duration < 0.0f) {
        FORCES_WARN(std::format("Rejected force with negative magnitude {} or duration {}",
                                force.magnitude, force.duration));
        return false;
    }
    if (force.direction.isZero()) {
        FORCES_DEBUG("Ignored force with zero direction");
        return false;
    }

    const float magnitude = std::min(force.magnitude, MAX_FORCE_MAGNITUDE);
    const float duration = force.kind == ForceKind::Instant
                               ? 0.0f
                               : std::min(force.duration, MAX_FORCE_DURATION);

    if (magnitude < FORCE_THRESHOLD) {
        return false;
    }
    if (force.kind != ForceKind::Instant && duration <= 0.0f) {
        FORCES_DEBUG("Ignored timed force with zero duration");
        return false;
    }

    if (m_forces.size() >= MAX_FORCES) {
        const size_t victim = findEvictionCandidate();
        if (force.priority <= m_forces[victim].priority) {
            FORCES_DEBUG(std::format("Force table full, dropped priority {} force",
                                     force.priority));
            return false;
        }
        FORCES_DEBUG(std::format("Evicting priority {} force for priority {}",
                                 m_forces[victim].priority, force.priority));
        m_forces.erase(m_forces.begin() + static_cast<std::ptrdiff_t>(victim));
    }

    m_forces.push_back(ActiveForce{force.kind, force.direction.normalized(), magnitude,
                                   duration, 0.0f, force.curve, force.priority,
                                   m_nextInsertion++});
    return true;
}

bool ExternalForcesManager::addInstant(const Vector3D& force) {
    return addForce(ExternalForce{ForceKind::Instant, force, force.length(), 0.0f,
                                  DecayCurve::Constant, INSTANT_PRIORITY});
}

bool ExternalForcesManager::addImpulse(const Vector3D& direction, float magnitude,
                                       float duration, DecayCurve curve) {
    return addForce(ExternalForce{ForceKind::Impulse, direction, magnitude, duration,
                                  curve, IMPULSE_PRIORITY});
}

bool ExternalForcesManager::addKnockback(const Vector3D& direction, float distance,
                                         float duration) {
    if (!std::isfinite(distance) || !std::isfinite(duration) || duration <= 0.0f) {
        FORCES_ERROR("Rejected knockback with invalid distance or duration");
        return false;
    }
    // Decay curve averages roughly half strength over the lifetime
    const float magnitude = distance / duration * 2.0f;
    return addImpulse(direction.horizontal(), magnitude, duration, DecayCurve::Knockback);
}

bool ExternalForcesManager::addContinuous(const Vector3D& direction, float magnitude,
                                          float duration) {
    return addForce(ExternalForce{ForceKind::Continuous, direction, magnitude, duration,
                                  DecayCurve::Constant, CONTINUOUS_PRIORITY});
}

Vector3D ExternalForcesManager::tick(float deltaTime) {
    Vector3D total;
    if (!std::isfinite(deltaTime) || deltaTime < 0.0f) {
        FORCES_ERROR("Rejected non-finite or negative tick delta");
        m_lastFrameForce = total;
        return total;
    }

    for (auto& force : m_forces) {
        total += force.direction * force.currentMagnitude();
        force.elapsed += force.kind == ForceKind::Instant ? 1.0f : deltaTime;
    }

    m_forces.erase(std::remove_if(m_forces.begin(), m_forces.end(),
                                  [](const ActiveForce& force) {
                                      return force.isExpired() ||
                                             force.currentMagnitude() < FORCE_THRESHOLD;
                                  }),
                   m_forces.end());

    m_lastFrameForce = total;
    return total;
}

void ExternalForcesManager::clear() {
    m_forces.clear();
    m_lastFrameForce = Vector3D();
}

size_t ExternalForcesManager::findEvictionCandidate() const {
    size_t candidate = 0;
    for (size_t i = 1; i < m_forces.size(); ++i) {
        const ActiveForce& force = m_forces[i];
        const ActiveForce& best = m_forces[candidate];
        if (force.priority < best.priority ||
            (force.priority == best.priority &&
             force.insertionOrder < best.insertionOrder)) {
            candidate = i;
        }
    }
    return candidate;
}
