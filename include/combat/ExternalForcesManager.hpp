/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef EXTERNAL_FORCES_MANAGER_HPP
#define EXTERNAL_FORCES_MANAGER_HPP

#include "combat/DecayCurve.hpp"
#include "utils/Vector3D.hpp"

#include <boost/container/static_vector.hpp>
#include <cstddef>
#include <cstdint>

enum class ForceKind : uint8_t {
    Instant,     // contributes for exactly one tick
    Impulse,     // decays over its duration
    Continuous   // constant until its duration runs out
};

/**
 * @brief Force request as submitted by gameplay code.
 *
 * direction need not be normalized; magnitude is speed in units per second.
 */
struct ExternalForce {
    ForceKind kind{ForceKind::Impulse};
    Vector3D direction;
    float magnitude{0.0f};
    float duration{0.0f};
    DecayCurve curve{DecayCurve::DefaultImpulse};
    int priority{0};
};

/**
 * @brief Fixed-capacity set of timed forces summed once per physics step.
 *
 * When full, a new force evicts the lowest-priority entry (oldest insertion
 * on ties) only if its own priority is strictly higher; otherwise it is
 * dropped. The movement integrator reads the summed vector after tick().
 */
class ExternalForcesManager {
public:
    static constexpr size_t MAX_FORCES{8};
    static constexpr float MAX_FORCE_MAGNITUDE{100.0f};
    static constexpr float MAX_FORCE_DURATION{10.0f};
    static constexpr float FORCE_THRESHOLD{0.1f};

    static constexpr int INSTANT_PRIORITY{0};
    static constexpr int IMPULSE_PRIORITY{1};
    static constexpr int CONTINUOUS_PRIORITY{0};
    static constexpr float DEFAULT_KNOCKBACK_DURATION{0.3f};

    ExternalForcesManager() = default;

    /**
     * @brief Validates, clamps and stores a force.
     * @return false if rejected (non-finite input, negligible magnitude, or
     *         full table without a lower-priority victim)
     */
    bool addForce(const ExternalForce& force);

    bool addInstant(const Vector3D& force);
    bool addImpulse(const Vector3D& direction, float magnitude, float duration,
                    DecayCurve curve = DecayCurve::DefaultImpulse);
    bool addKnockback(const Vector3D& direction, float distance,
                      float duration = DEFAULT_KNOCKBACK_DURATION);
    bool addContinuous(const Vector3D& direction, float magnitude, float duration);

    /**
     * @brief Sums all active forces, then ages and expires them.
     * @return summed force vector for this step
     */
    Vector3D tick(float deltaTime);

    void clear();

    [[nodiscard]] size_t activeCount() const { return m_forces.size(); }
    [[nodiscard]] bool hasActiveForces() const { return !m_forces.empty(); }
    [[nodiscard]] const Vector3D& lastFrameForce() const { return m_lastFrameForce; }

private:
    struct ActiveForce {
        ForceKind kind;
        Vector3D direction;   // unit
        float magnitude;      // initial
        float duration;
        float elapsed;
        DecayCurve curve;
        int priority;
        uint64_t insertionOrder;

        float currentMagnitude() const;
        bool isExpired() const;
    };

    size_t findEvictionCandidate() const;

    boost::container::static_vector<ActiveForce, MAX_FORCES> m_forces;
    uint64_t m_nextInsertion{0};
    Vector3D m_lastFrameForce;
};

#endif // EXTERNAL_FORCES_MANAGER_HPP
