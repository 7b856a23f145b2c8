/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef DODGE_STATE_HPP
#define DODGE_STATE_HPP

#include "core/Logger.hpp"
#include "entities/combatStates/CombatStateUtils.hpp"

#include <format>

/**
 * @brief Evasive roll with invulnerability frames.
 *
 * I-frame bounds are normalized to dodgeDuration. The roll cannot be
 * interrupted while invulnerable, and may cancel into an attack once it
 * reaches its recovery phase.
 */
template <typename TStateId>
class DodgeState : public CombatState<TStateId> {
public:
    static constexpr TStateId ID{TStateId::Dodge};
    static constexpr float RECOVERY_START{0.7f};

    void enter() override {
        CombatActor& actor = this->getContext();
        const CombatStats& stats = actor.getStats();

        m_exhausted = !actor.getStamina().tryConsume(stats.dodgeStaminaCost);
        if (m_exhausted) {
            COMBAT_DEBUG(std::format("Actor {} too exhausted to dodge", actor.getId()));
            this->changeState(CombatStateTraits<TStateId>::RECOVERY);
            return;
        }

        // Buffered direction first, then held movement, otherwise a backstep
        // away from the locked target or the current facing
        Vector3D direction;
        if (actor.getActionDirection()) {
            direction = actor.getActionDirection()->horizontal();
        }
        if (direction.isZero() && actor.getControlInput().hasMoveInput()) {
            direction = actor.getControlInput().move.horizontal();
        }
        if (direction.isZero()) {
            direction = -actor.getLockOnDirection().value_or(actor.getFacing());
        }
        m_direction = direction.normalized();
        m_speed = stats.dodgeDuration > 0.0f ? stats.dodgeDistance / stats.dodgeDuration : 0.0f;

        actor.setInvulnerable(stats.dodgeIFrameStart <= 0.0f);
    }

    void execute(float deltaTime) override {
        (void)deltaTime;
        if (m_exhausted) {
            return;
        }
        CombatActor& actor = this->getContext();
        const CombatStats& stats = actor.getStats();
        const float t = this->getNormalizedTime();

        actor.setInvulnerable(t >= stats.dodgeIFrameStart && t <= stats.dodgeIFrameEnd);

        if (t >= RECOVERY_START &&
            tryIntentTransition(actor, this->getMachine(), CombatAction::LightAttack,
                                CombatStateTraits<TStateId>::COUNTER)) {
            return;
        }
        if (t >= 1.0f) {
            this->changeState(CombatStateTraits<TStateId>::RECOVERY);
        }
    }

    void physicsExecute(float fixedDeltaTime) override {
        (void)fixedDeltaTime;
        const bool rolling = !m_exhausted && this->getNormalizedTime() < RECOVERY_START;
        this->getContext().setLocomotionIntent(rolling ? m_direction * m_speed : Vector3D());
    }

    void exit() override {
        CombatActor& actor = this->getContext();
        actor.setInvulnerable(false);
        actor.setLocomotionIntent(Vector3D());
        actor.setActionDirection(std::nullopt);
    }

    [[nodiscard]] bool canTransitionTo(TStateId target) const override {
        if (target == TStateId::Stagger || target == TStateId::Death) {
            return true;
        }
        const float t = this->getNormalizedTime();
        if (target == CombatStateTraits<TStateId>::RECOVERY) {
            return m_exhausted || t >= 1.0f;
        }
        return target == CombatStateTraits<TStateId>::COUNTER && t >= RECOVERY_START;
    }

    [[nodiscard]] bool canBeInterrupted() const override {
        return !this->getContext().isInvulnerable();
    }

    [[nodiscard]] float getDuration() const override {
        return this->getContext().getStats().dodgeDuration;
    }

    [[nodiscard]] const Vector3D& getDirection() const { return m_direction; }

private:
    Vector3D m_direction;
    float m_speed{0.0f};
    bool m_exhausted{false};
};

#endif // DODGE_STATE_HPP
