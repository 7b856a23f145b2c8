/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef STAGGER_STATE_HPP
#define STAGGER_STATE_HPP

#include "core/Logger.hpp"
#include "entities/combatStates/CombatStateUtils.hpp"

#include <format>

/**
 * @brief Forced recovery after a poise break or a parried attack.
 *
 * Only reachable by forced interruption. A second stagger restarts it. Poise
 * is reset when recovery completes; a dodge may cut the tail short.
 */
template <typename TStateId>
class StaggerState : public CombatState<TStateId> {
public:
    static constexpr TStateId ID{TStateId::Stagger};
    static constexpr float DODGE_CANCEL_START{0.7f};

    void enter() override {
        CombatActor& actor = this->getContext();
        actor.endSwing();
        actor.setBlocking(false);
        actor.setInvulnerable(false);
        actor.closeParryWindow();
        actor.setLocomotionIntent(Vector3D());
        COMBAT_DEBUG(std::format("Actor {} staggered", actor.getId()));
    }

    void execute(float deltaTime) override {
        (void)deltaTime;
        CombatActor& actor = this->getContext();
        if (this->getNormalizedTime() >= DODGE_CANCEL_START &&
            tryIntentTransition(actor, this->getMachine(), CombatAction::Dodge, TStateId::Dodge)) {
            actor.getPoise().resetPoise();
            return;
        }
        if (this->getStateTime() >= getDuration()) {
            actor.getPoise().resetPoise();
            this->changeState(CombatStateTraits<TStateId>::RECOVERY);
        }
    }

    [[nodiscard]] bool canTransitionTo(TStateId target) const override {
        if (target == TStateId::Death) {
            return true;
        }
        if (target == TStateId::Dodge) {
            return this->getNormalizedTime() >= DODGE_CANCEL_START;
        }
        return target == CombatStateTraits<TStateId>::RECOVERY &&
               this->getStateTime() >= getDuration();
    }

    [[nodiscard]] float getDuration() const override {
        return this->getContext().getStats().staggerRecoveryTime;
    }
};

#endif // STAGGER_STATE_HPP
