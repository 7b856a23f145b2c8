/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef PARRY_STATE_HPP
#define PARRY_STATE_HPP

#include "core/Logger.hpp"
#include "entities/combatStates/CombatStateUtils.hpp"

#include <format>

/**
 * @brief Dedicated parry: opens a graded window for the length of the state.
 *
 * Entering is free. A parry that ends without catching an attack costs
 * parryFailStaminaCost; a successful one may cancel straight into a counter.
 */
template <typename TStateId>
class ParryState : public CombatState<TStateId> {
public:
    static constexpr TStateId ID{TStateId::Parry};

    void enter() override {
        CombatActor& actor = this->getContext();
        const CombatStats& stats = actor.getStats();
        actor.setLocomotionIntent(Vector3D());
        if (!actor.openParryWindow(stats.parryWindowDuration, stats.perfectParryWindow)) {
            COMBAT_WARN(std::format("Actor {} has an invalid parry window", actor.getId()));
        }
    }

    void execute(float deltaTime) override {
        (void)deltaTime;
        CombatActor& actor = this->getContext();
        if (actor.hasParrySucceeded() &&
            tryIntentTransition(actor, this->getMachine(), CombatAction::LightAttack,
                                CombatStateTraits<TStateId>::COUNTER)) {
            return;
        }
        if (this->getStateTime() >= getDuration()) {
            this->changeState(CombatStateTraits<TStateId>::RECOVERY);
        }
    }

    void exit() override {
        CombatActor& actor = this->getContext();
        if (!actor.hasParrySucceeded()) {
            actor.getStamina().drain(actor.getStats().parryFailStaminaCost);
        }
        actor.closeParryWindow();
    }

    [[nodiscard]] bool canTransitionTo(TStateId target) const override {
        if (target == CombatStateTraits<TStateId>::COUNTER) {
            return this->getContext().hasParrySucceeded();
        }
        if (target == CombatStateTraits<TStateId>::RECOVERY) {
            return this->getStateTime() >= getDuration();
        }
        return target == TStateId::Stagger || target == TStateId::Death;
    }

    [[nodiscard]] float getDuration() const override {
        return this->getContext().getStats().parryStateDuration;
    }
};

#endif // PARRY_STATE_HPP
