/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef BLOCK_STATE_HPP
#define BLOCK_STATE_HPP

#include "core/Logger.hpp"
#include "entities/combatStates/CombatStateUtils.hpp"

#include <format>

/**
 * @brief Held guard with a short parry window at the moment it is raised.
 *
 * Lasts while block is held and stamina remains. A guard raised from a Block
 * intent without the button held stays up for the opening window only. Once
 * the opening window has passed the guard drains blockStaminaDrainPerSecond.
 * A locked-on actor keeps facing its target.
 */
template <typename TStateId>
class BlockState : public CombatState<TStateId> {
public:
    static constexpr TStateId ID{TStateId::Block};

    void enter() override {
        CombatActor& actor = this->getContext();
        const CombatStats& stats = actor.getStats();
        actor.setBlocking(true);
        m_tapped = !actor.getControlInput().blockHeld;
        if (!actor.openParryWindow(stats.blockParryWindow, stats.blockPerfectParryWindow)) {
            COMBAT_WARN(std::format("Actor {} has an invalid block parry window", actor.getId()));
        }
    }

    void execute(float deltaTime) override {
        CombatActor& actor = this->getContext();
        const CombatStats& stats = actor.getStats();

        if (tryIntentTransition(actor, this->getMachine(), CombatAction::Dodge, TStateId::Dodge)) {
            return;
        }
        const bool guardUp = actor.getControlInput().blockHeld ||
                             (m_tapped && this->getStateTime() < stats.blockParryWindow);
        if (!guardUp || actor.getStamina().isEmpty()) {
            this->changeState(CombatStateTraits<TStateId>::RECOVERY);
            return;
        }
        if (this->getStateTime() > stats.blockParryWindow) {
            actor.getStamina().drainContinuous(stats.blockStaminaDrainPerSecond, deltaTime);
        }
    }

    void physicsExecute(float fixedDeltaTime) override {
        (void)fixedDeltaTime;
        CombatActor& actor = this->getContext();
        faceLockOnTarget(actor);
        // Guarded walk
        actor.setLocomotionIntent(actor.getControlInput().move * actor.getStats().walkSpeed);
    }

    void exit() override {
        CombatActor& actor = this->getContext();
        actor.setBlocking(false);
        actor.closeParryWindow();
        actor.setLocomotionIntent(Vector3D());
    }

    [[nodiscard]] bool canTransitionTo(TStateId target) const override {
        return target == CombatStateTraits<TStateId>::RECOVERY || target == TStateId::Dodge ||
               target == TStateId::Stagger || target == TStateId::Death;
    }

    [[nodiscard]] bool isTapped() const { return m_tapped; }

private:
    bool m_tapped{false};
};

#endif // BLOCK_STATE_HPP
