/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef DEATH_STATE_HPP
#define DEATH_STATE_HPP

#include "core/Logger.hpp"
#include "entities/combatStates/CombatStateUtils.hpp"

#include <format>

// Terminal: rejects every requested and forced transition
template <typename TStateId>
class DeathState : public CombatState<TStateId> {
public:
    static constexpr TStateId ID{TStateId::Death};

    void enter() override {
        CombatActor& actor = this->getContext();
        actor.onDeathEntered();
        COMBAT_INFO(std::format("Actor {} entered Death", actor.getId()));
    }

    [[nodiscard]] bool canTransitionTo(TStateId target) const override {
        (void)target;
        return false;
    }

    [[nodiscard]] bool canBeInterrupted() const override { return false; }
    [[nodiscard]] bool isTerminal() const override { return true; }
};

#endif // DEATH_STATE_HPP
