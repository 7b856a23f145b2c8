/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef COMBAT_STATE_MACHINE_HPP
#define COMBAT_STATE_MACHINE_HPP

#include "entities/CombatActor.hpp"
#include "entities/IInterruptTarget.hpp"
#include "states/StateMachine.hpp"

/**
 * @brief State machine over a CombatActor that the resolver can interrupt.
 *
 * TStateId must provide Stagger and Death enumerators; Death must be
 * registered as a terminal state.
 */
template <typename TStateId>
class CombatStateMachine : public StateMachine<CombatActor, TStateId>,
                           public IInterruptTarget {
public:
    using Base = StateMachine<CombatActor, TStateId>;

    explicit CombatStateMachine(const typename Base::Registry& registry) : Base(registry) {}

    TransitionResult forceStagger() override {
        return this->forceInterrupt(TStateId::Stagger);
    }

    TransitionResult forceDeath() override {
        return this->forceInterrupt(TStateId::Death);
    }

    [[nodiscard]] bool isInTerminalState() const override {
        return Base::isInTerminalState();
    }

    [[nodiscard]] const char* getCurrentStateName() const override {
        return this->isRunning() ? toString(this->getCurrentStateId()) : "None";
    }
};

#endif // COMBAT_STATE_MACHINE_HPP
