/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef MACHINE_STATE_HPP
#define MACHINE_STATE_HPP

#include "states/TransitionResult.hpp"

template <typename TContext, typename TStateId> class StateMachine;

/**
 * @brief Base class for every state driven by StateMachine.
 *
 * A concrete state declares `static constexpr TStateId ID` and is registered
 * through StateRegistry::Builder::add<T>(). One instance per id lives as long
 * as its machine; per-activation data must be reset in enter().
 */
template <typename TContext, typename TStateId>
class MachineState {
public:
    using Machine = StateMachine<TContext, TStateId>;

    virtual ~MachineState() = default;

    virtual void enter() {}
    virtual void execute(float deltaTime) { (void)deltaTime; }
    virtual void physicsExecute(float fixedDeltaTime) { (void)fixedDeltaTime; }
    virtual void exit() {}

    // Policy for requested (non-forced) transitions
    [[nodiscard]] virtual bool canTransitionTo(TStateId target) const {
        (void)target;
        return true;
    }

    // Gate for forced transitions into non-terminal states
    [[nodiscard]] virtual bool canBeInterrupted() const { return true; }

    // Runs before exit() when a forced transition preempts this state
    virtual void onInterrupted() {}

    // Terminal states reject every further transition
    [[nodiscard]] virtual bool isTerminal() const { return false; }

    // Nominal duration in seconds; 0 means open-ended
    [[nodiscard]] virtual float getDuration() const { return 0.0f; }

protected:
    MachineState() = default;

    TContext& getContext() const { return *mp_context; }
    Machine& getMachine() const { return *mp_machine; }

    float getStateTime() const { return mp_machine->getStateTime(); }
    float getNormalizedTime() const { return mp_machine->getNormalizedStateTime(); }

    TransitionResult changeState(TStateId target) { return mp_machine->changeState(target); }

private:
    friend class StateMachine<TContext, TStateId>;

    void bind(Machine& machine, TContext& context) {
        mp_machine = &machine;
        mp_context = &context;
    }

    Machine* mp_machine{nullptr};
    TContext* mp_context{nullptr};
};

#endif // MACHINE_STATE_HPP
