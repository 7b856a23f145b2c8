/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef IINTERRUPT_TARGET_HPP
#define IINTERRUPT_TARGET_HPP

#include "states/TransitionResult.hpp"

/**
 * @brief Forced-reaction surface of an actor's state machine.
 *
 * The combat resolver only ever needs these reactions, regardless of whether
 * the actor is player or AI controlled.
 */
class IInterruptTarget {
public:
    virtual ~IInterruptTarget() = default;

    virtual TransitionResult forceStagger() = 0;
    virtual TransitionResult forceDeath() = 0;
    [[nodiscard]] virtual bool isInTerminalState() const = 0;
    [[nodiscard]] virtual const char* getCurrentStateName() const = 0;
};

#endif // IINTERRUPT_TARGET_HPP
