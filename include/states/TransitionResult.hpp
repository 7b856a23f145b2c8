/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef TRANSITION_RESULT_HPP
#define TRANSITION_RESULT_HPP

#include <cstdint>
#include <ostream>

/**
 * @brief Outcome of a transition request.
 *
 * Rejections are normal gameplay outcomes, not errors.
 */
enum class TransitionResult : uint8_t {
    Accepted,                 // applied immediately
    Queued,                   // issued from a state callback, applied when it returns
    RejectedSameState,
    RejectedByPolicy,         // current state's canTransitionTo said no
    RejectedTerminal,         // current state is terminal (Death)
    RejectedUninterruptible,  // forced request against canBeInterrupted() == false
    RejectedAlreadyRequested  // another request won earlier in the same callback
};

constexpr bool isAccepted(TransitionResult result) {
    return result == TransitionResult::Accepted || result == TransitionResult::Queued;
}

constexpr const char* toString(TransitionResult result) {
    switch (result) {
    case TransitionResult::Accepted: return "Accepted";
    case TransitionResult::Queued: return "Queued";
    case TransitionResult::RejectedSameState: return "RejectedSameState";
    case TransitionResult::RejectedByPolicy: return "RejectedByPolicy";
    case TransitionResult::RejectedTerminal: return "RejectedTerminal";
    case TransitionResult::RejectedUninterruptible: return "RejectedUninterruptible";
    case TransitionResult::RejectedAlreadyRequested: return "RejectedAlreadyRequested";
    }
    return "Unknown";
}

// Stream operator for Boost.Test
inline std::ostream& operator<<(std::ostream& os, TransitionResult result) {
    return os << toString(result);
}

#endif // TRANSITION_RESULT_HPP
