/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef STATE_MACHINE_HPP
#define STATE_MACHINE_HPP

#include "core/Logger.hpp"
#include "states/MachineState.hpp"
#include "states/StateRegistry.hpp"
#include "states/TransitionResult.hpp"

#include <array>
#include <cstddef>
#include <format>
#include <functional>
#include <memory>
#include <optional>
#include <stdexcept>
#include <utility>

/**
 * @brief Owns one actor's behavioral states and drives their lifecycle.
 *
 * Lifecycle: construct with the type's registry, initialize() with the actor
 * context, then start() in an initial state. After that:
 *
 * - changeState() is the requested path: rejected unless the current state's
 *   canTransitionTo() accepts the target.
 * - forceInterrupt() is the forced path: ignores canTransitionTo() but needs
 *   canBeInterrupted(), except when the target is terminal.
 * - A terminal current state rejects both paths.
 *
 * Requests made while a state callback is running (execute, physicsExecute,
 * exit/enter of a transition) are queued; only the first one in that callback
 * wins and it is applied as soon as the callback returns. A forced request may
 * replace a queued requested one, and a forced terminal request may replace a
 * queued forced one. Requests from outside any callback apply immediately.
 */
template <typename TContext, typename TStateId>
class StateMachine {
public:
    using State = MachineState<TContext, TStateId>;
    using Registry = StateRegistry<TContext, TStateId>;
    using StateChangedCallback = std::function<void(TStateId from, TStateId to)>;

    static constexpr size_t STATE_COUNT{Registry::STATE_COUNT};

    explicit StateMachine(const Registry& registry) : m_registry(registry) {}
    virtual ~StateMachine() = default;

    StateMachine(const StateMachine&) = delete;
    StateMachine& operator=(const StateMachine&) = delete;

    /**
     * @brief Binds the machine to its actor and instantiates every state.
     * @throws std::logic_error if called twice
     */
    void initialize(TContext& context) {
        if (mp_context != nullptr) {
            throw std::logic_error("StateMachine initialized twice");
        }
        for (size_t i = 0; i < STATE_COUNT; ++i) {
            m_states[i] = m_registry.create(static_cast<TStateId>(i));
            if (!m_states[i]) {
                throw std::logic_error(std::format("State factory for {} returned null",
                                                   toString(static_cast<TStateId>(i))));
            }
            m_states[i]->bind(*this, context);
        }
        mp_context = &context;
    }

    /**
     * @brief Enters the initial state.
     * @throws std::logic_error before initialize() or when already started
     */
    void start(TStateId initial) {
        if (mp_context == nullptr) {
            throw std::logic_error("StateMachine started before initialize()");
        }
        if (mp_current != nullptr) {
            throw std::logic_error("StateMachine started twice");
        }

        m_currentId = initial;
        mp_current = stateFor(initial);
        m_stateTime = 0.0f;

        ++m_callbackDepth;
        mp_current->enter();
        --m_callbackDepth;

        STATEMACHINE_DEBUG(std::format("Started in {}", toString(initial)));
        flushPending();
    }

    TransitionResult changeState(TStateId target) {
        return request(target, false);
    }

    TransitionResult forceInterrupt(TStateId target) {
        return request(target, true);
    }

    void execute(float deltaTime) {
        ensureRunning("execute");
        m_stateTime += deltaTime;

        ++m_callbackDepth;
        mp_current->execute(deltaTime);
        --m_callbackDepth;

        flushPending();
    }

    void physicsExecute(float fixedDeltaTime) {
        ensureRunning("physicsExecute");

        ++m_callbackDepth;
        mp_current->physicsExecute(fixedDeltaTime);
        --m_callbackDepth;

        flushPending();
    }

    [[nodiscard]] bool isInitialized() const { return mp_context != nullptr; }
    [[nodiscard]] bool isRunning() const { return mp_current != nullptr; }

    [[nodiscard]] TStateId getCurrentStateId() const {
        ensureRunning("getCurrentStateId");
        return m_currentId;
    }

    [[nodiscard]] std::optional<TStateId> getPreviousStateId() const { return m_previousId; }

    [[nodiscard]] bool isInState(TStateId id) const {
        return mp_current != nullptr && m_currentId == id;
    }

    [[nodiscard]] bool isInTerminalState() const {
        return mp_current != nullptr && mp_current->isTerminal();
    }

    [[nodiscard]] float getStateTime() const { return m_stateTime; }

    // State time over the state's nominal duration; 0 for open-ended states
    [[nodiscard]] float getNormalizedStateTime() const {
        if (mp_current == nullptr) {
            return 0.0f;
        }
        const float duration = mp_current->getDuration();
        return duration > 0.0f ? m_stateTime / duration : 0.0f;
    }

    [[nodiscard]] bool hasPendingTransition() const { return m_pending.has_value(); }

    /**
     * @brief Whether changeState(target) would currently be accepted or queued.
     *
     * Lets a state check policy before consuming a buffered intent.
     */
    [[nodiscard]] bool wouldAccept(TStateId target) const {
        if (mp_current == nullptr || validate(target, false) != TransitionResult::Accepted) {
            return false;
        }
        return m_callbackDepth == 0 || !m_pending.has_value();
    }

    /**
     * @brief Typed access by registered state class; no run-time type checks.
     * @throws std::logic_error before initialize()
     */
    template <typename TState> TState& getState() {
        return static_cast<TState&>(*stateFor(TState::ID));
    }

    template <typename TState> const TState& getState() const {
        return static_cast<const TState&>(*stateFor(TState::ID));
    }

    void setStateChangedCallback(StateChangedCallback callback) {
        m_onStateChanged = std::move(callback);
    }

protected:
    TContext& getContext() const { return *mp_context; }

private:
    // Guards against states that keep requesting from enter()
    static constexpr int MAX_CHAINED_TRANSITIONS{8};

    struct PendingTransition {
        TStateId source;
        TStateId target;
        bool forced;
    };

    State* stateFor(TStateId id) const {
        const auto index = static_cast<size_t>(id);
        if (index >= STATE_COUNT || !m_states[index]) {
            throw std::logic_error(std::format("No state instance for id {}", index));
        }
        return m_states[index].get();
    }

    void ensureRunning(const char* operation) const {
        if (mp_context == nullptr) {
            throw std::logic_error(std::format("StateMachine::{} before initialize()", operation));
        }
        if (mp_current == nullptr) {
            throw std::logic_error(std::format("StateMachine::{} before start()", operation));
        }
    }

    TransitionResult validate(TStateId target, bool forced) const {
        if (mp_current->isTerminal()) {
            return TransitionResult::RejectedTerminal;
        }
        if (forced) {
            if (!mp_current->canBeInterrupted() && !stateFor(target)->isTerminal()) {
                return TransitionResult::RejectedUninterruptible;
            }
            return TransitionResult::Accepted;
        }
        if (target == m_currentId) {
            return TransitionResult::RejectedSameState;
        }
        if (!mp_current->canTransitionTo(target)) {
            return TransitionResult::RejectedByPolicy;
        }
        return TransitionResult::Accepted;
    }

    TransitionResult request(TStateId target, bool forced) {
        ensureRunning(forced ? "forceInterrupt" : "changeState");

        const TransitionResult verdict = validate(target, forced);
        if (verdict != TransitionResult::Accepted) {
            STATEMACHINE_DEBUG(std::format("{} -> {} {}", toString(m_currentId),
                                           toString(target), toString(verdict)));
            return verdict;
        }

        if (m_callbackDepth > 0) {
            return queue(target, forced);
        }

        performTransition(target, forced);
        flushPending();
        return TransitionResult::Accepted;
    }

    TransitionResult queue(TStateId target, bool forced) {
        if (m_pending) {
            const bool replacesRequested = forced && !m_pending->forced;
            const bool replacesForced = forced && m_pending->forced &&
                                        stateFor(target)->isTerminal() &&
                                        !stateFor(m_pending->target)->isTerminal();
            if (!replacesRequested && !replacesForced) {
                return TransitionResult::RejectedAlreadyRequested;
            }
        }
        m_pending = PendingTransition{m_currentId, target, forced};
        return TransitionResult::Queued;
    }

    void performTransition(TStateId target, bool forced) {
        const TStateId from = m_currentId;
        State* next = stateFor(target);

        ++m_callbackDepth;
        if (forced) {
            mp_current->onInterrupted();
        }
        mp_current->exit();

        m_previousId = from;
        m_currentId = target;
        mp_current = next;
        m_stateTime = 0.0f;

        mp_current->enter();
        --m_callbackDepth;

        STATEMACHINE_DEBUG(std::format("{} -> {}{}", toString(from), toString(target),
                                       forced ? " (forced)" : ""));
        if (m_onStateChanged) {
            m_onStateChanged(from, target);
        }
    }

    void flushPending() {
        if (m_callbackDepth > 0 || m_flushing) {
            return;
        }

        m_flushing = true;
        int chained = 0;
        while (m_pending) {
            const PendingTransition pending = *m_pending;
            m_pending.reset();

            if (++chained > MAX_CHAINED_TRANSITIONS) {
                STATEMACHINE_ERROR(std::format("Dropped chained transition to {}: chain limit reached",
                                               toString(pending.target)));
                break;
            }

            // The state may have changed since the request was queued
            const TransitionResult verdict = validate(pending.target, pending.forced);
            if (verdict != TransitionResult::Accepted) {
                STATEMACHINE_DEBUG(std::format("Queued {} -> {} dropped: {}",
                                               toString(pending.source),
                                               toString(pending.target), toString(verdict)));
                continue;
            }
            performTransition(pending.target, pending.forced);
        }
        m_flushing = false;
    }

    const Registry& m_registry;
    TContext* mp_context{nullptr};
    std::array<std::unique_ptr<State>, STATE_COUNT> m_states{};
    State* mp_current{nullptr};
    TStateId m_currentId{};
    std::optional<TStateId> m_previousId;
    float m_stateTime{0.0f};
    int m_callbackDepth{0};
    bool m_flushing{false};
    std::optional<PendingTransition> m_pending;
    StateChangedCallback m_onStateChanged;
};

#endif // STATE_MACHINE_HPP
