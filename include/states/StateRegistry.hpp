/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef STATE_REGISTRY_HPP
#define STATE_REGISTRY_HPP

#include "states/MachineState.hpp"

#include <array>
#include <cstddef>
#include <format>
#include <memory>
#include <stdexcept>
#include <type_traits>

/**
 * @brief Table of state factories for one machine type, keyed by a closed enum.
 *
 * TStateId must end with a COUNT enumerator, and toString(TStateId) must be
 * visible through ADL. Build it once per machine type (typically in a
 * function-local static) and share it between every instance of that type.
 *
 * @code
 * static const PlayerRegistry registry = PlayerRegistry::Builder()
 *     .add<PlayerIdleState>()
 *     .add<PlayerDeathState>()
 *     .build();
 * @endcode
 */
template <typename TContext, typename TStateId>
class StateRegistry {
public:
    using State = MachineState<TContext, TStateId>;
    using Factory = std::unique_ptr<State> (*)();

    static constexpr size_t STATE_COUNT{static_cast<size_t>(TStateId::COUNT)};

    class Builder {
    public:
        /**
         * @brief Registers TState under TState::ID.
         * @throws std::invalid_argument if the id is already registered
         */
        template <typename TState> Builder& add() {
            static_assert(std::is_base_of_v<State, TState>,
                          "registered state must derive from MachineState");
            static_assert(std::is_default_constructible_v<TState>,
                          "registered state must be default constructible");
            static_assert(static_cast<size_t>(TState::ID) < STATE_COUNT,
                          "state id out of range");

            constexpr auto index = static_cast<size_t>(TState::ID);
            if (m_factories[index] != nullptr) {
                throw std::invalid_argument(
                    std::format("State {} registered twice", toString(TState::ID)));
            }
            m_factories[index] = []() -> std::unique_ptr<State> {
                return std::make_unique<TState>();
            };
            return *this;
        }

        /**
         * @throws std::logic_error if any id in the enum has no state
         */
        StateRegistry build() const {
            for (size_t i = 0; i < STATE_COUNT; ++i) {
                if (m_factories[i] == nullptr) {
                    throw std::logic_error(std::format(
                        "State registry incomplete: no state for {}",
                        toString(static_cast<TStateId>(i))));
                }
            }
            return StateRegistry(m_factories);
        }

    private:
        std::array<Factory, STATE_COUNT> m_factories{};
    };

    [[nodiscard]] std::unique_ptr<State> create(TStateId id) const {
        return m_factories[static_cast<size_t>(id)]();
    }

private:
    explicit StateRegistry(const std::array<Factory, STATE_COUNT>& factories)
        : m_factories(factories) {}

    std::array<Factory, STATE_COUNT> m_factories;
};

#endif // STATE_REGISTRY_HPP
