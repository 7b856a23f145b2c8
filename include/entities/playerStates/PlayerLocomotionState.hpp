/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef PLAYER_LOCOMOTION_STATE_HPP
#define PLAYER_LOCOMOTION_STATE_HPP

#include "entities/playerStates/PlayerActions.hpp"

#include <cstdint>

enum class LocomotionMode : uint8_t {
    Walk,
    Run,
    Sprint
};

constexpr const char* toString(LocomotionMode mode) {
    switch (mode) {
    case LocomotionMode::Walk:
        return "Walk";
    case LocomotionMode::Run:
        return "Run";
    case LocomotionMode::Sprint:
        return "Sprint";
    }
    return "Unknown";
}

/**
 * @brief Free movement; the mode is picked every frame from held input.
 *
 * Sprint drains stamina continuously and drops back to Run once the pool is
 * empty, until sprint is released and pressed again.
 */
class PlayerLocomotionState : public PlayerState {
public:
    static constexpr PlayerStateId ID{PlayerStateId::Locomotion};

    void enter() override;
    void execute(float deltaTime) override;
    void physicsExecute(float fixedDeltaTime) override;
    void exit() override;

    [[nodiscard]] LocomotionMode getMode() const { return m_mode; }

private:
    LocomotionMode m_mode{LocomotionMode::Run};
    Vector3D m_velocity;
    bool m_sprintExhausted{false};
};

#endif // PLAYER_LOCOMOTION_STATE_HPP
