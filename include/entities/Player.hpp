/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef PLAYER_HPP
#define PLAYER_HPP

#include "entities/CombatStateIds.hpp"
#include "entities/Combatant.hpp"
#include "states/CombatStateMachine.hpp"

using PlayerStateMachine = CombatStateMachine<PlayerStateId>;

class Player : public Combatant {
public:
    Player(ActorId id, const CombatStats& stats, const Riposte::SimClock& clock);
    ~Player() override = default;

    // Built once, shared by every Player
    static const PlayerStateMachine::Registry& getStateRegistry();

    PlayerStateMachine& getStateMachine() { return m_stateMachine; }
    const PlayerStateMachine& getStateMachine() const { return m_stateMachine; }
    [[nodiscard]] PlayerStateId getCurrentState() const { return m_stateMachine.getCurrentStateId(); }

    IInterruptTarget& getInterruptTarget() override { return m_stateMachine; }
    [[nodiscard]] const char* getCurrentStateName() const override {
        return m_stateMachine.getCurrentStateName();
    }
    [[nodiscard]] bool isInTerminalState() const override {
        return m_stateMachine.isInTerminalState();
    }

protected:
    void executeMachine(float deltaTime) override { m_stateMachine.execute(deltaTime); }
    void physicsExecuteMachine(float fixedDeltaTime) override {
        m_stateMachine.physicsExecute(fixedDeltaTime);
    }

private:
    PlayerStateMachine m_stateMachine;
};

#endif // PLAYER_HPP
