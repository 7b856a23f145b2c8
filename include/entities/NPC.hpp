/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef NPC_HPP
#define NPC_HPP

#include "ai/AIDriver.hpp"
#include "entities/Combatant.hpp"
#include "entities/NPCStateMachine.hpp"

#include <memory>
#include <utility>

/**
 * @brief AI-controlled combatant.
 *
 * The optional driver is consulted every update() before the state machine
 * runs, with the perception last given to setPerception().
 */
class NPC : public Combatant {
public:
    NPC(ActorId id, Faction faction, const CombatStats& stats, const Riposte::SimClock& clock);
    ~NPC() override = default;

    static const NPCStateMachine::Registry& getStateRegistry();

    void setDriver(std::unique_ptr<IAIDriver> driver) { mp_driver = std::move(driver); }
    [[nodiscard]] IAIDriver* getDriver() const { return mp_driver.get(); }

    void setPerception(const AIPerception& perception) { m_stateMachine.setPerception(perception); }
    [[nodiscard]] const AIPerception& getPerception() const { return m_stateMachine.getPerception(); }

    NPCStateMachine& getStateMachine() { return m_stateMachine; }
    const NPCStateMachine& getStateMachine() const { return m_stateMachine; }
    [[nodiscard]] NPCStateId getCurrentState() const { return m_stateMachine.getCurrentStateId(); }

    IInterruptTarget& getInterruptTarget() override { return m_stateMachine; }
    [[nodiscard]] const char* getCurrentStateName() const override {
        return m_stateMachine.getCurrentStateName();
    }
    [[nodiscard]] bool isInTerminalState() const override {
        return m_stateMachine.isInTerminalState();
    }

protected:
    void executeMachine(float deltaTime) override;
    void physicsExecuteMachine(float fixedDeltaTime) override {
        m_stateMachine.physicsExecute(fixedDeltaTime);
    }

private:
    NPCStateMachine m_stateMachine;
    std::unique_ptr<IAIDriver> mp_driver;
};

#endif // NPC_HPP
