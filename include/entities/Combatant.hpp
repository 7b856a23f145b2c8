/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef COMBATANT_HPP
#define COMBATANT_HPP

#include "combat/CombatStats.hpp"
#include "combat/CombatTypes.hpp"
#include "combat/IntentBuffer.hpp"
#include "entities/CombatActor.hpp"
#include "utils/Vector3D.hpp"

#include <optional>

namespace Riposte { class SimClock; }

class IInterruptTarget;

/**
 * @brief Common base for every combat-capable actor, player or AI driven.
 *
 * Owns the actor's combat context and exposes the same surface for both
 * kinds of actor; the concrete class owns the state machine. Position is
 * integrated here from the locomotion intent plus external forces, with no
 * collision response.
 */
class Combatant {
public:
    Combatant(ActorId id, Faction faction, const CombatStats& stats,
              const Riposte::SimClock& clock);
    virtual ~Combatant() = default;

    Combatant(const Combatant&) = delete;
    Combatant& operator=(const Combatant&) = delete;

    /**
     * @brief Frame step: state machine execute, then ledger upkeep.
     * @param deltaTime frame time in seconds
     */
    void update(float deltaTime);

    /**
     * @brief Physics step: state physics, then forces, then integration.
     * @param fixedDeltaTime fixed physics step in seconds
     */
    void physicsUpdate(float fixedDeltaTime);

    /**
     * @brief Buffers an action intent for the state machine to consume.
     * @return false if the actor is dead or the direction is invalid
     */
    bool requestAction(CombatAction action, std::optional<Vector3D> direction = std::nullopt);

    void setControlInput(const ControlInput& input) { m_actor.setControlInput(input); }

    // Position of the externally selected lock-on target; nullopt when there is none
    void setLockOnTarget(const std::optional<Vector3D>& targetPosition);

    CombatActor& getActor() { return m_actor; }
    const CombatActor& getActor() const { return m_actor; }
    [[nodiscard]] ActorId getId() const { return m_actor.getId(); }
    [[nodiscard]] bool isAlive() const { return m_actor.isAlive(); }

    [[nodiscard]] const Vector3D& getPosition() const { return m_position; }
    void setPosition(const Vector3D& position);

    virtual IInterruptTarget& getInterruptTarget() = 0;
    [[nodiscard]] virtual const char* getCurrentStateName() const = 0;
    [[nodiscard]] virtual bool isInTerminalState() const = 0;

protected:
    virtual void executeMachine(float deltaTime) = 0;
    virtual void physicsExecuteMachine(float fixedDeltaTime) = 0;

    CombatActor m_actor;

private:
    Vector3D m_position;
};

#endif // COMBATANT_HPP
