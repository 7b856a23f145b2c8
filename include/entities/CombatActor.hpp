/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef COMBAT_ACTOR_HPP
#define COMBAT_ACTOR_HPP

#include "combat/AttackData.hpp"
#include "combat/CombatStats.hpp"
#include "combat/CombatTypes.hpp"
#include "combat/ExternalForcesManager.hpp"
#include "combat/HealthLedger.hpp"
#include "combat/IntentBuffer.hpp"
#include "combat/PoiseLedger.hpp"
#include "combat/StaminaLedger.hpp"
#include "combat/TimingWindow.hpp"
#include "events/CombatEventHub.hpp"
#include "utils/Vector3D.hpp"

#include <cstdint>
#include <optional>

namespace Riposte { class SimClock; }

class IInterruptTarget;

// Continuous (held) input, refreshed by the driver every frame
struct ControlInput {
    Vector3D move;          // desired planar direction, length 0..1
    bool blockHeld{false};
    bool sprintHeld{false};
    bool walkHeld{false};

    [[nodiscard]] bool hasMoveInput() const { return move.lengthSquared() > 0.01f; }
};

struct ActiveAttack {
    AttackData data;
    uint32_t swingId{0};
};

/**
 * @brief Combat context of one actor: identity, ledgers and live defense state.
 *
 * Owned by its Combatant and sharing its lifetime. States write the defense
 * flags and the locomotion intent; CombatResolver is the only writer allowed to
 * touch another actor's ledgers.
 */
class CombatActor {
public:
    CombatActor(ActorId id, Faction faction, const CombatStats& stats,
                const Riposte::SimClock& clock);

    CombatActor(const CombatActor&) = delete;
    CombatActor& operator=(const CombatActor&) = delete;

    // Identity
    [[nodiscard]] ActorId getId() const { return m_id; }
    [[nodiscard]] Faction getFaction() const { return m_faction; }
    [[nodiscard]] bool isAlive() const { return !m_health.isDepleted(); }
    [[nodiscard]] bool isHostileTo(const CombatActor& other) const {
        return areHostile(m_faction, other.m_faction);
    }

    [[nodiscard]] const CombatStats& getStats() const { return m_stats; }
    [[nodiscard]] const Riposte::SimClock& getClock() const { return m_clock; }
    [[nodiscard]] double now() const;

    // Ledgers
    HealthLedger& getHealth() { return m_health; }
    const HealthLedger& getHealth() const { return m_health; }
    PoiseLedger& getPoise() { return m_poise; }
    const PoiseLedger& getPoise() const { return m_poise; }
    StaminaLedger& getStamina() { return m_stamina; }
    const StaminaLedger& getStamina() const { return m_stamina; }
    IntentBuffer& getIntents() { return m_intents; }
    const IntentBuffer& getIntents() const { return m_intents; }
    ExternalForcesManager& getForces() { return m_forces; }
    const ExternalForcesManager& getForces() const { return m_forces; }
    CombatEventHub& getEvents() { return m_events; }

    // UI readouts, 0..1
    [[nodiscard]] float getHealthNormalized() const { return m_health.getNormalized(); }
    [[nodiscard]] float getPoiseNormalized() const { return m_poise.getNormalized(); }
    [[nodiscard]] float getStaminaNormalized() const { return m_stamina.getNormalized(); }

    // Defense state
    void setInvulnerable(bool invulnerable) { m_invulnerable = invulnerable; }
    [[nodiscard]] bool isInvulnerable() const { return m_invulnerable; }
    void setBlocking(bool blocking) { m_blocking = blocking; }
    [[nodiscard]] bool isBlocking() const { return m_blocking; }

    // Opens a parry window starting now; clears any previous parry success
    bool openParryWindow(float duration, float perfectDuration);
    void closeParryWindow() { m_parryWindow.reset(); }
    // True while a window is open and not yet expired
    [[nodiscard]] bool isParrying() const;
    [[nodiscard]] const std::optional<TimingWindow>& getParryWindow() const { return m_parryWindow; }
    void markParrySucceeded() { m_parrySucceeded = true; }
    [[nodiscard]] bool hasParrySucceeded() const { return m_parrySucceeded; }

    // Movement requests
    void setControlInput(const ControlInput& input);
    [[nodiscard]] const ControlInput& getControlInput() const { return m_controlInput; }
    void setLocomotionIntent(const Vector3D& velocity) { m_locomotion = velocity; }
    [[nodiscard]] const Vector3D& getLocomotionIntent() const { return m_locomotion; }
    void setFacing(const Vector3D& facing);
    [[nodiscard]] const Vector3D& getFacing() const { return m_facing; }
    void setActionDirection(const std::optional<Vector3D>& direction) { m_actionDirection = direction; }
    [[nodiscard]] const std::optional<Vector3D>& getActionDirection() const { return m_actionDirection; }

    /**
     * @brief Lock-on. The driver supplies the selected target's position;
     * states toggle the lock from a LockOn intent and read its direction.
     *
     * Losing the candidate (nullopt) drops an active lock.
     */
    void setLockOnCandidate(const std::optional<Vector3D>& targetPosition);
    // Releases an active lock, or locks onto the candidate; false with nothing to lock onto
    bool toggleLockOn();
    // Recomputes the target direction from this actor's position
    void refreshLockOn(const Vector3D& ownPosition);
    [[nodiscard]] bool isLockedOn() const { return m_lockedOn; }
    // Planar unit direction to the locked target; nullopt when not locked
    [[nodiscard]] std::optional<Vector3D> getLockOnDirection() const;

    // Attack windows, written by attack states and read by hit detection
    uint32_t beginSwing(const AttackData& attack);
    void setHitboxActive(bool active) { m_hitboxActive = active && m_swing.has_value(); }
    void endSwing();
    // nullptr unless a swing is in its active frames
    [[nodiscard]] const ActiveAttack* getActiveAttack() const;
    [[nodiscard]] const std::optional<ActiveAttack>& getCurrentSwing() const { return m_swing; }
    [[nodiscard]] float computeAttackDamage(const AttackData& attack) const;

    // Last incoming hit, used for stagger knockback direction
    void setLastHitDirection(const Vector3D& direction) { m_lastHitDirection = direction; }
    [[nodiscard]] const Vector3D& getLastHitDirection() const { return m_lastHitDirection; }

    // Forced reactions
    void bindInterruptTarget(IInterruptTarget* target) { mp_interruptTarget = target; }
    [[nodiscard]] IInterruptTarget* getInterruptTarget() const { return mp_interruptTarget; }

    /**
     * @brief Applies health damage and emits HealthChanged when it changes.
     * @return health delta (<= 0); 0 once dead
     */
    int applyHealthDamage(int amount);
    int heal(int amount);

    void notifyDamageApplied(const DamageInfo& damage, const DamageResult& result);
    void notifyPoiseBroken(std::optional<ActorId> source);
    void notifyParry(std::optional<ActorId> attacker, bool perfect);
    // Emits Death once, and only when health is depleted
    bool notifyDeath(std::optional<ActorId> killer);

    // Drops transient combat state when entering Death
    void onDeathEntered();

    // Per-frame ledger upkeep (stamina regen, poise decay)
    void tickLedgers(float deltaTime);

    // Per-physics-step forces; result stays readable until the next step
    Vector3D tickForces(float fixedDeltaTime);
    [[nodiscard]] const Vector3D& getFrameForce() const { return m_forces.lastFrameForce(); }

private:
    ActorId m_id;
    Faction m_faction;
    CombatStats m_stats;
    const Riposte::SimClock& m_clock;

    HealthLedger m_health;
    PoiseLedger m_poise;
    StaminaLedger m_stamina;
    IntentBuffer m_intents;
    ExternalForcesManager m_forces;
    CombatEventHub m_events;

    bool m_invulnerable{false};
    bool m_blocking{false};
    std::optional<TimingWindow> m_parryWindow;
    bool m_parrySucceeded{false};

    ControlInput m_controlInput;
    Vector3D m_locomotion;
    Vector3D m_facing{0.0f, 0.0f, 1.0f};
    std::optional<Vector3D> m_actionDirection;
    std::optional<Vector3D> m_lockOnCandidate;
    std::optional<Vector3D> m_lockOnDirection;
    bool m_lockedOn{false};

    std::optional<ActiveAttack> m_swing;
    bool m_hitboxActive{false};
    uint32_t m_nextSwingId{1};

    Vector3D m_lastHitDirection;
    IInterruptTarget* mp_interruptTarget{nullptr};
    bool m_deathNotified{false};
};

#endif // COMBAT_ACTOR_HPP
