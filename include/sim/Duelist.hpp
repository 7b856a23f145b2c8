/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef DUELIST_HPP
#define DUELIST_HPP

#include "ai/AIDriver.hpp"

#include <array>
#include <cstdint>
#include <string>

class Combatant;

enum class DuelistReaction : uint8_t {
    None,
    Parry,
    Block,
    Dodge
};

struct DuelistProfile {
    float attackCooldown{1.2f};
    uint32_t heavyEvery{0};         // every Nth attack is heavy, 0 = never
    std::array<DuelistReaction, 4> reactions{DuelistReaction::Parry, DuelistReaction::Block,
                                             DuelistReaction::None, DuelistReaction::Dodge};
    float blockHoldTime{0.6f};
    bool steers{false};             // walks into range itself instead of relying on Chase
};

/**
 * @brief Deterministic scripted fighter used to drive both sides of the duel.
 *
 * Reacts to each new swing of its target by cycling through the profile's
 * reactions, and attacks on a cooldown whenever it is in range. It only uses
 * the Combatant's public input surface.
 */
class Duelist {
public:
    explicit Duelist(const DuelistProfile& profile) : m_profile(profile) {}

    void drive(Combatant& self, const Combatant& target, float deltaTime);

    [[nodiscard]] uint32_t getAttackCount() const { return m_attackCount; }

private:
    void react(Combatant& self, const Vector3D& toTarget);

    DuelistProfile m_profile;
    float m_cooldown{0.0f};
    float m_blockTimer{0.0f};
    uint32_t m_lastSwingSeen{0};
    uint32_t m_reactionIndex{0};
    uint32_t m_attackCount{0};
};

// Adapts a Duelist to the NPC driver contract
class DuelistDriver : public IAIDriver {
public:
    DuelistDriver(const DuelistProfile& profile, const Combatant& target)
        : m_duelist(profile), m_target(target) {}

    void think(NPC& npc, const AIPerception& perception, float deltaTime) override;
    [[nodiscard]] std::string getName() const override { return "Duelist"; }

private:
    Duelist m_duelist;
    const Combatant& m_target;
};

#endif // DUELIST_HPP
