/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "sim/Duelist.hpp"
#include "core/Logger.hpp"
#include "entities/NPC.hpp"

#include <algorithm>
#include <format>

namespace {
// Players stop a little inside reach so small drifts keep them in range
constexpr float APPROACH_FACTOR{0.8f};
}

void Duelist::drive(Combatant& self, const Combatant& target, float deltaTime) {
    m_cooldown = std::max(0.0f, m_cooldown - deltaTime);
    m_blockTimer = std::max(0.0f, m_blockTimer - deltaTime);

    ControlInput input;
    if (!self.isAlive() || !target.isAlive()) {
        self.setControlInput(input);
        return;
    }

    if (!self.getActor().isLockedOn()) {
        self.requestAction(CombatAction::LockOn);
    }

    const Vector3D offset = (target.getPosition() - self.getPosition()).horizontal();
    const float distance = offset.length();
    const Vector3D toTarget = offset.normalized();

    const auto& swing = target.getActor().getCurrentSwing();
    if (swing && swing->swingId != m_lastSwingSeen) {
        m_lastSwingSeen = swing->swingId;
        react(self, toTarget);
    }
    input.blockHeld = m_blockTimer > 0.0f;

    const float range = self.getActor().getStats().attackRange;
    if (distance > range * APPROACH_FACTOR) {
        if (m_profile.steers) {
            input.move = toTarget;
        }
    } else if (m_cooldown <= 0.0f && !input.blockHeld) {
        ++m_attackCount;
        const bool heavy = m_profile.heavyEvery > 0 && m_attackCount % m_profile.heavyEvery == 0;
        self.requestAction(heavy ? CombatAction::HeavyAttack : CombatAction::LightAttack, toTarget);
        m_cooldown = m_profile.attackCooldown;
    }

    self.setControlInput(input);
}

void Duelist::react(Combatant& self, const Vector3D& toTarget) {
    const DuelistReaction reaction =
        m_profile.reactions[m_reactionIndex++ % m_profile.reactions.size()];
    switch (reaction) {
    case DuelistReaction::Parry:
        self.requestAction(CombatAction::Parry);
        break;
    case DuelistReaction::Block:
        m_blockTimer = m_profile.blockHoldTime;
        break;
    case DuelistReaction::Dodge:
        // Sidestep
        self.requestAction(CombatAction::Dodge, Vector3D(toTarget.getZ(), 0.0f, -toTarget.getX()));
        break;
    case DuelistReaction::None:
        break;
    }
}

void DuelistDriver::think(NPC& npc, const AIPerception& perception, float deltaTime) {
    if (!perception.targetDetected) {
        npc.setControlInput(ControlInput{});
        return;
    }
    m_duelist.drive(npc, m_target, deltaTime);
}
