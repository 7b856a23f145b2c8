/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef NPC_STATE_MACHINE_HPP
#define NPC_STATE_MACHINE_HPP

#include "ai/AIDriver.hpp"
#include "combat/AttackData.hpp"
#include "entities/CombatStateIds.hpp"
#include "states/CombatStateMachine.hpp"

#include <boost/container/static_vector.hpp>
#include <cstddef>
#include <span>

/**
 * @brief NPC machine plus the per-NPC data its states read.
 *
 * Perception is pushed in each frame by the owner. The attack pattern is the
 * swing sequence AttackPattern plays once an attack starts.
 */
class NPCStateMachine : public CombatStateMachine<NPCStateId> {
public:
    static constexpr size_t MAX_PATTERN_LENGTH{6};
    using AttackPattern = boost::container::static_vector<AttackKind, MAX_PATTERN_LENGTH>;

    explicit NPCStateMachine(const Registry& registry);

    void setPerception(const AIPerception& perception);
    [[nodiscard]] const AIPerception& getPerception() const { return m_perception; }

    /**
     * @brief Replaces the swing sequence.
     * @return false (pattern unchanged) if empty or longer than MAX_PATTERN_LENGTH
     */
    bool setAttackPattern(std::span<const AttackKind> pattern);
    [[nodiscard]] const AttackPattern& getAttackPattern() const { return m_pattern; }

private:
    AIPerception m_perception;
    AttackPattern m_pattern{AttackKind::Light, AttackKind::Light, AttackKind::Heavy};
};

#endif // NPC_STATE_MACHINE_HPP
