/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef COMBAT_STATE_IDS_HPP
#define COMBAT_STATE_IDS_HPP

#include <cstdint>
#include <ostream>

enum class PlayerStateId : uint8_t {
    Idle,
    Locomotion,
    LightAttack,
    HeavyAttack,
    Parry,
    Block,
    Dodge,
    Stagger,
    Death,
    COUNT
};

enum class NPCStateId : uint8_t {
    Idle,
    Alert,
    Chase,
    AttackPattern,
    Parry,
    Block,
    Dodge,
    Stagger,
    Death,
    COUNT
};

constexpr const char* toString(PlayerStateId id) {
    switch (id) {
    case PlayerStateId::Idle:
        return "Idle";
    case PlayerStateId::Locomotion:
        return "Locomotion";
    case PlayerStateId::LightAttack:
        return "LightAttack";
    case PlayerStateId::HeavyAttack:
        return "HeavyAttack";
    case PlayerStateId::Parry:
        return "Parry";
    case PlayerStateId::Block:
        return "Block";
    case PlayerStateId::Dodge:
        return "Dodge";
    case PlayerStateId::Stagger:
        return "Stagger";
    case PlayerStateId::Death:
        return "Death";
    case PlayerStateId::COUNT:
        break;
    }
    return "Unknown";
}

constexpr const char* toString(NPCStateId id) {
    switch (id) {
    case NPCStateId::Idle:
        return "Idle";
    case NPCStateId::Alert:
        return "Alert";
    case NPCStateId::Chase:
        return "Chase";
    case NPCStateId::AttackPattern:
        return "AttackPattern";
    case NPCStateId::Parry:
        return "Parry";
    case NPCStateId::Block:
        return "Block";
    case NPCStateId::Dodge:
        return "Dodge";
    case NPCStateId::Stagger:
        return "Stagger";
    case NPCStateId::Death:
        return "Death";
    case NPCStateId::COUNT:
        break;
    }
    return "Unknown";
}

inline std::ostream& operator<<(std::ostream& os, PlayerStateId id) {
    return os << toString(id);
}

inline std::ostream& operator<<(std::ostream& os, NPCStateId id) {
    return os << toString(id);
}

/**
 * @brief Per-enum hooks the shared defensive states need.
 *
 * RECOVERY is where a finished defensive action returns to, COUNTER is the
 * attack a successful parry may cancel into.
 */
template <typename TStateId> struct CombatStateTraits;

template <> struct CombatStateTraits<PlayerStateId> {
    static constexpr PlayerStateId RECOVERY{PlayerStateId::Idle};
    static constexpr PlayerStateId COUNTER{PlayerStateId::LightAttack};
};

template <> struct CombatStateTraits<NPCStateId> {
    static constexpr NPCStateId RECOVERY{NPCStateId::Alert};
    static constexpr NPCStateId COUNTER{NPCStateId::AttackPattern};
};

#endif // COMBAT_STATE_IDS_HPP
