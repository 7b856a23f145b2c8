/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef COMBAT_TYPES_HPP
#define COMBAT_TYPES_HPP

#include <cstdint>

using ActorId = uint32_t;

enum class Faction : uint8_t {
    Player,
    Enemy,
    Neutral
};

// Neutral actors are hostile to nobody; others are hostile across factions
constexpr bool areHostile(Faction a, Faction b) {
    if (a == Faction::Neutral || b == Faction::Neutral) {
        return false;
    }
    return a != b;
}

constexpr bool areAllies(Faction a, Faction b) {
    return a == b && a != Faction::Neutral;
}

#endif // COMBAT_TYPES_HPP
