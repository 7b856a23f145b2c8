/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef COMBAT_EVENT_HPP
#define COMBAT_EVENT_HPP

#include "combat/CombatTypes.hpp"
#include "combat/DamageInfo.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <ostream>
#include <variant>

enum class CombatEventType : uint8_t {
    HealthChanged = 0,
    DamageApplied,
    Death,
    PoiseBroken,
    ParryOccurred,
    COUNT
};

const char* toString(CombatEventType type);

// Stream operator for Boost.Test
inline std::ostream& operator<<(std::ostream& os, CombatEventType type) {
    return os << toString(type);
}

struct HealthChangedEvent {
    int current{0};
    int max{0};
    int delta{0};
};

struct DamageAppliedEvent {
    DamageInfo damage;
    DamageResult result;
};

struct DeathEvent {
    std::optional<ActorId> killer;
};

struct PoiseBrokenEvent {
    std::optional<ActorId> source;
};

struct ParryOccurredEvent {
    std::optional<ActorId> attacker;
    bool perfect{false};
};

/**
 * @brief Notification emitted by a CombatActor.
 *
 * actorId is always the actor that owns the hub the event was dispatched on.
 */
struct CombatEventData {
    using Payload = std::variant<HealthChangedEvent, DamageAppliedEvent, DeathEvent,
                                 PoiseBrokenEvent, ParryOccurredEvent>;

    CombatEventType type;
    ActorId actorId;
    Payload payload;

    template <typename T> const T* get() const { return std::get_if<T>(&payload); }
};

#endif // COMBAT_EVENT_HPP
