/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef INTENT_BUFFER_HPP
#define INTENT_BUFFER_HPP

#include "utils/Vector3D.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>

namespace Riposte { class SimClock; }

/**
 * @brief Discrete action kinds an input or AI driver can request.
 */
enum class CombatAction : uint8_t {
    LightAttack = 0,
    HeavyAttack,
    Parry,
    Block,
    Dodge,
    LockOn,
    COUNT
};

const char* toString(CombatAction action);

struct BufferedIntent {
    CombatAction action{CombatAction::LightAttack};
    double timestamp{0.0};
    std::optional<Vector3D> direction;
    bool consumed{false};
};

/**
 * @brief Fixed table of the latest intent per action kind.
 *
 * One slot per action: a newer push of the same kind overwrites the older
 * entry whether it was consumed or not. Stale or consumed entries are never
 * pruned on a timer; readers treat them as absent.
 */
class IntentBuffer {
public:
    static constexpr float DEFAULT_WINDOW{0.15f};

    explicit IntentBuffer(const Riposte::SimClock& clock);

    /**
     * @brief Records an intent stamped with the current simulation time.
     * @param direction optional aim/move direction, normalized on store
     * @return false if the direction is not finite (nothing is stored)
     */
    bool push(CombatAction action,
              std::optional<Vector3D> direction = std::nullopt);

    /**
     * @brief Consumes the buffered intent if it is fresh and unconsumed.
     * @param window maximum age in seconds
     * @return the intent, marked consumed in the table, or std::nullopt
     */
    std::optional<BufferedIntent> tryConsume(CombatAction action,
                                             float window = DEFAULT_WINDOW);

    // Non-consuming freshness query
    [[nodiscard]] bool hasBuffered(CombatAction action,
                                   float window = DEFAULT_WINDOW) const;

    void clear();

private:
    static constexpr size_t ACTION_COUNT{static_cast<size_t>(CombatAction::COUNT)};

    struct Slot {
        BufferedIntent intent;
        bool occupied{false};
    };

    bool isLive(const Slot& slot, float window) const;

    const Riposte::SimClock& m_clock;
    std::array<Slot, ACTION_COUNT> m_slots{};
};

#endif // INTENT_BUFFER_HPP
