/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef COMBAT_EVENT_HUB_HPP
#define COMBAT_EVENT_HUB_HPP

#include "events/CombatEvent.hpp"

#include <array>
#include <boost/container/small_vector.hpp>
#include <cstdint>
#include <functional>

using CombatEventHandler = std::function<void(const CombatEventData&)>;

/**
 * @brief Per-actor observer list for combat notifications.
 *
 * Handlers are registered at setup time and invoked synchronously from
 * dispatch(), each exactly once per event. Removal through the token is safe
 * at any time, including from inside a handler: the entry is invalidated
 * immediately and compacted once no dispatch is running.
 */
class CombatEventHub {
public:
    struct HandlerToken {
        CombatEventType type{CombatEventType::COUNT};
        uint64_t id{0};

        [[nodiscard]] bool isValid() const { return id != 0; }
    };

    CombatEventHub() = default;
    CombatEventHub(const CombatEventHub&) = delete;
    CombatEventHub& operator=(const CombatEventHub&) = delete;

    HandlerToken registerHandler(CombatEventType type, CombatEventHandler handler);
    bool removeHandler(const HandlerToken& token);

    void dispatch(const CombatEventData& event);

    void clear();

    [[nodiscard]] size_t getHandlerCount(CombatEventType type) const;

private:
    static constexpr size_t TYPE_COUNT{static_cast<size_t>(CombatEventType::COUNT)};

    struct HandlerEntry {
        CombatEventHandler callable;
        uint64_t id{0};
    };

    struct PendingEntry {
        CombatEventType type;
        HandlerEntry entry;
    };

    void compact();

    std::array<boost::container::small_vector<HandlerEntry, 4>, TYPE_COUNT> m_handlers;
    boost::container::small_vector<PendingEntry, 2> m_pendingAdds;
    uint64_t m_nextHandlerId{1};
    int m_dispatchDepth{0};
    bool m_needsCompaction{false};
};

/**
 * @brief RAII registration; unregisters on destruction.
 *
 * The hub must outlive the subscription.
 */
class ScopedCombatSubscription {
public:
    ScopedCombatSubscription() = default;
    ScopedCombatSubscription(CombatEventHub& hub, CombatEventType type,
                             CombatEventHandler handler);
    ~ScopedCombatSubscription();

    ScopedCombatSubscription(ScopedCombatSubscription&& other) noexcept;
    ScopedCombatSubscription& operator=(ScopedCombatSubscription&& other) noexcept;
    ScopedCombatSubscription(const ScopedCombatSubscription&) = delete;
    ScopedCombatSubscription& operator=(const ScopedCombatSubscription&) = delete;

    void reset();

private:
    CombatEventHub* mp_hub{nullptr};
    CombatEventHub::HandlerToken m_token;
};

#endif // COMBAT_EVENT_HUB_HPP
