/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "events/CombatEventHub.hpp"
#include "core/Logger.hpp"

#include <algorithm>
#include <format>
#include <utility>

CombatEventHub::HandlerToken
CombatEventHub::registerHandler(CombatEventType type, CombatEventHandler handler) {
    const auto idx = static_cast<size_t>(type);
    if (idx >= TYPE_COUNT || !handler) {
        EVENTS_ERROR(std::format("Rejected handler registration for {}", toString(type)));
        return HandlerToken{};
    }

    const uint64_t id = m_nextHandlerId++;
    if (m_dispatchDepth > 0) {
        // Storage must not move while a handler is running
        m_pendingAdds.push_back(PendingEntry{type, HandlerEntry{std::move(handler), id}});
    } else {
        m_handlers[idx].push_back(HandlerEntry{std::move(handler), id});
    }
    return HandlerToken{type, id};
}

bool CombatEventHub::removeHandler(const HandlerToken& token) {
    const auto idx = static_cast<size_t>(token.type);
    if (!token.isValid() || idx >= TYPE_COUNT) {
        return false;
    }

    auto pending = std::find_if(m_pendingAdds.begin(), m_pendingAdds.end(),
                                [&token](const PendingEntry& entry) {
                                    return entry.entry.id == token.id;
                                });
    if (pending != m_pendingAdds.end()) {
        pending->entry.id = 0;
        return true;
    }

    auto& entries = m_handlers[idx];
    auto it = std::find_if(entries.begin(), entries.end(),
                           [&token](const HandlerEntry& entry) {
                               return entry.id == token.id;
                           });
    if (it == entries.end()) {
        return false;
    }

    // Mark as invalid; the callable is destroyed once no dispatch is running
    it->id = 0;
    if (m_dispatchDepth > 0) {
        m_needsCompaction = true;
    } else {
        compact();
    }
    return true;
}

void CombatEventHub::dispatch(const CombatEventData& event) {
    const auto idx = static_cast<size_t>(event.type);
    if (idx >= TYPE_COUNT) {
        EVENTS_ERROR("Dispatch of unknown event type ignored");
        return;
    }

    auto& entries = m_handlers[idx];

    ++m_dispatchDepth;
    for (size_t i = 0; i < entries.size(); ++i) {
        if (entries[i].id != 0 && entries[i].callable) {
            entries[i].callable(event);
        }
    }
    --m_dispatchDepth;

    if (m_dispatchDepth == 0) {
        // Handlers added during dispatch wait for the next event
        for (auto& pending : m_pendingAdds) {
            if (pending.entry.id != 0) {
                m_handlers[static_cast<size_t>(pending.type)].push_back(std::move(pending.entry));
            }
        }
        m_pendingAdds.clear();
        if (m_needsCompaction) {
            compact();
        }
    }
}

void CombatEventHub::clear() {
    m_pendingAdds.clear();
    for (auto& entries : m_handlers) {
        if (m_dispatchDepth > 0) {
            for (auto& entry : entries) {
                entry.id = 0;
            }
            m_needsCompaction = true;
        } else {
            entries.clear();
        }
    }
}

size_t CombatEventHub::getHandlerCount(CombatEventType type) const {
    const auto idx = static_cast<size_t>(type);
    if (idx >= TYPE_COUNT) {
        return 0;
    }
    return static_cast<size_t>(std::count_if(m_handlers[idx].begin(), m_handlers[idx].end(),
                                             [](const HandlerEntry& entry) {
                                                 return entry.id != 0;
                                             }));
}

void CombatEventHub::compact() {
    for (auto& entries : m_handlers) {
        entries.erase(std::remove_if(entries.begin(), entries.end(),
                                     [](const HandlerEntry& entry) {
                                         return entry.id == 0;
                                     }),
                      entries.end());
    }
    m_needsCompaction = false;
}

ScopedCombatSubscription::ScopedCombatSubscription(CombatEventHub& hub,
                                                   CombatEventType type,
                                                   CombatEventHandler handler)
    : mp_hub(&hub), m_token(hub.registerHandler(type, std::move(handler))) {}

ScopedCombatSubscription::~ScopedCombatSubscription() {
    reset();
}

ScopedCombatSubscription::ScopedCombatSubscription(ScopedCombatSubscription&& other) noexcept
    : mp_hub(other.mp_hub), m_token(other.m_token) {
    other.mp_hub = nullptr;
    other.m_token = CombatEventHub::HandlerToken{};
}

ScopedCombatSubscription&
ScopedCombatSubscription::operator=(ScopedCombatSubscription&& other) noexcept {
    if (this != &other) {
        reset();
        mp_hub = other.mp_hub;
        m_token = other.m_token;
        other.mp_hub = nullptr;
        other.m_token = CombatEventHub::HandlerToken{};
    }
    return *this;
}

void ScopedCombatSubscription::reset() {
    if (mp_hub && m_token.isValid()) {
        mp_hub->removeHandler(m_token);
    }
    mp_hub = nullptr;
    m_token = CombatEventHub::HandlerToken{};
}
