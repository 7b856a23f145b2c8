/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#define BOOST_TEST_MODULE CombatEventHubTests
#include <boost/test/unit_test.hpp>

#include "events/CombatEventHub.hpp"

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace {

CombatEventData healthEvent(int delta) {
    return CombatEventData{CombatEventType::HealthChanged, 7,
                           HealthChangedEvent{100 + delta, 100, delta}};
}

CombatEventData deathEvent() {
    return CombatEventData{CombatEventType::Death, 7, DeathEvent{3}};
}

} // namespace

struct HubFixture {
    CombatEventHub hub;
    std::vector<std::string> calls;

    CombatEventHandler recorder(const std::string& name) {
        return [this, name](const CombatEventData& event) {
            calls.push_back(name + ":" + toString(event.type));
        };
    }
};

// ============================================================================
// REGISTRATION AND DISPATCH
// ============================================================================

BOOST_FIXTURE_TEST_SUITE(DispatchTests, HubFixture)

BOOST_AUTO_TEST_CASE(TestDispatchReachesMatchingHandlersOnly) {
    hub.registerHandler(CombatEventType::HealthChanged, recorder("a"));
    hub.registerHandler(CombatEventType::Death, recorder("b"));

    hub.dispatch(healthEvent(-10));
    BOOST_REQUIRE_EQUAL(calls.size(), 1u);
    BOOST_CHECK_EQUAL(calls[0], "a:HealthChanged");

    hub.dispatch(deathEvent());
    BOOST_REQUIRE_EQUAL(calls.size(), 2u);
    BOOST_CHECK_EQUAL(calls[1], "b:Death");
}

BOOST_AUTO_TEST_CASE(TestHandlersRunInRegistrationOrder) {
    hub.registerHandler(CombatEventType::Death, recorder("first"));
    hub.registerHandler(CombatEventType::Death, recorder("second"));
    hub.registerHandler(CombatEventType::Death, recorder("third"));

    hub.dispatch(deathEvent());
    const std::vector<std::string> expected{"first:Death", "second:Death", "third:Death"};
    BOOST_CHECK_EQUAL_COLLECTIONS(calls.begin(), calls.end(), expected.begin(), expected.end());
}

BOOST_AUTO_TEST_CASE(TestPayloadAccess) {
    int seenDelta = 0;
    bool wrongPayload = false;
    std::optional<ActorId> killer;
    hub.registerHandler(CombatEventType::HealthChanged,
                        [&seenDelta, &wrongPayload](const CombatEventData& event) {
                            wrongPayload = event.get<DeathEvent>() != nullptr;
                            if (const auto* payload = event.get<HealthChangedEvent>()) {
                                seenDelta = payload->delta;
                            }
                        });
    hub.registerHandler(CombatEventType::Death, [&killer](const CombatEventData& event) {
        if (const auto* payload = event.get<DeathEvent>()) {
            killer = payload->killer;
        }
    });

    hub.dispatch(healthEvent(-25));
    hub.dispatch(deathEvent());
    BOOST_CHECK_EQUAL(seenDelta, -25);
    BOOST_CHECK(!wrongPayload);
    BOOST_REQUIRE(killer.has_value());
    BOOST_CHECK_EQUAL(*killer, 3u);
}

BOOST_AUTO_TEST_CASE(TestDispatchWithoutHandlers) {
    hub.dispatch(deathEvent());
    BOOST_CHECK(calls.empty());
}

BOOST_AUTO_TEST_CASE(TestInvalidRegistrationRejected) {
    auto token = hub.registerHandler(CombatEventType::Death, CombatEventHandler{});
    BOOST_CHECK(!token.isValid());
    token = hub.registerHandler(CombatEventType::COUNT, recorder("x"));
    BOOST_CHECK(!token.isValid());
    BOOST_CHECK_EQUAL(hub.getHandlerCount(CombatEventType::Death), 0u);
}

BOOST_AUTO_TEST_CASE(TestHandlerCounts) {
    hub.registerHandler(CombatEventType::Death, recorder("a"));
    hub.registerHandler(CombatEventType::Death, recorder("b"));
    hub.registerHandler(CombatEventType::PoiseBroken, recorder("c"));
    BOOST_CHECK_EQUAL(hub.getHandlerCount(CombatEventType::Death), 2u);
    BOOST_CHECK_EQUAL(hub.getHandlerCount(CombatEventType::PoiseBroken), 1u);
    BOOST_CHECK_EQUAL(hub.getHandlerCount(CombatEventType::ParryOccurred), 0u);
    BOOST_CHECK_EQUAL(hub.getHandlerCount(CombatEventType::COUNT), 0u);

    hub.clear();
    BOOST_CHECK_EQUAL(hub.getHandlerCount(CombatEventType::Death), 0u);
    hub.dispatch(deathEvent());
    BOOST_CHECK(calls.empty());
}

BOOST_AUTO_TEST_SUITE_END()

// ============================================================================
// REMOVAL
// ============================================================================

BOOST_FIXTURE_TEST_SUITE(RemovalTests, HubFixture)

BOOST_AUTO_TEST_CASE(TestRemoveHandler) {
    auto keep = hub.registerHandler(CombatEventType::Death, recorder("keep"));
    auto drop = hub.registerHandler(CombatEventType::Death, recorder("drop"));
    BOOST_CHECK(keep.isValid());

    BOOST_CHECK(hub.removeHandler(drop));
    BOOST_CHECK(!hub.removeHandler(drop));
    BOOST_CHECK_EQUAL(hub.getHandlerCount(CombatEventType::Death), 1u);

    hub.dispatch(deathEvent());
    BOOST_REQUIRE_EQUAL(calls.size(), 1u);
    BOOST_CHECK_EQUAL(calls[0], "keep:Death");
}

BOOST_AUTO_TEST_CASE(TestRemoveInvalidToken) {
    BOOST_CHECK(!hub.removeHandler(CombatEventHub::HandlerToken{}));
}

BOOST_AUTO_TEST_CASE(TestHandlerRemovesItselfDuringDispatch) {
    CombatEventHub::HandlerToken self;
    self = hub.registerHandler(CombatEventType::Death, [this, &self](const CombatEventData&) {
        calls.push_back("once");
        BOOST_CHECK(hub.removeHandler(self));
    });
    hub.registerHandler(CombatEventType::Death, recorder("after"));

    hub.dispatch(deathEvent());
    hub.dispatch(deathEvent());
    const std::vector<std::string> expected{"once", "after:Death", "after:Death"};
    BOOST_CHECK_EQUAL_COLLECTIONS(calls.begin(), calls.end(), expected.begin(), expected.end());
}

BOOST_AUTO_TEST_CASE(TestHandlerRemovesLaterHandler) {
    CombatEventHub::HandlerToken victim;
    hub.registerHandler(CombatEventType::Death, [this, &victim](const CombatEventData&) {
        calls.push_back("remover");
        BOOST_CHECK(hub.removeHandler(victim));
    });
    victim = hub.registerHandler(CombatEventType::Death, recorder("victim"));

    hub.dispatch(deathEvent());
    BOOST_REQUIRE_EQUAL(calls.size(), 1u);
    BOOST_CHECK_EQUAL(calls[0], "remover");
    BOOST_CHECK_EQUAL(hub.getHandlerCount(CombatEventType::Death), 1u);
}

BOOST_AUTO_TEST_CASE(TestHandlerAddedDuringDispatchWaitsForNextEvent) {
    bool added = false;
    hub.registerHandler(CombatEventType::Death, [this, &added](const CombatEventData&) {
        calls.push_back("outer");
        if (!added) {
            added = true;
            hub.registerHandler(CombatEventType::Death, recorder("late"));
        }
    });

    hub.dispatch(deathEvent());
    BOOST_CHECK_EQUAL(calls.size(), 1u);

    hub.dispatch(deathEvent());
    const std::vector<std::string> expected{"outer", "outer", "late:Death"};
    BOOST_CHECK_EQUAL_COLLECTIONS(calls.begin(), calls.end(), expected.begin(), expected.end());
}

BOOST_AUTO_TEST_CASE(TestNestedDispatch) {
    hub.registerHandler(CombatEventType::HealthChanged, [this](const CombatEventData& event) {
        calls.push_back("health");
        const auto* payload = event.get<HealthChangedEvent>();
        if (payload != nullptr && payload->current <= 0) {
            hub.dispatch(deathEvent());
        }
    });
    hub.registerHandler(CombatEventType::Death, recorder("death"));

    hub.dispatch(healthEvent(-100));
    const std::vector<std::string> expected{"health", "death:Death"};
    BOOST_CHECK_EQUAL_COLLECTIONS(calls.begin(), calls.end(), expected.begin(), expected.end());
}

BOOST_AUTO_TEST_CASE(TestClearDuringDispatch) {
    hub.registerHandler(CombatEventType::Death, [this](const CombatEventData&) {
        calls.push_back("clearer");
        hub.clear();
    });
    hub.registerHandler(CombatEventType::Death, recorder("skipped"));

    hub.dispatch(deathEvent());
    BOOST_REQUIRE_EQUAL(calls.size(), 1u);
    BOOST_CHECK_EQUAL(hub.getHandlerCount(CombatEventType::Death), 0u);
}

BOOST_AUTO_TEST_SUITE_END()

// ============================================================================
// SCOPED SUBSCRIPTION
// ============================================================================

BOOST_FIXTURE_TEST_SUITE(ScopedSubscriptionTests, HubFixture)

BOOST_AUTO_TEST_CASE(TestUnregistersOnDestruction) {
    {
        ScopedCombatSubscription subscription(hub, CombatEventType::Death, recorder("scoped"));
        BOOST_CHECK_EQUAL(hub.getHandlerCount(CombatEventType::Death), 1u);
        hub.dispatch(deathEvent());
    }
    BOOST_CHECK_EQUAL(hub.getHandlerCount(CombatEventType::Death), 0u);
    hub.dispatch(deathEvent());
    BOOST_CHECK_EQUAL(calls.size(), 1u);
}

BOOST_AUTO_TEST_CASE(TestMoveTransfersOwnership) {
    ScopedCombatSubscription outer;
    {
        ScopedCombatSubscription inner(hub, CombatEventType::Death, recorder("moved"));
        outer = std::move(inner);
    }
    BOOST_CHECK_EQUAL(hub.getHandlerCount(CombatEventType::Death), 1u);

    std::vector<ScopedCombatSubscription> held;
    held.push_back(std::move(outer));
    BOOST_CHECK_EQUAL(hub.getHandlerCount(CombatEventType::Death), 1u);

    held.clear();
    BOOST_CHECK_EQUAL(hub.getHandlerCount(CombatEventType::Death), 0u);
}

BOOST_AUTO_TEST_CASE(TestResetIsIdempotent) {
    ScopedCombatSubscription subscription(hub, CombatEventType::Death, recorder("r"));
    subscription.reset();
    subscription.reset();
    BOOST_CHECK_EQUAL(hub.getHandlerCount(CombatEventType::Death), 0u);
}

BOOST_AUTO_TEST_SUITE_END()
