/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#define BOOST_TEST_MODULE IntentBufferTests
#include <boost/test/unit_test.hpp>

#include "combat/IntentBuffer.hpp"
#include "core/SimClock.hpp"

#include <limits>

using Riposte::SimClock;

struct IntentBufferFixture {
    SimClock clock;
    IntentBuffer buffer{clock};
};

BOOST_FIXTURE_TEST_SUITE(IntentBufferTestSuite, IntentBufferFixture)

BOOST_AUTO_TEST_CASE(TestConsumeWithinWindow) {
    BOOST_CHECK(buffer.push(CombatAction::LightAttack));
    clock.advance(0.1f);

    auto intent = buffer.tryConsume(CombatAction::LightAttack, 0.15f);
    BOOST_REQUIRE(intent.has_value());
    BOOST_CHECK(intent->action == CombatAction::LightAttack);
    BOOST_CHECK_EQUAL(intent->timestamp, 0.0);
    BOOST_CHECK(intent->consumed);
}

BOOST_AUTO_TEST_CASE(TestConsumeIsOneShot) {
    buffer.push(CombatAction::Dodge);
    BOOST_CHECK(buffer.tryConsume(CombatAction::Dodge).has_value());
    BOOST_CHECK(!buffer.tryConsume(CombatAction::Dodge).has_value());
    BOOST_CHECK(!buffer.hasBuffered(CombatAction::Dodge));
}

BOOST_AUTO_TEST_CASE(TestStaleIntentIsAbsent) {
    buffer.push(CombatAction::Parry);
    clock.advance(0.2f);

    BOOST_CHECK(!buffer.hasBuffered(CombatAction::Parry, 0.15f));
    BOOST_CHECK(!buffer.tryConsume(CombatAction::Parry, 0.15f).has_value());
    // A wider window still sees it
    BOOST_CHECK(buffer.hasBuffered(CombatAction::Parry, 0.5f));
}

BOOST_AUTO_TEST_CASE(TestHasBufferedDoesNotConsume) {
    buffer.push(CombatAction::HeavyAttack);
    BOOST_CHECK(buffer.hasBuffered(CombatAction::HeavyAttack));
    BOOST_CHECK(buffer.hasBuffered(CombatAction::HeavyAttack));
    BOOST_CHECK(buffer.tryConsume(CombatAction::HeavyAttack).has_value());
}

BOOST_AUTO_TEST_CASE(TestNewerPushOverwritesSlot) {
    buffer.push(CombatAction::LightAttack, Vector3D(1.0f, 0.0f, 0.0f));
    clock.advance(0.05f);
    buffer.push(CombatAction::LightAttack, Vector3D(0.0f, 0.0f, 2.0f));

    auto intent = buffer.tryConsume(CombatAction::LightAttack);
    BOOST_REQUIRE(intent.has_value());
    BOOST_CHECK_CLOSE(intent->timestamp, 0.05, 0.01);
    BOOST_REQUIRE(intent->direction.has_value());
    // Directions are normalized on store
    BOOST_CHECK_CLOSE(intent->direction->getZ(), 1.0f, 0.001f);
}

BOOST_AUTO_TEST_CASE(TestPushAfterConsumeRearms) {
    buffer.push(CombatAction::Dodge);
    BOOST_CHECK(buffer.tryConsume(CombatAction::Dodge).has_value());
    buffer.push(CombatAction::Dodge);
    BOOST_CHECK(buffer.hasBuffered(CombatAction::Dodge));
}

BOOST_AUTO_TEST_CASE(TestActionsAreIndependent) {
    buffer.push(CombatAction::LightAttack);
    buffer.push(CombatAction::Dodge);

    BOOST_CHECK(buffer.tryConsume(CombatAction::Dodge).has_value());
    BOOST_CHECK(buffer.hasBuffered(CombatAction::LightAttack));
    BOOST_CHECK(!buffer.hasBuffered(CombatAction::Parry));
}

BOOST_AUTO_TEST_CASE(TestNonFiniteDirectionRejected) {
    const float nan = std::numeric_limits<float>::quiet_NaN();
    BOOST_CHECK(!buffer.push(CombatAction::Dodge, Vector3D(nan, 0.0f, 0.0f)));
    BOOST_CHECK(!buffer.hasBuffered(CombatAction::Dodge));
}

BOOST_AUTO_TEST_CASE(TestZeroDirectionStoredAsNone) {
    BOOST_CHECK(buffer.push(CombatAction::Dodge, Vector3D()));
    auto intent = buffer.tryConsume(CombatAction::Dodge);
    BOOST_REQUIRE(intent.has_value());
    BOOST_CHECK(!intent->direction.has_value());
}

BOOST_AUTO_TEST_CASE(TestInvalidWindowRejected) {
    buffer.push(CombatAction::Block);
    BOOST_CHECK(!buffer.tryConsume(CombatAction::Block, -1.0f).has_value());
    BOOST_CHECK(!buffer.hasBuffered(CombatAction::Block,
                                    std::numeric_limits<float>::quiet_NaN()));
    // The rejected calls did not consume it
    BOOST_CHECK(buffer.hasBuffered(CombatAction::Block));
}

BOOST_AUTO_TEST_CASE(TestClearDropsEverything) {
    buffer.push(CombatAction::LightAttack);
    buffer.push(CombatAction::Parry);
    buffer.clear();
    BOOST_CHECK(!buffer.hasBuffered(CombatAction::LightAttack));
    BOOST_CHECK(!buffer.hasBuffered(CombatAction::Parry));
}

BOOST_AUTO_TEST_SUITE_END()
