/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#define BOOST_TEST_MODULE NPCStateTests
#include <boost/test/unit_test.hpp>

#include "ai/AIDriver.hpp"
#include "combat/CombatResolver.hpp"
#include "core/SimClock.hpp"
#include "entities/NPC.hpp"
#include "entities/npcStates/NPCAttackPatternState.hpp"
#include "entities/npcStates/NPCChaseState.hpp"

#include <array>
#include <limits>
#include <memory>
#include <string>

using Riposte::SimClock;

namespace {

constexpr float FRAME{1.0f / 60.0f};
constexpr float PHYSICS_STEP{0.02f};

AIPerception seen(float distance) {
    return AIPerception{true, distance, Vector3D(0.0f, 0.0f, 1.0f)};
}

} // namespace

// Requests a light attack whenever the target is in reach
class ScriptedDriver : public IAIDriver {
public:
    explicit ScriptedDriver(int& thinkCount) : m_thinkCount(thinkCount) {}

    void think(NPC& npc, const AIPerception& perception, float deltaTime) override {
        (void)deltaTime;
        ++m_thinkCount;
        if (perception.targetDetected && perception.distanceToTarget <= 2.0f) {
            npc.requestAction(CombatAction::LightAttack);
        }
    }

    std::string getName() const override { return "Scripted"; }

private:
    int& m_thinkCount;
};

class NPCFixture {
public:
    NPCFixture() : npc(2, Faction::Enemy, CombatStats::createDefaultEnemy(), clock) {}

    void step(int frames = 1) {
        for (int i = 0; i < frames; ++i) {
            BOOST_REQUIRE(clock.advance(FRAME));
            npc.update(FRAME);
        }
    }

    // Idle -> Alert -> Chase with the target at the given distance
    void enterChase(float distance) {
        npc.setPerception(seen(distance));
        step();
        BOOST_REQUIRE_EQUAL(npc.getCurrentState(), NPCStateId::Alert);
        step(32);
        BOOST_REQUIRE_EQUAL(npc.getCurrentState(), NPCStateId::Chase);
    }

    size_t swingIndex() const {
        return npc.getStateMachine().getState<NPCAttackPatternState>().getSwingIndex();
    }

    SimClock clock;
    NPC npc;
};

// ============================================================================
// AWARENESS AND CHASE
// ============================================================================

BOOST_FIXTURE_TEST_SUITE(AwarenessTests, NPCFixture)

BOOST_AUTO_TEST_CASE(TestIdleWithoutTarget) {
    BOOST_CHECK_EQUAL(npc.getCurrentState(), NPCStateId::Idle);
    step(10);
    BOOST_CHECK_EQUAL(npc.getCurrentState(), NPCStateId::Idle);
}

BOOST_AUTO_TEST_CASE(TestAlertThenChase) {
    npc.setPerception(seen(6.0f));
    step();
    BOOST_CHECK_EQUAL(npc.getCurrentState(), NPCStateId::Alert);

    // alertDuration is 0.5 s
    step(20);
    BOOST_CHECK_EQUAL(npc.getCurrentState(), NPCStateId::Alert);
    step(12);
    BOOST_CHECK_EQUAL(npc.getCurrentState(), NPCStateId::Chase);
}

BOOST_AUTO_TEST_CASE(TestAlertFacesTarget) {
    npc.setPerception(AIPerception{true, 5.0f, Vector3D(1.0f, 0.0f, 0.0f)});
    step();
    BOOST_CHECK_CLOSE(npc.getActor().getFacing().getX(), 1.0f, 0.01f);
}

BOOST_AUTO_TEST_CASE(TestChaseClosesDistance) {
    enterChase(6.0f);
    step();
    npc.physicsUpdate(PHYSICS_STEP);
    // 3 m/s toward +z
    BOOST_CHECK_CLOSE(npc.getPosition().getZ(), 0.06f, 0.1f);
}

BOOST_AUTO_TEST_CASE(TestChaseStopsInRange) {
    enterChase(1.5f);
    step();
    BOOST_CHECK(npc.getStateMachine().getState<NPCChaseState>().isInAttackRange());
    npc.physicsUpdate(PHYSICS_STEP);
    BOOST_CHECK_SMALL(npc.getPosition().getZ(), 0.0001f);
    // No attack without an intent
    BOOST_CHECK_EQUAL(npc.getCurrentState(), NPCStateId::Chase);
}

BOOST_AUTO_TEST_CASE(TestLosingTargetReturnsToIdle) {
    enterChase(6.0f);
    npc.setPerception(AIPerception{});
    step();
    BOOST_CHECK_EQUAL(npc.getCurrentState(), NPCStateId::Idle);
}

BOOST_AUTO_TEST_CASE(TestNonFinitePerceptionRejected) {
    npc.setPerception(AIPerception{true, std::numeric_limits<float>::quiet_NaN(),
                                   Vector3D(0.0f, 0.0f, 1.0f)});
    BOOST_CHECK(!npc.getPerception().targetDetected);
}

BOOST_AUTO_TEST_CASE(TestPerceptionDirectionFlattened) {
    npc.setPerception(AIPerception{true, 3.0f, Vector3D(0.0f, 4.0f, 3.0f)});
    BOOST_CHECK_SMALL(npc.getPerception().directionToTarget.getY(), 0.0001f);
    BOOST_CHECK_CLOSE(npc.getPerception().directionToTarget.getZ(), 1.0f, 0.01f);
}

BOOST_AUTO_TEST_SUITE_END()

// ============================================================================
// ATTACK PATTERN
// ============================================================================

BOOST_FIXTURE_TEST_SUITE(AttackPatternTests, NPCFixture)

BOOST_AUTO_TEST_CASE(TestDefaultPattern) {
    const auto& pattern = npc.getStateMachine().getAttackPattern();
    BOOST_REQUIRE_EQUAL(pattern.size(), 3u);
    BOOST_CHECK(pattern[0] == AttackKind::Light);
    BOOST_CHECK(pattern[1] == AttackKind::Light);
    BOOST_CHECK(pattern[2] == AttackKind::Heavy);
}

BOOST_AUTO_TEST_CASE(TestPatternValidation) {
    const std::array<AttackKind, 1> single{AttackKind::Heavy};
    BOOST_CHECK(npc.getStateMachine().setAttackPattern(single));
    BOOST_CHECK_EQUAL(npc.getStateMachine().getAttackPattern().size(), 1u);

    BOOST_CHECK(!npc.getStateMachine().setAttackPattern({}));

    std::array<AttackKind, NPCStateMachine::MAX_PATTERN_LENGTH + 1> tooLong{};
    BOOST_CHECK(!npc.getStateMachine().setAttackPattern(tooLong));
    BOOST_CHECK_EQUAL(npc.getStateMachine().getAttackPattern().size(), 1u);
}

BOOST_AUTO_TEST_CASE(TestPatternPlaysInOrder) {
    enterChase(1.5f);
    BOOST_CHECK(npc.requestAction(CombatAction::LightAttack));
    step();
    BOOST_REQUIRE_EQUAL(npc.getCurrentState(), NPCStateId::AttackPattern);
    BOOST_CHECK_EQUAL(swingIndex(), 0u);

    // Light swings last 0.6 s
    step(38);
    BOOST_CHECK_EQUAL(swingIndex(), 1u);
    step(37);
    BOOST_CHECK_EQUAL(swingIndex(), 2u);

    const auto& state = npc.getStateMachine().getState<NPCAttackPatternState>();
    BOOST_CHECK(state.getAttack().kind == AttackKind::Heavy);
    BOOST_CHECK_EQUAL(npc.getStateMachine().forceStagger(),
                      TransitionResult::RejectedUninterruptible);

    // Heavy swing lasts 1.0 s, then back to Alert
    step(65);
    BOOST_CHECK_EQUAL(npc.getCurrentState(), NPCStateId::Alert);
    BOOST_CHECK(!npc.getActor().getCurrentSwing().has_value());
}

BOOST_AUTO_TEST_CASE(TestEachSwingGetsNewId) {
    enterChase(1.5f);
    npc.requestAction(CombatAction::LightAttack);
    step();
    const uint32_t first = npc.getActor().getCurrentSwing()->swingId;
    step(38);
    BOOST_REQUIRE(npc.getActor().getCurrentSwing().has_value());
    BOOST_CHECK_NE(npc.getActor().getCurrentSwing()->swingId, first);
}

BOOST_AUTO_TEST_CASE(TestPatternStopsWhenTargetLost) {
    enterChase(1.5f);
    npc.requestAction(CombatAction::LightAttack);
    step();
    npc.setPerception(AIPerception{});

    step(40);
    BOOST_CHECK_EQUAL(npc.getCurrentState(), NPCStateId::Idle);
}

BOOST_AUTO_TEST_CASE(TestLightSwingsCanBeStaggered) {
    enterChase(1.5f);
    npc.requestAction(CombatAction::LightAttack);
    step();
    BOOST_CHECK_EQUAL(npc.getStateMachine().forceStagger(), TransitionResult::Accepted);
    BOOST_CHECK_EQUAL(npc.getCurrentState(), NPCStateId::Stagger);
    BOOST_CHECK(!npc.getActor().getCurrentSwing().has_value());
}

BOOST_AUTO_TEST_SUITE_END()

// ============================================================================
// REACTIONS
// ============================================================================

BOOST_FIXTURE_TEST_SUITE(ReactionTests, NPCFixture)

BOOST_AUTO_TEST_CASE(TestAlertDodges) {
    npc.setPerception(seen(4.0f));
    step();
    npc.requestAction(CombatAction::Dodge, Vector3D(1.0f, 0.0f, 0.0f));
    step();
    BOOST_CHECK_EQUAL(npc.getCurrentState(), NPCStateId::Dodge);
}

BOOST_AUTO_TEST_CASE(TestAlertParries) {
    npc.setPerception(seen(4.0f));
    step();
    npc.requestAction(CombatAction::Parry);
    step();
    BOOST_CHECK_EQUAL(npc.getCurrentState(), NPCStateId::Parry);
    BOOST_CHECK(npc.getActor().isParrying());
}

BOOST_AUTO_TEST_CASE(TestChaseBlocksWhileHeld) {
    enterChase(6.0f);
    ControlInput input;
    input.blockHeld = true;
    npc.setControlInput(input);
    step();
    BOOST_CHECK_EQUAL(npc.getCurrentState(), NPCStateId::Block);
    BOOST_CHECK(npc.getActor().isBlocking());

    npc.setControlInput(ControlInput{});
    step();
    BOOST_CHECK_EQUAL(npc.getCurrentState(), NPCStateId::Alert);
}

BOOST_AUTO_TEST_CASE(TestAlertBlockIntentRaisesGuard) {
    npc.setPerception(seen(4.0f));
    step();
    BOOST_CHECK(npc.requestAction(CombatAction::Block));
    step();
    BOOST_CHECK_EQUAL(npc.getCurrentState(), NPCStateId::Block);
    BOOST_CHECK(npc.getActor().isBlocking());
    BOOST_CHECK(npc.getActor().isParrying());

    // Not held, so the guard drops after the opening window
    step(20);
    BOOST_CHECK_EQUAL(npc.getCurrentState(), NPCStateId::Alert);
    BOOST_CHECK(!npc.getActor().isBlocking());
}

BOOST_AUTO_TEST_CASE(TestLockOnOverridesPerceivedFacing) {
    npc.setPerception(seen(4.0f));
    npc.setLockOnTarget(Vector3D(3.0f, 0.0f, 0.0f));
    step();
    BOOST_REQUIRE_EQUAL(npc.getCurrentState(), NPCStateId::Alert);
    BOOST_CHECK_CLOSE(npc.getActor().getFacing().getZ(), 1.0f, 0.01f);

    npc.requestAction(CombatAction::LockOn);
    step();
    BOOST_CHECK(npc.getActor().isLockedOn());
    BOOST_CHECK_CLOSE(npc.getActor().getFacing().getX(), 1.0f, 0.01f);
    BOOST_CHECK_SMALL(npc.getActor().getFacing().getZ(), 0.0001f);
}

BOOST_AUTO_TEST_CASE(TestIdleIgnoresDefensiveIntents) {
    npc.requestAction(CombatAction::Parry);
    step();
    BOOST_CHECK_EQUAL(npc.getCurrentState(), NPCStateId::Idle);
}

BOOST_AUTO_TEST_CASE(TestStaggerRecoversToAlert) {
    npc.setPerception(seen(4.0f));
    BOOST_CHECK_EQUAL(npc.getStateMachine().forceStagger(), TransitionResult::Accepted);
    // staggerRecoveryTime is 2.0 s
    step(115);
    BOOST_CHECK_EQUAL(npc.getCurrentState(), NPCStateId::Stagger);
    step(10);
    BOOST_CHECK_EQUAL(npc.getCurrentState(), NPCStateId::Alert);
}

BOOST_AUTO_TEST_CASE(TestDeathIsTerminal) {
    auto damage = DamageInfo::physical(100.0f, 0.0f, 1, Vector3D(), Vector3D(0.0f, 0.0f, 1.0f),
                                       clock.now());
    BOOST_REQUIRE(damage.has_value());
    auto result = CombatResolver::resolve(*damage, npc.getActor());
    BOOST_REQUIRE(result.has_value());
    BOOST_CHECK(result->causedDeath);
    BOOST_CHECK_EQUAL(npc.getCurrentState(), NPCStateId::Death);
    BOOST_CHECK(npc.isInTerminalState());
    BOOST_CHECK_EQUAL(std::string(npc.getCurrentStateName()), "Death");
}

BOOST_AUTO_TEST_SUITE_END()

// ============================================================================
// DRIVER
// ============================================================================

BOOST_FIXTURE_TEST_SUITE(DriverTests, NPCFixture)

BOOST_AUTO_TEST_CASE(TestDriverStartsAttack) {
    int thinkCount = 0;
    npc.setDriver(std::make_unique<ScriptedDriver>(thinkCount));
    BOOST_REQUIRE(npc.getDriver() != nullptr);
    BOOST_CHECK_EQUAL(npc.getDriver()->getName(), "Scripted");

    npc.setPerception(seen(1.5f));
    step(36);
    BOOST_CHECK_EQUAL(thinkCount, 36);
    BOOST_CHECK_EQUAL(npc.getCurrentState(), NPCStateId::AttackPattern);
}

BOOST_AUTO_TEST_CASE(TestDeadNPCStopsThinking) {
    int thinkCount = 0;
    npc.setDriver(std::make_unique<ScriptedDriver>(thinkCount));
    step();
    BOOST_CHECK_EQUAL(thinkCount, 1);

    auto damage = DamageInfo::physical(100.0f, 0.0f, 1, Vector3D(), Vector3D(0.0f, 0.0f, 1.0f),
                                       clock.now());
    BOOST_REQUIRE(damage.has_value());
    BOOST_REQUIRE(CombatResolver::resolve(*damage, npc.getActor()).has_value());
    step(5);
    BOOST_CHECK_EQUAL(thinkCount, 1);
}

BOOST_AUTO_TEST_SUITE_END()
