/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#define BOOST_TEST_MODULE CombatResolverTests
#include <boost/test/unit_test.hpp>

#include "combat/CombatResolver.hpp"
#include "core/SimClock.hpp"
#include "entities/CombatActor.hpp"
#include "entities/IInterruptTarget.hpp"

#include <vector>

using Riposte::SimClock;

// ============================================================================
// Test doubles
// ============================================================================

class RecordingInterruptTarget : public IInterruptTarget {
public:
    TransitionResult forceStagger() override {
        ++staggerCount;
        return TransitionResult::Accepted;
    }
    TransitionResult forceDeath() override {
        ++deathCount;
        terminal = true;
        return TransitionResult::Accepted;
    }
    bool isInTerminalState() const override { return terminal; }
    const char* getCurrentStateName() const override { return terminal ? "Death" : "Idle"; }

    int staggerCount{0};
    int deathCount{0};
    bool terminal{false};
};

namespace {

CombatStats makeDefenderStats() {
    CombatStats stats = CombatStats::createDefaultPlayer();
    stats.maxHealth = 100;
    stats.maxPoise = 50.0f;
    stats.physicalDefense = 0.1f;
    stats.partialParryDamageFactor = 0.5f;
    stats.partialParryPoiseFactor = 0.5f;
    stats.blockDamageFactor = 0.5f;
    stats.blockStaminaCostOnHit = 15.0f;
    return stats;
}

} // namespace

class ResolverFixture {
public:
    ResolverFixture()
        : defender(1, Faction::Player, makeDefenderStats(), clock),
          attacker(2, Faction::Enemy, CombatStats::createDefaultEnemy(), clock) {
        clock.advance(1.0f);
        defender.bindInterruptTarget(&defenderTarget);
        attacker.bindInterruptTarget(&attackerTarget);

        for (size_t i = 0; i < static_cast<size_t>(CombatEventType::COUNT); ++i) {
            defender.getEvents().registerHandler(
                static_cast<CombatEventType>(i),
                [this](const CombatEventData& event) { events.push_back(event.type); });
        }
    }

    DamageInfo hit(float amount, float poise = 0.0f) const {
        auto damage = DamageInfo::physical(amount, poise, attacker.getId(), Vector3D(),
                                           Vector3D(0.0f, 0.0f, 1.0f), clock.now());
        BOOST_REQUIRE(damage.has_value());
        return *damage;
    }

    DamageInfo unparryable(float amount) const {
        auto damage = DamageInfo::unblockable(amount, 0.0f, attacker.getId(), Vector3D(),
                                              Vector3D(0.0f, 0.0f, 1.0f), clock.now());
        BOOST_REQUIRE(damage.has_value());
        return *damage;
    }

    std::optional<DamageResult> resolve(const DamageInfo& damage) {
        return CombatResolver::resolve(damage, defender, &attacker);
    }

    SimClock clock;
    CombatActor defender;
    CombatActor attacker;
    RecordingInterruptTarget defenderTarget;
    RecordingInterruptTarget attackerTarget;
    std::vector<CombatEventType> events;
};

// ============================================================================
// PLAIN HITS AND ROUNDING
// ============================================================================

BOOST_FIXTURE_TEST_SUITE(PlainHitTests, ResolverFixture)

BOOST_AUTO_TEST_CASE(TestDefenseReducesDamage) {
    auto result = resolve(hit(20.0f));
    BOOST_REQUIRE(result.has_value());
    BOOST_CHECK_EQUAL(result->finalDamage, 18);
    BOOST_CHECK(!result->wasDefended());
    BOOST_CHECK_EQUAL(defender.getHealth().getCurrent(), 82);

    const std::vector<CombatEventType> expected{CombatEventType::HealthChanged,
                                                CombatEventType::DamageApplied};
    BOOST_CHECK_EQUAL_COLLECTIONS(events.begin(), events.end(), expected.begin(),
                                  expected.end());
}

BOOST_AUTO_TEST_CASE(TestFinalDamageIsFloored) {
    // 11 * 0.9 = 9.9
    auto result = resolve(hit(11.0f));
    BOOST_REQUIRE(result.has_value());
    BOOST_CHECK_EQUAL(result->finalDamage, 9);
}

BOOST_AUTO_TEST_CASE(TestConnectingHitDealsAtLeastOne) {
    auto result = resolve(hit(0.5f));
    BOOST_REQUIRE(result.has_value());
    BOOST_CHECK_EQUAL(result->finalDamage, 1);
    BOOST_CHECK_EQUAL(defender.getHealth().getCurrent(), 99);
}

BOOST_AUTO_TEST_CASE(TestLastHitDirectionRecorded) {
    resolve(hit(5.0f));
    BOOST_CHECK_CLOSE(defender.getLastHitDirection().getZ(), 1.0f, 0.001f);
}

BOOST_AUTO_TEST_SUITE_END()

// ============================================================================
// DODGE, PARRY AND BLOCK
// ============================================================================

BOOST_FIXTURE_TEST_SUITE(DefenseBranchTests, ResolverFixture)

BOOST_AUTO_TEST_CASE(TestInvulnerableDodges) {
    defender.setInvulnerable(true);
    auto result = resolve(hit(50.0f, 40.0f));
    BOOST_REQUIRE(result.has_value());
    BOOST_CHECK(result->dodged);
    BOOST_CHECK_EQUAL(result->finalDamage, 0);
    BOOST_CHECK(result->noDamageTaken());
    BOOST_CHECK_EQUAL(defender.getHealth().getCurrent(), 100);
    BOOST_CHECK_EQUAL(defender.getPoise().getCurrent(), 0.0f);

    BOOST_REQUIRE_EQUAL(events.size(), 1u);
    BOOST_CHECK(events[0] == CombatEventType::DamageApplied);
}

BOOST_AUTO_TEST_CASE(TestPerfectParryStaggersAttacker) {
    BOOST_REQUIRE(defender.openParryWindow(0.2f, 0.1f));
    clock.advance(0.05f);

    auto result = resolve(hit(30.0f, 40.0f));
    BOOST_REQUIRE(result.has_value());
    BOOST_CHECK(result->parried);
    BOOST_CHECK_EQUAL(result->finalDamage, 0);
    BOOST_CHECK_EQUAL(result->finalPoiseDamage, 0.0f);
    BOOST_CHECK_EQUAL(defender.getHealth().getCurrent(), 100);
    BOOST_CHECK_EQUAL(defender.getStamina().getCurrent(), defender.getStamina().getMax());
    BOOST_CHECK(defender.hasParrySucceeded());

    BOOST_CHECK_EQUAL(attackerTarget.staggerCount, 1);
    BOOST_CHECK_EQUAL(defenderTarget.staggerCount, 0);

    const std::vector<CombatEventType> expected{CombatEventType::DamageApplied,
                                                CombatEventType::ParryOccurred};
    BOOST_CHECK_EQUAL_COLLECTIONS(events.begin(), events.end(), expected.begin(),
                                  expected.end());
}

BOOST_AUTO_TEST_CASE(TestPartialParryReducesDamage) {
    BOOST_REQUIRE(defender.openParryWindow(0.2f, 0.1f));
    clock.advance(0.15f);

    auto result = resolve(hit(20.0f, 10.0f));
    BOOST_REQUIRE(result.has_value());
    BOOST_CHECK(result->partiallyParried);
    BOOST_CHECK(!result->parried);
    BOOST_CHECK_EQUAL(result->finalDamage, 10);
    BOOST_CHECK_CLOSE(result->finalPoiseDamage, 5.0f, 0.001f);
    BOOST_CHECK_EQUAL(attackerTarget.staggerCount, 0);

    const std::vector<CombatEventType> expected{CombatEventType::HealthChanged,
                                                CombatEventType::DamageApplied,
                                                CombatEventType::ParryOccurred};
    BOOST_CHECK_EQUAL_COLLECTIONS(events.begin(), events.end(), expected.begin(),
                                  expected.end());
}

BOOST_AUTO_TEST_CASE(TestExpiredParryFallsThrough) {
    BOOST_REQUIRE(defender.openParryWindow(0.2f, 0.1f));
    clock.advance(0.3f);

    auto result = resolve(hit(20.0f));
    BOOST_REQUIRE(result.has_value());
    BOOST_CHECK(!result->parried);
    BOOST_CHECK(!result->partiallyParried);
    BOOST_CHECK_EQUAL(result->finalDamage, 18);
}

BOOST_AUTO_TEST_CASE(TestUnparryableIgnoresParryAndGuard) {
    defender.setBlocking(true);
    BOOST_REQUIRE(defender.openParryWindow(0.2f, 0.1f));

    auto result = resolve(unparryable(20.0f));
    BOOST_REQUIRE(result.has_value());
    BOOST_CHECK(!result->parried);
    BOOST_CHECK(!result->blocked);
    BOOST_CHECK_EQUAL(result->finalDamage, 18);
}

BOOST_AUTO_TEST_CASE(TestBlockReducesDamageAndCostsStamina) {
    defender.setBlocking(true);

    // 20 * 0.9 * 0.5 = 9
    auto result = resolve(hit(20.0f));
    BOOST_REQUIRE(result.has_value());
    BOOST_CHECK(result->blocked);
    BOOST_CHECK(result->wasDefended());
    BOOST_CHECK_EQUAL(result->finalDamage, 9);
    BOOST_CHECK_CLOSE(defender.getStamina().getCurrent(), 85.0f, 0.001f);
}

BOOST_AUTO_TEST_CASE(TestParryTakesPrecedenceOverBlock) {
    defender.setBlocking(true);
    BOOST_REQUIRE(defender.openParryWindow(0.2f, 0.1f));

    auto result = resolve(hit(20.0f));
    BOOST_REQUIRE(result.has_value());
    BOOST_CHECK(result->parried);
    BOOST_CHECK(!result->blocked);
    BOOST_CHECK_EQUAL(defender.getStamina().getCurrent(), defender.getStamina().getMax());
}

BOOST_AUTO_TEST_SUITE_END()

// ============================================================================
// POISE AND DEATH
// ============================================================================

BOOST_FIXTURE_TEST_SUITE(ForcedReactionTests, ResolverFixture)

BOOST_AUTO_TEST_CASE(TestPoiseBreakForcesStagger) {
    auto result = resolve(hit(5.0f, 60.0f));
    BOOST_REQUIRE(result.has_value());
    BOOST_CHECK(result->poiseBroken);
    BOOST_CHECK_EQUAL(defender.getPoise().getCurrent(), 0.0f);
    BOOST_CHECK_EQUAL(defenderTarget.staggerCount, 1);
    BOOST_CHECK_EQUAL(defender.getForces().activeCount(), 1u);

    const std::vector<CombatEventType> expected{CombatEventType::HealthChanged,
                                                CombatEventType::DamageApplied,
                                                CombatEventType::PoiseBroken};
    BOOST_CHECK_EQUAL_COLLECTIONS(events.begin(), events.end(), expected.begin(),
                                  expected.end());
}

BOOST_AUTO_TEST_CASE(TestBlockedHitStillDealsPoise) {
    defender.setBlocking(true);
    auto result = resolve(hit(10.0f, 20.0f));
    BOOST_REQUIRE(result.has_value());
    BOOST_CHECK_CLOSE(result->finalPoiseDamage, 20.0f, 0.001f);
    BOOST_CHECK_CLOSE(defender.getPoise().getCurrent(), 20.0f, 0.001f);
}

BOOST_AUTO_TEST_CASE(TestDeathSupersedesStagger) {
    auto result = resolve(hit(500.0f, 60.0f));
    BOOST_REQUIRE(result.has_value());
    BOOST_CHECK(result->causedDeath);
    BOOST_CHECK(result->poiseBroken);
    BOOST_CHECK(!defender.isAlive());
    BOOST_CHECK_EQUAL(defenderTarget.deathCount, 1);
    BOOST_CHECK_EQUAL(defenderTarget.staggerCount, 0);

    const std::vector<CombatEventType> expected{
        CombatEventType::HealthChanged, CombatEventType::DamageApplied,
        CombatEventType::PoiseBroken, CombatEventType::Death};
    BOOST_CHECK_EQUAL_COLLECTIONS(events.begin(), events.end(), expected.begin(),
                                  expected.end());
}

BOOST_AUTO_TEST_CASE(TestDeadDefenderIgnoresHits) {
    resolve(hit(500.0f));
    events.clear();

    BOOST_CHECK(!resolve(hit(10.0f)).has_value());
    BOOST_CHECK(events.empty());
    BOOST_CHECK_EQUAL(defenderTarget.deathCount, 1);
}

BOOST_AUTO_TEST_SUITE_END()

// ============================================================================
// FRIENDLY FIRE AND PRESENTATION
// ============================================================================

BOOST_FIXTURE_TEST_SUITE(ResolverMiscTests, ResolverFixture)

BOOST_AUTO_TEST_CASE(TestAlliesAndSelfAreIgnored) {
    CombatActor ally(3, Faction::Player, CombatStats::createDefaultPlayer(), clock);
    BOOST_CHECK(!CombatResolver::resolve(hit(10.0f), defender, &ally).has_value());
    BOOST_CHECK(!CombatResolver::resolve(hit(10.0f), defender, &defender).has_value());
    BOOST_CHECK_EQUAL(defender.getHealth().getCurrent(), 100);
}

BOOST_AUTO_TEST_CASE(TestEnvironmentalHitWithoutAttacker) {
    auto damage = DamageInfo::physical(10.0f, 0.0f, std::nullopt, Vector3D(),
                                       Vector3D(1.0f, 0.0f, 0.0f), clock.now());
    BOOST_REQUIRE(damage.has_value());
    auto result = CombatResolver::resolve(*damage, defender);
    BOOST_REQUIRE(result.has_value());
    BOOST_CHECK_EQUAL(result->finalDamage, 9);
}

BOOST_AUTO_TEST_CASE(TestHitstop) {
    DamageResult none;
    BOOST_CHECK_EQUAL(CombatResolver::computeHitstop(none), 0.0f);

    DamageResult hitResult;
    hitResult.finalDamage = 10;
    BOOST_CHECK_CLOSE(CombatResolver::computeHitstop(hitResult), 0.06f, 0.01f);
}

BOOST_AUTO_TEST_SUITE_END()
