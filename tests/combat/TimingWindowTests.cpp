/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#define BOOST_TEST_MODULE TimingWindowTests
#include <boost/test/unit_test.hpp>

#include "combat/TimingWindow.hpp"

#include <limits>

// ============================================================================
// PURE EVALUATION
// ============================================================================

BOOST_AUTO_TEST_SUITE(EvaluateTimingTests)

BOOST_AUTO_TEST_CASE(TestPerfectPartialExpiredBands) {
    // Window opened at t=10 for 0.2s with a 0.1s perfect phase
    BOOST_CHECK_EQUAL(evaluateTiming(10.0, 0.2f, 0.1f, 10.0), TimingQuality::Perfect);
    BOOST_CHECK_EQUAL(evaluateTiming(10.0, 0.2f, 0.1f, 10.05), TimingQuality::Perfect);
    BOOST_CHECK_EQUAL(evaluateTiming(10.0, 0.2f, 0.1f, 10.15), TimingQuality::Partial);
    BOOST_CHECK_EQUAL(evaluateTiming(10.0, 0.2f, 0.1f, 10.25), TimingQuality::Expired);
}

BOOST_AUTO_TEST_CASE(TestBoundariesAreInclusive) {
    // Binary-exact values so the boundary comparison is not subject to rounding
    BOOST_CHECK_EQUAL(evaluateTiming(0.0, 0.5f, 0.25f, 0.25), TimingQuality::Perfect);
    BOOST_CHECK_EQUAL(evaluateTiming(0.0, 0.5f, 0.25f, 0.5), TimingQuality::Partial);
}

BOOST_AUTO_TEST_CASE(TestBeforeWindowStartIsExpired) {
    BOOST_CHECK_EQUAL(evaluateTiming(5.0, 0.2f, 0.1f, 4.99), TimingQuality::Expired);
}

BOOST_AUTO_TEST_CASE(TestZeroLengthWindow) {
    BOOST_CHECK_EQUAL(evaluateTiming(1.0, 0.0f, 0.0f, 1.0), TimingQuality::Perfect);
    BOOST_CHECK_EQUAL(evaluateTiming(1.0, 0.0f, 0.0f, 1.001), TimingQuality::Expired);
}

BOOST_AUTO_TEST_CASE(TestEvaluationIsConstexpr) {
    static_assert(evaluateTiming(0.0, 0.2f, 0.1f, 0.05) == TimingQuality::Perfect);
    static_assert(evaluateTiming(0.0, 0.2f, 0.1f, 1.0) == TimingQuality::Expired);
    BOOST_CHECK(true);
}

BOOST_AUTO_TEST_SUITE_END()

// ============================================================================
// TIMING WINDOW OBJECT
// ============================================================================

BOOST_AUTO_TEST_SUITE(TimingWindowObjectTests)

BOOST_AUTO_TEST_CASE(TestCreateStoresInputs) {
    auto window = TimingWindow::create(2.0, 0.3f, 0.1f);
    BOOST_REQUIRE(window.has_value());
    BOOST_CHECK_EQUAL(window->getStart(), 2.0);
    BOOST_CHECK_CLOSE(window->getDuration(), 0.3f, 0.001f);
    BOOST_CHECK_CLOSE(window->getPerfectDuration(), 0.1f, 0.001f);
}

BOOST_AUTO_TEST_CASE(TestPerfectLongerThanWindowIsClamped) {
    auto window = TimingWindow::create(0.0, 0.2f, 0.5f);
    BOOST_REQUIRE(window.has_value());
    BOOST_CHECK_CLOSE(window->getPerfectDuration(), 0.2f, 0.001f);
    BOOST_CHECK_EQUAL(window->evaluate(0.15), TimingQuality::Perfect);
}

BOOST_AUTO_TEST_CASE(TestRejectsInvalidInputs) {
    const float nan = std::numeric_limits<float>::quiet_NaN();
    const double inf = std::numeric_limits<double>::infinity();

    BOOST_CHECK(!TimingWindow::create(0.0, -0.1f, 0.0f).has_value());
    BOOST_CHECK(!TimingWindow::create(0.0, 0.2f, -0.1f).has_value());
    BOOST_CHECK(!TimingWindow::create(0.0, nan, 0.1f).has_value());
    BOOST_CHECK(!TimingWindow::create(inf, 0.2f, 0.1f).has_value());
}

BOOST_AUTO_TEST_CASE(TestDerivedValuesFollowTime) {
    auto window = TimingWindow::create(1.0, 0.5f, 0.25f);
    BOOST_REQUIRE(window.has_value());

    BOOST_CHECK_CLOSE(window->elapsed(1.25), 0.25, 0.001);
    BOOST_CHECK_CLOSE(window->normalized(1.25), 0.5f, 0.001f);
    BOOST_CHECK(!window->isExpired(1.4));
    BOOST_CHECK(window->isExpired(1.6));

    // Evaluation is pure: asking twice gives the same answer
    BOOST_CHECK_EQUAL(window->evaluate(1.1), window->evaluate(1.1));
}

BOOST_AUTO_TEST_CASE(TestQualityNames) {
    BOOST_CHECK_EQUAL(std::string(toString(TimingQuality::Perfect)), "Perfect");
    BOOST_CHECK_EQUAL(std::string(toString(TimingQuality::Partial)), "Partial");
    BOOST_CHECK_EQUAL(std::string(toString(TimingQuality::Expired)), "Expired");
}

BOOST_AUTO_TEST_SUITE_END()
