/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#define BOOST_TEST_MODULE TimestepManagerTests
#include <boost/test/unit_test.hpp>

#include "core/TimestepManager.hpp"

namespace {
constexpr float STEP = 1.0f / 60.0f;

int drainSteps(TimestepManager& timestep) {
    int steps = 0;
    while (timestep.shouldUpdate()) {
        ++steps;
    }
    return steps;
}
} // namespace

BOOST_AUTO_TEST_SUITE(TimestepManagerTests)

BOOST_AUTO_TEST_CASE(TestDefaults) {
    TimestepManager timestep;
    BOOST_CHECK_CLOSE(timestep.getTargetFPS(), 60.0f, 0.001f);
    BOOST_CHECK_CLOSE(timestep.getUpdateDeltaTime(), STEP, 0.001f);
    BOOST_CHECK(!timestep.isUsingSoftwareFrameLimiting());
    BOOST_CHECK(!timestep.shouldUpdate());
}

BOOST_AUTO_TEST_CASE(TestOneFrameOneStep) {
    TimestepManager timestep(60.0f, STEP);
    timestep.advance(STEP * 1.01);
    BOOST_CHECK_EQUAL(drainSteps(timestep), 1);
}

BOOST_AUTO_TEST_CASE(TestCatchUpSteps) {
    TimestepManager timestep(60.0f, STEP);
    timestep.advance(3.5 * STEP);
    BOOST_CHECK_EQUAL(drainSteps(timestep), 3);

    // The remainder carries into the interpolation alpha
    BOOST_CHECK_CLOSE(timestep.getInterpolationAlpha(), 0.5, 0.1);
}

BOOST_AUTO_TEST_CASE(TestShortFramesAccumulate) {
    TimestepManager timestep(60.0f, STEP);
    timestep.advance(STEP * 0.6);
    BOOST_CHECK_EQUAL(drainSteps(timestep), 0);
    timestep.advance(STEP * 0.6);
    BOOST_CHECK_EQUAL(drainSteps(timestep), 1);
}

BOOST_AUTO_TEST_CASE(TestStallIsCapped) {
    TimestepManager timestep(60.0f, STEP);
    timestep.advance(5.0);

    // At most MAX_ACCUMULATOR worth of steps run after a stall
    int steps = drainSteps(timestep);
    BOOST_CHECK_LE(steps, static_cast<int>(TimestepManager::MAX_ACCUMULATOR / STEP) + 1);
    BOOST_CHECK_GE(steps, 14);
}

BOOST_AUTO_TEST_CASE(TestNegativeDeltaIgnored) {
    TimestepManager timestep(60.0f, STEP);
    timestep.advance(-1.0);
    BOOST_CHECK_EQUAL(drainSteps(timestep), 0);
    BOOST_CHECK_EQUAL(timestep.getInterpolationAlpha(), 0.0);
}

BOOST_AUTO_TEST_CASE(TestInterpolationAlphaClamped) {
    TimestepManager timestep(60.0f, STEP);
    timestep.advance(STEP * 2.5);
    BOOST_CHECK_LE(timestep.getInterpolationAlpha(), 1.0);
    drainSteps(timestep);
    BOOST_CHECK_GE(timestep.getInterpolationAlpha(), 0.0);
    BOOST_CHECK_LT(timestep.getInterpolationAlpha(), 1.0);
}

BOOST_AUTO_TEST_CASE(TestFPSTracksFrameTime) {
    TimestepManager timestep(60.0f, STEP);
    for (int i = 0; i < 200; ++i) {
        timestep.advance(1.0 / 30.0);
        drainSteps(timestep);
    }
    BOOST_CHECK_CLOSE(timestep.getCurrentFPS(), 30.0f, 1.0f);
    BOOST_CHECK_EQUAL(timestep.getFrameTimeMs(), 33u);
}

BOOST_AUTO_TEST_CASE(TestSettersRejectNonPositive) {
    TimestepManager timestep(60.0f, STEP);
    timestep.setTargetFPS(0.0f);
    timestep.setFixedTimestep(-1.0f);
    BOOST_CHECK_CLOSE(timestep.getTargetFPS(), 60.0f, 0.001f);
    BOOST_CHECK_CLOSE(timestep.getUpdateDeltaTime(), STEP, 0.001f);

    timestep.setTargetFPS(144.0f);
    timestep.setFixedTimestep(0.01f);
    BOOST_CHECK_CLOSE(timestep.getTargetFPS(), 144.0f, 0.001f);
    BOOST_CHECK_CLOSE(timestep.getUpdateDeltaTime(), 0.01f, 0.001f);
}

BOOST_AUTO_TEST_CASE(TestResetClearsAccumulator) {
    TimestepManager timestep(60.0f, STEP);
    timestep.advance(STEP * 3.0);
    timestep.reset();
    BOOST_CHECK_EQUAL(drainSteps(timestep), 0);
    BOOST_CHECK_EQUAL(timestep.getCurrentFPS(), 0.0f);
}

BOOST_AUTO_TEST_CASE(TestSoftwareLimitingToggle) {
    TimestepManager timestep;
    timestep.setSoftwareFrameLimiting(true);
    BOOST_CHECK(timestep.isUsingSoftwareFrameLimiting());
    timestep.setSoftwareFrameLimiting(false);
    BOOST_CHECK(!timestep.isUsingSoftwareFrameLimiting());
}

BOOST_AUTO_TEST_SUITE_END()
