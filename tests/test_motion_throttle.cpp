/*
 * File: tests/test_motion_throttle.cpp
 * Project: Motion Bridge
 * Purpose: Energy-saving suppression policy
 * Last updated: 2026-10-19
 */

#include <catch2/catch_all.hpp>
#include <chrono>
#include <limits>
#include "common/motion_throttle.hpp"

using namespace std::chrono_literals;

namespace
{
    RawMotion at(double ts, bool calibrated = true)
    {
        RawMotion r;
        r.sample = {0.1, 0.2, 0.3, ts};
        r.calibrated = calibrated;
        return r;
    }
}

TEST_CASE("steady samples are forwarded")
{
    MotionThrottle th;
    auto now = MotionThrottle::clock::now();
    for (int i = 0; i < 10; ++i)
    {
        auto d = th.evaluate(at(100.0 + i / 60.0), now + i * 16ms);
        REQUIRE(d.forward);
        REQUIRE(d.reason == ThrottleReason::forwarded);
    }
    REQUIRE_FALSE(th.suppressed());
    REQUIRE(*th.last_sample_time() == Catch::Approx(100.0 + 9 / 60.0));
}

TEST_CASE("a gap longer than the stationary threshold suppresses")
{
    MotionThrottle th;
    auto now = MotionThrottle::clock::now();
    REQUIRE(th.evaluate(at(100.0), now).forward);

    auto d = th.evaluate(at(105.0), now + 5s);
    REQUIRE_FALSE(d.forward);
    REQUIRE(d.reason == ThrottleReason::stationary);
    REQUIRE(d.entered_suppression);
    REQUIRE(th.suppressed());

    SECTION("a fresh reading 0.5 s later is still held back")
    {
        auto d2 = th.evaluate(at(105.5), now + 5s + 500ms);
        REQUIRE_FALSE(d2.forward);
        REQUIRE(d2.reason == ThrottleReason::cooldown);
        REQUIRE_FALSE(d2.entered_suppression);
    }

    SECTION("after the cooldown the next sample is judged fresh")
    {
        auto d2 = th.evaluate(at(106.1), now + 6s + 100ms);
        REQUIRE(d2.forward);
        REQUIRE_FALSE(th.suppressed());
    }

    SECTION("after the cooldown a sample that is still idle suppresses again")
    {
        auto d2 = th.evaluate(at(110.0), now + 10s);
        REQUIRE_FALSE(d2.forward);
        REQUIRE(d2.reason == ThrottleReason::stationary);
        REQUIRE(d2.entered_suppression);
    }
}

TEST_CASE("a gap of exactly the threshold is not stationary")
{
    MotionThrottle th;
    auto now = MotionThrottle::clock::now();
    REQUIRE(th.evaluate(at(10.0), now).forward);
    REQUIRE(th.evaluate(at(13.0), now + 3s).forward);
}

TEST_CASE("non-finite orientation is low confidence")
{
    const double nan = std::numeric_limits<double>::quiet_NaN();
    MotionThrottle th;
    auto now = MotionThrottle::clock::now();
    RawMotion r = at(1.0);
    r.sample.yaw = nan;

    auto d = th.evaluate(r, now);
    REQUIRE_FALSE(d.forward);
    REQUIRE(d.reason == ThrottleReason::low_confidence);
    REQUIRE(d.entered_suppression);

    // Good data inside the cooldown is withheld.
    REQUIRE(th.evaluate(at(1.2), now + 200ms).reason == ThrottleReason::cooldown);
    // And accepted once the cooldown has passed.
    REQUIRE(th.evaluate(at(2.1), now + 1100ms).forward);
}

TEST_CASE("uncalibrated readings keep the throttle suppressed")
{
    MotionThrottle th;
    auto now = MotionThrottle::clock::now();
    REQUIRE(th.evaluate(at(1.0), now).forward);

    auto d = th.evaluate(at(1.1, false), now + 100ms);
    REQUIRE(d.reason == ThrottleReason::low_confidence);
    REQUIRE(th.evaluate(at(1.5, false), now + 500ms).reason == ThrottleReason::cooldown);

    // Cooldown over but confidence still missing: back into suppression.
    auto again = th.evaluate(at(2.2, false), now + 1200ms);
    REQUIRE_FALSE(again.forward);
    REQUIRE(again.reason == ThrottleReason::low_confidence);
    REQUIRE(again.entered_suppression);

    REQUIRE(th.evaluate(at(2.5), now + 2300ms).forward);
}

TEST_CASE("reset forgets history")
{
    MotionThrottle th;
    auto now = MotionThrottle::clock::now();
    th.evaluate(at(1.0), now);
    th.evaluate(at(9.0), now + 8s);
    REQUIRE(th.suppressed());
    th.reset();
    REQUIRE_FALSE(th.suppressed());
    REQUIRE_FALSE(th.last_sample_time().has_value());
    REQUIRE(th.evaluate(at(50.0), now + 8s + 1ms).forward);
}

TEST_CASE("samples are never modified")
{
    MotionThrottle th;
    auto r = at(7.0);
    const auto copy = r;
    th.evaluate(r, MotionThrottle::clock::now());
    REQUIRE(r.sample.pitch == copy.sample.pitch);
    REQUIRE(r.sample.timestamp == copy.sample.timestamp);
}
