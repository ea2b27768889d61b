/*
 * File: tests/test_motion_sample.cpp
 * Project: Motion Bridge
 * Purpose: Wire codec for orientation samples
 * Last updated: 2026-10-19
 */

#include <catch2/catch_all.hpp>
#include <cmath>
#include <limits>
#include <nlohmann/json.hpp>
#include "common/motion_sample.hpp"

TEST_CASE("encode produces the four wire fields and nothing else")
{
    MotionSample s{0.123, -0.456, 0.789, 1234567890.0};
    auto j = nlohmann::json::parse(encode_sample(s));
    REQUIRE(j.is_object());
    REQUIRE(j.size() == 4);
    REQUIRE(j["pitch"].get<double>() == Catch::Approx(0.123));
    REQUIRE(j["yaw"].get<double>() == Catch::Approx(-0.456));
    REQUIRE(j["roll"].get<double>() == Catch::Approx(0.789));
    REQUIRE(j["timestamp"].get<double>() == Catch::Approx(1234567890.0));
}

TEST_CASE("encode output is stable through decode")
{
    const MotionSample samples[] = {
        {0.1, 0.2, 0.3, 100.0},
        {-3.141592653589793, 1.5707963267948966, 1e-12, 98765.4321},
        {0.0, -0.0, 2.5e-300, 0.016666666666666666},
    };
    for (const auto &s : samples)
    {
        auto once = encode_sample(s);
        REQUIRE(encode_sample(decode_sample(once)) == once);
    }
}

TEST_CASE("encode rejects non-finite fields")
{
    const double nan = std::numeric_limits<double>::quiet_NaN();
    const double inf = std::numeric_limits<double>::infinity();
    REQUIRE_THROWS_AS(encode_sample({nan, 0, 0, 1}), std::domain_error);
    REQUIRE_THROWS_AS(encode_sample({0, inf, 0, 1}), std::domain_error);
    REQUIRE_THROWS_AS(encode_sample({0, 0, -inf, 1}), std::domain_error);
    REQUIRE_THROWS_AS(encode_sample({0, 0, 0, nan}), std::domain_error);
}

TEST_CASE("encode does not escape slashes")
{
    // No string fields today, but the dump settings must never emit "\/".
    auto text = encode_sample({0.5, 0.25, 0.125, 42.0});
    REQUIRE(text.find("\\/") == std::string::npos);
    REQUIRE(text.find('{') == 0);
}

TEST_CASE("decode reports malformed input")
{
    REQUIRE_THROWS_AS(decode_sample("not json"), std::invalid_argument);
    REQUIRE_THROWS_AS(decode_sample("[1,2,3]"), std::invalid_argument);
    REQUIRE_THROWS_AS(decode_sample(R"({"pitch":1,"yaw":2,"roll":3})"), std::invalid_argument);
    REQUIRE_THROWS_AS(decode_sample(R"({"pitch":"1","yaw":2,"roll":3,"timestamp":4})"), std::invalid_argument);
}

TEST_CASE("degree accessors")
{
    const double pi = 3.14159265358979323846;
    MotionSample s{pi / 2, pi, pi / 4, 0};
    REQUIRE(s.pitch_degrees() == Catch::Approx(90.0));
    REQUIRE(s.yaw_degrees() == Catch::Approx(180.0));
    REQUIRE(s.roll_degrees() == Catch::Approx(45.0));
}
