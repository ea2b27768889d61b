/*
 * File: include/common/motion_sample.hpp
 * Project: Motion Bridge
 * Purpose: Orientation sample value type and its wire JSON codec
 * Notes:
 *  - Wire object is flat: pitch, yaw, roll, timestamp (all doubles)
 *  - Non-finite samples must be filtered before encode (see motion_throttle.hpp)
 * Last updated: 2026-10-19
 */

#pragma once
#include <cmath>
#include <stdexcept>
#include <string>
#include <nlohmann/json.hpp>

constexpr double kRadToDeg = 180.0 / 3.14159265358979323846;

struct MotionSample
{
    double pitch{0.0}; // radians
    double yaw{0.0};   // radians
    double roll{0.0};  // radians
    double timestamp{0.0}; // seconds, fractional

    double pitch_degrees() const { return pitch * kRadToDeg; }
    double yaw_degrees() const { return yaw * kRadToDeg; }
    double roll_degrees() const { return roll * kRadToDeg; }

    bool is_finite() const
    {
        return std::isfinite(pitch) && std::isfinite(yaw) &&
               std::isfinite(roll) && std::isfinite(timestamp);
    }
};

// What a MotionSource hands over: the sample plus the sensor's confidence.
struct RawMotion
{
    MotionSample sample;
    bool calibrated{true};
};

inline nlohmann::json sample_to_json(const MotionSample &s)
{
    return nlohmann::json{
        {"pitch", s.pitch},
        {"yaw", s.yaw},
        {"roll", s.roll},
        {"timestamp", s.timestamp}};
}

// nlohmann never escapes '/', and writes doubles with round-trip precision.
// A non-finite field would be dumped as null, so it is rejected instead.
inline std::string encode_sample(const MotionSample &s)
{
    if (!s.is_finite())
        throw std::domain_error("encode_sample: non-finite field");
    return sample_to_json(s).dump();
}

inline MotionSample sample_from_json(const nlohmann::json &j)
{
    if (!j.is_object())
        throw std::invalid_argument("motion sample: expected a JSON object");
    auto field = [&](const char *k)
    {
        auto it = j.find(k);
        if (it == j.end())
            throw std::invalid_argument(std::string("motion sample: missing field '") + k + "'");
        if (!it->is_number())
            throw std::invalid_argument(std::string("motion sample: field '") + k + "' is not a number");
        return it->get<double>();
    };
    MotionSample s;
    s.pitch = field("pitch");
    s.yaw = field("yaw");
    s.roll = field("roll");
    s.timestamp = field("timestamp");
    return s;
}

inline MotionSample decode_sample(const std::string &text)
{
    auto j = nlohmann::json::parse(text, nullptr, false);
    if (j.is_discarded())
        throw std::invalid_argument("motion sample: malformed JSON");
    return sample_from_json(j);
}
