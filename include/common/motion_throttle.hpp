/*
 * File: include/common/motion_throttle.hpp
 * Project: Motion Bridge
 * Purpose: Energy-saving suppression policy for raw sensor samples
 * Notes:
 *  - Active <-> Suppressed; 1 s minimum dwell in Suppressed
 *  - Cooldown is a deadline checked per sample, there is no timer thread
 * Last updated: 2026-10-19
 */

#pragma once
#include <chrono>
#include <mutex>
#include <optional>
#include "common/motion_sample.hpp"

enum class ThrottleReason
{
    forwarded,
    low_confidence,
    stationary,
    cooldown
};

inline const char *to_string(ThrottleReason r)
{
    switch (r)
    {
    case ThrottleReason::forwarded:
        return "forwarded";
    case ThrottleReason::low_confidence:
        return "low confidence";
    case ThrottleReason::stationary:
        return "stationary";
    case ThrottleReason::cooldown:
        return "cooldown";
    }
    return "unknown";
}

struct ThrottleDecision
{
    bool forward{false};
    ThrottleReason reason{ThrottleReason::forwarded};
    // True only on the sample that moved Active -> Suppressed.
    bool entered_suppression{false};
};

class MotionThrottle
{
public:
    using clock = std::chrono::steady_clock;

    static constexpr double kStationaryThreshold = 3.0; // seconds between sample timestamps
    static constexpr std::chrono::milliseconds kCooldown{1000};

    ThrottleDecision evaluate(const RawMotion &raw, clock::time_point now)
    {
        std::scoped_lock lk(m_);
        if (suppressed_)
        {
            if (now < resume_at_)
                return {false, ThrottleReason::cooldown, false};
            // Eligible again; this sample still has to pass both checks.
            suppressed_ = false;
        }

        const auto &s = raw.sample;
        if (!raw.calibrated || !s.is_finite())
            return suppress(ThrottleReason::low_confidence, now);

        if (anchor_ && s.timestamp - *anchor_ > kStationaryThreshold)
        {
            // Re-anchor on the idle-breaking sample so fresh motion after the
            // cooldown is not judged against the stale gap again.
            anchor_ = s.timestamp;
            return suppress(ThrottleReason::stationary, now);
        }

        anchor_ = s.timestamp;
        return {true, ThrottleReason::forwarded, false};
    }

    bool suppressed() const
    {
        std::scoped_lock lk(m_);
        return suppressed_;
    }

    std::optional<double> last_sample_time() const
    {
        std::scoped_lock lk(m_);
        return anchor_;
    }

    void reset()
    {
        std::scoped_lock lk(m_);
        suppressed_ = false;
        anchor_.reset();
        resume_at_ = clock::time_point{};
    }

private:
    ThrottleDecision suppress(ThrottleReason why, clock::time_point now)
    {
        suppressed_ = true;
        resume_at_ = now + kCooldown;
        return {false, why, true};
    }

    mutable std::mutex m_;
    bool suppressed_{false};
    std::optional<double> anchor_; // last forwarded sample, or the one that tripped stationary
    clock::time_point resume_at_{};
};
