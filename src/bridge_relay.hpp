/*
 * File: src/bridge_relay.hpp
 * Project: Motion Bridge
 * Purpose: Source -> throttle -> sink wiring
 * Notes:
 *  - Runs on the source's callback thread
 *  - Sink is normally BroadcastServer::broadcast
 * Last updated: 2026-10-19
 */

#pragma once
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <iostream>

#include "bridge_source.hpp"
#include "common/motion_throttle.hpp"

class MotionRelay
{
public:
    using Sink = std::function<void(const MotionSample &)>;
    using Clock = std::function<MotionThrottle::clock::time_point()>;

    MotionRelay(MotionSource &source, MotionThrottle &throttle, Sink sink,
                Clock now = []
                { return MotionThrottle::clock::now(); })
        : source_(source), throttle_(throttle), sink_(std::move(sink)), now_(std::move(now)) {}

    ~MotionRelay() { stop(); }

    void start()
    {
        throttle_.reset();
        saving_ = false;
        source_.start([this](const RawMotion &raw)
                      { on_sample(raw); });
    }

    void stop() { source_.stop(); }

    // Directly usable by sources that are driven from outside.
    void on_sample(const RawMotion &raw)
    {
        auto d = throttle_.evaluate(raw, now_());
        if (!d.forward)
        {
            ++suppressed_;
            if (d.entered_suppression && !saving_.exchange(true))
                std::cout << "[relay] entering energy saving mode (" << to_string(d.reason) << ")\n";
            return;
        }
        if (saving_.exchange(false))
            std::cout << "[relay] motion resumed\n";
        ++forwarded_;
        sink_(raw.sample);
    }

    std::uint64_t forwarded() const { return forwarded_.load(); }
    std::uint64_t suppressed() const { return suppressed_.load(); }

private:
    MotionSource &source_;
    MotionThrottle &throttle_;
    Sink sink_;
    Clock now_;
    std::atomic<bool> saving_{false};
    std::atomic<std::uint64_t> forwarded_{0};
    std::atomic<std::uint64_t> suppressed_{0};
};
