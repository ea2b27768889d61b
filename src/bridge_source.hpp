/*
 * File: src/bridge_source.hpp
 * Project: Motion Bridge
 * Purpose: Orientation sample producers feeding the relay
 * Notes:
 *  - Sources push on their own thread; the core never polls them
 *  - The headphone driver is external; SimulatedMotionSource stands in for it
 * Last updated: 2026-10-19
 */

#pragma once
#include <atomic>
#include <chrono>
#include <cmath>
#include <functional>
#include <iostream>
#include <istream>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include <nlohmann/json.hpp>

#include "common/motion_sample.hpp"

class MotionSource
{
public:
    using Callback = std::function<void(const RawMotion &)>;

    virtual ~MotionSource() = default;
    // Restartable: start() after stop() begins a fresh sequence.
    virtual void start(Callback cb) = 0;
    virtual void stop() = 0;
};

inline double monotonic_seconds()
{
    using namespace std::chrono;
    return duration<double>(steady_clock::now().time_since_epoch()).count();
}

// Smooth synthetic head motion: slow yaw sweep with a little nodding.
class SimulatedMotionSource : public MotionSource
{
public:
    explicit SimulatedMotionSource(double rate_hz = 60.0) : rate_hz_(rate_hz) {}

    ~SimulatedMotionSource() override { stop(); }

    void start(Callback cb) override
    {
        std::scoped_lock lk(m_);
        if (worker_.joinable())
            return;
        running_ = true;
        worker_ = std::thread([this, cb = std::move(cb)]
                              { loop(cb); });
        std::cout << "[source] simulated motion at " << rate_hz_ << " Hz\n";
    }

    void stop() override
    {
        std::scoped_lock lk(m_);
        running_ = false;
        if (worker_.joinable())
            worker_.join();
    }

private:
    void loop(const Callback &cb)
    {
        const auto period = std::chrono::duration_cast<std::chrono::steady_clock::duration>(
            std::chrono::duration<double>(1.0 / rate_hz_));
        const double t0 = monotonic_seconds();
        auto next = std::chrono::steady_clock::now();
        while (running_)
        {
            double t = monotonic_seconds();
            double dt = t - t0;
            RawMotion raw;
            raw.sample.yaw = 0.6 * std::sin(0.5 * dt);
            raw.sample.pitch = 0.15 * std::sin(1.3 * dt);
            raw.sample.roll = 0.05 * std::sin(0.7 * dt);
            raw.sample.timestamp = t;
            cb(raw);
            next += period;
            std::this_thread::sleep_until(next);
        }
    }

    double rate_hz_;
    std::mutex m_;
    std::atomic<bool> running_{false};
    std::thread worker_;
};

// One JSON object per line: {"pitch","yaw","roll","timestamp","calibrated"?}.
// Missing timestamp defaults to the local monotonic clock.
// A single reader thread owns the stream for the source's lifetime; start() and
// stop() only attach and detach the callback. Lines read while stopped are dropped.
// The stream must outlive the reader (until drained() or process exit).
class StreamMotionSource : public MotionSource
{
public:
    explicit StreamMotionSource(std::istream &in) : shared_(std::make_shared<Shared>(in)) {}

    ~StreamMotionSource() override { stop(); }

    void start(Callback cb) override
    {
        std::scoped_lock lk(shared_->cb_mtx);
        shared_->cb = std::move(cb);
        if (reader_started_)
            return;
        reader_started_ = true;
        std::thread([shared = shared_]
                    { loop(*shared); })
            .detach();
    }

    // Waits out a callback in progress; nothing is delivered after this returns.
    void stop() override
    {
        std::scoped_lock lk(shared_->cb_mtx);
        shared_->cb = nullptr;
    }

    // True once the reader hit end of input.
    bool drained() const { return shared_->done.load(); }

    static bool parse_line(const std::string &line, RawMotion &out)
    {
        auto j = nlohmann::json::parse(line, nullptr, false);
        if (j.is_discarded() || !j.is_object())
            return false;
        if (!j.contains("timestamp"))
            j["timestamp"] = monotonic_seconds();
        try
        {
            out.sample = sample_from_json(j);
        }
        catch (const std::invalid_argument &)
        {
            return false;
        }
        auto c = j.find("calibrated");
        out.calibrated = (c == j.end()) || (c->is_boolean() && c->get<bool>());
        return true;
    }

private:
    struct Shared
    {
        explicit Shared(std::istream &s) : in(s) {}
        std::istream &in;
        std::mutex cb_mtx; // held while delivering
        Callback cb;
        std::atomic<bool> done{false};
    };

    static void loop(Shared &sh)
    {
        std::string line;
        std::size_t lineno = 0;
        while (std::getline(sh.in, line))
        {
            ++lineno;
            if (line.empty())
                continue;
            RawMotion raw;
            if (!parse_line(line, raw))
            {
                std::cerr << "WARN: [source] skipping malformed line " << lineno << "\n";
                continue;
            }
            std::scoped_lock lk(sh.cb_mtx);
            if (sh.cb)
                sh.cb(raw);
        }
        sh.done = true;
    }

    std::shared_ptr<Shared> shared_;
    bool reader_started_{false}; // guarded by shared_->cb_mtx
};
