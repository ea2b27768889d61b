/*
 * File: src/bridge_state.hpp
 * Project: Motion Bridge
 * Purpose: State shared between the server and its connections
 * Notes:
 *  - Owned by BroadcastServer; connections hold a plain reference
 *  - handshakes tracks sockets that have not upgraded yet so stop() can reach them
 * Last updated: 2026-10-19
 */

#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include "common/client_registry.hpp"
#include "common/count_feed.hpp"

struct SessionOptions
{
    std::size_t max_send_queue{256};
    bool echo_client_messages{true};
};

struct BridgeState
{
    ConnectionCountFeed count_feed;
    ClientRegistry clients{&count_feed}; // upgraded, Open connections
    ClientRegistry handshakes;           // accepted, not yet upgraded
    SessionOptions options;
    std::chrono::steady_clock::time_point start = std::chrono::steady_clock::now();
    std::atomic<std::size_t> dropped_frames{0};

    // Every accepted socket, whatever its state, until its close path has run.
    std::mutex live_mtx;
    std::condition_variable live_cv;
    std::size_t live_sessions{0};

    void session_opened()
    {
        std::scoped_lock lk(live_mtx);
        ++live_sessions;
    }

    void session_finished()
    {
        {
            std::scoped_lock lk(live_mtx);
            if (live_sessions > 0)
                --live_sessions;
        }
        live_cv.notify_all();
    }

    bool wait_sessions_idle(std::chrono::milliseconds limit)
    {
        std::unique_lock lk(live_mtx);
        return live_cv.wait_for(lk, limit, [this]
                                { return live_sessions == 0; });
    }
};
