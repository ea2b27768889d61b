/*
 * File: include/common/count_feed.hpp
 * Project: Motion Bridge
 * Purpose: Observer feed for the live connection count
 * Notes:
 *  - Single writer (the client registry), any number of subscribers
 *  - Emits only on change; emissions never overlap
 * Last updated: 2026-10-19
 */

#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>

class ConnectionCountFeed
{
public:
    using Callback = std::function<void(std::size_t)>;
    using Token = std::uint64_t;

    Token subscribe(Callback cb)
    {
        std::scoped_lock lk(subs_mtx_);
        auto t = next_token_++;
        subs_.emplace(t, std::move(cb));
        return t;
    }

    void unsubscribe(Token t)
    {
        std::scoped_lock lk(subs_mtx_);
        subs_.erase(t);
    }

    std::size_t latest() const
    {
        std::scoped_lock lk(subs_mtx_);
        return latest_;
    }

    // Callbacks run on the publishing thread and must not call publish().
    void publish(std::size_t count)
    {
        std::scoped_lock emit(emit_mtx_);
        std::map<Token, Callback> subs;
        {
            std::scoped_lock lk(subs_mtx_);
            if (count == latest_)
                return;
            latest_ = count;
            subs = subs_;
        }
        for (auto &entry : subs)
            entry.second(count);
    }

private:
    std::mutex emit_mtx_;
    mutable std::mutex subs_mtx_;
    std::map<Token, Callback> subs_;
    Token next_token_{1};
    std::size_t latest_{0};
};
