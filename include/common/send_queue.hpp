/*
 * File: include/common/send_queue.hpp
 * Project: Motion Bridge
 * Purpose: Bounded per-connection outbound frame queue
 * Notes:
 *  - Not synchronized; each connection touches its queue only on its own strand
 *  - A full queue drops the new frame; queued frames keep their order
 * Last updated: 2026-10-19
 */

#pragma once
#include <cstddef>
#include <deque>
#include <utility>

enum class PushResult
{
    started,         // queue was empty; caller starts a write
    queued,          // a write is already in flight
    overflow_began,  // dropped; first drop since the queue last had room
    dropped          // dropped during an ongoing overflow
};

template <typename T>
class BoundedSendQueue
{
public:
    explicit BoundedSendQueue(std::size_t limit) : limit_(limit) {}

    PushResult push(T item)
    {
        if (items_.size() >= limit_)
        {
            ++dropped_;
            if (overflowing_)
                return PushResult::dropped;
            overflowing_ = true;
            return PushResult::overflow_began;
        }
        items_.push_back(std::move(item));
        return items_.size() == 1 ? PushResult::started : PushResult::queued;
    }

    T &front() { return items_.front(); }

    void pop()
    {
        items_.pop_front();
        if (items_.size() < limit_)
            overflowing_ = false;
    }

    void clear() { items_.clear(); }

    bool empty() const { return items_.empty(); }
    std::size_t size() const { return items_.size(); }
    std::size_t limit() const { return limit_; }
    std::size_t dropped() const { return dropped_; }
    bool overflowing() const { return overflowing_; }

private:
    std::deque<T> items_;
    std::size_t limit_;
    std::size_t dropped_{0};
    bool overflowing_{false};
};
