/*
 * File: include/common/client_registry.hpp
 * Project: Motion Bridge
 * Purpose: Thread-safe set of live clients keyed by opaque id
 * Notes:
 *  - Registry holds weak references; the connection owns itself
 *  - A client is removed strictly before its socket is released
 * Last updated: 2026-10-19
 */

#pragma once
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>
#include "common/count_feed.hpp"

using ClientId = std::uint64_t;

inline ClientId next_client_id()
{
    static std::atomic<ClientId> seq{1};
    return seq.fetch_add(1);
}

// Send side of one connection, as seen by the broadcaster.
class Client
{
public:
    virtual ~Client() = default;
    virtual ClientId id() const = 0;
    // Silent no-op unless the connection is open.
    virtual void send(std::shared_ptr<const std::string> text) = 0;
    virtual void close() = 0;
};

class ClientRegistry
{
public:
    ClientRegistry() = default;
    explicit ClientRegistry(ConnectionCountFeed *feed) : feed_(feed) {}

    ClientRegistry(const ClientRegistry &) = delete;
    ClientRegistry &operator=(const ClientRegistry &) = delete;

    std::size_t add(const std::shared_ptr<Client> &c)
    {
        std::size_t n;
        {
            std::scoped_lock lk(mtx_);
            clients_[c->id()] = c;
            n = clients_.size();
        }
        notify();
        return n;
    }

    // Removing an absent id is a no-op: close and error paths may both get here.
    std::size_t remove(ClientId id)
    {
        std::size_t n;
        bool erased;
        {
            std::scoped_lock lk(mtx_);
            erased = clients_.erase(id) > 0;
            n = clients_.size();
        }
        if (erased)
            notify();
        return n;
    }

    std::vector<std::shared_ptr<Client>> snapshot() const
    {
        std::vector<std::shared_ptr<Client>> out;
        std::scoped_lock lk(mtx_);
        out.reserve(clients_.size());
        for (auto &entry : clients_)
        {
            if (auto c = entry.second.lock())
                out.push_back(std::move(c));
        }
        return out;
    }

    // Empties the registry and hands back whatever was still alive.
    std::vector<std::shared_ptr<Client>> clear()
    {
        std::vector<std::shared_ptr<Client>> out;
        {
            std::scoped_lock lk(mtx_);
            for (auto &entry : clients_)
            {
                if (auto c = entry.second.lock())
                    out.push_back(std::move(c));
            }
            clients_.clear();
        }
        notify();
        return out;
    }

    std::size_t count() const
    {
        std::scoped_lock lk(mtx_);
        return clients_.size();
    }

    bool contains(ClientId id) const
    {
        std::scoped_lock lk(mtx_);
        return clients_.count(id) > 0;
    }

private:
    // Count is re-read under notify_mtx_ so the last emission matches the final size.
    void notify()
    {
        if (!feed_)
            return;
        std::scoped_lock lk(notify_mtx_);
        feed_->publish(count());
    }

    mutable std::mutex mtx_;
    std::mutex notify_mtx_;
    std::unordered_map<ClientId, std::weak_ptr<Client>> clients_;
    ConnectionCountFeed *feed_ = nullptr;
};
