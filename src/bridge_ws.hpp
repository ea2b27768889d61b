/*
 * File: src/bridge_ws.hpp
 * Project: Motion Bridge
 * Purpose: WebSocket broadcast server and per-connection protocol handling
 * Notes:
 *  - One accept strand plus N worker threads on a shared io_context
 *  - Each connection owns a strand and an ordered outbound queue
 *  - Ping/pong and close echo are answered by Beast itself
 * Last updated: 2026-10-19
 */

#pragma once
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/asio.hpp>
#include <boost/asio/strand.hpp>

#include <atomic>
#include <chrono>
#include <future>
#include <iostream>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "bridge_http.hpp"
#include "bridge_state.hpp"
#include "common/motion_sample.hpp"
#include "common/send_queue.hpp"

namespace beast = boost::beast;
namespace net = boost::asio;
namespace websocket = boost::beast::websocket;
using tcp = boost::asio::ip::tcp;

enum class ConnectionState
{
    connecting,
    open,
    closing,
    closed
};

// Start() could not get a listening socket. The server stays stopped.
class BindError : public std::runtime_error
{
public:
    BindError(const std::string &what, boost::system::error_code ec)
        : std::runtime_error(what + ": " + ec.message()), code_(ec) {}

    boost::system::error_code code() const { return code_; }

private:
    boost::system::error_code code_;
};

// Upgrade requests must carry a key and protocol version 13.
inline bool acceptable_upgrade(const http::request<http::string_body> &req)
{
    if (!websocket::is_upgrade(req))
        return false;
    return !req[http::field::sec_websocket_key].empty() &&
           req[http::field::sec_websocket_version] == "13";
}

class Session : public Client, public std::enable_shared_from_this<Session>
{
public:
    Session(tcp::socket &&s, BridgeState &st)
        : ex_(s.get_executor()), stream_(std::move(s)), state_(st), id_(next_client_id()),
          queue_(st.options.max_send_queue)
    {
        state_.session_opened();
    }

    ~Session() override
    {
        if (!finished_)
            state_.session_finished();
    }

    ClientId id() const override { return id_; }

    ConnectionState state() const { return conn_state_.load(); }

    void run()
    {
        state_.handshakes.add(shared_from_this());
        net::dispatch(ex_, [self = shared_from_this()]
                      { self->do_read_request(); });
    }

    void send(std::shared_ptr<const std::string> text) override
    {
        if (conn_state_.load() != ConnectionState::open)
            return;
        net::post(ex_, [self = shared_from_this(), text = std::move(text)]() mutable
                  { self->enqueue(Outbound{std::move(text), true}); });
    }

    // Abrupt close; safe from any thread.
    void close() override
    {
        auto cur = conn_state_.load();
        while (cur != ConnectionState::closed &&
               !conn_state_.compare_exchange_weak(cur, ConnectionState::closing))
        {
        }
        net::post(ex_, [self = shared_from_this()]
                  { self->finish("closed by server"); });
    }

private:
    struct Outbound
    {
        std::shared_ptr<const std::string> data;
        bool text;
    };

    // -------- HTTP phase --------

    void do_read_request()
    {
        if (finished_)
            return;
        req_ = {};
        stream_.expires_after(std::chrono::seconds(30));
        auto self = shared_from_this();
        http::async_read(stream_, buffer_, req_, [self](beast::error_code ec, std::size_t)
                         { self->on_read_request(ec); });
    }

    void on_read_request(beast::error_code ec)
    {
        if (ec || finished_)
            return finish("");

        if (acceptable_upgrade(req_))
            return do_upgrade();

        if (websocket::is_upgrade(req_))
        {
            std::cerr << "WARN: [ws] rejected malformed upgrade for " << req_.target() << "\n";
            return respond(not_found_response(req_.version(), false));
        }
        respond(handle_plain_request(req_, state_));
    }

    void respond(http::response<http::string_body> &&res)
    {
        auto self = shared_from_this();
        auto sp = std::make_shared<http::response<http::string_body>>(std::move(res));
        http::async_write(stream_, *sp, [self, sp](beast::error_code ec, std::size_t)
                          {
            if (ec || !sp->keep_alive())
            {
                beast::error_code ignored;
                self->stream_.socket().shutdown(tcp::socket::shutdown_send, ignored);
                return self->finish("");
            }
            self->do_read_request(); });
    }

    // -------- WebSocket phase --------

    void do_upgrade()
    {
        stream_.expires_never();
        ws_.emplace(std::move(stream_));
        // Consumers rarely send anything, so the server pings to keep them from idling out.
        auto timeouts = websocket::stream_base::timeout::suggested(beast::role_type::server);
        timeouts.keep_alive_pings = true;
        ws_->set_option(timeouts);
        ws_->set_option(websocket::stream_base::decorator([](websocket::response_type &res)
                                                          { res.set(http::field::server, kServerName); }));
        ws_->control_callback([this](websocket::frame_type kind, beast::string_view)
                              {
            if (kind == websocket::frame_type::close)
            {
                auto expected = ConnectionState::open;
                conn_state_.compare_exchange_strong(expected, ConnectionState::closing);
            } });

        auto self = shared_from_this();
        ws_->async_accept(req_, [self](beast::error_code ec)
                          { self->on_accept(ec); });
    }

    void on_accept(beast::error_code ec)
    {
        if (ec)
            return finish("handshake failed: " + ec.message());

        auto expected = ConnectionState::connecting;
        if (finished_ || !conn_state_.compare_exchange_strong(expected, ConnectionState::open))
            return finish("");

        // Join clients before leaving handshakes so stop() always sweeps this session.
        auto n = state_.clients.add(shared_from_this());
        registered_ = true;
        state_.handshakes.remove(id_);
        std::cout << "[ws] client " << id_ << " connected (total: " << n << ")\n";
        do_read();
    }

    void do_read()
    {
        auto self = shared_from_this();
        ws_->async_read(buffer_, [self](beast::error_code ec, std::size_t)
                        { self->on_read(ec); });
    }

    void on_read(beast::error_code ec)
    {
        if (ec == websocket::error::closed)
            return finish("closed by peer");
        if (ec)
            return finish(ec.message());

        if (state_.options.echo_client_messages)
        {
            auto msg = std::make_shared<const std::string>(beast::buffers_to_string(buffer_.data()));
            enqueue(Outbound{std::move(msg), ws_->got_text()});
        }
        buffer_.consume(buffer_.size());
        do_read();
    }

    void enqueue(Outbound m)
    {
        if (finished_ || conn_state_.load() != ConnectionState::open)
            return;
        switch (queue_.push(std::move(m)))
        {
        case PushResult::started:
            do_write();
            break;
        case PushResult::queued:
            break;
        case PushResult::overflow_began:
            std::cerr << "WARN: [ws] client " << id_ << " is not keeping up; dropping frames\n";
            ++state_.dropped_frames;
            break;
        case PushResult::dropped:
            ++state_.dropped_frames;
            break;
        }
    }

    void do_write()
    {
        auto self = shared_from_this();
        ws_->text(queue_.front().text);
        ws_->async_write(net::buffer(*queue_.front().data), [self](beast::error_code ec, std::size_t)
                         { self->on_write(ec); });
    }

    void on_write(beast::error_code ec)
    {
        if (finished_)
            return;
        if (ec)
            return finish("write failed: " + ec.message());
        queue_.pop();
        if (!queue_.empty())
            do_write();
    }

    // Single exit for every path into Closed. Deregisters before the socket goes away.
    void finish(const std::string &why)
    {
        conn_state_.store(ConnectionState::closed);
        if (finished_)
            return;
        finished_ = true;

        state_.handshakes.remove(id_);
        if (registered_)
        {
            auto n = state_.clients.remove(id_);
            std::cout << "[ws] client " << id_ << " disconnected (" << why << ", total: " << n << ")\n";
        }
        queue_.clear();

        if (ws_)
            beast::get_lowest_layer(*ws_).close();
        else
            stream_.close();
        state_.session_finished();
    }

    tcp::socket::executor_type ex_;
    beast::tcp_stream stream_; // moved into ws_ on upgrade
    std::optional<websocket::stream<beast::tcp_stream>> ws_;
    beast::flat_buffer buffer_;
    http::request<http::string_body> req_;
    BridgeState &state_;
    const ClientId id_;
    std::atomic<ConnectionState> conn_state_{ConnectionState::connecting};

    // Touched only on the connection's strand.
    BoundedSendQueue<Outbound> queue_;
    bool registered_{false};
    bool finished_{false};
};

class BroadcastServer
{
public:
    explicit BroadcastServer(SessionOptions opts = {}, std::size_t io_threads = 2)
        : accept_strand_(net::make_strand(ioc_)), acceptor_(accept_strand_),
          io_threads_(io_threads == 0 ? 1 : io_threads)
    {
        state_.options = opts;
    }

    ~BroadcastServer() { stop(); }

    BroadcastServer(const BroadcastServer &) = delete;
    BroadcastServer &operator=(const BroadcastServer &) = delete;

    // Port 0 binds an ephemeral port; see port(). Throws BindError.
    void start(const std::string &address, unsigned short port)
    {
        std::unique_lock lk(lifecycle_mtx_);
        if (running_)
        {
            std::cerr << "WARN: [ws] server already running on port " << port_ << "\n";
            return;
        }

        boost::system::error_code ec;
        auto addr = net::ip::make_address(address, ec);
        if (ec)
            throw BindError("bad bind address '" + address + "'", ec);

        tcp::endpoint ep{addr, port};
        acceptor_.open(ep.protocol(), ec);
        if (!ec)
            acceptor_.set_option(net::socket_base::reuse_address(true), ec);
        if (!ec)
            acceptor_.bind(ep, ec);
        if (!ec)
            acceptor_.listen(net::socket_base::max_listen_connections, ec);
        if (ec)
        {
            boost::system::error_code ignored;
            acceptor_.close(ignored);
            throw BindError("cannot listen on " + address + ":" + std::to_string(port), ec);
        }
        port_ = acceptor_.local_endpoint().port();
        state_.start = std::chrono::steady_clock::now();

        ioc_.restart();
        work_.emplace(net::make_work_guard(ioc_));
        running_ = true;
        do_accept();
        for (std::size_t i = 0; i < io_threads_; ++i)
            threads_.emplace_back([this]
                                  { run_worker(); });
        std::cout << "[ws] listening on ws://" << address << ":" << port_ << "/\n";
    }

    // Must not be called from a worker thread or from a count subscriber.
    void stop()
    {
        std::unique_lock lk(lifecycle_mtx_);
        if (!running_)
            return;
        running_ = false;

        // Close the listener on its own strand so no accept handler is mid-flight.
        std::promise<void> listener_closed;
        auto done = listener_closed.get_future();
        net::post(accept_strand_, [this, &listener_closed]
                  {
            boost::system::error_code ignored;
            acceptor_.close(ignored);
            listener_closed.set_value(); });
        done.wait();

        auto pending = state_.handshakes.clear();
        auto open = state_.clients.clear();
        for (auto &c : pending)
            c->close();
        for (auto &c : open)
            c->close();
        if (!state_.wait_sessions_idle(std::chrono::seconds(2)))
            std::cerr << "WARN: [ws] connections still draining at stop\n";

        work_.reset();
        ioc_.stop();
        for (auto &t : threads_)
        {
            if (t.joinable())
                t.join();
        }
        threads_.clear();
        std::cout << "[ws] server stopped\n";
    }

    // Encodes once and hands the same frame to every open client.
    void broadcast(const MotionSample &sample)
    {
        std::shared_lock lk(lifecycle_mtx_);
        if (!running_ || state_.clients.count() == 0)
            return;

        std::shared_ptr<const std::string> frame;
        try
        {
            frame = std::make_shared<const std::string>(encode_sample(sample));
        }
        catch (const std::domain_error &e)
        {
            std::cerr << "WARN: [ws] skipped broadcast: " << e.what() << "\n";
            return;
        }
        for (auto &c : state_.clients.snapshot())
            c->send(frame);
    }

    std::size_t connection_count() const { return state_.clients.count(); }

    // Frames dropped across all connections because a send queue was full.
    std::size_t dropped_frames() const { return state_.dropped_frames.load(); }

    ConnectionCountFeed &connection_count_feed() { return state_.count_feed; }

    bool running() const { return running_.load(); }

    unsigned short port() const { return port_; }

private:
    void run_worker()
    {
        for (;;)
        {
            try
            {
                ioc_.run();
                return;
            }
            catch (const std::exception &e)
            {
                std::cerr << "ERROR: [ws] worker: " << e.what() << "\n";
            }
        }
    }

    void do_accept()
    {
        acceptor_.async_accept(net::make_strand(ioc_), [this](beast::error_code ec, tcp::socket socket)
                               { on_accept(ec, std::move(socket)); });
    }

    void on_accept(beast::error_code ec, tcp::socket socket)
    {
        if (ec == net::error::operation_aborted || !acceptor_.is_open())
            return;
        if (!running_)
        {
            boost::system::error_code ignored;
            socket.close(ignored);
            return;
        }
        if (ec)
            std::cerr << "WARN: [ws] accept: " << ec.message() << "\n";
        else
        {
            boost::system::error_code ignored;
            socket.set_option(tcp::no_delay(true), ignored);
            std::make_shared<Session>(std::move(socket), state_)->run();
        }
        do_accept();
    }

    BridgeState state_; // outlives the io_context so late handler teardown is safe
    net::io_context ioc_;
    net::strand<net::io_context::executor_type> accept_strand_;
    tcp::acceptor acceptor_;
    std::optional<net::executor_work_guard<net::io_context::executor_type>> work_;
    std::vector<std::thread> threads_;
    std::size_t io_threads_;
    std::shared_mutex lifecycle_mtx_;
    std::atomic<bool> running_{false};
    unsigned short port_{0};
};
