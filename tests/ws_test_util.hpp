/*
 * File: tests/ws_test_util.hpp
 * Project: Motion Bridge
 * Purpose: Loopback WebSocket/HTTP clients with timeouts for integration tests
 * Last updated: 2026-10-19
 */

#pragma once
#include <chrono>
#include <functional>
#include <string>
#include <thread>
#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>

namespace test_util
{
    namespace beast = boost::beast;
    namespace net = boost::asio;
    namespace http = boost::beast::http;
    namespace websocket = boost::beast::websocket;
    using tcp = boost::asio::ip::tcp;
    using namespace std::chrono_literals;

    inline bool wait_until(const std::function<bool()> &pred,
                           std::chrono::milliseconds limit = 3000ms)
    {
        auto deadline = std::chrono::steady_clock::now() + limit;
        while (std::chrono::steady_clock::now() < deadline)
        {
            if (pred())
                return true;
            std::this_thread::sleep_for(5ms);
        }
        return pred();
    }

    inline tcp::endpoint loopback(unsigned short port)
    {
        return {net::ip::make_address("127.0.0.1"), port};
    }

    class WsClient
    {
    public:
        explicit WsClient(unsigned short port, const std::string &target = "/")
        {
            beast::get_lowest_layer(ws).connect(loopback(port));
            ws.handshake("127.0.0.1:" + std::to_string(port), target);
            ws.control_callback([this](websocket::frame_type kind, beast::string_view payload)
                                {
                if (kind == websocket::frame_type::pong)
                    last_pong = std::string(payload); });
        }

        // False on timeout or any read error (including the server closing).
        bool read_text(std::string &out, std::chrono::milliseconds limit = 2000ms)
        {
            beast::flat_buffer b;
            beast::error_code result = net::error::timed_out;
            beast::get_lowest_layer(ws).expires_after(limit);
            ws.async_read(b, [&](beast::error_code ec, std::size_t)
                          { result = ec; });
            ioc.restart();
            ioc.run();
            if (result)
                return false;
            out = beast::buffers_to_string(b.data());
            return true;
        }

        void send_text(const std::string &s)
        {
            ws.text(true);
            ws.write(net::buffer(s));
        }

        // Drops the TCP connection without a close handshake.
        void kill()
        {
            beast::error_code ignored;
            beast::get_lowest_layer(ws).socket().shutdown(tcp::socket::shutdown_both, ignored);
            beast::get_lowest_layer(ws).close();
        }

        net::io_context ioc;
        websocket::stream<beast::tcp_stream> ws{ioc};
        std::string last_pong;
    };

    inline http::response<http::string_body> http_request(unsigned short port, http::request<http::string_body> req)
    {
        net::io_context ioc;
        beast::tcp_stream stream{ioc};
        stream.connect(loopback(port));
        req.set(http::field::host, "127.0.0.1:" + std::to_string(port));
        req.keep_alive(false);
        req.prepare_payload();
        http::write(stream, req);
        beast::flat_buffer buf;
        http::response<http::string_body> res;
        http::read(stream, buf, res);
        beast::error_code ignored;
        stream.socket().shutdown(tcp::socket::shutdown_both, ignored);
        return res;
    }

    inline http::response<http::string_body> http_get(unsigned short port, const std::string &target)
    {
        return http_request(port, http::request<http::string_body>{http::verb::get, target, 11});
    }
}
