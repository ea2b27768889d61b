/*
 * File: src/bridge_http.hpp
 * Project: Motion Bridge
 * Purpose: Responses for plain HTTP requests that do not ask for an upgrade
 * Notes:
 *  - GET /health returns JSON with the live client count
 *  - Everything else is 404 with a short plain-text body
 * Last updated: 2026-10-19
 */

#pragma once
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <string>

#include "bridge_state.hpp"

namespace http = boost::beast::http;

constexpr const char *kServerName = "motion-bridge";
constexpr const char *kNotFoundBody = "WebSocket endpoint available at /";

inline http::response<http::string_body> not_found_response(unsigned version, bool keep_alive)
{
    http::response<http::string_body> res{http::status::not_found, version};
    res.set(http::field::server, kServerName);
    res.set(http::field::content_type, "text/plain");
    res.keep_alive(keep_alive);
    res.body() = kNotFoundBody;
    res.prepare_payload();
    return res;
}

inline http::response<http::string_body> handle_plain_request(const http::request<http::string_body> &req,
                                                             const BridgeState &state)
{
    using nlohmann::json;

    // GET /health
    if (req.method() == http::verb::get && req.target() == "/health")
    {
        auto up = std::chrono::duration<double>(std::chrono::steady_clock::now() - state.start).count();
        http::response<http::string_body> res{http::status::ok, req.version()};
        res.set(http::field::server, kServerName);
        res.set(http::field::content_type, "application/json");
        res.keep_alive(req.keep_alive());
        res.body() = json{{"status", "ok"}, {"clients", state.clients.count()}, {"uptime_s", up}}.dump();
        res.prepare_payload();
        return res;
    }

    // 404 fallback
    return not_found_response(req.version(), req.keep_alive());
}
