/*
 * File: include/common/bridge_config.hpp
 * Project: Motion Bridge
 * Purpose: Runtime configuration, port helpers and client endpoint parsing
 * Notes:
 *  - Built once from argv and injected; nothing reads process-wide state later
 *  - Fallback port selection lives here, never inside the server
 * Last updated: 2026-10-19
 */

#pragma once
#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <boost/asio.hpp>

constexpr unsigned short kDefaultPort = 17604;

struct BridgeConfig
{
    std::string bind_address{"127.0.0.1"};
    unsigned short port{kDefaultPort};
    std::size_t io_threads{2};
    std::size_t max_send_queue{256}; // frames per client
    bool echo_client_messages{true};
    std::string source{"sim"}; // sim | stdin
    double sim_rate_hz{60.0};
    bool auto_port{false};
};

inline bool is_valid_port(long port)
{
    return port >= 1024 && port <= 65535;
}

namespace detail
{
    inline long parse_long(const std::string &flag, const std::string &v)
    {
        try
        {
            std::size_t used = 0;
            long n = std::stol(v, &used);
            if (used != v.size())
                throw std::invalid_argument(v);
            return n;
        }
        catch (const std::logic_error &)
        {
            throw std::invalid_argument(flag + ": not an integer: '" + v + "'");
        }
    }

    inline double parse_double(const std::string &flag, const std::string &v)
    {
        try
        {
            std::size_t used = 0;
            double d = std::stod(v, &used);
            if (used != v.size())
                throw std::invalid_argument(v);
            return d;
        }
        catch (const std::logic_error &)
        {
            throw std::invalid_argument(flag + ": not a number: '" + v + "'");
        }
    }
}

inline BridgeConfig parse_args(int argc, const char *const *argv)
{
    BridgeConfig cfg;
    for (int i = 1; i < argc; ++i)
    {
        std::string a = argv[i];
        auto value = [&]() -> std::string
        {
            if (i + 1 >= argc)
                throw std::invalid_argument(a + ": missing value");
            return argv[++i];
        };

        if (a == "--bind")
        {
            cfg.bind_address = value();
            boost::system::error_code ec;
            boost::asio::ip::make_address(cfg.bind_address, ec);
            if (ec)
                throw std::invalid_argument("--bind: bad address '" + cfg.bind_address + "'");
        }
        else if (a == "--port")
        {
            long p = detail::parse_long(a, value());
            if (!is_valid_port(p))
                throw std::invalid_argument("--port: " + std::to_string(p) + " outside 1024-65535");
            cfg.port = static_cast<unsigned short>(p);
        }
        else if (a == "--threads")
        {
            long n = detail::parse_long(a, value());
            if (n < 1 || n > 64)
                throw std::invalid_argument("--threads: must be 1-64");
            cfg.io_threads = static_cast<std::size_t>(n);
        }
        else if (a == "--queue")
        {
            long n = detail::parse_long(a, value());
            if (n < 1)
                throw std::invalid_argument("--queue: must be positive");
            cfg.max_send_queue = static_cast<std::size_t>(n);
        }
        else if (a == "--rate")
        {
            double r = detail::parse_double(a, value());
            if (!(r > 0.0 && r <= 1000.0))
                throw std::invalid_argument("--rate: must be in (0, 1000] Hz");
            cfg.sim_rate_hz = r;
        }
        else if (a == "--source")
        {
            cfg.source = value();
            if (cfg.source != "sim" && cfg.source != "stdin")
                throw std::invalid_argument("--source: expected 'sim' or 'stdin'");
        }
        else if (a == "--no-echo")
            cfg.echo_client_messages = false;
        else if (a == "--auto-port")
            cfg.auto_port = true;
        else
            throw std::invalid_argument("unknown option: " + a);
    }
    return cfg;
}

// True if a listening socket could be bound at address:port right now.
inline bool port_available(const std::string &address, unsigned short port)
{
    boost::asio::io_context ioc;
    boost::asio::ip::tcp::acceptor trial(ioc);
    boost::system::error_code ec;
    auto addr = boost::asio::ip::make_address(address, ec);
    if (ec)
        return false;
    boost::asio::ip::tcp::endpoint ep{addr, port};
    trial.open(ep.protocol(), ec);
    if (ec)
        return false;
    trial.set_option(boost::asio::socket_base::reuse_address(true), ec);
    trial.bind(ep, ec);
    if (!ec)
        trial.listen(boost::asio::socket_base::max_listen_connections, ec);
    boost::system::error_code ignored;
    trial.close(ignored);
    return !ec;
}

inline std::optional<unsigned short> next_available_port(const std::string &address, unsigned short start)
{
    for (unsigned long p = start; p <= 65535; ++p)
    {
        if (port_available(address, static_cast<unsigned short>(p)))
            return static_cast<unsigned short>(p);
    }
    return std::nullopt;
}

// Where a consumer connects: ws://HOST[:PORT][/TARGET].
struct WsEndpoint
{
    std::string host{"127.0.0.1"};
    unsigned short port{kDefaultPort};
    std::string target{"/"};

    std::string authority() const { return host + ":" + std::to_string(port); }
};

// Only the ws scheme is served. Port defaults to the bridge's default port.
inline WsEndpoint parse_ws_endpoint(const std::string &url)
{
    const std::string scheme = "ws://";
    if (url.compare(0, scheme.size(), scheme) != 0)
        throw std::invalid_argument("expected a ws:// URL, got '" + url + "'");

    WsEndpoint ep;
    std::string authority = url.substr(scheme.size());
    if (auto slash = authority.find('/'); slash != std::string::npos)
    {
        ep.target = authority.substr(slash);
        authority.resize(slash);
    }
    if (auto colon = authority.rfind(':'); colon != std::string::npos)
    {
        long p = detail::parse_long("port", authority.substr(colon + 1));
        if (p < 1 || p > 65535)
            throw std::invalid_argument("port out of range in '" + url + "'");
        ep.port = static_cast<unsigned short>(p);
        authority.resize(colon);
    }
    if (authority.empty())
        throw std::invalid_argument("missing host in '" + url + "'");
    ep.host = authority;
    return ep;
}
