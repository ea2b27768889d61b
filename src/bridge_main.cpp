/*
 * File: src/bridge_main.cpp
 * Project: Motion Bridge
 * Purpose: Server binary: loopback WebSocket broadcast of orientation samples
 * Notes:
 *  - Bind failure is reported once; no automatic restart
 *  - --auto-port picks the next free port before start, the server never retries
 * Last updated: 2026-10-19
 */

#include <csignal>
#include <iostream>
#include <memory>
#include <boost/asio.hpp>
#include "bridge_relay.hpp"
#include "bridge_source.hpp"
#include "bridge_ws.hpp"
#include "common/bridge_config.hpp"
#include "common/motion_throttle.hpp"

static void usage(const char *prog)
{
    std::cerr << "usage: " << prog
              << " [--bind ADDR] [--port N] [--threads N] [--queue N] [--no-echo]"
                 " [--source sim|stdin] [--rate HZ] [--auto-port]\n";
}

int main(int argc, char **argv)
{
    BridgeConfig cfg;
    try
    {
        cfg = parse_args(argc, argv);
    }
    catch (const std::invalid_argument &e)
    {
        std::cerr << "ERROR: " << e.what() << "\n";
        usage(argv[0]);
        return 2;
    }

    if (cfg.auto_port && !port_available(cfg.bind_address, cfg.port))
    {
        auto next = next_available_port(cfg.bind_address, cfg.port);
        if (!next)
        {
            std::cerr << "ERROR: no free port at or above " << cfg.port << "\n";
            return 1;
        }
        std::cerr << "WARN: port " << cfg.port << " busy, using " << *next << "\n";
        cfg.port = *next;
    }

    SessionOptions opts;
    opts.max_send_queue = cfg.max_send_queue;
    opts.echo_client_messages = cfg.echo_client_messages;
    BroadcastServer server{opts, cfg.io_threads};
    server.connection_count_feed().subscribe([](std::size_t n)
                                             { std::cout << "[bridge] connected clients: " << n << "\n"; });

    try
    {
        server.start(cfg.bind_address, cfg.port);
    }
    catch (const BindError &e)
    {
        std::cerr << "ERROR: failed to start WebSocket server: " << e.what() << "\n";
        return 1;
    }

    std::unique_ptr<MotionSource> source;
    if (cfg.source == "stdin")
        source = std::make_unique<StreamMotionSource>(std::cin);
    else
        source = std::make_unique<SimulatedMotionSource>(cfg.sim_rate_hz);

    MotionThrottle throttle;
    MotionRelay relay{*source, throttle, [&server](const MotionSample &s)
                      { server.broadcast(s); }};
    relay.start();

    boost::asio::io_context signals_ioc{1};
    boost::asio::signal_set signals{signals_ioc, SIGINT, SIGTERM};
    signals.async_wait([](const boost::system::error_code &, int sig)
                       { std::cout << "[bridge] signal " << sig << ", shutting down\n"; });
    signals_ioc.run();

    relay.stop();
    server.stop();
    std::cout << "[bridge] forwarded=" << relay.forwarded() << " suppressed=" << relay.suppressed() << "\n";
    return 0;
}
