/*
 * File: clients/motion_client/motion_client_main.cpp
 * Project: Motion Bridge
 * Purpose: Example WebSocket consumer printing orientation in degrees
 * Notes:
 *  - Frames that do not decode as a motion sample are printed raw
 * Last updated: 2026-10-19
 */

#include <iomanip>
#include <iostream>
#include <string>
#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>
#include "common/bridge_config.hpp"
#include "common/motion_sample.hpp"

namespace websocket = boost::beast::websocket;

int main(int argc, char **argv)
{
    WsEndpoint endpoint;
    long count = 0; // 0 = until the server closes
    try
    {
        for (int i = 1; i < argc; ++i)
        {
            std::string a = argv[i];
            if (a == "--ws" && i + 1 < argc)
                endpoint = parse_ws_endpoint(argv[++i]);
            else if (a == "--count" && i + 1 < argc)
                count = detail::parse_long(a, argv[++i]);
            else
                throw std::invalid_argument("unknown option: " + a);
        }
    }
    catch (const std::invalid_argument &e)
    {
        std::cerr << "motion_client: " << e.what() << "\n"
                  << "usage: " << argv[0] << " [--ws ws://HOST:PORT/] [--count N]\n";
        return 2;
    }

    try
    {
        boost::asio::io_context ioc;
        boost::asio::ip::tcp::resolver res{ioc};
        auto const results = res.resolve(endpoint.host, std::to_string(endpoint.port));
        boost::asio::ip::tcp::socket sock{ioc};
        boost::asio::connect(sock, results.begin(), results.end());
        websocket::stream<boost::asio::ip::tcp::socket> ws{std::move(sock)};
        ws.handshake(endpoint.authority(), endpoint.target);
        std::cerr << "motion_client: connected to ws://" << endpoint.authority() << endpoint.target << "\n";

        boost::beast::flat_buffer buf;
        std::cout << std::fixed << std::setprecision(1);
        for (long n = 0; count == 0 || n < count; ++n)
        {
            ws.read(buf);
            auto s = boost::beast::buffers_to_string(buf.data());
            buf.consume(buf.size());
            try
            {
                auto m = decode_sample(s);
                std::cout << "t=" << std::setprecision(3) << m.timestamp << std::setprecision(1)
                          << " pitch=" << m.pitch_degrees() << " yaw=" << m.yaw_degrees()
                          << " roll=" << m.roll_degrees() << "\n";
            }
            catch (const std::invalid_argument &)
            {
                std::cout << "raw: " << s << "\n";
            }
        }
        ws.close(websocket::close_code::normal);
        return 0;
    }
    catch (const boost::system::system_error &e)
    {
        if (e.code() == websocket::error::closed)
            return 0;
        std::cerr << "motion_client error: " << e.what() << "\n";
        return 1;
    }
    catch (const std::exception &e)
    {
        std::cerr << "motion_client error: " << e.what() << "\n";
        return 1;
    }
}
