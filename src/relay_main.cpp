/*
 * File: src/relay_main.cpp
 * Project: TAIS Track Relay
 * Purpose: Main server binary: HTTP /v1/tais/* endpoints, WS fan-out, timers
 * Notes:
 *  - State is in-memory only; nothing survives a restart
 *  - Outbound frames go through bounded per-client queues
 * Last updated: 2026-10-18
 */

#include <csignal>
#include <iostream>
#include <stdexcept>
#include <thread>
#include <vector>
#include <boost/asio.hpp>
#include <boost/asio/signal_set.hpp>
#include "relay_http.hpp"
#include "relay_state.hpp"
#include "relay_timers.hpp"
#include "relay_ws.hpp"

int main(int argc, char **argv)
{
    RelayConfig config;
    try
    {
        config = parse_args(argc, argv);
    }
    catch (const std::invalid_argument &e)
    {
        std::cerr << "tais_relay: " << e.what() << "\n";
        return 2;
    }

    try
    {
        auto [http_host, http_port] = split_host_port(config.http_bind);
        auto [ws_host, ws_port] = split_host_port(config.ws_bind);

        boost::asio::io_context ioc{config.threads};
        RelayState state{config};

        boost::asio::ip::tcp::endpoint http_ep{boost::asio::ip::make_address(http_host), http_port};
        boost::asio::ip::tcp::endpoint ws_ep{boost::asio::ip::make_address(ws_host), ws_port};

        HttpServer http{ioc, http_ep, state};
        WsServer ws{ioc, ws_ep, state};
        RelayTimers timers{ioc, state};
        timers.start();

        boost::asio::signal_set signals(ioc, SIGINT, SIGTERM);
        signals.async_wait([&](const boost::system::error_code &, int)
                           {
            std::cout << "tais_relay: shutting down\n";
            timers.stop();
            http.stop();
            ws.stop();
            ioc.stop(); });

        std::cout << "tais_relay listening http=" << config.http_bind << " ws=" << config.ws_bind
                  << " flush_ms=" << config.flush_interval.count() << " stale_s=" << config.stale_after.count() << "\n";

        std::vector<std::thread> workers;
        for (int i = 1; i < config.threads; ++i)
            workers.emplace_back([&ioc]
                                 { ioc.run(); });
        ioc.run();
        for (auto &t : workers)
            t.join();
        return 0;
    }
    catch (const std::exception &e)
    {
        std::cerr << "tais_relay error: " << e.what() << "\n";
        return 1;
    }
}
