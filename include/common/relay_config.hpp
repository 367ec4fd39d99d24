/*
 * File: include/common/relay_config.hpp
 * Project: TAIS Track Relay
 * Purpose: Command line configuration
 * Last updated: 2026-10-18
 */

#pragma once
#include <chrono>
#include <stdexcept>
#include <string>
#include <utility>
#include <nlohmann/json.hpp>


struct RelayConfig
{
    std::string http_bind{"0.0.0.0:8080"};
    std::string ws_bind{"0.0.0.0:8090"};
    int threads{2};
    std::chrono::milliseconds flush_interval{1000};
    std::chrono::seconds purge_interval{10};
    std::chrono::seconds stale_after{60};
    std::size_t max_pending{256}; // frames queued per client before dropping
};

inline long parse_positive(const std::string &flag, const std::string &v)
{
    size_t used = 0;
    long n = 0;
    try
    {
        n = std::stol(v, &used);
    }
    catch (const std::exception &)
    {
        throw std::invalid_argument(flag + ": not a number: " + v);
    }
    if (used != v.size() || n <= 0)
        throw std::invalid_argument(flag + ": expected a positive integer: " + v);
    return n;
}

// "host:port" -> {host, port}
inline std::pair<std::string, unsigned short> split_host_port(const std::string &s)
{
    auto p = s.rfind(':');
    if (p == std::string::npos || p == 0 || p + 1 == s.size())
        throw std::invalid_argument("expected host:port, got: " + s);
    auto port = parse_positive("port", s.substr(p + 1));
    if (port > 65535)
        throw std::invalid_argument("port out of range: " + s);
    return {s.substr(0, p), static_cast<unsigned short>(port)};
}

inline RelayConfig parse_args(int argc, char **argv)
{
    RelayConfig c;
    for (int i = 1; i < argc; ++i)
    {
        std::string a = argv[i];
        if (i + 1 >= argc)
            break;
        if (a == "--http")
            c.http_bind = argv[++i];
        else if (a == "--ws")
            c.ws_bind = argv[++i];
        else if (a == "--threads")
            c.threads = static_cast<int>(parse_positive(a, argv[++i]));
        else if (a == "--flush-ms")
            c.flush_interval = std::chrono::milliseconds(parse_positive(a, argv[++i]));
        else if (a == "--purge-s")
            c.purge_interval = std::chrono::seconds(parse_positive(a, argv[++i]));
        else if (a == "--stale-s")
            c.stale_after = std::chrono::seconds(parse_positive(a, argv[++i]));
        else if (a == "--max-pending")
            c.max_pending = static_cast<std::size_t>(parse_positive(a, argv[++i]));
    }
    split_host_port(c.http_bind);
    split_host_port(c.ws_bind);
    return c;
}

inline nlohmann::json config_to_json(const RelayConfig &c)
{
    return nlohmann::json{
        {"http", c.http_bind},
        {"ws", c.ws_bind},
        {"threads", c.threads},
        {"flush_ms", c.flush_interval.count()},
        {"purge_s", c.purge_interval.count()},
        {"stale_s", c.stale_after.count()},
        {"max_pending", c.max_pending}};
}
