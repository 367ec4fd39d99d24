/*
 * File: src/relay_http.hpp
 * Project: TAIS Track Relay
 * Purpose: HTTP routing and handlers
 * Notes:
 *  - /v1/tais/ingest is where the feed bridge forwards (topic, body)
 *  - Directory and snapshot routes are pure reads
 * Last updated: 2026-10-18
 */

#pragma once
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>
#include <boost/asio.hpp>
#include <boost/asio/strand.hpp>

#include <nlohmann/json.hpp>

#include <cctype>
#include <chrono>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

#include "relay_state.hpp"

namespace http = boost::beast::http;

inline constexpr std::string_view kFacilitiesRoute = "/v1/tais/facilities";
inline constexpr std::string_view kIngestRoute = "/v1/tais/ingest";

// -------- target helpers --------

// '+' means space only in form-encoded query values, never in a path segment
inline std::string percent_decode(std::string_view s, bool plus_as_space = false)
{
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); ++i)
    {
        if (s[i] == '%' && i + 2 < s.size() && std::isxdigit(static_cast<unsigned char>(s[i + 1])) &&
            std::isxdigit(static_cast<unsigned char>(s[i + 2])))
        {
            out.push_back(static_cast<char>(std::stoi(std::string(s.substr(i + 1, 2)), nullptr, 16)));
            i += 2;
        }
        else if (plus_as_space && s[i] == '+')
            out.push_back(' ');
        else
            out.push_back(s[i]);
    }
    return out;
}

inline std::string_view target_path(std::string_view target)
{
    auto q = target.find('?');
    return q == std::string_view::npos ? target : target.substr(0, q);
}

// crude parser for ?key=value&...
inline std::string query_param(std::string_view target, std::string_view key)
{
    auto q = target.find('?');
    if (q == std::string_view::npos)
        return {};
    auto qs = target.substr(q + 1);
    while (!qs.empty())
    {
        auto amp = qs.find('&');
        auto pair = qs.substr(0, amp);
        auto eq = pair.find('=');
        if (eq != std::string_view::npos && pair.substr(0, eq) == key)
            return percent_decode(pair.substr(eq + 1), true);
        if (amp == std::string_view::npos)
            break;
        qs.remove_prefix(amp + 1);
    }
    return {};
}

inline http::response<http::string_body> json_response(http::status status, unsigned version, const nlohmann::json &body)
{
    http::response<http::string_body> res{status, version};
    res.set(http::field::content_type, "application/json");
    res.body() = body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    res.prepare_payload();
    return res;
}

// -------- routes --------

inline http::response<http::string_body> handle_request(const http::request<http::string_body> &req, RelayState &state)
{
    using nlohmann::json;
    const auto target = std::string_view(req.target().data(), req.target().size());
    const auto path = target_path(target);

    // GET /health
    if (req.method() == http::verb::get && path == "/health")
    {
        auto up = std::chrono::duration<double>(std::chrono::steady_clock::now() - state.start).count();
        auto c = state.relay.counters();
        return json_response(http::status::ok, req.version(),
                             json{{"status", "ok"},
                                  {"uptime_s", up},
                                  {"messages", c.messages},
                                  {"malformed", c.malformed},
                                  {"records_applied", c.records_applied},
                                  {"records_skipped", c.records_skipped},
                                  {"frames_sent", c.frames_sent},
                                  {"frames_dropped", c.frames_dropped},
                                  {"tracks_purged", c.tracks_purged},
                                  {"tracks", state.relay.store().track_count()},
                                  {"clients", state.relay.clients().total()}});
    }

    // GET /v1/config
    if (req.method() == http::verb::get && path == "/v1/config")
        return json_response(http::status::ok, req.version(), config_to_json(state.config));

    // GET /v1/tais/facilities
    if (req.method() == http::verb::get && path == kFacilitiesRoute)
        return json_response(http::status::ok, req.version(), state.relay.directory_json());

    // GET /v1/tais/facilities/{facility}
    if (req.method() == http::verb::get && path.size() > kFacilitiesRoute.size() + 1 &&
        path.substr(0, kFacilitiesRoute.size() + 1) == std::string(kFacilitiesRoute) + "/")
    {
        auto facility = percent_decode(path.substr(kFacilitiesRoute.size() + 1));
        return json_response(http::status::ok, req.version(), state.relay.snapshot_json(facility));
    }

    // POST /v1/tais/ingest?topic=TAIS/...   body: raw TATrackAndFlightPlan XML
    if (req.method() == http::verb::post && path == kIngestRoute)
    {
        auto topic = query_param(target, "topic");
        if (topic.empty())
            return json_response(http::status::bad_request, req.version(), json{{"error", "missing topic param"}});

        auto r = state.relay.ingest(topic, req.body());
        if (r.status == NormalizeStatus::malformed)
            return json_response(http::status::bad_request, req.version(),
                                 json{{"status", to_string(r.status)}, {"error", r.error}});
        return json_response(http::status::ok, req.version(),
                             json{{"status", to_string(r.status)},
                                  {"facility", r.facility},
                                  {"applied", r.applied},
                                  {"skipped", r.skipped}});
    }

    // 404 fallback
    return json_response(http::status::not_found, req.version(), json{{"error", "not found"}});
}

// -------- HTTP server --------

class HttpServer
{
    boost::asio::io_context &ioc_;
    boost::asio::ip::tcp::acceptor acceptor_;
    RelayState &state_;

public:
    HttpServer(boost::asio::io_context &ioc, boost::asio::ip::tcp::endpoint ep, RelayState &s)
        : ioc_(ioc), acceptor_(ioc), state_(s)
    {
        acceptor_.open(ep.protocol());
        acceptor_.set_option(boost::asio::socket_base::reuse_address(true));
        acceptor_.bind(ep);
        acceptor_.listen(boost::asio::socket_base::max_listen_connections);
        do_accept();
    }

    void stop()
    {
        boost::system::error_code ec;
        acceptor_.close(ec);
    }

private:
    void do_accept()
    {
        acceptor_.async_accept(boost::asio::make_strand(ioc_), [this](boost::system::error_code ec, boost::asio::ip::tcp::socket s)
                               {
            if (ec == boost::asio::error::operation_aborted) return;
            if (!ec) std::make_shared<Session>(std::move(s), state_)->run();
            else std::cerr << "[http] accept: " << ec.message() << "\n";
            do_accept(); });
    }

    struct Session : std::enable_shared_from_this<Session>
    {
        boost::asio::ip::tcp::socket socket;
        boost::beast::flat_buffer buffer;
        http::request<http::string_body> req;
        RelayState &state;

        Session(boost::asio::ip::tcp::socket &&s, RelayState &st)
            : socket(std::move(s)), state(st) {}

        void run() { do_read(); }

        void do_read()
        {
            auto self = shared_from_this();
            http::async_read(socket, buffer, req, [self](boost::beast::error_code ec, std::size_t)
                             {
                if (!ec) self->handle(); });
        }

        // keep response alive through async_write
        void respond(http::response<http::string_body> &&res)
        {
            auto self = shared_from_this();
            auto sp = std::make_shared<http::response<http::string_body>>(std::move(res));
            sp->set(http::field::server, "tais-relay");

            http::async_write(socket, *sp, [self, sp](boost::beast::error_code, std::size_t)
                              {
                boost::system::error_code ignored;
                self->socket.shutdown(boost::asio::ip::tcp::socket::shutdown_send, ignored); });
        }

        void handle()
        {
            try
            {
                respond(handle_request(req, state));
            }
            catch (const std::exception &e)
            {
                std::cerr << "[http] " << req.target() << ": " << e.what() << "\n";
                respond(json_response(http::status::internal_server_error, req.version(),
                                      nlohmann::json{{"error", "internal"}, {"what", e.what()}}));
            }
        }
    };
};
