/*
 * File: src/relay_ws.hpp
 * Project: TAIS Track Relay
 * Purpose: /tais/ws/{facility} subscriber endpoint
 * Notes:
 *  - enqueue() is called from relay threads; writes happen on the session strand
 *  - A full queue drops the frame; the next batch carries full state anyway
 * Last updated: 2026-10-18
 */

#pragma once
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/asio.hpp>
#include <boost/asio/strand.hpp>
#include <atomic>
#include <deque>
#include <iostream>
#include <memory>
#include <mutex>
#include "relay_http.hpp"
#include "relay_state.hpp"

namespace websocket = boost::beast::websocket;

inline constexpr std::string_view kWsRoutePrefix = "/tais/ws/";

// "/tais/ws/ZNY?x=y" -> "ZNY"; empty when the target is not a facility route
inline std::string ws_facility(std::string_view target)
{
    auto path = target_path(target);
    if (path.size() <= kWsRoutePrefix.size() || path.substr(0, kWsRoutePrefix.size()) != kWsRoutePrefix)
        return {};
    auto rest = path.substr(kWsRoutePrefix.size());
    if (rest.find('/') != std::string_view::npos)
        return {};
    return percent_decode(rest);
}

class WsServer
{
    boost::asio::io_context &ioc_;
    boost::asio::ip::tcp::acceptor acceptor_;
    RelayState &state_;

public:
    WsServer(boost::asio::io_context &ioc, boost::asio::ip::tcp::endpoint ep, RelayState &s)
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

    boost::asio::ip::tcp::endpoint local_endpoint() const { return acceptor_.local_endpoint(); }

private:
    void do_accept()
    {
        acceptor_.async_accept(boost::asio::make_strand(ioc_), [this](boost::system::error_code ec, boost::asio::ip::tcp::socket s)
                               {
            if (ec == boost::asio::error::operation_aborted) return;
            if (!ec) std::make_shared<Session>(std::move(s), state_)->run();
            else std::cerr << "[ws] accept: " << ec.message() << "\n";
            do_accept(); });
    }

    class Session : public TrackClient, public std::enable_shared_from_this<Session>
    {
        websocket::stream<boost::asio::ip::tcp::socket> ws;
        boost::beast::flat_buffer buffer;
        http::request<http::string_body> upgrade;
        RelayState &state;
        std::string facility;
        std::string client_id;

        std::atomic<bool> open{false};
        std::mutex q_mtx;
        std::deque<Frame> queue; // front is in flight while writing
        bool writing = false;
        bool overflowing = false;

    public:
        Session(boost::asio::ip::tcp::socket &&s, RelayState &st)
            : ws(std::move(s)), state(st) {}

        void run()
        {
            auto self = shared_from_this();
            http::async_read(ws.next_layer(), buffer, upgrade, [self](boost::beast::error_code ec, std::size_t)
                             { self->on_request(ec); });
        }

        bool enqueue(Frame frame) override
        {
            if (!open.load())
                return false;
            {
                std::scoped_lock lk(q_mtx);
                if (queue.size() >= state.config.max_pending)
                {
                    if (!overflowing)
                        std::cerr << "[ws] " << facility << ": client queue full, dropping frames\n";
                    overflowing = true;
                    return false;
                }
                overflowing = false;
                queue.push_back(std::move(frame));
                if (writing)
                    return true;
                writing = true;
            }
            boost::asio::post(ws.get_executor(), [self = shared_from_this()]
                              { self->do_write(); });
            return true;
        }

        bool is_open() const override { return open.load(); }

    private:
        void on_request(boost::beast::error_code ec)
        {
            if (ec)
                return;
            facility = ws_facility(std::string_view(upgrade.target().data(), upgrade.target().size()));
            if (!websocket::is_upgrade(upgrade) || facility.empty())
            {
                reject(http::status::not_found);
                return;
            }
            ws.set_option(websocket::stream_base::timeout::suggested(boost::beast::role_type::server));
            auto self = shared_from_this();
            ws.async_accept(upgrade, [self](boost::beast::error_code ec)
                            { self->on_accept(ec); });
        }

        void reject(http::status status)
        {
            auto self = shared_from_this();
            auto res = std::make_shared<http::response<http::string_body>>(
                json_response(status, upgrade.version(), nlohmann::json{{"error", "expected websocket upgrade on /tais/ws/{facility}"}}));
            http::async_write(ws.next_layer(), *res, [self, res](boost::beast::error_code, std::size_t)
                              {
                boost::system::error_code ignored;
                self->ws.next_layer().shutdown(boost::asio::ip::tcp::socket::shutdown_send, ignored); });
        }

        void on_accept(boost::beast::error_code ec)
        {
            if (ec)
            {
                std::cerr << "[ws] handshake: " << ec.message() << "\n";
                return;
            }
            buffer.consume(buffer.size());
            open = true;
            client_id = state.relay.subscribe(facility, shared_from_this());
            do_read();
        }

        // inbound frames carry nothing; reading keeps close/ping handling alive
        void do_read()
        {
            auto self = shared_from_this();
            ws.async_read(buffer, [self](boost::beast::error_code ec, std::size_t)
                          {
                if (ec) { self->close(); return; }
                self->buffer.consume(self->buffer.size());
                self->do_read(); });
        }

        void do_write()
        {
            Frame next;
            {
                std::scoped_lock lk(q_mtx);
                if (queue.empty() || !open.load())
                {
                    writing = false;
                    return;
                }
                next = queue.front();
            }
            ws.text(true);
            auto self = shared_from_this();
            ws.async_write(boost::asio::buffer(*next), [self, next](boost::beast::error_code ec, std::size_t)
                           {
                if (ec) { self->close(); return; }
                {
                    std::scoped_lock lk(self->q_mtx);
                    if (!self->queue.empty())
                        self->queue.pop_front();
                }
                self->do_write(); });
        }

        void close()
        {
            if (!open.exchange(false))
                return;
            state.relay.unsubscribe(facility, client_id);
            std::scoped_lock lk(q_mtx);
            queue.clear();
            writing = false;
        }
    };
};
