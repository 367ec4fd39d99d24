/*
 * File: src/relay_timers.hpp
 * Project: TAIS Track Relay
 * Purpose: Broadcast and purge loops
 * Notes:
 *  - The two periods are independent of each other and of ingestion
 * Last updated: 2026-10-18
 */

#pragma once
#include <boost/asio.hpp>
#include <boost/asio/steady_timer.hpp>
#include <atomic>
#include <chrono>
#include <exception>
#include <iostream>
#include "relay_state.hpp"

class RelayTimers
{
    boost::asio::steady_timer flush_timer_;
    boost::asio::steady_timer purge_timer_;
    RelayState &state_;
    std::atomic<bool> stopped_{false};

public:
    RelayTimers(boost::asio::io_context &ioc, RelayState &s)
        : flush_timer_(boost::asio::make_strand(ioc)), purge_timer_(boost::asio::make_strand(ioc)), state_(s) {}

    void start()
    {
        schedule_flush();
        schedule_purge();
    }

    void stop()
    {
        stopped_ = true;
        // timers are not thread-safe; cancel on their own strands
        boost::asio::post(flush_timer_.get_executor(), [this]
                          { flush_timer_.cancel(); });
        boost::asio::post(purge_timer_.get_executor(), [this]
                          { purge_timer_.cancel(); });
    }

private:
    void schedule_flush()
    {
        flush_timer_.expires_after(state_.config.flush_interval);
        flush_timer_.async_wait([this](const boost::system::error_code &ec)
                                {
            if (ec || stopped_) return;
            try
            {
                state_.relay.flush_dirty();
            }
            catch (const std::exception &e)
            {
                std::cerr << "[tais] flush: " << e.what() << "\n";
            }
            schedule_flush(); });
    }

    void schedule_purge()
    {
        purge_timer_.expires_after(state_.config.purge_interval);
        purge_timer_.async_wait([this](const boost::system::error_code &ec)
                                {
            if (ec || stopped_) return;
            try
            {
                auto n = state_.relay.purge_stale();
                if (n > 0)
                    std::cout << "[tais] purged " << n << " stale tracks\n";
            }
            catch (const std::exception &e)
            {
                std::cerr << "[tais] purge: " << e.what() << "\n";
            }
            schedule_purge(); });
    }
};
