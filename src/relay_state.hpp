/*
 * File: src/relay_state.hpp
 * Project: TAIS Track Relay
 * Purpose: Process-wide state shared by the HTTP, WS and timer paths
 * Notes:
 *  - State is in-memory only; nothing survives a restart
 *  - Outbound frames go through bounded per-client queues
 * Last updated: 2026-10-18
 */

#pragma once
#include <chrono>
#include "common/relay_config.hpp"
#include "common/track_relay.hpp"


struct RelayState {
RelayConfig config;
TrackRelay relay;
std::chrono::steady_clock::time_point start = std::chrono::steady_clock::now();

explicit RelayState(RelayConfig c, TrackRelay::NowFn now = {})
: config(std::move(c)), relay(config.stale_after, std::move(now)) {}
};
