/*
 * File: include/common/envelope.hpp
 * Project: TAIS Track Relay
 * Purpose: {type, payload} frames sent to subscribers
 * Last updated: 2026-10-18
 */

#pragma once
#include <memory>
#include <string>
#include <nlohmann/json.hpp>
#include "common/client_registry.hpp"
#include "common/track.hpp"


inline Frame make_frame(const char* type, nlohmann::json payload){
nlohmann::json env{{"type", type}, {"payload", std::move(payload)}};
// feed text is not guaranteed to be valid UTF-8
return std::make_shared<const std::string>(env.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));
}

inline Frame snapshot_frame(const std::vector<Track>& sorted, Clock::time_point now){
return make_frame("snapshot", tracks_to_json(sorted, now));
}

inline Frame batch_frame(const std::vector<Track>& tracks, Clock::time_point now){
return make_frame("batch", tracks_to_json(tracks, now));
}

inline Frame remove_frame(const std::string& facility, const std::string& track_num){
return make_frame("remove", nlohmann::json{{"facility", facility}, {"trackNum", track_num}});
}
