/*
 * File: include/common/track.hpp
 * Project: TAIS Track Relay
 * Purpose: Track model, wire JSON shape, per-facility track store
 * Notes:
 *  - State is in-memory only; nothing survives a restart
 *  - Absent fields never overwrite stored values
 *  - Outbound frames go through bounded per-client queues
 * Last updated: 2026-10-18
 */

#pragma once
#include <algorithm>
#include <chrono>
#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>


using Clock = std::chrono::system_clock;


struct Track {
std::string facility;
std::string track_num;

// flight plan
std::optional<std::string> callsign;
std::optional<std::string> ac_type;
std::optional<std::string> equipment;
std::optional<std::string> wake;
std::optional<std::string> flight_rules;
std::optional<std::string> origin;
std::optional<std::string> destination;
std::optional<std::string> entry_fix;
std::optional<std::string> exit_fix;
std::optional<std::string> assigned_squawk;
std::optional<std::string> reported_squawk;
std::optional<int> requested_altitude;
std::optional<std::string> runway;
std::optional<std::string> scratchpad1;
std::optional<std::string> scratchpad2;
std::optional<std::string> owner; // CPS controller id
std::optional<std::string> pending_handoff;

// track
double lat{0.0};
double lon{0.0};
std::optional<int> altitude_ft;
std::optional<int> ground_speed_kt;
std::optional<int> ground_track_deg;
std::optional<int> vertical_rate_fpm;
std::optional<std::string> mode_s; // hex
bool frozen{false};
bool pseudo{false};
Clock::time_point last_seen{};
};


// One record's worth of fields. Unset members leave the stored value alone.
struct TrackUpdate {
std::string facility;
std::string track_num;
double lat{0.0};
double lon{0.0};

std::optional<std::string> callsign;
std::optional<std::string> ac_type;
std::optional<std::string> equipment;
std::optional<std::string> wake;
std::optional<std::string> flight_rules;
std::optional<std::string> origin;
std::optional<std::string> destination;
std::optional<std::string> entry_fix;
std::optional<std::string> exit_fix;
std::optional<std::string> assigned_squawk;
std::optional<std::string> reported_squawk;
std::optional<int> requested_altitude;
std::optional<std::string> runway;
std::optional<std::string> scratchpad1;
std::optional<std::string> scratchpad2;
std::optional<std::string> owner;
std::optional<std::string> pending_handoff;

std::optional<int> altitude_ft;
std::optional<int> ground_speed_kt;
std::optional<int> ground_track_deg;
std::optional<int> vertical_rate_fpm;
std::optional<std::string> mode_s;
std::optional<bool> frozen;
std::optional<bool> pseudo;
};


template <typename T>
inline void assign_if(std::optional<T>& dst, const std::optional<T>& src){
if (src) dst = *src;
}


// Position and last_seen always move; everything else only when present.
inline void apply_update(Track& t, const TrackUpdate& u, Clock::time_point now){
t.lat = u.lat;
t.lon = u.lon;
t.last_seen = now;

assign_if(t.callsign, u.callsign);
assign_if(t.ac_type, u.ac_type);
assign_if(t.equipment, u.equipment);
assign_if(t.wake, u.wake);
assign_if(t.flight_rules, u.flight_rules);
assign_if(t.origin, u.origin);
assign_if(t.destination, u.destination);
assign_if(t.entry_fix, u.entry_fix);
assign_if(t.exit_fix, u.exit_fix);
assign_if(t.assigned_squawk, u.assigned_squawk);
assign_if(t.reported_squawk, u.reported_squawk);
assign_if(t.requested_altitude, u.requested_altitude);
assign_if(t.runway, u.runway);
assign_if(t.scratchpad1, u.scratchpad1);
assign_if(t.scratchpad2, u.scratchpad2);
assign_if(t.owner, u.owner);
assign_if(t.pending_handoff, u.pending_handoff);

assign_if(t.altitude_ft, u.altitude_ft);
assign_if(t.ground_speed_kt, u.ground_speed_kt);
assign_if(t.ground_track_deg, u.ground_track_deg);
assign_if(t.vertical_rate_fpm, u.vertical_rate_fpm);
assign_if(t.mode_s, u.mode_s);
if (u.frozen) t.frozen = *u.frozen;
if (u.pseudo) t.pseudo = *u.pseudo;
}


template <typename T>
inline nlohmann::json opt_json(const std::optional<T>& v){
return v ? nlohmann::json(*v) : nlohmann::json(nullptr);
}


// Field names are the client wire contract.
inline nlohmann::json track_to_json(const Track& t, Clock::time_point now){
using nlohmann::json; using namespace std::chrono;
auto age = duration_cast<seconds>(now - t.last_seen).count();
return json{
{"facility", t.facility},
{"trackNum", t.track_num},
{"callsign", opt_json(t.callsign)},
{"acType", opt_json(t.ac_type)},
{"equip", opt_json(t.equipment)},
{"wake", opt_json(t.wake)},
{"rules", opt_json(t.flight_rules)},
{"origin", opt_json(t.origin)},
{"dest", opt_json(t.destination)},
{"entryFix", opt_json(t.entry_fix)},
{"exitFix", opt_json(t.exit_fix)},
{"assignedSqk", opt_json(t.assigned_squawk)},
{"reportedSqk", opt_json(t.reported_squawk)},
{"reqAlt", opt_json(t.requested_altitude)},
{"runway", opt_json(t.runway)},
{"sp1", opt_json(t.scratchpad1)},
{"sp2", opt_json(t.scratchpad2)},
{"owner", opt_json(t.owner)},
{"handoff", opt_json(t.pending_handoff)},
{"lat", t.lat},
{"lon", t.lon},
{"altFt", opt_json(t.altitude_ft)},
{"gs", opt_json(t.ground_speed_kt)},
{"trk", opt_json(t.ground_track_deg)},
{"vs", opt_json(t.vertical_rate_fpm)},
{"modeS", opt_json(t.mode_s)},
{"frozen", t.frozen},
{"pseudo", t.pseudo},
{"ageSec", age < 0 ? 0 : age}
};
}


inline nlohmann::json tracks_to_json(const std::vector<Track>& tracks, Clock::time_point now){
nlohmann::json arr = nlohmann::json::array();
for (const auto& t : tracks) arr.push_back(track_to_json(t, now));
return arr;
}


// Snapshot ordering: callsign when known, else track number.
inline void sort_for_display(std::vector<Track>& tracks){
std::sort(tracks.begin(), tracks.end(), [](const Track& a, const Track& b){
const std::string& ka = a.callsign ? *a.callsign : a.track_num;
const std::string& kb = b.callsign ? *b.callsign : b.track_num;
if (ka != kb) return ka < kb;
return a.track_num < b.track_num;
});
}


struct FacilityCount {
std::string facility;
std::size_t track_count{0};
};


// facility -> trackNum -> Track
class TrackStore {
mutable std::mutex m_;
std::unordered_map<std::string, std::unordered_map<std::string, Track>> facilities_;

Track& get_or_create_locked(const std::string& facility, const std::string& track_num){
auto& bucket = facilities_[facility];
auto [it, inserted] = bucket.try_emplace(track_num);
if (inserted) { it->second.facility = facility; it->second.track_num = track_num; }
return it->second;
}

public:
Track get_or_create(const std::string& facility, const std::string& track_num){
std::scoped_lock lk(m_);
return get_or_create_locked(facility, track_num);
}

// get-or-create plus field merge in one critical section; true when the track is new
bool apply(const TrackUpdate& u, Clock::time_point now){
std::scoped_lock lk(m_);
auto& bucket = facilities_[u.facility];
auto [it, inserted] = bucket.try_emplace(u.track_num);
if (inserted) { it->second.facility = u.facility; it->second.track_num = u.track_num; }
apply_update(it->second, u, now);
return inserted;
}

std::optional<Track> find(const std::string& facility, const std::string& track_num) const {
std::scoped_lock lk(m_);
auto f = facilities_.find(facility);
if (f == facilities_.end()) return std::nullopt;
auto it = f->second.find(track_num);
if (it == f->second.end()) return std::nullopt;
return it->second;
}

std::vector<Track> list(const std::string& facility) const {
std::scoped_lock lk(m_);
std::vector<Track> out;
auto f = facilities_.find(facility);
if (f == facilities_.end()) return out;
out.reserve(f->second.size());
for (const auto& kv : f->second) out.push_back(kv.second);
return out;
}

bool remove(const std::string& facility, const std::string& track_num){
std::scoped_lock lk(m_);
auto f = facilities_.find(facility);
if (f == facilities_.end()) return false;
bool erased = f->second.erase(track_num) > 0;
if (f->second.empty()) facilities_.erase(f);
return erased;
}

// Drops every track last seen before cutoff and any facility left empty.
std::vector<Track> remove_stale(Clock::time_point cutoff){
std::scoped_lock lk(m_);
std::vector<Track> removed;
for (auto f = facilities_.begin(); f != facilities_.end();) {
auto& bucket = f->second;
for (auto it = bucket.begin(); it != bucket.end();) {
if (it->second.last_seen < cutoff) { removed.push_back(std::move(it->second)); it = bucket.erase(it); }
else ++it;
}
if (bucket.empty()) f = facilities_.erase(f);
else ++f;
}
return removed;
}

std::vector<FacilityCount> counts() const {
std::scoped_lock lk(m_);
std::vector<FacilityCount> out;
out.reserve(facilities_.size());
for (const auto& kv : facilities_)
if (!kv.second.empty()) out.push_back(FacilityCount{kv.first, kv.second.size()});
return out;
}

std::size_t track_count() const {
std::scoped_lock lk(m_);
std::size_t n = 0;
for (const auto& kv : facilities_) n += kv.second.size();
return n;
}

std::size_t facility_count() const {
std::scoped_lock lk(m_);
return facilities_.size();
}
};
