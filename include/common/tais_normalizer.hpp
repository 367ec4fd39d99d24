/*
 * File: include/common/tais_normalizer.hpp
 * Project: TAIS Track Relay
 * Purpose: TATrackAndFlightPlan XML -> per-track field updates
 * Notes:
 *  - Never throws; failures come back as NormalizeStatus::malformed
 *  - Absent, blank or sentinel values stay unset in the update
 * Last updated: 2026-10-18
 */

#pragma once
#include <cctype>
#include <charconv>
#include <cmath>
#include <cstdlib>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>
#include <boost/property_tree/ptree.hpp>
#include <boost/property_tree/xml_parser.hpp>
#include "common/track.hpp"

namespace pt = boost::property_tree;

inline constexpr std::string_view kTaisTopicPrefix = "TAIS/";
inline constexpr std::string_view kTaisRootElement = "TATrackAndFlightPlan";
inline constexpr double kPi = 3.14159265358979323846;

enum class NormalizeStatus
{
    ok,
    ignored_topic,    // not a TAIS/ topic
    unknown_root,     // some other message type on the same feed
    missing_facility, // no <src>
    malformed         // XML did not parse
};

inline const char *to_string(NormalizeStatus s)
{
    switch (s)
    {
    case NormalizeStatus::ok:
        return "ok";
    case NormalizeStatus::ignored_topic:
        return "ignored_topic";
    case NormalizeStatus::unknown_root:
        return "unknown_root";
    case NormalizeStatus::missing_facility:
        return "missing_facility";
    case NormalizeStatus::malformed:
        return "malformed";
    }
    return "unknown";
}

struct NormalizeResult
{
    NormalizeStatus status{NormalizeStatus::ok};
    std::string facility;
    std::vector<TrackUpdate> updates;
    std::size_t skipped{0}; // records without trackNum/lat/lon
    std::string error_kind;
    std::string error;
};

// -------- scalar helpers --------

inline std::string_view trim(std::string_view s)
{
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front())))
        s.remove_prefix(1);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back())))
        s.remove_suffix(1);
    return s;
}

inline bool iequals_prefix(std::string_view s, std::string_view prefix)
{
    if (s.size() < prefix.size())
        return false;
    for (size_t i = 0; i < prefix.size(); ++i)
    {
        if (std::toupper(static_cast<unsigned char>(s[i])) != std::toupper(static_cast<unsigned char>(prefix[i])))
            return false;
    }
    return true;
}

// Optional sign, decimal digits, surrounding whitespace allowed.
inline std::optional<int> parse_int(const std::optional<std::string> &v)
{
    if (!v)
        return std::nullopt;
    auto s = trim(*v);
    if (!s.empty() && s.front() == '+')
    {
        s.remove_prefix(1);
        if (!s.empty() && s.front() == '-')
            return std::nullopt;
    }
    if (s.empty())
        return std::nullopt;
    int out = 0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
    if (ec != std::errc() || ptr != s.data() + s.size())
        return std::nullopt;
    return out;
}

// Plain decimal/exponent notation only; no hex, inf or nan.
inline std::optional<double> parse_double(const std::optional<std::string> &v)
{
    if (!v)
        return std::nullopt;
    auto s = trim(*v);
    if (s.empty())
        return std::nullopt;
    for (char c : s)
    {
        if (!std::isdigit(static_cast<unsigned char>(c)) && c != '+' && c != '-' && c != '.' && c != 'e' && c != 'E')
            return std::nullopt;
    }
    std::string buf(s);
    char *end = nullptr;
    double d = std::strtod(buf.c_str(), &end);
    if (end != buf.c_str() + buf.size() || !std::isfinite(d))
        return std::nullopt;
    return d;
}

inline std::optional<std::string> non_blank(std::optional<std::string> v)
{
    if (!v || trim(*v).empty())
        return std::nullopt;
    return v;
}

inline std::optional<std::string> unless_sentinel(std::optional<std::string> v, std::string_view sentinel)
{
    v = non_blank(std::move(v));
    if (v && *v == sentinel)
        return std::nullopt;
    return v;
}

// "000000" and friends mean the transponder address is unknown.
inline std::optional<std::string> mode_s_address(std::optional<std::string> v)
{
    v = non_blank(std::move(v));
    if (v && trim(*v).find_first_not_of('0') == std::string_view::npos)
        return std::nullopt;
    return v;
}

inline std::optional<bool> flag(const std::optional<std::string> &v)
{
    if (!v)
        return std::nullopt;
    return trim(*v) == "1";
}

inline std::optional<std::string> child_text(const pt::ptree &node, const char *name)
{
    auto c = node.get_child_optional(pt::ptree::path_type(name, '/'));
    if (!c)
        return std::nullopt;
    return c->data();
}

inline std::string_view local_name(std::string_view qname)
{
    auto p = qname.find(':');
    return p == std::string_view::npos ? qname : qname.substr(p + 1);
}

// Ground speed/track from the vx/vy velocity pair (knots).
inline void derive_velocity(TrackUpdate &u, const std::optional<int> &vx, const std::optional<int> &vy)
{
    if (!vx || !vy)
        return;
    const double x = *vx, y = *vy;
    const double speed = std::sqrt(x * x + y * y);
    u.ground_speed_kt = static_cast<int>(std::lround(speed));
    if (speed > 0)
    {
        double heading = std::atan2(x, y) * 180.0 / kPi;
        if (heading < 0)
            heading += 360.0;
        u.ground_track_deg = static_cast<int>(std::lround(heading)) % 360;
    }
}

// -------- record / message --------

inline std::optional<TrackUpdate> normalize_record(const std::string &facility, const pt::ptree &record)
{
    auto track = record.get_child_optional("track");
    if (!track)
        return std::nullopt;

    auto track_num = non_blank(child_text(*track, "trackNum"));
    auto lat = parse_double(child_text(*track, "lat"));
    auto lon = parse_double(child_text(*track, "lon"));
    if (!track_num || !lat || !lon)
        return std::nullopt;

    TrackUpdate u;
    u.facility = facility;
    u.track_num = std::string(trim(*track_num));
    u.lat = *lat;
    u.lon = *lon;

    u.reported_squawk = non_blank(child_text(*track, "reportedBeaconCode"));
    u.altitude_ft = parse_int(child_text(*track, "reportedAltitude"));
    u.vertical_rate_fpm = parse_int(child_text(*track, "vVert"));
    u.frozen = flag(child_text(*track, "frozen"));
    u.pseudo = flag(child_text(*track, "pseudo"));
    u.mode_s = mode_s_address(child_text(*track, "acAddress"));
    derive_velocity(u, parse_int(child_text(*track, "vx")), parse_int(child_text(*track, "vy")));

    if (auto fp = record.get_child_optional("flightPlan"))
    {
        u.callsign = non_blank(child_text(*fp, "acid"));
        u.ac_type = non_blank(child_text(*fp, "acType"));
        u.flight_rules = non_blank(child_text(*fp, "flightRules"));
        u.entry_fix = non_blank(child_text(*fp, "entryFix"));
        u.exit_fix = non_blank(child_text(*fp, "exitFix"));
        u.assigned_squawk = non_blank(child_text(*fp, "assignedBeaconCode"));
        u.requested_altitude = parse_int(child_text(*fp, "requestedAltitude"));
        u.runway = non_blank(child_text(*fp, "runway"));
        u.scratchpad1 = non_blank(child_text(*fp, "scratchPad1"));
        u.scratchpad2 = non_blank(child_text(*fp, "scratchPad2"));
        u.owner = unless_sentinel(child_text(*fp, "cps"), "unassigned");
        u.wake = unless_sentinel(child_text(*fp, "category"), "unavailable");
        u.equipment = unless_sentinel(child_text(*fp, "eqptSuffix"), "unavailable");
        u.pending_handoff = non_blank(child_text(*fp, "pendingHandoff"));
    }

    if (auto enh = record.get_child_optional("enhancedData"))
    {
        u.origin = non_blank(child_text(*enh, "departureAirport"));
        u.destination = non_blank(child_text(*enh, "destinationAirport"));
    }
    return u;
}

inline NormalizeResult normalize_tais(std::string_view topic, std::string_view body)
{
    NormalizeResult r;
    if (!iequals_prefix(topic, kTaisTopicPrefix))
    {
        r.status = NormalizeStatus::ignored_topic;
        return r;
    }

    pt::ptree doc;
    try
    {
        std::istringstream in{std::string(body)};
        pt::read_xml(in, doc, pt::xml_parser::no_comments);
    }
    catch (const pt::xml_parser_error &e)
    {
        r.status = NormalizeStatus::malformed;
        r.error_kind = "xml_parser_error";
        r.error = e.what();
        return r;
    }
    catch (const std::exception &e)
    {
        r.status = NormalizeStatus::malformed;
        r.error_kind = "exception";
        r.error = e.what();
        return r;
    }

    const pt::ptree *root = nullptr;
    for (const auto &kv : doc)
    {
        if (!kv.first.empty() && kv.first.front() != '<')
        {
            if (local_name(kv.first) == kTaisRootElement)
                root = &kv.second;
            break;
        }
    }
    if (!root)
    {
        r.status = NormalizeStatus::unknown_root;
        return r;
    }

    auto src = non_blank(child_text(*root, "src"));
    if (!src)
    {
        r.status = NormalizeStatus::missing_facility;
        return r;
    }
    r.facility = std::string(trim(*src));

    for (const auto &kv : *root)
    {
        if (kv.first != "record")
            continue;
        if (auto u = normalize_record(r.facility, kv.second))
            r.updates.push_back(std::move(*u));
        else
            ++r.skipped;
    }
    return r;
}
