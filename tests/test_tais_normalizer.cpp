/*
 * File: tests/test_tais_normalizer.cpp
 * Project: TAIS Track Relay
 * Purpose: TAIS XML field extraction and coercion rules
 * Last updated: 2026-10-18
 */

#include <catch2/catch_all.hpp>
#include "common/tais_normalizer.hpp"
#include "tais_fixtures.hpp"


TEST_CASE("topic prefix is matched case-insensitively"){
auto body = tais_simple("A80", "100", 33.6, -84.4);
REQUIRE(normalize_tais("TAIS/A80", body).status == NormalizeStatus::ok);
REQUIRE(normalize_tais("tais/a80", body).status == NormalizeStatus::ok);
REQUIRE(normalize_tais("ASDEX/KATL", body).status == NormalizeStatus::ignored_topic);
REQUIRE(normalize_tais("TAIS", body).status == NormalizeStatus::ignored_topic);
}


TEST_CASE("other roots, missing src and broken XML are reported, not thrown"){
REQUIRE(normalize_tais("TAIS/x", "<SurfaceMovementEventMessage/>").status == NormalizeStatus::unknown_root);
REQUIRE(normalize_tais("TAIS/x", "<TATrackAndFlightPlan><record/></TATrackAndFlightPlan>").status == NormalizeStatus::missing_facility);
auto r = normalize_tais("TAIS/x", "<TATrackAndFlightPlan><src>A80</src><record>");
REQUIRE(r.status == NormalizeStatus::malformed);
REQUIRE_FALSE(r.error.empty());
REQUIRE(normalize_tais("TAIS/x", "not xml at all").status == NormalizeStatus::malformed);
}


TEST_CASE("namespaced root element is accepted"){
auto body = "<ns2:TATrackAndFlightPlan xmlns:ns2=\"urn:test\"><src>N90</src>" +
tais_record(tais_track("5", "40.6", "-73.7")) + "</ns2:TATrackAndFlightPlan>";
auto r = normalize_tais("TAIS/N90", body);
REQUIRE(r.status == NormalizeStatus::ok);
REQUIRE(r.facility == "N90");
REQUIRE(r.updates.size() == 1);
}


TEST_CASE("records without trackNum or numeric position are skipped"){
auto body = tais_message("A80",
tais_record(tais_track("1", "33.5", "-84.1")) +
tais_record(tais_track("2", "abc", "-84.1")) +
tais_record("<track><lat>33.5</lat><lon>-84.1</lon></track>") +
tais_record(tais_track("4", "33.5", "")) +
tais_record(tais_track("   ", "33.5", "-84.1")) +
"<record><flightPlan><acid>X</acid></flightPlan></record>");
auto r = normalize_tais("TAIS/A80", body);
REQUIRE(r.status == NormalizeStatus::ok);
REQUIRE(r.updates.size() == 1);
REQUIRE(r.updates[0].track_num == "1");
REQUIRE(r.updates[0].lat == Catch::Approx(33.5));
REQUIRE(r.updates[0].lon == Catch::Approx(-84.1));
REQUIRE(r.skipped == 5);
}


TEST_CASE("ground speed and track derive from vx/vy"){
auto one = [](const std::string& vel){
auto r = normalize_tais("TAIS/A80", tais_message("A80", tais_record(tais_track("1", "1", "1", vel))));
REQUIRE(r.updates.size() == 1);
return r.updates[0];
};

auto u = one("<vx>3</vx><vy>4</vy>");
REQUIRE(u.ground_speed_kt == std::optional<int>(5));
REQUIRE(u.ground_track_deg == std::optional<int>(37));

u = one("<vx>-10</vx><vy>0</vy>");
REQUIRE(u.ground_speed_kt == std::optional<int>(10));
REQUIRE(u.ground_track_deg == std::optional<int>(270));

u = one("<vx>0</vx><vy>-250</vy>");
REQUIRE(u.ground_track_deg == std::optional<int>(180));

u = one("<vx>0</vx><vy>0</vy>");
REQUIRE(u.ground_speed_kt == std::optional<int>(0));
REQUIRE_FALSE(u.ground_track_deg);

u = one("<vx>12</vx>");
REQUIRE_FALSE(u.ground_speed_kt);
REQUIRE_FALSE(u.ground_track_deg);

u = one("<vx>1.5</vx><vy>4</vy>");
REQUIRE_FALSE(u.ground_speed_kt);
}


TEST_CASE("heading that rounds up to 360 wraps to 0"){
// atan2(-1, 200) ~ -0.29 deg -> 359.71 -> 360 -> 0
auto r = normalize_tais("TAIS/A80", tais_message("A80", tais_record(tais_track("1", "1", "1", "<vx>-1</vx><vy>200</vy>"))));
REQUIRE(r.updates[0].ground_track_deg == std::optional<int>(0));
}


TEST_CASE("sentinels and blanks stay unset"){
auto track = tais_track("1", "1", "1", "<acAddress>000000</acAddress><reportedBeaconCode></reportedBeaconCode>");
auto fp = "<flightPlan><acid>SWA9</acid><cps>unassigned</cps><eqptSuffix>unavailable</eqptSuffix>"
"<category>unavailable</category><scratchPad1>   </scratchPad1><scratchPad2>ABC</scratchPad2>"
"<runway></runway><requestedAltitude>high</requestedAltitude></flightPlan>";
auto r = normalize_tais("TAIS/A80", tais_message("A80", tais_record(track, fp)));
REQUIRE(r.updates.size() == 1);
const auto& u = r.updates[0];
REQUIRE_FALSE(u.mode_s);
REQUIRE_FALSE(u.reported_squawk);
REQUIRE_FALSE(u.owner);
REQUIRE_FALSE(u.equipment);
REQUIRE_FALSE(u.wake);
REQUIRE_FALSE(u.scratchpad1);
REQUIRE_FALSE(u.runway);
REQUIRE_FALSE(u.requested_altitude);
REQUIRE(u.scratchpad2 == std::optional<std::string>("ABC"));
REQUIRE(u.callsign == std::optional<std::string>("SWA9"));
}


TEST_CASE("flight plan and enhanced data map to track fields"){
auto track = tais_track("77", "33.64", "-84.43",
"<reportedBeaconCode>4521</reportedBeaconCode><reportedAltitude>11000</reportedAltitude>"
"<vVert>-1500</vVert><acAddress>A1B2C3</acAddress><frozen>1</frozen><pseudo>0</pseudo>");
auto fp = "<flightPlan><acid>DAL1</acid><acType>B739</acType><flightRules>IFR</flightRules>"
"<entryFix>ERLIN</entryFix><exitFix>SMKEY</exitFix><assignedBeaconCode>4521</assignedBeaconCode>"
"<requestedAltitude>230</requestedAltitude><runway>26R</runway><scratchPad1>ERL</scratchPad1>"
"<cps>2D</cps><category>L</category><eqptSuffix>L</eqptSuffix><pendingHandoff>3F</pendingHandoff></flightPlan>";
auto enh = "<enhancedData><departureAirport>KATL</departureAirport><destinationAirport>KBOS</destinationAirport></enhancedData>";
auto r = normalize_tais("TAIS/A80", tais_message("A80", tais_record(track, fp, enh)));
REQUIRE(r.updates.size() == 1);
const auto& u = r.updates[0];
REQUIRE(u.facility == "A80");
REQUIRE(u.reported_squawk == std::optional<std::string>("4521"));
REQUIRE(u.altitude_ft == std::optional<int>(11000));
REQUIRE(u.vertical_rate_fpm == std::optional<int>(-1500));
REQUIRE(u.mode_s == std::optional<std::string>("A1B2C3"));
REQUIRE(u.frozen == std::optional<bool>(true));
REQUIRE(u.pseudo == std::optional<bool>(false));
REQUIRE(u.callsign == std::optional<std::string>("DAL1"));
REQUIRE(u.ac_type == std::optional<std::string>("B739"));
REQUIRE(u.flight_rules == std::optional<std::string>("IFR"));
REQUIRE(u.entry_fix == std::optional<std::string>("ERLIN"));
REQUIRE(u.exit_fix == std::optional<std::string>("SMKEY"));
REQUIRE(u.assigned_squawk == std::optional<std::string>("4521"));
REQUIRE(u.requested_altitude == std::optional<int>(230));
REQUIRE(u.runway == std::optional<std::string>("26R"));
REQUIRE(u.scratchpad1 == std::optional<std::string>("ERL"));
REQUIRE(u.owner == std::optional<std::string>("2D"));
REQUIRE(u.wake == std::optional<std::string>("L"));
REQUIRE(u.equipment == std::optional<std::string>("L"));
REQUIRE(u.pending_handoff == std::optional<std::string>("3F"));
REQUIRE(u.origin == std::optional<std::string>("KATL"));
REQUIRE(u.destination == std::optional<std::string>("KBOS"));
}


TEST_CASE("flags are unset when absent"){
auto r = normalize_tais("TAIS/A80", tais_message("A80", tais_record(tais_track("1", "1", "1"))));
REQUIRE_FALSE(r.updates[0].frozen);
REQUIRE_FALSE(r.updates[0].pseudo);
r = normalize_tais("TAIS/A80", tais_message("A80", tais_record(tais_track("1", "1", "1", "<frozen>true</frozen>"))));
REQUIRE(r.updates[0].frozen == std::optional<bool>(false));
}


TEST_CASE("scalar parsers"){
REQUIRE(parse_int(std::string(" 42 ")) == std::optional<int>(42));
REQUIRE(parse_int(std::string("+7")) == std::optional<int>(7));
REQUIRE(parse_int(std::string("-7")) == std::optional<int>(-7));
REQUIRE_FALSE(parse_int(std::string("4.2")));
REQUIRE_FALSE(parse_int(std::string("99999999999")));
REQUIRE_FALSE(parse_int(std::nullopt));
REQUIRE(parse_double(std::string("-84.43")) == std::optional<double>(-84.43));
REQUIRE(parse_double(std::string("1e2")) == std::optional<double>(100.0));
REQUIRE_FALSE(parse_double(std::string("nan")));
REQUIRE_FALSE(parse_double(std::string("0x10")));
REQUIRE_FALSE(parse_double(std::string("12abc")));
REQUIRE_FALSE(parse_double(std::string("")));
}
