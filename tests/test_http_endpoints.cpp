/*
 * File: tests/test_http_endpoints.cpp
 * Project: TAIS Track Relay
 * Purpose: HTTP routing and handlers
 * Last updated: 2026-10-18
 */

#include <catch2/catch_all.hpp>
#include <boost/asio.hpp>
#include <boost/beast/http.hpp>
#include "relay_http.hpp"
#include "tais_fixtures.hpp"

static http::request<http::string_body> get(const std::string& target){
http::request<http::string_body> req{http::verb::get, target, 11};
return req;
}

static http::request<http::string_body> post(const std::string& target, const std::string& body){
http::request<http::string_body> req{http::verb::post, target, 11};
req.body() = body;
req.prepare_payload();
return req;
}


TEST_CASE("ingest route feeds the relay"){
RelayState state{RelayConfig{}};
auto res = handle_request(post("/v1/tais/ingest?topic=TAIS%2FA80", tais_simple("A80", "12", 33.6, -84.4)), state);
REQUIRE(res.result() == http::status::ok);
auto j = nlohmann::json::parse(res.body());
REQUIRE(j["status"] == "ok");
REQUIRE(j["facility"] == "A80");
REQUIRE(j["applied"] == 1);
REQUIRE(state.relay.store().find("A80", "12"));
}


TEST_CASE("ingest route rejects missing topic and broken XML"){
RelayState state{RelayConfig{}};
REQUIRE(handle_request(post("/v1/tais/ingest", "<x/>"), state).result() == http::status::bad_request);
auto res = handle_request(post("/v1/tais/ingest?topic=TAIS/A80", "<TATrackAndFlightPlan>"), state);
REQUIRE(res.result() == http::status::bad_request);
REQUIRE(nlohmann::json::parse(res.body())["status"] == "malformed");

res = handle_request(post("/v1/tais/ingest?topic=SMES/KATL", tais_simple("A80", "1", 1, 1)), state);
REQUIRE(res.result() == http::status::ok);
REQUIRE(nlohmann::json::parse(res.body())["status"] == "ignored_topic");
REQUIRE(state.relay.store().track_count() == 0);
}


TEST_CASE("directory and snapshot routes"){
RelayState state{RelayConfig{}};
state.relay.process_message("TAIS/A80", tais_simple("A80", "1", 1, 1, "DAL1"));
state.relay.process_message("TAIS/N90", tais_simple("N90", "1", 1, 1));
state.relay.process_message("TAIS/N90", tais_simple("N90", "2", 1, 1));

auto dir = nlohmann::json::parse(handle_request(get("/v1/tais/facilities"), state).body());
REQUIRE(dir.size() == 2);
REQUIRE(dir[0]["facility"] == "N90");
REQUIRE(dir[0]["trackCount"] == 2);

auto snap = nlohmann::json::parse(handle_request(get("/v1/tais/facilities/A80"), state).body());
REQUIRE(snap["facility"] == "A80");
REQUIRE(snap["tracks"].size() == 1);
REQUIRE(snap["tracks"][0]["callsign"] == "DAL1");

auto empty = nlohmann::json::parse(handle_request(get("/v1/tais/facilities/ZZZ"), state).body());
REQUIRE(empty["facility"] == "ZZZ");
REQUIRE(empty["tracks"].empty());
}


TEST_CASE("health, config and fallback"){
RelayConfig cfg; cfg.stale_after = std::chrono::seconds(90);
RelayState state{cfg};
auto health = nlohmann::json::parse(handle_request(get("/health"), state).body());
REQUIRE(health["status"] == "ok");
REQUIRE(health["tracks"] == 0);
REQUIRE(health["records_applied"] == 0);

state.relay.process_message("TAIS/A80", tais_simple("A80", "1", 1, 1));
state.relay.process_message("TAIS/A80", tais_simple("A80", "2", 1, 1));
health = nlohmann::json::parse(handle_request(get("/health"), state).body());
REQUIRE(health["messages"] == 2);
REQUIRE(health["records_applied"] == 2);
REQUIRE(health["records_skipped"] == 0);
REQUIRE(health["frames_sent"] == 0);
REQUIRE(health["frames_dropped"] == 0);
REQUIRE(health["tracks_purged"] == 0);
REQUIRE(health["tracks"] == 2);

auto conf = nlohmann::json::parse(handle_request(get("/v1/config"), state).body());
REQUIRE(conf["stale_s"] == 90);
REQUIRE(conf["flush_ms"] == 1000);

REQUIRE(handle_request(get("/nope"), state).result() == http::status::not_found);
REQUIRE(handle_request(post("/v1/tais/facilities", ""), state).result() == http::status::not_found);
}


TEST_CASE("query and path helpers"){
REQUIRE(query_param("/x?a=1&topic=TAIS%2FZNY&b=2", "topic") == "TAIS/ZNY");
REQUIRE(query_param("/x?topic=", "topic").empty());
REQUIRE(query_param("/x", "topic").empty());
REQUIRE(target_path("/v1/tais/facilities?x=1") == "/v1/tais/facilities");
REQUIRE(percent_decode("A%2fB+C") == "A/B+C");
REQUIRE(percent_decode("A%2fB+C", true) == "A/B C");
REQUIRE(query_param("/x?topic=TAIS/A+B", "topic") == "TAIS/A B");
}


TEST_CASE("facility path segment keeps a literal plus"){
RelayState state{RelayConfig{}};
state.relay.process_message("TAIS/A+B", tais_simple("A+B", "1", 1, 1));
auto snap = nlohmann::json::parse(handle_request(get("/v1/tais/facilities/A+B"), state).body());
REQUIRE(snap["facility"] == "A+B");
REQUIRE(snap["tracks"].size() == 1);
}
