#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <skysync/opensky.hpp>

using Catch::Approx;
using namespace skysync;

static const char* kStates = R"({
  "time": 1700000100,
  "states": [
    ["A0B1C2", "UAL123  ", "United States", 1700000095, 1700000099, -73.95, 40.65,
     10668.0, false, 231.5, 275.3, -1.2, null, 10900.0, "1234", false, 0],
    ["ffee01", null, "Germany", null, 1700000090, 8.55, 50.03,
     null, false, 120.0, null, null, null, 3200.0, null, false, 0],
    ["deadbe", "NOPOS", "France", 1700000095, 1700000099, null, null,
     1000.0, false, 100.0, 10.0, 0.0, null, 1000.0, null, false, 0],
    ["", "NOID", "France", 1700000095, 1700000099, 1.0, 1.0,
     1000.0, false, 100.0, 10.0, 0.0, null, 1000.0, null, false, 0]
  ]
})";

TEST_CASE("parse_states maps positional fields to named reports") {
  std::string err;
  auto set = opensky::parse_states(kStates, &err);
  REQUIRE(set.has_value());
  REQUIRE(set->source == "opensky");
  REQUIRE_FALSE(set->fallback);
  REQUIRE(set->aircraft.size() == 2);   // no position / no id dropped

  const auto& a = set->aircraft[0];
  REQUIRE(a.id == "a0b1c2");
  REQUIRE(a.callsign == "UAL123");
  REQUIRE(a.origin_country == "United States");
  REQUIRE(a.squawk == "1234");
  REQUIRE(a.snapshot.lon == Approx(-73.95));
  REQUIRE(a.snapshot.lat == Approx(40.65));
  REQUIRE(a.snapshot.altitude_m == Approx(10668.0));
  REQUIRE(a.snapshot.ground_speed_mps.value() == Approx(231.5));
  REQUIRE(a.snapshot.heading_deg.has_value());
  REQUIRE(*a.snapshot.heading_deg == Approx(275.3));
  REQUIRE(a.snapshot.vertical_rate_mps == Approx(-1.2));
  REQUIRE(a.snapshot.observed_at == Approx(1700000095.0));
  REQUIRE_FALSE(a.snapshot.on_ground);
}

TEST_CASE("parse_states falls back for missing optional fields") {
  auto set = opensky::parse_states(kStates);
  REQUIRE(set.has_value());
  const auto& b = set->aircraft[1];
  REQUIRE(b.callsign.empty());
  REQUIRE(b.snapshot.altitude_m == Approx(3200.0));          // geometric when baro missing
  REQUIRE_FALSE(b.snapshot.heading_deg.has_value());
  REQUIRE(b.snapshot.vertical_rate_mps == 0.0);
  REQUIRE(b.snapshot.observed_at == Approx(1700000090.0));   // last_contact
}

TEST_CASE("parse_states keeps an unreported velocity absent") {
  auto set = opensky::parse_states(R"({"time": 10, "states": [
    ["abc001", "KLM9", "Netherlands", 10, 10, 4.7, 52.3, 9000.0, false, null, 90.0, 0.0, null, 9050.0, null, false, 0]
  ]})");
  REQUIRE(set.has_value());
  REQUIRE(set->aircraft.size() == 1);
  REQUIRE_FALSE(set->aircraft[0].snapshot.ground_speed_mps.has_value());
}

TEST_CASE("parse_states treats null states as an empty set") {
  auto set = opensky::parse_states(R"({"time": 1, "states": null})");
  REQUIRE(set.has_value());
  REQUIRE(set->aircraft.empty());
}

TEST_CASE("parse_states rejects malformed documents") {
  std::string err;
  REQUIRE_FALSE(opensky::parse_states("<html>Bad Gateway</html>", &err).has_value());
  REQUIRE_FALSE(err.empty());
  REQUIRE_FALSE(opensky::parse_states(R"({"states": 12})").has_value());
  REQUIRE_FALSE(opensky::parse_states("[1,2,3]").has_value());
}

TEST_CASE("states_url carries the bounding box") {
  const auto url = opensky::states_url("https://example.org/api/", BBox{40.5, -74.1, 40.8, -73.8});
  REQUIRE(url == "https://example.org/api/states/all?lamin=40.5000&lomin=-74.1000&lamax=40.8000&lomax=-73.8000");
}

TEST_CASE("token request body is form encoded") {
  REQUIRE(opensky::token_request_body("my id", "s&cret") ==
          "grant_type=client_credentials&client_id=my%20id&client_secret=s%26cret");
}

TEST_CASE("parse_token reads access_token and expires_in") {
  auto g = opensky::parse_token(R"({"access_token":"abc","expires_in":1800,"token_type":"Bearer"})");
  REQUIRE(g.has_value());
  REQUIRE(g->access_token == "abc");
  REQUIRE(g->expires_in_s == Approx(1800.0));

  auto no_exp = opensky::parse_token(R"({"access_token":"abc"})");
  REQUIRE(no_exp.has_value());
  REQUIRE(no_exp->expires_in_s == 0.0);

  REQUIRE_FALSE(opensky::parse_token(R"({"error":"invalid_client"})").has_value());
  REQUIRE_FALSE(opensky::parse_token("not json").has_value());
}

TEST_CASE("retry_after_hint prefers the provider specific header") {
  HttpResponse r;
  r.status = 429;
  REQUIRE_FALSE(opensky::retry_after_hint(r).has_value());
  r.headers["retry-after"] = "30";
  REQUIRE(*opensky::retry_after_hint(r) == Approx(30.0));
  r.headers["x-rate-limit-retry-after-seconds"] = "120";
  REQUIRE(*opensky::retry_after_hint(r) == Approx(120.0));
}
