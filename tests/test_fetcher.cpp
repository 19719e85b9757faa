#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <limits>

#include <skysync/fetcher.hpp>
#include <skysync/settings.hpp>
#include <skysync/token_cache.hpp>
#include "fakes.hpp"

using Catch::Approx;
using namespace skysync;
using namespace skysync::test;

namespace {

const BBox kNyc{40.5, -74.1, 40.8, -73.8};

std::string one_aircraft(double now) {
  return states_body(now, {StateRow{.icao24 = "abc123", .lat = 40.6, .lon = -73.9, .time_position = now}});
}

struct Rig {
  explicit Rig(Settings c = {}) : cfg(std::move(c)), tokens(http, clock, cfg), fetcher(http, tokens, clock, cfg) {}
  Settings cfg;
  ManualClock clock;
  ScriptedHttpClient http;
  TokenCache tokens;
  SnapshotFetcher fetcher;
};

Settings credentials() {
  Settings s;
  s.client_id = "id";
  s.client_secret = "secret";
  return s;
}

} // namespace

TEST_CASE("successful fetch returns named reports and attaches the bearer token") {
  Rig rig(credentials());
  rig.http.push_post(respond(200, token_body("tok", 1800)));
  rig.http.push_get(respond(200, one_aircraft(rig.clock.now())));

  const FetchResult r = rig.fetcher.fetch_region(kNyc);
  REQUIRE(r.ok());
  REQUIRE(r.data.aircraft.size() == 1);
  REQUIRE(r.data.aircraft[0].id == "abc123");
  REQUIRE_FALSE(r.data.fallback);

  const auto& get = rig.http.requests.back();
  REQUIRE(get.method == HttpRequest::Method::Get);
  REQUIRE(has_header(get, "Authorization: Bearer tok"));
  REQUIRE(get.url.find("lamin=40.5000") != std::string::npos);
  REQUIRE(get.timeout_s == Approx(rig.cfg.request_timeout_s));
}

TEST_CASE("anonymous queries go out without a token only when allowed") {
  Rig rig;   // no credentials
  rig.http.push_get(respond(200, one_aircraft(rig.clock.now())));
  const FetchResult ok = rig.fetcher.fetch_region(kNyc, /*auth_optional*/ true);
  REQUIRE(ok.ok());
  REQUIRE(rig.http.requests.back().headers.empty());

  const FetchResult denied = rig.fetcher.fetch_region(kNyc, /*auth_optional*/ false);
  REQUIRE(denied.code == ErrorCode::Auth);
  REQUIRE(rig.http.gets() == 1);
}

TEST_CASE("persistent 5xx produces flagged fallback data after the retry budget") {
  Rig rig;
  for (int i = 0; i < 3; ++i) rig.http.push_get(respond(503));

  const FetchResult r = rig.fetcher.fetch_region(kNyc);
  REQUIRE(r.ok());
  REQUIRE(r.data.fallback);
  REQUIRE(r.data.source == "synthetic");
  REQUIRE_FALSE(r.data.message.empty());
  REQUIRE_FALSE(r.data.aircraft.empty());
  for (const auto& a : r.data.aircraft) REQUIRE(kNyc.contains(a.snapshot.lat, a.snapshot.lon));

  REQUIRE(rig.http.gets() == 3);
  REQUIRE(rig.clock.sleeps.size() == 2);
  REQUIRE(rig.clock.sleeps[0] == Approx(1.0));
  REQUIRE(rig.clock.sleeps[1] == Approx(2.0));
}

TEST_CASE("without fallback an exhausted budget is UpstreamUnavailable") {
  Settings cfg;
  cfg.fallback_enabled = false;
  Rig rig(cfg);
  rig.http.push_get(respond(500));
  rig.http.push_get(timeout_response());
  rig.http.push_get(respond(502));

  const FetchResult r = rig.fetcher.fetch_region(kNyc);
  REQUIRE(r.code == ErrorCode::UpstreamUnavailable);
  REQUIRE(http_status_for(r.code) == 503);
  REQUIRE(rig.http.gets() == 3);
}

TEST_CASE("transient failures recover within the budget") {
  Rig rig;
  rig.http.push_get(timeout_response());
  rig.http.push_get(respond(200, "{not json"));
  rig.http.push_get(respond(200, one_aircraft(rig.clock.now())));

  const FetchResult r = rig.fetcher.fetch_region(kNyc);
  REQUIRE(r.ok());
  REQUIRE_FALSE(r.data.fallback);
  REQUIRE(rig.http.gets() == 3);
}

TEST_CASE("backoff doubles from the base delay") {
  Rig rig;
  REQUIRE(rig.fetcher.backoff_delay(1) == Approx(1.0));
  REQUIRE(rig.fetcher.backoff_delay(2) == Approx(2.0));
  REQUIRE(rig.fetcher.backoff_delay(3) == Approx(4.0));
}

TEST_CASE("429 surfaces RateLimited with the retry-after hint and no retry") {
  Rig rig;
  HttpResponse limited = respond(429);
  limited.headers["x-rate-limit-retry-after-seconds"] = "42";
  rig.http.push_get(limited);

  const FetchResult r = rig.fetcher.fetch_region(kNyc);
  REQUIRE(r.code == ErrorCode::RateLimited);
  REQUIRE(r.retry_after_s == Approx(42.0));
  REQUIRE(rig.http.gets() == 1);
  REQUIRE(rig.clock.sleeps.empty());
}

TEST_CASE("401 refreshes the token and retries once") {
  Rig rig(credentials());
  rig.http.push_post(respond(200, token_body("old", 1800)));
  rig.http.push_post(respond(200, token_body("new", 1800)));
  rig.http.push_get(respond(401));
  rig.http.push_get(respond(200, one_aircraft(rig.clock.now())));

  const FetchResult r = rig.fetcher.fetch_region(kNyc);
  REQUIRE(r.ok());
  REQUIRE(rig.http.posts() == 2);
  REQUIRE(has_header(rig.http.requests.back(), "Authorization: Bearer new"));
}

TEST_CASE("a second 401 is an AuthError") {
  Rig rig(credentials());
  rig.http.push_post(respond(200, token_body("old", 1800)));
  rig.http.push_post(respond(200, token_body("new", 1800)));
  rig.http.push_get(respond(401));
  rig.http.push_get(respond(401));

  const FetchResult r = rig.fetcher.fetch_region(kNyc);
  REQUIRE(r.code == ErrorCode::Auth);
  REQUIRE(rig.http.gets() == 2);
}

TEST_CASE("other 4xx is not retried") {
  Settings cfg;
  cfg.fallback_enabled = false;
  Rig rig(cfg);
  rig.http.push_get(respond(404));
  const FetchResult r = rig.fetcher.fetch_region(kNyc);
  REQUIRE(r.code == ErrorCode::UpstreamUnavailable);
  REQUIRE(rig.http.gets() == 1);
}

TEST_CASE("cancelled token stops before any request") {
  Rig rig;
  CancelToken cancel;
  cancel.cancel();
  const FetchResult r = rig.fetcher.fetch_region(kNyc, &cancel);
  REQUIRE(r.code == ErrorCode::Cancelled);
  REQUIRE(rig.http.requests.empty());
}

TEST_CASE("bounds are validated and clamped") {
  Rig rig;
  const double nan = std::numeric_limits<double>::quiet_NaN();
  REQUIRE(rig.fetcher.fetch_region(BBox{nan, 0, 1, 1}).code == ErrorCode::Validation);
  REQUIRE(rig.http.requests.empty());

  rig.http.push_get(respond(200, R"({"time":1,"states":null})"));
  REQUIRE(rig.fetcher.fetch_region(BBox{80.0, 170.0, 95.0, 185.0}).ok());
  const auto& url = rig.http.requests.back().url;
  REQUIRE(url.find("lamax=90.0000") != std::string::npos);
  REQUIRE(url.find("lomax=180.0000") != std::string::npos);
}
