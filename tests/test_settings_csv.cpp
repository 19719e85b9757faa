#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <cstdlib>
#include <sstream>

#include <skysync/settings.hpp>

using Catch::Approx;
using namespace skysync;

static std::string csv_minimal = R"(key,value
update_interval_s,10
max_view_extent_deg,40
fallback_enabled,false
max_attempts,5
api_base_url,http://localhost:8080/api
)";

static std::string csv_with_noise = R"( Key , Value
# comment lines are ignored

 soft_stale_s , 20
tile_ttl_s, not-a-number
unknown_key,1
max_attempts,2.5
,
min_opacity,1.7
)";

TEST_CASE("settings_from_csv_stream parses valid rows") {
  std::istringstream ss(csv_minimal);
  const Settings s = settings_from_csv_stream(ss);
  REQUIRE(s.update_interval_s == Approx(10.0));
  REQUIRE(s.max_view_extent_deg == Approx(40.0));
  REQUIRE_FALSE(s.fallback_enabled);
  REQUIRE(s.max_attempts == 5);
  REQUIRE(s.api_base_url == "http://localhost:8080/api");
  // untouched keys keep defaults
  REQUIRE(s.tile_max_extent_deg == Approx(20.0));
  REQUIRE(s.throttle_interval_s == Approx(0.5));
}

TEST_CASE("settings_from_csv_stream handles spaces, comments and bad rows") {
  std::istringstream ss(csv_with_noise);
  const Settings s = settings_from_csv_stream(ss);
  REQUIRE(s.soft_stale_s == Approx(20.0));
  REQUIRE(s.tile_ttl_s == Approx(10.0));     // invalid value skipped
  REQUIRE(s.max_attempts == 3);              // non-integer skipped
  REQUIRE(s.min_opacity == Approx(1.0));     // clamped
}

TEST_CASE("integer settings beyond int range are skipped") {
  std::istringstream ss("max_attempts,1e20\nfallback_count,3e10\n");
  const Settings s = settings_from_csv_stream(ss);
  REQUIRE(s.max_attempts == 3);
  REQUIRE(s.fallback_count == 12);
}

TEST_CASE("hard stale threshold is raised to the soft one") {
  std::istringstream ss("soft_stale_s,90\nhard_stale_s,45\n");
  const Settings s = settings_from_csv_stream(ss);
  REQUIRE(s.hard_stale_s == Approx(90.0));
}

TEST_CASE("defaults match the documented values") {
  const Settings s;
  REQUIRE(s.update_interval_s == 15.0);
  REQUIRE(s.soft_stale_s == 30.0);
  REQUIRE(s.hard_stale_s == 60.0);
  REQUIRE(s.max_view_extent_deg == 80.0);
  REQUIRE(s.tile_ttl_s == 10.0);
  REQUIRE(s.request_timeout_s == 10.0);
  REQUIRE(s.max_attempts == 3);
  REQUIRE(s.backoff_base_s == 1.0);
  REQUIRE(s.fallback_enabled);
}

TEST_CASE("load_settings_csv returns nullopt on missing file") {
  auto none = load_settings_csv("this_file_does_not_exist.csv");
  REQUIRE_FALSE(none.has_value());
}

TEST_CASE("environment credentials override the file") {
  Settings s;
  s.client_id = "from-file";
  ::setenv("OPENSKY_CLIENT_ID", "env-id", 1);
  ::setenv("OPENSKY_CLIENT_SECRET", "env-secret", 1);
  apply_env_overrides(s);
  ::unsetenv("OPENSKY_CLIENT_ID");
  ::unsetenv("OPENSKY_CLIENT_SECRET");
  REQUIRE(s.client_id == "env-id");
  REQUIRE(s.client_secret == "env-secret");
}
