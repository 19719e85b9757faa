#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <cmath>

#include <skysync/interp.hpp>
#include <skysync/snapshot.hpp>

using Catch::Approx;
using namespace skysync;

static Snapshot snap(double lon, double lat, std::optional<double> hdg, double speed = 200.0) {
  Snapshot s;
  s.lon = lon; s.lat = lat; s.heading_deg = hdg; s.ground_speed_mps = speed;
  s.altitude_m = 10000.0;
  return s;
}

static const InterpParams kParams{ .update_interval_s = 15.0, .min_ground_speed_mps = 0.5 };

TEST_CASE("interpolate is linear in progress") {
  const auto a = snap(0.0, 0.0, 0.0);
  const auto b = snap(10.0, 20.0, 90.0);

  const Pose p = interpolate(a, b, 100.0, 107.5, kParams);  // half-way
  REQUIRE(p.progress == Approx(0.5));
  REQUIRE(p.lon == Approx(5.0));
  REQUIRE(p.lat == Approx(10.0));
  REQUIRE(p.heading_deg == Approx(45.0));
}

TEST_CASE("progress is clamped to [0, 1]") {
  const auto a = snap(0.0, 0.0, 0.0);
  const auto b = snap(10.0, 10.0, 0.0);
  // before start -> previous
  const Pose before = interpolate(a, b, 100.0, 90.0, kParams);
  REQUIRE(before.progress == 0.0);
  REQUIRE(before.lon == Approx(0.0));
  // long after -> target
  const Pose after = interpolate(a, b, 100.0, 1000.0, kParams);
  REQUIRE(after.progress == 1.0);
  REQUIRE(after.lon == 10.0);
}

TEST_CASE("progress 1 returns exactly the target") {
  const auto a = snap(-73.9, 40.6, 350.0);
  const auto b = snap(-73.7, 40.9, 10.0);
  const Pose p = interpolate(a, b, 0.0, 15.0, kParams);
  REQUIRE(p.lon == b.lon);
  REQUIRE(p.lat == b.lat);
  REQUIRE(p.heading_deg == 10.0);
}

TEST_CASE("heading takes the shorter arc across north") {
  const auto a = snap(0.0, 0.0, 350.0);
  const auto b = snap(1.0, 1.0, 10.0);
  const Pose p = interpolate(a, b, 0.0, 7.5, kParams);
  // halfway should be ~0 deg (cos ~ 1, sin ~ 0)
  REQUIRE(std::cos(p.heading_deg * kDegToRad) == Approx(1.0).margin(1e-9));
  REQUIRE(std::sin(p.heading_deg * kDegToRad) == Approx(0.0).margin(1e-9));
  REQUIRE(p.heading_deg >= 0.0);
  REQUIRE(p.heading_deg < 360.0);
}

TEST_CASE("missing heading borrows the other side") {
  const auto a = snap(0.0, 0.0, std::nullopt);
  const auto b = snap(1.0, 1.0, 120.0);
  REQUIRE(interpolate(a, b, 0.0, 3.0, kParams).heading_deg == Approx(120.0));
  REQUIRE(interpolate(b, a, 0.0, 3.0, kParams).heading_deg == Approx(120.0));
  const auto c = snap(1.0, 1.0, std::nullopt);
  REQUIRE(interpolate(a, c, 0.0, 3.0, kParams).heading_deg == 0.0);
}

TEST_CASE("slow targets snap instead of sliding") {
  const auto a = snap(0.0, 0.0, 0.0, 0.0);
  const auto b = snap(1.0, 1.0, 0.0, 0.1);   // below min_ground_speed_mps
  const Pose early = interpolate(a, b, 0.0, 6.0, kParams);   // progress 0.4
  REQUIRE(early.lon == 0.0);
  REQUIRE(early.lat == 0.0);
  const Pose late = interpolate(a, b, 0.0, 9.0, kParams);    // progress 0.6
  REQUIRE(late.lon == 1.0);
  REQUIRE(late.lat == 1.0);
}

TEST_CASE("an unreported target speed still slides") {
  const auto a = snap(0.0, 0.0, 0.0);
  Snapshot b = snap(1.0, 1.0, 0.0);
  b.ground_speed_mps.reset();
  const Pose p = interpolate(a, b, 0.0, 6.0, kParams);   // progress 0.4
  REQUIRE(p.lon == Approx(0.4));
  REQUIRE(p.lat == Approx(0.4));
}

TEST_CASE("interp_progress never moves backward as time advances") {
  double prev = -1.0;
  for (double t = 95.0; t < 130.0; t += 0.25) {
    const double p = interp_progress(100.0, t, 15.0);
    REQUIRE(p >= prev);
    REQUIRE(p >= 0.0);
    REQUIRE(p <= 1.0);
    prev = p;
  }
}
