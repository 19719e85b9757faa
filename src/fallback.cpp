#include <skysync/fallback.hpp>
#include <array>
#include <cstdio>
#include <string>
#include <unordered_set>

namespace skysync {

namespace {

constexpr std::array<const char*, 8> kAirlines = {
  "UAL", "DAL", "AAL", "BAW", "DLH", "AFR", "KLM", "SWA"
};
constexpr std::array<const char*, 5> kCountries = {
  "United States", "United Kingdom", "Germany", "France", "Netherlands"
};

// FNV-1a
std::uint32_t hash_str(const std::string& s) {
  std::uint32_t h = 2166136261u;
  for (unsigned char c : s) {
    h ^= c;
    h *= 16777619u;
  }
  return h;
}

} // namespace

std::uint32_t fallback_seed(const BBox& b) {
  return hash_str(canonical_key(b, 0.01));
}

SnapshotSet synthesize_fallback(const BBox& b, int count, double now, std::mt19937& rng) {
  SnapshotSet out;
  out.fallback = true;
  out.source = "synthetic";
  out.message = "Live data unavailable; showing sample traffic";
  if (count <= 0 || !is_valid(b)) return out;

  // Keep a small margin so every point is strictly inside the box.
  const double mlat = b.height_deg() * 0.02;
  const double mlon = b.width_deg() * 0.02;
  std::uniform_real_distribution<double> U_lat(b.lat_min + mlat, b.lat_max - mlat);
  std::uniform_real_distribution<double> U_lon(b.lon_min + mlon, b.lon_max - mlon);
  std::uniform_real_distribution<double> U_hdg(0.0, 360.0);
  std::uniform_real_distribution<double> U_spd(180.0, 260.0);   // m/s, cruise
  std::uniform_real_distribution<double> U_alt(3000.0, 12000.0);
  std::uniform_real_distribution<double> U_vr(-5.0, 5.0);
  std::uniform_int_distribution<int> U_airline(0, static_cast<int>(kAirlines.size()) - 1);
  std::uniform_int_distribution<int> U_country(0, static_cast<int>(kCountries.size()) - 1);
  std::uniform_int_distribution<int> U_flight(100, 9999);
  std::uniform_int_distribution<unsigned> U_addr(0u, 0xFFFFFFu);
  std::unordered_set<std::string> used;

  out.aircraft.reserve(static_cast<std::size_t>(count));
  for (int i = 0; i < count; ++i) {
    AircraftReport r;
    char id[16];
    do {
      std::snprintf(id, sizeof(id), "%06x", U_addr(rng));
    } while (!used.insert(id).second);
    r.id = id;
    r.callsign = std::string(kAirlines[U_airline(rng)]) + std::to_string(U_flight(rng));
    r.origin_country = kCountries[U_country(rng)];
    r.squawk = "2000";

    Snapshot& s = r.snapshot;
    s.lat = U_lat(rng);
    s.lon = U_lon(rng);
    s.heading_deg = U_hdg(rng);
    s.ground_speed_mps = U_spd(rng);
    s.altitude_m = U_alt(rng);
    s.vertical_rate_mps = U_vr(rng);
    s.on_ground = false;
    s.observed_at = now;
    out.aircraft.push_back(std::move(r));
  }
  return out;
}

SnapshotSet synthesize_fallback(const BBox& b, int count, double now) {
  std::mt19937 rng(fallback_seed(b));
  return synthesize_fallback(b, count, now, rng);
}

} // namespace skysync
