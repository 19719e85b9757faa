#pragma once
#include <optional>
#include <string>
#include <vector>

namespace skysync {

// Single immutable observation of one aircraft
struct Snapshot {
  double lon = 0.0;                     // degrees
  double lat = 0.0;                     // degrees
  std::optional<double> heading_deg;    // true track [0, 360), may be absent
  std::optional<double> ground_speed_mps;  // m/s, absent when not reported
  double vertical_rate_mps = 0.0;
  double altitude_m = 0.0;              // baro, else geometric
  bool on_ground = false;
  double observed_at = 0.0;             // unix seconds
};

// One upstream state vector with named fields.
struct AircraftReport {
  std::string id;               // ICAO24 transponder address (lower-case hex)
  std::string callsign;         // trimmed, may be empty
  std::string origin_country;
  std::string squawk;
  Snapshot snapshot;
};

struct SnapshotSet {
  std::vector<AircraftReport> aircraft;
  bool fallback = false;        // true when synthesized, never real data
  std::string message;          // human readable note for the user
  std::string source;           // "opensky", "synthetic", ...
};

} // namespace skysync
