#pragma once
#include <skysync/geo.hpp>
#include <skysync/settings.hpp>
#include <skysync/snapshot.hpp>

namespace skysync {

struct InterpParams {
  double update_interval_s = 15.0;
  double min_ground_speed_mps = 0.5;

  static InterpParams from(const Settings& s) {
    return InterpParams{ .update_interval_s = s.update_interval_s,
                         .min_ground_speed_mps = s.min_ground_speed_mps };
  }
};

// Rendered position of one aircraft at some instant.
struct Pose {
  double lon = 0.0;
  double lat = 0.0;
  double heading_deg = 0.0;   // [0, 360)
  double altitude_m = 0.0;
  double progress = 0.0;      // [0, 1]
};

// Linear progress of the interval that started at `start`; clamped to [0, 1].
inline double interp_progress(double start, double now, double update_interval_s) {
  if (update_interval_s <= 0.0) return 1.0;
  return clamp01((now - start) / update_interval_s);
}

// Pose between `prev` and `target` at `now`.
// - lon/lat/altitude linear in progress
// - heading along the shorter arc; a missing side borrows the other, both missing -> 0
// - target reported slower than min_ground_speed_mps: position snaps (prev below 0.5, target from 0.5)
// - progress 1 returns exactly the target
inline Pose interpolate(const Snapshot& prev, const Snapshot& target,
                        double start, double now, const InterpParams& p) {
  const double t = interp_progress(start, now, p.update_interval_s);

  const double h_target = target.heading_deg.value_or(prev.heading_deg.value_or(0.0));
  const double h_prev   = prev.heading_deg.value_or(h_target);

  Pose out;
  out.progress = t;
  if (t >= 1.0) {
    out.lon = target.lon;
    out.lat = target.lat;
    out.altitude_m = target.altitude_m;
    out.heading_deg = normalize_heading(h_target);
    return out;
  }

  out.heading_deg = lerp_heading_shortest(h_prev, h_target, t);
  if (target.ground_speed_mps && *target.ground_speed_mps < p.min_ground_speed_mps) {
    const Snapshot& at = (t < 0.5) ? prev : target;
    out.lon = at.lon;
    out.lat = at.lat;
    out.altitude_m = at.altitude_m;
  } else {
    out.lon = lerp(prev.lon, target.lon, t);
    out.lat = lerp(prev.lat, target.lat, t);
    out.altitude_m = lerp(prev.altitude_m, target.altitude_m, t);
  }
  return out;
}

} // namespace skysync
