#pragma once
#include <cmath>
#include <numbers>
#include <string>
#include <vector>

namespace skysync {

// Constant naming convention (kCamelCase)
inline constexpr double kPI = std::numbers::pi_v<double>;
inline constexpr double kDegToRad = kPI / 180.0;
inline constexpr double kRadToDeg = 180.0 / kPI;

// Geographic bounding box in degrees. lat = y, lon = x.
struct BBox {
  double lat_min = 0.0;
  double lon_min = 0.0;
  double lat_max = 0.0;
  double lon_max = 0.0;

  double width_deg() const  { return lon_max - lon_min; }
  double height_deg() const { return lat_max - lat_min; }

  bool contains(double lat, double lon) const {
    return lat >= lat_min && lat <= lat_max && lon >= lon_min && lon <= lon_max;
  }

  bool operator==(const BBox&) const = default;
};

inline double lerp(double a, double b, double t) { return a + (b - a) * t; }

inline double clamp01(double x) {
  return x < 0.0 ? 0.0 : (x > 1.0 ? 1.0 : x);
}

// Heading into [0, 360)
inline double normalize_heading(double deg) {
  deg = std::fmod(deg, 360.0);
  if (deg < 0.0) deg += 360.0;
  if (deg >= 360.0) deg -= 360.0;
  return deg;
}

// Signed shortest difference b - a, in [-180, 180]
inline double heading_diff(double a, double b) {
  double d = normalize_heading(b) - normalize_heading(a);
  if (d >  180.0) d -= 360.0;
  if (d < -180.0) d += 360.0;
  return d;
}

// Circular interpolation along the shorter arc; result in [0, 360).
inline double lerp_heading_shortest(double a, double b, double t) {
  return normalize_heading(normalize_heading(a) + heading_diff(a, b) * t);
}

// All four bounds finite and min <= max on both axes.
bool is_valid(const BBox& b);

// Latitude into [-90, 90], longitude into [-180, 180].
BBox clamp_to_world(const BBox& b);

// Rounds each edge to a multiple of `precision_deg` and formats a stable key.
std::string canonical_key(const BBox& b, double precision_deg);

// Grid of ceil(w/cap) x ceil(h/cap) equal tiles covering `b` exactly.
// Row-major from (lat_min, lon_min). A box already within the cap yields itself.
std::vector<BBox> split_into_tiles(const BBox& b, double max_extent_deg);

} // namespace skysync
