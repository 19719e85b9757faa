#include <skysync/geo.hpp>
#include <algorithm>
#include <cstdio>

namespace skysync {

bool is_valid(const BBox& b) {
  if (!std::isfinite(b.lat_min) || !std::isfinite(b.lon_min) ||
      !std::isfinite(b.lat_max) || !std::isfinite(b.lon_max)) return false;
  return b.lat_min <= b.lat_max && b.lon_min <= b.lon_max;
}

BBox clamp_to_world(const BBox& b) {
  return BBox{
    std::clamp(b.lat_min, -90.0, 90.0),
    std::clamp(b.lon_min, -180.0, 180.0),
    std::clamp(b.lat_max, -90.0, 90.0),
    std::clamp(b.lon_max, -180.0, 180.0),
  };
}

static double round_to(double v, double step) {
  if (step <= 0.0) return v;
  const double r = std::round(v / step) * step;
  return r == 0.0 ? 0.0 : r; // no "-0.00" keys
}

std::string canonical_key(const BBox& b, double precision_deg) {
  char buf[128];
  std::snprintf(buf, sizeof(buf), "%.4f,%.4f,%.4f,%.4f",
                round_to(b.lat_min, precision_deg),
                round_to(b.lon_min, precision_deg),
                round_to(b.lat_max, precision_deg),
                round_to(b.lon_max, precision_deg));
  return std::string(buf);
}

std::vector<BBox> split_into_tiles(const BBox& b, double max_extent_deg) {
  const double w = b.width_deg();
  const double h = b.height_deg();
  if (max_extent_deg <= 0.0 || (w <= max_extent_deg && h <= max_extent_deg)) {
    return {b};
  }

  const int nx = std::max(1, static_cast<int>(std::ceil(w / max_extent_deg)));
  const int ny = std::max(1, static_cast<int>(std::ceil(h / max_extent_deg)));
  const double dx = w / nx;
  const double dy = h / ny;

  std::vector<BBox> tiles;
  tiles.reserve(static_cast<std::size_t>(nx) * static_cast<std::size_t>(ny));
  for (int iy = 0; iy < ny; ++iy) {
    // Outer edges are taken from the original box so rounding never opens a gap.
    const double la0 = (iy == 0)      ? b.lat_min : b.lat_min + dy * iy;
    const double la1 = (iy == ny - 1) ? b.lat_max : b.lat_min + dy * (iy + 1);
    for (int ix = 0; ix < nx; ++ix) {
      const double lo0 = (ix == 0)      ? b.lon_min : b.lon_min + dx * ix;
      const double lo1 = (ix == nx - 1) ? b.lon_max : b.lon_min + dx * (ix + 1);
      tiles.push_back(BBox{la0, lo0, la1, lo1});
    }
  }
  return tiles;
}

} // namespace skysync
