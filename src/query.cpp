#include <skysync/query.hpp>
#include <cmath>
#include <nlohmann/json.hpp>
#include <skysync/viewport.hpp>
#include <spdlog/spdlog.h>

using json = nlohmann::json;

namespace skysync {

bool passes_display_filter(const AircraftReport& r, double now, const Settings& cfg) {
  const Snapshot& s = r.snapshot;
  if (r.id.empty() || !std::isfinite(s.lat) || !std::isfinite(s.lon)) return false;
  if (!cfg.filter_enabled) return true;
  if (cfg.airborne_only && s.on_ground) return false;
  if (s.altitude_m < cfg.min_altitude_m) return false;
  if (now - s.observed_at > cfg.max_position_age_s) return false;
  // an unreported velocity is not evidence of a parked aircraft
  if (s.ground_speed_mps && *s.ground_speed_mps < cfg.min_display_speed_mps) return false;
  return true;
}

static QueryResult error_result(ErrorCode code, std::string message, double retry_after = 0.0) {
  QueryResult q;
  q.code = code;
  q.http_status = http_status_for(code);
  q.message = std::move(message);
  q.retry_after_s = retry_after;
  return q;
}

QueryResult QueryService::get_snapshots(std::optional<double> lat_min, std::optional<double> lon_min,
                                        std::optional<double> lat_max, std::optional<double> lon_max,
                                        const CancelToken* cancel) {
  if (!lat_min || !lon_min || !lat_max || !lon_max) {
    return error_result(ErrorCode::Validation,
                        "Missing bounding box: lat_min, lon_min, lat_max and lon_max are required");
  }
  const BBox b{*lat_min, *lon_min, *lat_max, *lon_max};
  if (!is_valid(b)) {
    return error_result(ErrorCode::Validation,
                        "Invalid bounding box: bounds must be finite with min <= max");
  }
  if (b.width_deg() > cfg_.max_view_extent_deg || b.height_deg() > cfg_.max_view_extent_deg) {
    return error_result(ErrorCode::AreaTooLarge, area_too_large_message(cfg_.max_view_extent_deg));
  }

  FetchResult fr = tiles_.fetch_large(b, {}, cancel);
  switch (fr.code) {
    case ErrorCode::Ok:
      break;
    case ErrorCode::RateLimited:
      return error_result(fr.code, "Rate limit exceeded. Please try again later.", fr.retry_after_s);
    case ErrorCode::Auth:
      return error_result(fr.code, "Service unavailable: Could not authenticate with OpenSky API.");
    default:
      return error_result(fr.code, fr.message.empty() ? "Failed to fetch flight data." : fr.message);
  }

  QueryResult q;
  q.fallback = fr.data.fallback;
  q.message = fr.data.message;
  q.source = fr.data.source;
  const double now = clock_.now();
  q.aircraft.reserve(fr.data.aircraft.size());
  for (auto& r : fr.data.aircraft) {
    if (!b.contains(r.snapshot.lat, r.snapshot.lon)) continue;
    if (!passes_display_filter(r, now, cfg_)) continue;
    q.aircraft.push_back(std::move(r));
  }
  spdlog::info("query: {} of {} aircraft shown{}", q.aircraft.size(), fr.data.aircraft.size(),
               q.fallback ? " (fallback)" : "");
  return q;
}

json to_json(const QueryResult& r) {
  if (!r.ok()) {
    json j = {{"message", r.message}};
    if (r.code == ErrorCode::RateLimited) j["retry_after"] = r.retry_after_s;
    return j;
  }
  json flights = json::array();
  for (const auto& a : r.aircraft) {
    const Snapshot& s = a.snapshot;
    json f = {
      {"icao24", a.id},
      {"callsign", a.callsign.empty() ? json(nullptr) : json(a.callsign)},
      {"origin_country", a.origin_country},
      {"time_position", s.observed_at},
      {"longitude", s.lon},
      {"latitude", s.lat},
      {"baro_altitude", s.altitude_m},
      {"on_ground", s.on_ground},
      {"velocity", s.ground_speed_mps ? json(*s.ground_speed_mps) : json(nullptr)},
      {"true_track", s.heading_deg ? json(*s.heading_deg) : json(nullptr)},
      {"vertical_rate", s.vertical_rate_mps},
      {"squawk", a.squawk.empty() ? json(nullptr) : json(a.squawk)},
    };
    flights.push_back(std::move(f));
  }
  json j = {{"flights", std::move(flights)}};
  if (r.fallback) {
    j["_fallback"] = true;
    j["_message"] = r.message;
    j["_source"] = r.source;
  }
  return j;
}

} // namespace skysync
