#include <skysync/opensky.hpp>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <initializer_list>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace skysync::opensky {

namespace {

std::string trim(std::string s) {
  auto not_space = [](unsigned char c){ return !std::isspace(c); };
  s.erase(s.begin(), std::find_if(s.begin(), s.end(), not_space));
  s.erase(std::find_if(s.rbegin(), s.rend(), not_space).base(), s.end());
  return s;
}

std::optional<double> num_at(const json& a, std::size_t i) {
  if (i >= a.size() || !a[i].is_number()) return std::nullopt;
  const double v = a[i].get<double>();
  if (!std::isfinite(v)) return std::nullopt;
  return v;
}

std::string str_at(const json& a, std::size_t i) {
  if (i >= a.size() || !a[i].is_string()) return {};
  return a[i].get<std::string>();
}

bool bool_at(const json& a, std::size_t i) {
  return i < a.size() && a[i].is_boolean() && a[i].get<bool>();
}

std::optional<AircraftReport> parse_entry(const json& e, double response_time) {
  if (!e.is_array() || e.size() < kMinFields) return std::nullopt;

  AircraftReport r;
  r.id = trim(str_at(e, kIcao24));
  std::transform(r.id.begin(), r.id.end(), r.id.begin(),
                 [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
  if (r.id.empty()) return std::nullopt;

  const auto lon = num_at(e, kLongitude);
  const auto lat = num_at(e, kLatitude);
  if (!lon || !lat) return std::nullopt;

  r.callsign = trim(str_at(e, kCallsign));
  r.origin_country = str_at(e, kOriginCountry);
  r.squawk = str_at(e, kSquawk);

  Snapshot& s = r.snapshot;
  s.lon = *lon;
  s.lat = *lat;
  if (auto trk = num_at(e, kTrueTrack)) s.heading_deg = normalize_heading(*trk);
  s.ground_speed_mps = num_at(e, kVelocity);
  s.vertical_rate_mps = num_at(e, kVerticalRate).value_or(0.0);
  if (auto baro = num_at(e, kBaroAltitude)) s.altitude_m = *baro;
  else s.altitude_m = num_at(e, kGeoAltitude).value_or(0.0);
  s.on_ground = bool_at(e, kOnGround);
  if (auto tp = num_at(e, kTimePosition)) s.observed_at = *tp;
  else s.observed_at = num_at(e, kLastContact).value_or(response_time);
  return r;
}

} // namespace

std::string states_url(const std::string& api_base_url, const BBox& b) {
  char q[160];
  std::snprintf(q, sizeof(q), "/states/all?lamin=%.4f&lomin=%.4f&lamax=%.4f&lomax=%.4f",
                b.lat_min, b.lon_min, b.lat_max, b.lon_max);
  std::string base = api_base_url;
  while (!base.empty() && base.back() == '/') base.pop_back();
  return base + q;
}

std::string url_encode(const std::string& s) {
  static const char* hex = "0123456789ABCDEF";
  std::string out;
  out.reserve(s.size() * 3);
  for (unsigned char c : s) {
    if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
      out.push_back(static_cast<char>(c));
    } else {
      out.push_back('%');
      out.push_back(hex[c >> 4]);
      out.push_back(hex[c & 0x0F]);
    }
  }
  return out;
}

std::string token_request_body(const std::string& client_id, const std::string& client_secret) {
  return "grant_type=client_credentials&client_id=" + url_encode(client_id) +
         "&client_secret=" + url_encode(client_secret);
}

std::optional<SnapshotSet> parse_states(const std::string& body, std::string* error) {
  try {
    const json root = json::parse(body);
    if (!root.is_object()) {
      if (error) *error = "response is not a JSON object";
      return std::nullopt;
    }
    const double t = root.value("time", 0.0);

    SnapshotSet out;
    out.source = "opensky";
    auto it = root.find("states");
    // empty result set arrives as {"time":..., "states":null}
    if (it == root.end() || it->is_null()) return out;
    if (!it->is_array()) {
      if (error) *error = "'states' is not an array";
      return std::nullopt;
    }
    out.aircraft.reserve(it->size());
    for (const auto& e : *it) {
      if (auto r = parse_entry(e, t)) out.aircraft.push_back(std::move(*r));
    }
    return out;
  } catch (const json::exception& e) {
    if (error) *error = e.what();
    return std::nullopt;
  }
}

std::optional<TokenGrant> parse_token(const std::string& body) {
  try {
    const json root = json::parse(body);
    if (!root.is_object()) return std::nullopt;
    auto it = root.find("access_token");
    if (it == root.end() || !it->is_string() || it->get<std::string>().empty()) return std::nullopt;
    TokenGrant g;
    g.access_token = it->get<std::string>();
    auto exp = root.find("expires_in");
    if (exp != root.end() && exp->is_number()) g.expires_in_s = exp->get<double>();
    return g;
  } catch (const json::exception&) {
    return std::nullopt;
  }
}

std::optional<double> retry_after_hint(const HttpResponse& resp) {
  for (const char* name : {"x-rate-limit-retry-after-seconds", "retry-after"}) {
    const std::string v = resp.header(name);
    if (v.empty()) continue;
    char* end = nullptr;
    const double secs = std::strtod(v.c_str(), &end);
    if (end != v.c_str() && std::isfinite(secs) && secs >= 0.0) return secs;
  }
  return std::nullopt;
}

} // namespace skysync::opensky
