#include <skysync/settings.hpp>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <functional>
#include <limits>
#include <unordered_map>
#include <vector>
#include <spdlog/spdlog.h>

namespace skysync {

static std::string trim(std::string s) {
  auto not_space = [](unsigned char c){ return !std::isspace(c); };
  s.erase(s.begin(), std::find_if(s.begin(), s.end(), not_space));
  s.erase(std::find_if(s.rbegin(), s.rend(), not_space).base(), s.end());
  return s;
}

static std::string lower(std::string s) {
  for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return s;
}

// Split at the first comma only; values keep any later commas.
static std::vector<std::string> split_key_value(const std::string& line) {
  const auto comma = line.find(',');
  if (comma == std::string::npos) return {trim(line)};
  return {trim(line.substr(0, comma)), trim(line.substr(comma + 1))};
}

static bool is_header_row(const std::vector<std::string>& cols) {
  return cols.size() == 2 && lower(cols[0]) == "key" && lower(cols[1]) == "value";
}

static double to_double_safe(const std::string& s, bool& ok) {
  if (s.empty()) { ok = false; return 0.0; }
  char* end = nullptr;
  const double v = std::strtod(s.c_str(), &end);
  ok = (end == s.c_str() + s.size()) && std::isfinite(v);
  return v;
}

static bool to_bool_safe(const std::string& s, bool& ok) {
  const auto v = lower(s);
  ok = true;
  if (v == "true" || v == "1" || v == "yes" || v == "on")  return true;
  if (v == "false" || v == "0" || v == "no" || v == "off") return false;
  ok = false;
  return false;
}

namespace {

using Setter = std::function<bool(Settings&, const std::string&)>;

Setter num(double Settings::* field, double lo) {
  return [field, lo](Settings& s, const std::string& v) {
    bool ok = false;
    const double d = to_double_safe(v, ok);
    if (!ok || d < lo) return false;
    s.*field = d;
    return true;
  };
}

Setter integer(int Settings::* field, int lo) {
  return [field, lo](Settings& s, const std::string& v) {
    bool ok = false;
    const double d = to_double_safe(v, ok);
    if (!ok || d < lo || d > std::numeric_limits<int>::max() || d != std::floor(d)) return false;
    s.*field = static_cast<int>(d);
    return true;
  };
}

Setter flag(bool Settings::* field) {
  return [field](Settings& s, const std::string& v) {
    bool ok = false;
    const bool b = to_bool_safe(v, ok);
    if (ok) s.*field = b;
    return ok;
  };
}

Setter text(std::string Settings::* field) {
  return [field](Settings& s, const std::string& v) {
    s.*field = v;
    return true;
  };
}

const std::unordered_map<std::string, Setter>& setters() {
  static const std::unordered_map<std::string, Setter> table = {
    {"update_interval_s",       num(&Settings::update_interval_s, 0.001)},
    {"soft_stale_s",            num(&Settings::soft_stale_s, 0.0)},
    {"hard_stale_s",            num(&Settings::hard_stale_s, 0.0)},
    {"min_opacity",             num(&Settings::min_opacity, 0.0)},
    {"fade_rate_per_s",         num(&Settings::fade_rate_per_s, 0.0)},
    {"min_ground_speed_mps",    num(&Settings::min_ground_speed_mps, 0.0)},
    {"throttle_interval_s",     num(&Settings::throttle_interval_s, 0.0)},
    {"max_view_extent_deg",     num(&Settings::max_view_extent_deg, 0.001)},
    {"tile_max_extent_deg",     num(&Settings::tile_max_extent_deg, 0.001)},
    {"tile_spacing_s",          num(&Settings::tile_spacing_s, 0.0)},
    {"tile_ttl_s",              num(&Settings::tile_ttl_s, 0.0)},
    {"cache_key_precision_deg", num(&Settings::cache_key_precision_deg, 0.0)},
    {"request_timeout_s",       num(&Settings::request_timeout_s, 0.001)},
    {"max_attempts",            integer(&Settings::max_attempts, 1)},
    {"backoff_base_s",          num(&Settings::backoff_base_s, 0.0)},
    {"fallback_enabled",        flag(&Settings::fallback_enabled)},
    {"fallback_count",          integer(&Settings::fallback_count, 0)},
    {"auth_optional",           flag(&Settings::auth_optional)},
    {"token_expiry_buffer_s",   num(&Settings::token_expiry_buffer_s, 0.0)},
    {"poll_interval_s",         num(&Settings::poll_interval_s, 0.001)},
    {"filter_enabled",          flag(&Settings::filter_enabled)},
    {"airborne_only",           flag(&Settings::airborne_only)},
    {"min_altitude_m",          num(&Settings::min_altitude_m, -1000.0)},
    {"max_position_age_s",      num(&Settings::max_position_age_s, 0.0)},
    {"min_display_speed_mps",   num(&Settings::min_display_speed_mps, 0.0)},
    {"api_base_url",            text(&Settings::api_base_url)},
    {"auth_url",                text(&Settings::auth_url)},
    {"client_id",               text(&Settings::client_id)},
    {"client_secret",           text(&Settings::client_secret)},
    {"log_level",               text(&Settings::log_level)},
  };
  return table;
}

} // namespace

Settings settings_from_csv_stream(std::istream& in) {
  Settings out;
  std::string line;
  bool header_consumed = false;

  while (std::getline(in, line)) {
    std::string raw = trim(line);
    if (raw.empty()) continue;
    if (raw[0] == '#') continue;

    auto cols = split_key_value(raw);

    if (!header_consumed && is_header_row(cols)) {
      header_consumed = true;
      continue;
    }
    if (cols.size() != 2 || cols[0].empty()) continue;

    const auto key = lower(cols[0]);
    const auto& table = setters();
    auto it = table.find(key);
    if (it == table.end()) {
      spdlog::warn("settings: unknown key '{}' ignored", cols[0]);
      continue;
    }
    if (!it->second(out, cols[1])) {
      spdlog::warn("settings: invalid value '{}' for '{}' ignored", cols[1], key);
    }
  }

  if (out.hard_stale_s < out.soft_stale_s) {
    spdlog::warn("settings: hard_stale_s < soft_stale_s, raising hard threshold");
    out.hard_stale_s = out.soft_stale_s;
  }
  out.min_opacity = std::clamp(out.min_opacity, 0.0, 1.0);
  return out;
}

std::optional<Settings> load_settings_csv(const std::string& path) {
  std::ifstream f(path);
  if (!f) return std::nullopt;
  return settings_from_csv_stream(f);
}

void apply_env_overrides(Settings& s) {
  if (const char* id = std::getenv("OPENSKY_CLIENT_ID"); id && *id) s.client_id = id;
  if (const char* sec = std::getenv("OPENSKY_CLIENT_SECRET"); sec && *sec) s.client_secret = sec;
}

} // namespace skysync
