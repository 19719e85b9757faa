#pragma once
#include <istream>
#include <optional>
#include <string>

namespace skysync {

struct Settings {
  // Interpolation / state store
  double update_interval_s     = 15.0;  // nominal time between snapshots
  double soft_stale_s          = 30.0;  // fade threshold
  double hard_stale_s          = 60.0;  // eviction threshold
  double min_opacity           = 0.3;
  double fade_rate_per_s       = 1.0;   // opacity units per second
  double min_ground_speed_mps  = 0.5;   // below: position frozen

  // Viewport
  double throttle_interval_s   = 0.5;
  double max_view_extent_deg   = 80.0;

  // Tiling / cache
  double tile_max_extent_deg   = 20.0;
  double tile_spacing_s        = 1.0;
  double tile_ttl_s            = 10.0;
  double cache_key_precision_deg = 0.01;

  // Fetcher
  double request_timeout_s     = 10.0;
  int    max_attempts          = 3;
  double backoff_base_s        = 1.0;
  bool   fallback_enabled      = true;
  int    fallback_count        = 12;
  bool   auth_optional         = true;  // provider accepts anonymous queries

  // Token
  double token_expiry_buffer_s = 60.0;

  // Sync runner
  double poll_interval_s       = 15.0;

  // Display filter
  bool   filter_enabled        = true;
  bool   airborne_only         = true;
  double min_altitude_m        = 100.0;
  double max_position_age_s    = 60.0;
  double min_display_speed_mps = 50.0;

  // Endpoints / credentials
  std::string api_base_url  = "https://opensky-network.org/api";
  std::string auth_url      = "https://auth.opensky-network.org/auth/realms/opensky-network/protocol/openid-connect/token";
  std::string client_id;
  std::string client_secret;

  std::string log_level     = "info";
};

// Stream-based "key,value" loader starting from defaults.
// Accepts an optional header row; ignores lines starting with '#' and blank lines.
// Whitespace around fields is trimmed. Unknown keys and invalid values are skipped.
Settings settings_from_csv_stream(std::istream& in);

// Filesystem wrapper; returns nullopt if file cannot be opened.
std::optional<Settings> load_settings_csv(const std::string& path);

// OPENSKY_CLIENT_ID / OPENSKY_CLIENT_SECRET override file credentials.
void apply_env_overrides(Settings& s);

} // namespace skysync
