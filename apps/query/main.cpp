#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <skysync/fetcher.hpp>
#include <skysync/http.hpp>
#include <skysync/log.hpp>
#include <skysync/query.hpp>
#include <skysync/settings.hpp>
#include <skysync/tile_cache.hpp>
#include <skysync/token_cache.hpp>

using namespace skysync;

static std::optional<double> parse_coord(const char* s) {
  if (!s || !*s) return std::nullopt;
  char* end = nullptr;
  const double v = std::strtod(s, &end);
  if (end == s || *end != '\0') return std::nullopt;
  return v;
}

static void usage() {
  std::fprintf(stderr, "usage: skysync-query lat_min lon_min lat_max lon_max [--config file.csv]\n");
}

int main(int argc, char** argv) {
  std::string config_path;
  const char* coords[4] = {nullptr, nullptr, nullptr, nullptr};
  int n = 0;
  for (int i = 1; i < argc; ++i) {
    if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
      config_path = argv[++i];
    } else if (std::strcmp(argv[i], "--help") == 0 || std::strcmp(argv[i], "-h") == 0) {
      usage();
      return 0;
    } else if (n < 4) {
      coords[n++] = argv[i];
    } else {
      usage();
      return 1;
    }
  }

  Settings cfg;
  if (!config_path.empty()) {
    auto loaded = load_settings_csv(config_path);
    if (!loaded) {
      std::fprintf(stderr, "cannot open config '%s'\n", config_path.c_str());
      return 1;
    }
    cfg = *loaded;
  }
  apply_env_overrides(cfg);
  init_logging(cfg.log_level);

  CurlGlobal curl;
  if (!curl.ok()) {
    spdlog::error("libcurl initialisation failed");
    return 1;
  }
  CurlHttpClient http;
  SystemClock clock;
  TokenCache tokens(http, clock, cfg);
  SnapshotFetcher fetcher(http, tokens, clock, cfg);
  TileCache tiles(fetcher, clock, cfg);
  QueryService service(tiles, clock, cfg);

  const QueryResult r = service.get_snapshots(parse_coord(coords[0]), parse_coord(coords[1]),
                                              parse_coord(coords[2]), parse_coord(coords[3]));
  std::printf("%s\n", to_json(r).dump(2).c_str());
  if (!r.ok()) spdlog::error("HTTP {} {}", r.http_status, error_name(r.code));
  return r.http_status == 200 ? 0 : 1;
}
