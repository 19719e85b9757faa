#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>
#include <spdlog/spdlog.h>

#include <skysync/http.hpp>
#include <skysync/log.hpp>
#include <skysync/settings.hpp>
#include <skysync/tracker.hpp>
#include <skysync/viewer/app.hpp>

using namespace skysync;

int main(int argc, char** argv) {
  std::string config_path;
  for (int i = 1; i < argc; ++i) {
    if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc) config_path = argv[++i];
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
  Tracker tracker(http, clock, cfg);
  tracker.start();

  // New York area
  ViewerApp app(tracker, clock, BBox{40.0, -75.0, 41.5, -73.0});
  const int code = app.run();

  tracker.stop();
  return code;
}
