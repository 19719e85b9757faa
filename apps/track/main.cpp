#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>
#include <spdlog/spdlog.h>

#include <skysync/frame_loop.hpp>
#include <skysync/http.hpp>
#include <skysync/log.hpp>
#include <skysync/settings.hpp>
#include <skysync/tracker.hpp>

using namespace skysync;

namespace {

volatile std::sig_atomic_t g_interrupted = 0;

void on_sigint(int) { g_interrupted = 1; }

bool parse_double(const char* s, double& out) {
  if (!s || !*s) return false;
  char* end = nullptr;
  out = std::strtod(s, &end);
  return end != s && *end == '\0';
}

void usage() {
  std::fprintf(stderr,
    "usage: skysync-track lat_min lon_min lat_max lon_max "
    "[--config file.csv] [--follow ICAO24|CALLSIGN] [--seconds N]\n");
}

} // namespace

int main(int argc, char** argv) {
  std::string config_path, follow;
  double seconds = 60.0;
  double bounds[4] = {0, 0, 0, 0};
  int n = 0;
  for (int i = 1; i < argc; ++i) {
    if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
      config_path = argv[++i];
    } else if (std::strcmp(argv[i], "--follow") == 0 && i + 1 < argc) {
      follow = argv[++i];
    } else if (std::strcmp(argv[i], "--seconds") == 0 && i + 1 < argc) {
      if (!parse_double(argv[++i], seconds) || seconds <= 0.0) { usage(); return 1; }
    } else if (n < 4 && parse_double(argv[i], bounds[n])) {
      ++n;
    } else {
      usage();
      return 1;
    }
  }
  if (n != 4) { usage(); return 1; }

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

  const BBox region{bounds[0], bounds[1], bounds[2], bounds[3]};
  switch (tracker.viewport().on_bounds_changed(region)) {
    case ViewportDecision::Invalid:
      spdlog::error("invalid bounding box");
      return 1;
    case ViewportDecision::AreaTooLarge:
      spdlog::error("{}", tracker.area_warning());
      return 1;
    default:
      break;
  }

  std::signal(SIGINT, on_sigint);

  const double t_end = clock.now() + seconds;
  double next_summary = 0.0;
  FrameLoop loop(clock, 0.5);
  loop.run([&](double now) {
    if (g_interrupted || now >= t_end) { loop.stop(); return; }
    const auto items = tracker.frame(now);
    if (now < next_summary) return;
    next_summary = now + 5.0;

    std::size_t stale = 0;
    for (const auto& it : items) if (it.phase == Phase::Stale) ++stale;
    std::string status = "waiting";
    if (const auto& u = tracker.last_update()) {
      status = u->result.ok() ? (u->result.data.fallback ? "fallback" : u->result.data.source)
                              : error_name(u->result.code);
    }
    std::printf("tracked=%zu stale=%zu source=%s\n", items.size(), stale, status.c_str());

    if (!follow.empty()) {
      const Entity* e = tracker.store().find(follow);
      if (!e) {
        std::printf("  %s: not in view\n", follow.c_str());
      } else {
        for (const auto& it : items) {
          if (it.id != e->id) continue;
          std::printf("  %s %-8s lat=%.4f lon=%.4f hdg=%.0f alt=%.0fm %s\n",
                      it.id.c_str(), it.callsign.c_str(), it.lat, it.lon,
                      it.heading_deg, it.altitude_m, phase_name(it.phase));
        }
      }
    }
    std::fflush(stdout);
  });

  tracker.stop();
  return 0;
}
