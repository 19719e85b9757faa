#include <skysync/tracker.hpp>
#include <algorithm>
#include <skysync/query.hpp>
#include <spdlog/spdlog.h>

namespace skysync {

Tracker::Tracker(HttpClient& http, Clock& clock, const Settings& cfg)
  : cfg_(cfg),
    tokens_(http, clock, cfg),
    fetcher_(http, tokens_, clock, cfg),
    tiles_(fetcher_, clock, cfg),
    store_(cfg),
    anim_(store_, cfg),
    viewport_(clock, cfg),
    runner_(tiles_, clock, cfg) {
  subscription_ = viewport_.subscribe(ViewportListener{
    .on_accepted = [this](const BBox& b) {
      area_warning_.clear();
      runner_.request_viewport(b);
    },
    .on_area_too_large = [this](const BBox&, const std::string& msg) {
      area_warning_ = msg;
    },
  });
}

Tracker::~Tracker() {
  viewport_.unsubscribe(subscription_);
  runner_.stop();
}

bool Tracker::pump(double now) {
  SyncUpdate upd;
  if (!runner_.buffer().try_consume_latest(cursor_, upd)) return false;
  if (!runner_.is_current(upd)) {
    spdlog::debug("tracker: dropped result of old generation {}", upd.generation);
    return false;
  }
  if (upd.result.ok()) {
    auto& aircraft = upd.result.data.aircraft;
    const std::size_t received = aircraft.size();
    aircraft.erase(std::remove_if(aircraft.begin(), aircraft.end(),
                                  [&](const AircraftReport& r) { return !passes_display_filter(r, now, cfg_); }),
                   aircraft.end());
    const auto st = store_.ingest(upd.result.data, now);
    spdlog::info("tracker: ingested {} of {} aircraft ({} new, {} evicted){}{}",
                 aircraft.size(), received, st.created, st.evicted,
                 upd.partial ? " [partial]" : "", upd.result.data.fallback ? " [fallback]" : "");
  }
  // The payload is in the store now; keep only the status.
  upd.result.data.aircraft.clear();
  last_update_ = std::move(upd);
  return true;
}

std::vector<RenderItem> Tracker::frame(double now) {
  pump(now);
  store_.age(now);
  return anim_.render_frame(now);
}

} // namespace skysync
