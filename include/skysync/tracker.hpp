#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <skysync/animation.hpp>
#include <skysync/clock.hpp>
#include <skysync/fetcher.hpp>
#include <skysync/http.hpp>
#include <skysync/settings.hpp>
#include <skysync/snap_buffer.hpp>
#include <skysync/state_store.hpp>
#include <skysync/sync_runner.hpp>
#include <skysync/tile_cache.hpp>
#include <skysync/token_cache.hpp>
#include <skysync/viewport.hpp>

namespace skysync {

// The whole pipeline wired once: viewport -> runner -> tiles -> fetcher -> token,
// and on the render side buffer -> store -> animation.
// pump() and frame() are meant for the render thread.
class Tracker {
public:
  Tracker(HttpClient& http, Clock& clock, const Settings& cfg);
  ~Tracker();
  Tracker(const Tracker&) = delete;
  Tracker& operator=(const Tracker&) = delete;

  void start() { runner_.start(); }
  void stop() { runner_.stop(); }

  // Ingest the newest published result if it belongs to the current viewport.
  // Only aircraft passing the display filter enter the store. A failed update
  // ingests nothing and leaves staleness to age().
  bool pump(double now);

  // pump(), age the store, then render.
  std::vector<RenderItem> frame(double now);

  ViewportController& viewport() { return viewport_; }
  SyncRunner& runner() { return runner_; }
  StateStore& store() { return store_; }
  const StateStore& store() const { return store_; }
  TileCache& tiles() { return tiles_; }

  // Status of the last ingested update (code, fallback flag, message).
  const std::optional<SyncUpdate>& last_update() const { return last_update_; }
  const std::string& area_warning() const { return area_warning_; }

private:
  const Settings& cfg_;
  TokenCache tokens_;
  SnapshotFetcher fetcher_;
  TileCache tiles_;
  StateStore store_;
  AnimationEngine anim_;
  ViewportController viewport_;
  SyncRunner runner_;

  int subscription_{0};
  std::uint64_t cursor_{0};
  std::optional<SyncUpdate> last_update_;
  std::string area_warning_;
};

} // namespace skysync
