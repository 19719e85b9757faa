#pragma once
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include <skysync/settings.hpp>
#include <skysync/state_store.hpp>

namespace skysync {

struct RenderItem {
  std::string id;
  std::string callsign;
  double lon = 0.0;
  double lat = 0.0;
  double heading_deg = 0.0;
  double altitude_m = 0.0;
  double opacity = 1.0;
  Phase phase = Phase::New;
};

// Reads the store once per frame and produces render items sorted by id.
// Opacity is per-engine scratch; the store is never written.
class AnimationEngine {
public:
  AnimationEngine(const StateStore& store, const Settings& cfg)
    : store_(store), cfg_(cfg) {}

  std::vector<RenderItem> render_frame(double now);

  void reset() { opacity_.clear(); last_frame_.reset(); }

private:
  double step_opacity_(const std::string& id, bool stale, double dt);

  const StateStore& store_;
  const Settings& cfg_;
  std::unordered_map<std::string, double> opacity_;
  std::optional<double> last_frame_;
};

} // namespace skysync
