#include <skysync/animation.hpp>
#include <algorithm>

namespace skysync {

double AnimationEngine::step_opacity_(const std::string& id, bool stale, double dt) {
  double& op = opacity_.try_emplace(id, 1.0).first->second;
  const double step = cfg_.fade_rate_per_s * dt;
  if (stale) op = std::max(cfg_.min_opacity, op - step);
  else       op = std::min(1.0, op + step);
  return op;
}

std::vector<RenderItem> AnimationEngine::render_frame(double now) {
  const double dt = last_frame_ ? std::max(0.0, now - *last_frame_) : 0.0;
  last_frame_ = now;

  const InterpParams params = InterpParams::from(cfg_);
  const auto& entities = store_.entities();

  std::vector<RenderItem> out;
  out.reserve(entities.size());
  for (const auto& [id, e] : entities) {
    const Pose pose = interpolate(e, now, params);
    RenderItem it;
    it.id = id;
    it.callsign = e.callsign;
    it.lon = pose.lon;
    it.lat = pose.lat;
    it.heading_deg = pose.heading_deg;
    it.altitude_m = pose.altitude_m;
    it.opacity = step_opacity_(id, e.phase == Phase::Stale, dt);
    it.phase = e.phase;
    out.push_back(std::move(it));
  }

  // Forget scratch for evicted ids
  for (auto it = opacity_.begin(); it != opacity_.end();) {
    if (!entities.count(it->first)) it = opacity_.erase(it);
    else ++it;
  }

  std::sort(out.begin(), out.end(),
            [](const RenderItem& a, const RenderItem& b){ return a.id < b.id; });
  return out;
}

} // namespace skysync
