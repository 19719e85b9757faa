#include <skysync/viewport.hpp>
#include <cstdio>
#include <vector>
#include <spdlog/spdlog.h>

namespace skysync {

std::string area_too_large_message(double max_extent_deg) {
  char buf[96];
  std::snprintf(buf, sizeof(buf), "Area too large: maximum extent is %g degrees", max_extent_deg);
  return buf;
}

ViewportDecision ViewportController::on_bounds_changed(const BBox& bounds) {
  if (!is_valid(bounds)) {
    spdlog::debug("viewport: invalid bounds ignored");
    return ViewportDecision::Invalid;
  }

  std::vector<ViewportListener> targets;
  bool too_large = false;
  {
    std::lock_guard<std::mutex> lk(mu_);
    const double now = clock_.now();
    if (last_accepted_at_ && now - *last_accepted_at_ < cfg_.throttle_interval_s) {
      return ViewportDecision::Throttled;
    }
    last_accepted_at_ = now;
    ++accepted_;
    too_large = bounds.width_deg() > cfg_.max_view_extent_deg ||
                bounds.height_deg() > cfg_.max_view_extent_deg;
    if (!too_large) current_ = bounds;
    targets.reserve(listeners_.size());
    for (const auto& [id, l] : listeners_) targets.push_back(l);
  }

  // Listeners run without the lock so they may call back into the controller.
  if (too_large) {
    const std::string msg = area_too_large_message(cfg_.max_view_extent_deg);
    spdlog::info("viewport: {:.1f}x{:.1f} deg rejected, {}", bounds.width_deg(), bounds.height_deg(), msg);
    for (const auto& l : targets) if (l.on_area_too_large) l.on_area_too_large(bounds, msg);
    return ViewportDecision::AreaTooLarge;
  }
  for (const auto& l : targets) if (l.on_accepted) l.on_accepted(bounds);
  return ViewportDecision::Accepted;
}

int ViewportController::subscribe(ViewportListener l) {
  std::lock_guard<std::mutex> lk(mu_);
  const int id = next_id_++;
  listeners_.emplace(id, std::move(l));
  return id;
}

void ViewportController::unsubscribe(int id) {
  std::lock_guard<std::mutex> lk(mu_);
  listeners_.erase(id);
}

std::optional<BBox> ViewportController::current() const {
  std::lock_guard<std::mutex> lk(mu_);
  return current_;
}

std::size_t ViewportController::accepted_count() const {
  std::lock_guard<std::mutex> lk(mu_);
  return accepted_;
}

} // namespace skysync
