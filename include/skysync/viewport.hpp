#pragma once
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <skysync/clock.hpp>
#include <skysync/geo.hpp>
#include <skysync/settings.hpp>

namespace skysync {

struct ViewportListener {
  std::function<void(const BBox&)> on_accepted;
  std::function<void(const BBox&, const std::string& message)> on_area_too_large;
};

enum class ViewportDecision : int {
  Accepted = 0,
  Throttled,      // inside the throttle window, dropped
  Invalid,        // non-finite or inverted bounds
  AreaTooLarge,   // wider or taller than max_view_extent_deg
};

// "Area too large: maximum extent is N degrees"
std::string area_too_large_message(double max_extent_deg);

// Turns raw bounds-changed events from the render surface into at most one
// accepted viewport per throttle window.
class ViewportController {
public:
  ViewportController(Clock& clock, const Settings& cfg) : clock_(clock), cfg_(cfg) {}

  ViewportDecision on_bounds_changed(const BBox& bounds);

  int subscribe(ViewportListener l);
  void unsubscribe(int id);

  std::optional<BBox> current() const;
  std::size_t accepted_count() const;

private:
  Clock& clock_;
  const Settings& cfg_;

  mutable std::mutex mu_;
  std::map<int, ViewportListener> listeners_;
  int next_id_{1};
  std::optional<double> last_accepted_at_;
  std::optional<BBox> current_;
  std::size_t accepted_{0};
};

} // namespace skysync
