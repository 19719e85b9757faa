#pragma once
#include <vector>
#include <skysync/animation.hpp>
#include <skysync/clock.hpp>
#include <skysync/geo.hpp>

namespace skysync {

class Tracker;

// RAII application that renders tracked aircraft and the HUD.
class ViewerApp {
public:
  ViewerApp(Tracker& tracker, Clock& clock, const BBox& initial);
  int run(); // returns 0 on normal exit

private:
  // Input & data flow
  void process_input_();
  void submit_viewport_();
  // Rendering
  void render_frame_(const std::vector<RenderItem>& items);
  void draw_graticule_();
  void draw_hud_(const std::vector<RenderItem>& items);

  // Helpers
  struct Vec2f { float x; float y; };
  Vec2f geoToScreen_(double lon, double lat) const;
  BBox view_bbox_() const;

  // Dependencies
  Tracker& tracker_;
  Clock& clock_;

  // Camera (degrees)
  double center_lon_{0.0};
  double center_lat_{0.0};
  double span_lon_deg_{2.0};
  bool viewport_dirty_{true};
};

} // namespace skysync
