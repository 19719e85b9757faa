#include <raylib.h>
#include <algorithm>
#include <cmath>
#include <cstdio>
#include <string>
#include <unordered_map>

#include <skysync/frame_loop.hpp>
#include <skysync/tracker.hpp>
#include <skysync/viewer/app.hpp>

namespace skysync {

namespace {

// High-contrast palette; assigned per aircraft id (stable during session).
static Color colorFor(const std::string& id) {
  static const Color PAL[] = {
    {231, 76, 60, 255},   // red
    {52, 152, 219, 255},  // blue
    {46, 204, 113, 255},  // green
    {241, 196, 15, 255},  // yellow
    {155, 89, 182, 255},  // purple
    {26, 188, 156, 255},  // teal
    {230, 126, 34, 255},  // orange
    {236, 112, 99, 255},  // salmon
  };
  static std::unordered_map<std::string, int> idx;
  auto it = idx.find(id);
  if (it == idx.end()) {
    int assigned = static_cast<int>(idx.size()) % static_cast<int>(sizeof(PAL)/sizeof(PAL[0]));
    it = idx.emplace(id, assigned).first;
  }
  return PAL[it->second];
}

static Color with_alpha(Color c, double opacity) {
  c.a = static_cast<unsigned char>(std::clamp(opacity, 0.0, 1.0) * 255.0);
  return c;
}

// --- HUD layout ---
static constexpr int kHUD_LINE1_Y = 20;  // size 20
static constexpr int kHUD_LINE2_Y = 46;  // size 18
static constexpr int kHUD_LINE3_Y = 72;  // size 14

static constexpr double kMinSpanDeg = 0.05;
static constexpr double kMaxSpanDeg = 180.0;

} // namespace

// ---- ViewerApp ----

ViewerApp::ViewerApp(Tracker& tracker, Clock& clock, const BBox& initial)
  : tracker_(tracker), clock_(clock) {
  center_lon_ = 0.5 * (initial.lon_min + initial.lon_max);
  center_lat_ = 0.5 * (initial.lat_min + initial.lat_max);
  span_lon_deg_ = std::clamp(initial.width_deg(), kMinSpanDeg, kMaxSpanDeg);
}

// Equirectangular: lon -> x, lat -> y, same degrees-per-pixel on both axes.
ViewerApp::Vec2f ViewerApp::geoToScreen_(double lon, double lat) const {
  const float scale = float(GetScreenWidth() / span_lon_deg_);
  const float cx = GetScreenWidth()  * 0.5f;
  const float cy = GetScreenHeight() * 0.5f;
  return { cx + float((lon - center_lon_) * scale), cy - float((lat - center_lat_) * scale) };
}

BBox ViewerApp::view_bbox_() const {
  const double half_w = 0.5 * span_lon_deg_;
  const double half_h = half_w * double(GetScreenHeight()) / double(GetScreenWidth());
  return BBox{ center_lat_ - half_h, center_lon_ - half_w, center_lat_ + half_h, center_lon_ + half_w };
}

int ViewerApp::run() {
  const int W = 1024, H = 768;
  InitWindow(W, H, "SkySync - Viewer");
  SetTargetFPS(60);

  // raylib paces the frames; the loop itself does not sleep.
  FrameLoop loop(clock_, 0.0);
  loop.run([&](double now) {
    if (WindowShouldClose()) { loop.stop(); return; }
    process_input_();
    submit_viewport_();
    render_frame_(tracker_.frame(now));
  });

  CloseWindow();
  return 0;
}

void ViewerApp::process_input_() {
  // Zoom
  if (IsKeyDown(KEY_W) || IsKeyDown(KEY_KP_ADD))      { span_lon_deg_ *= 0.99; viewport_dirty_ = true; }
  if (IsKeyDown(KEY_S) || IsKeyDown(KEY_KP_SUBTRACT)) { span_lon_deg_ *= 1.01; viewport_dirty_ = true; }
  span_lon_deg_ = std::clamp(span_lon_deg_, kMinSpanDeg, kMaxSpanDeg);

  // Camera pan, 1% of the view per frame while key held
  const double pan_step = span_lon_deg_ * 0.01;
  if (IsKeyDown(KEY_LEFT))  { center_lon_ -= pan_step; viewport_dirty_ = true; }
  if (IsKeyDown(KEY_RIGHT)) { center_lon_ += pan_step; viewport_dirty_ = true; }
  if (IsKeyDown(KEY_UP))    { center_lat_ += pan_step; viewport_dirty_ = true; }
  if (IsKeyDown(KEY_DOWN))  { center_lat_ -= pan_step; viewport_dirty_ = true; }
  center_lat_ = std::clamp(center_lat_, -90.0, 90.0);
  center_lon_ = std::clamp(center_lon_, -180.0, 180.0);
}

// Re-offer the view every frame until the controller takes it; throttled
// events are dropped there, so the last pan position would otherwise be lost.
void ViewerApp::submit_viewport_() {
  if (!viewport_dirty_) return;
  const auto d = tracker_.viewport().on_bounds_changed(clamp_to_world(view_bbox_()));
  if (d != ViewportDecision::Throttled) viewport_dirty_ = false;
}

void ViewerApp::render_frame_(const std::vector<RenderItem>& items) {
  BeginDrawing();
  ClearBackground(Color{14, 22, 38, 255});

  draw_graticule_();

  // Draw each aircraft as a heading-oriented triangle
  for (const auto& it : items) {
    const auto p = geoToScreen_(it.lon, it.lat);
    Vector2 pos = { p.x, p.y };
    const float len = 9.0f, wid = 5.0f;
    // heading is clockwise from north; screen y grows downward
    const float h = float(it.heading_deg * kDegToRad);
    const float c = std::sin(h), s = std::cos(h);   // unit vector (east, north)
    Vector2 nose  = { pos.x + c*len,          pos.y - s*len };
    Vector2 tailL = { pos.x - c*len - s*wid,  pos.y + s*len - c*wid };
    Vector2 tailR = { pos.x - c*len + s*wid,  pos.y + s*len + c*wid };
    const Color col = with_alpha(colorFor(it.id), it.opacity);
    DrawTriangle(nose, tailL, tailR, col);
    DrawTriangle(nose, tailR, tailL, col);   // either winding
    if (!it.callsign.empty()) {
      DrawText(it.callsign.c_str(), int(pos.x) + 8, int(pos.y) + 6, 10, with_alpha(RAYWHITE, it.opacity * 0.8));
    }
  }

  draw_hud_(items);
  EndDrawing();
}

void ViewerApp::draw_graticule_() {
  const BBox v = view_bbox_();
  double step = 1.0;
  if (span_lon_deg_ > 40.0) step = 10.0;
  else if (span_lon_deg_ > 8.0) step = 5.0;
  else if (span_lon_deg_ < 1.0) step = 0.1;
  const Color line = Color{40, 55, 80, 255};
  for (double lon = std::floor(v.lon_min / step) * step; lon <= v.lon_max; lon += step) {
    auto a = geoToScreen_(lon, v.lat_min);
    auto b = geoToScreen_(lon, v.lat_max);
    DrawLineEx({a.x, a.y}, {b.x, b.y}, 1.0f, line);
  }
  for (double lat = std::floor(v.lat_min / step) * step; lat <= v.lat_max; lat += step) {
    auto a = geoToScreen_(v.lon_min, lat);
    auto b = geoToScreen_(v.lon_max, lat);
    DrawLineEx({a.x, a.y}, {b.x, b.y}, 1.0f, line);
  }
}

void ViewerApp::draw_hud_(const std::vector<RenderItem>& items) {
  std::size_t stale = 0;
  for (const auto& it : items) if (it.phase == Phase::Stale) ++stale;
  const BBox v = view_bbox_();

  DrawText(TextFormat("aircraft=%d  stale=%d  view=%.2f,%.2f .. %.2f,%.2f  span=%.1f deg",
                      (int)items.size(), (int)stale,
                      v.lat_min, v.lon_min, v.lat_max, v.lon_max, span_lon_deg_),
           20, kHUD_LINE1_Y, 20, Color{220,230,240,255});

  // Status / banner line
  std::string banner;
  Color banner_col = Color{235,200,120,255};
  if (!tracker_.area_warning().empty()) {
    banner = tracker_.area_warning() + " - zoom in";
    banner_col = Color{240,110,100,255};
  } else if (const auto& u = tracker_.last_update()) {
    if (!u->result.ok()) {
      banner = std::string(error_name(u->result.code)) + ": " + u->result.message;
      banner_col = Color{240,110,100,255};
    } else if (u->result.data.fallback) {
      banner = "Sample data: " + u->result.data.message;
    }
  } else {
    banner = "Waiting for first update...";
  }
  if (!banner.empty()) DrawText(banner.c_str(), 20, kHUD_LINE2_Y, 18, banner_col);

  DrawText("W/S or +/-: Zoom | Arrows: Pan | Esc: Quit",
           20, kHUD_LINE3_Y, 14, Color{170,185,205,255});
}

} // namespace skysync
