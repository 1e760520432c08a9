#include <raylib.h>
#include <algorithm>
#include <cmath>
#include <cstdio>
#include <string>
#include <utility>
#include <vector>

#include <apex/viewer/app.hpp>

namespace apex {

namespace {

const Color kColA      = {231, 76, 60, 255};   // red
const Color kColB      = {52, 152, 219, 255};  // blue
const Color kColText   = {220, 220, 230, 255};
const Color kColDim    = {150, 150, 165, 255};
const Color kColGrid   = {50, 50, 58, 255};
const Color kColZone   = {255, 255, 255, 18};
const Color kColZoneSel = {241, 196, 15, 40};
const Color kColFaster = {80, 220, 120, 255};
const Color kColSlower = {235, 110, 90, 255};

constexpr std::size_t kPlotPoints = 1500;

// --- Layout (keep in sync with draw_hud_) ---
constexpr int kHUD_LINE1_Y    = 16;  // size 20
constexpr int kHUD_LINE2_Y    = 42;  // size 16
constexpr int kHUD_LINE3_Y    = 64;  // size 14
constexpr int kHUD_BOTTOM_PAD = 20;
constexpr int kPanelW         = 380;

void fmt_time(double s, char* out, int cap) {
  if (cap <= 0 || out == nullptr) return;
  if (s < 0.0 || !std::isfinite(s)) { std::snprintf(out, (size_t)cap, "%s", "--"); return; }
  int minutes = (int)(s / 60.0);
  double rem  = s - minutes * 60.0;
  int secs    = (int)rem;
  int ms      = (int)((rem - secs) * 1000.0 + 0.5);
  if (minutes > 0) std::snprintf(out, (size_t)cap, "%d:%02d.%03d", minutes, secs, ms);
  else             std::snprintf(out, (size_t)cap, "%d.%03d", secs, ms);
}

void fmt_opt(const std::optional<double>& v, const char* unit, char* out, int cap) {
  if (!v) { std::snprintf(out, (size_t)cap, "%s", "n/a"); return; }
  std::snprintf(out, (size_t)cap, "%+.2f %s", *v, unit);
}

double max_speed(const std::vector<Sample>& samples) {
  double m = 0.0;
  for (const auto& s : samples) if (present(s.speed_kmh)) m = std::max(m, s.speed_kmh);
  return m;
}

// Word wrap for DrawText (no built-in wrapping in raylib).
std::vector<std::string> wrap(const std::string& text, int font, int max_w) {
  std::vector<std::string> lines;
  std::string cur;
  std::size_t i = 0;
  while (i < text.size()) {
    std::size_t j = text.find(' ', i);
    if (j == std::string::npos) j = text.size();
    const std::string word = text.substr(i, j - i);
    const std::string trial = cur.empty() ? word : cur + " " + word;
    if (!cur.empty() && MeasureText(trial.c_str(), font) > max_w) {
      lines.push_back(cur);
      cur = word;
    } else {
      cur = trial;
    }
    i = j + 1;
  }
  if (!cur.empty()) lines.push_back(cur);
  return lines;
}

} // namespace

ViewerApp::ViewerApp(ViewerData data) : data_(std::move(data)) {
  plot_a_ = downsample_trace(data_.lap_a.lap.samples, kPlotPoints);
  plot_b_ = downsample_trace(data_.lap_b.lap.samples, kPlotPoints);
  speed_max_kmh_ = std::max({1.0, max_speed(plot_a_), max_speed(plot_b_)});

  delta_ = delta_speed_trace(DistanceTrace(data_.lap_a.lap.samples),
                             DistanceTrace(data_.lap_b.lap.samples), 5.0);
  for (const auto& p : delta_) delta_abs_max_kmh_ = std::max(delta_abs_max_kmh_, std::fabs(p.speed_kmh));

  reset_view_();
}

void ViewerApp::reset_view_() {
  const DistanceTrace a(data_.lap_a.lap.samples);
  const DistanceTrace b(data_.lap_b.lap.samples);
  view_lo_m_ = std::min(a.start_m(), b.start_m());
  view_hi_m_ = std::max(a.end_m(), b.end_m());
  if (view_hi_m_ - view_lo_m_ < 1.0) view_hi_m_ = view_lo_m_ + 1.0;
}

void ViewerApp::focus_corner_(std::size_t k) {
  if (k >= data_.lap_a.corners.size()) return;
  const auto& c = data_.lap_a.corners[k];
  const double margin = 150.0; // room for the braking zone
  view_lo_m_ = c.distance_start_m - margin;
  view_hi_m_ = c.distance_exit_m + margin * 0.5;
}

float ViewerApp::x_of_(const Rectf& r, double distance_m) const {
  const double t = (distance_m - view_lo_m_) / (view_hi_m_ - view_lo_m_);
  return r.x + float(t) * r.w;
}

int ViewerApp::run() {
  const int W = 1280, H = 768;
  InitWindow(W, H, "apexlab - corner comparison");
  SetTargetFPS(60);

  while (!WindowShouldClose()) {
    process_input_();
    render_frame_();
  }

  CloseWindow();
  return 0;
}

void ViewerApp::process_input_() {
  const std::size_t n = data_.comparison.corners.size();
  if (n > 0) {
    if (IsKeyPressed(KEY_RIGHT) || IsKeyPressed(KEY_RIGHT_BRACKET)) selected_ = (selected_ + 1) % n;
    if (IsKeyPressed(KEY_LEFT) || IsKeyPressed(KEY_LEFT_BRACKET))   selected_ = (selected_ + n - 1) % n;
    if (IsKeyPressed(KEY_Z)) focus_corner_(selected_);
  }

  // Zoom around the window center
  const double span = view_hi_m_ - view_lo_m_;
  const double mid = 0.5 * (view_lo_m_ + view_hi_m_);
  if (IsKeyDown(KEY_W) || IsKeyDown(KEY_KP_ADD)) {
    const double s = std::max(20.0, span * 0.98);
    view_lo_m_ = mid - s * 0.5; view_hi_m_ = mid + s * 0.5;
  }
  if (IsKeyDown(KEY_S) || IsKeyDown(KEY_KP_SUBTRACT)) {
    const double s = span * 1.02;
    view_lo_m_ = mid - s * 0.5; view_hi_m_ = mid + s * 0.5;
  }

  // Pan (fraction of the window per frame while key held)
  const double pan = span * 0.01;
  if (IsKeyDown(KEY_A)) { view_lo_m_ -= pan; view_hi_m_ -= pan; }
  if (IsKeyDown(KEY_D)) { view_lo_m_ += pan; view_hi_m_ += pan; }
  if (IsKeyPressed(KEY_C)) reset_view_();
}

void ViewerApp::render_frame_() {
  BeginDrawing();
  ClearBackground(Color{18, 18, 22, 255});
  draw_plot_();
  draw_delta_strip_();
  draw_corner_panel_();
  draw_hud_();
  EndDrawing();
}

void ViewerApp::draw_plot_() {
  const int y0 = kHUD_LINE3_Y + 14 + kHUD_BOTTOM_PAD;
  const Rectf r{60.0f, float(y0), float(GetScreenWidth() - kPanelW - 90),
                float(GetScreenHeight() - y0 - 170)};

  DrawRectangle(int(r.x), int(r.y), int(r.w), int(r.h), Color{24, 24, 28, 255});

  // Horizontal speed grid every 50 km/h
  for (int v = 0; v <= int(speed_max_kmh_); v += 50) {
    const float y = r.y + r.h - float(v / speed_max_kmh_) * r.h;
    DrawLine(int(r.x), int(y), int(r.x + r.w), int(y), kColGrid);
    DrawText(TextFormat("%d", v), int(r.x) - 34, int(y) - 6, 12, kColDim);
  }

  BeginScissorMode(int(r.x), int(r.y), int(r.w), int(r.h));

  // Corner zones of driver A, numbered in lap order
  for (std::size_t k = 0; k < data_.lap_a.corners.size(); ++k) {
    const auto& c = data_.lap_a.corners[k];
    const float xa = x_of_(r, c.distance_start_m);
    const float xb = x_of_(r, c.distance_exit_m);
    DrawRectangle(int(xa), int(r.y), std::max(1, int(xb - xa)), int(r.h),
                  k == selected_ ? kColZoneSel : kColZone);
    const float xapex = x_of_(r, c.distance_apex_m);
    DrawLine(int(xapex), int(r.y), int(xapex), int(r.y + r.h), Color{241, 196, 15, 90});
    DrawText(TextFormat("C%zu", k + 1), int(xa) + 4, int(r.y) + 4, 14, kColDim);
    if (c.braking_point_distance_m) {
      const float xbp = x_of_(r, *c.braking_point_distance_m);
      DrawLine(int(xbp), int(r.y), int(xbp), int(r.y + r.h), Color{231, 76, 60, 80});
    }
  }
  for (const auto& c : data_.lap_b.corners) {
    if (c.braking_point_distance_m) {
      const float xbp = x_of_(r, *c.braking_point_distance_m);
      DrawLine(int(xbp), int(r.y), int(xbp), int(r.y + r.h), Color{52, 152, 219, 80});
    }
  }

  auto trace = [&](const std::vector<Sample>& pts, Color col) {
    for (std::size_t i = 1; i < pts.size(); ++i) {
      const auto& p = pts[i-1];
      const auto& q = pts[i];
      if (!present(p.speed_kmh) || !present(q.speed_kmh)) continue;
      if (q.distance_m < view_lo_m_ || p.distance_m > view_hi_m_) continue;
      const Vector2 a{x_of_(r, p.distance_m), r.y + r.h - float(p.speed_kmh / speed_max_kmh_) * r.h};
      const Vector2 b{x_of_(r, q.distance_m), r.y + r.h - float(q.speed_kmh / speed_max_kmh_) * r.h};
      DrawLineEx(a, b, 2.0f, col);
    }
  };
  trace(plot_a_, kColA);
  trace(plot_b_, kColB);

  EndScissorMode();

  DrawRectangleLines(int(r.x), int(r.y), int(r.w), int(r.h), kColGrid);
  DrawText("km/h", int(r.x) - 44, int(r.y) - 16, 12, kColDim);
  DrawText(TextFormat("%.0f m", view_lo_m_), int(r.x), int(r.y + r.h) + 4, 12, kColDim);
  const char* hi = TextFormat("%.0f m", view_hi_m_);
  DrawText(hi, int(r.x + r.w) - MeasureText(hi, 12), int(r.y + r.h) + 4, 12, kColDim);
}

void ViewerApp::draw_delta_strip_() {
  const Rectf r{60.0f, float(GetScreenHeight() - 140), float(GetScreenWidth() - kPanelW - 90), 110.0f};
  DrawRectangle(int(r.x), int(r.y), int(r.w), int(r.h), Color{24, 24, 28, 255});
  const float mid = r.y + r.h * 0.5f;
  DrawLine(int(r.x), int(mid), int(r.x + r.w), int(mid), kColGrid);
  DrawText(TextFormat("speed delta (%s - %s), +/-%.0f km/h", data_.driver_b_id.c_str(),
                      data_.driver_a_id.c_str(), delta_abs_max_kmh_),
           int(r.x), int(r.y) - 16, 12, kColDim);

  BeginScissorMode(int(r.x), int(r.y), int(r.w), int(r.h));
  for (std::size_t i = 1; i < delta_.size(); ++i) {
    const auto& p = delta_[i-1];
    const auto& q = delta_[i];
    if (q.distance_m < view_lo_m_ || p.distance_m > view_hi_m_) continue;
    const float k = 0.5f * r.h / float(delta_abs_max_kmh_);
    const Vector2 a{x_of_(r, p.distance_m), mid - float(p.speed_kmh) * k};
    const Vector2 b{x_of_(r, q.distance_m), mid - float(q.speed_kmh) * k};
    DrawLineEx(a, b, 1.5f, q.speed_kmh >= 0.0 ? kColB : kColA);
  }
  EndScissorMode();
  DrawRectangleLines(int(r.x), int(r.y), int(r.w), int(r.h), kColGrid);
}

void ViewerApp::draw_corner_panel_() {
  const int pad = 10;
  const int x0 = GetScreenWidth() - kPanelW - 10;
  const int y0 = kHUD_LINE3_Y + 14 + kHUD_BOTTOM_PAD;
  const int box_h = GetScreenHeight() - y0 - 30;

  DrawRectangle(x0 - 6, y0 - 6, kPanelW + 12, box_h + 12, Color{0, 0, 0, 80});
  DrawRectangle(x0, y0, kPanelW, box_h, Color{24, 24, 28, 220});

  const auto& corners = data_.comparison.corners;
  if (corners.empty()) {
    DrawText("No aligned corners", x0 + pad, y0 + pad, 18, kColText);
    return;
  }
  const std::size_t k = std::min(selected_, corners.size() - 1);
  const ComparisonResult& res = corners[k];
  const CornerMetrics& ca = data_.lap_a.corners[k];
  const CornerMetrics& cb = data_.lap_b.corners[k];

  int y = y0 + pad;
  DrawText(TextFormat("Corner %zu of %zu", k + 1, corners.size()), x0 + pad, y, 20, kColText);
  y += 28;

  // Two-column metric table
  const int X_NAME = x0 + pad;
  const int X_A    = x0 + pad + 150;
  const int X_B    = x0 + pad + 260;
  DrawText(data_.driver_a_id.c_str(), X_A, y, 16, kColA);
  DrawText(data_.driver_b_id.c_str(), X_B, y, 16, kColB);
  y += 20;

  auto row = [&](const char* name, const std::optional<double>& a, const std::optional<double>& b,
                 const char* fmt) {
    char ba[32], bb[32];
    if (a) std::snprintf(ba, sizeof(ba), fmt, *a); else std::snprintf(ba, sizeof(ba), "%s", "n/a");
    if (b) std::snprintf(bb, sizeof(bb), fmt, *b); else std::snprintf(bb, sizeof(bb), "%s", "n/a");
    DrawText(name, X_NAME, y, 14, kColDim);
    DrawText(ba, X_A, y, 14, kColText);
    DrawText(bb, X_B, y, 14, kColText);
    y += 18;
  };
  row("Braking point", ca.braking_point_distance_m, cb.braking_point_distance_m, "%.0f m");
  row("Entry speed", ca.entry_speed_kmh, cb.entry_speed_kmh, "%.1f");
  row("Apex speed", ca.apex_speed_kmh, cb.apex_speed_kmh, "%.1f");
  row("Exit speed", ca.exit_speed_kmh, cb.exit_speed_kmh, "%.1f");
  row("Corner time", ca.corner_time_s, cb.corner_time_s, "%.3f s");
  row("Max lateral g", ca.lateral_g_max, cb.lateral_g_max, "%.2f");
  row("Steering std-dev", ca.steering_smoothness, cb.steering_smoothness, "%.1f");
  row("Throttle on", ca.throttle_application_distance_m, cb.throttle_application_distance_m, "%.0f m");

  y += 6;
  char buf[48];
  fmt_opt(res.deltas.get(Metric::CornerTime), "s", buf, sizeof(buf));
  DrawText(TextFormat("Corner time delta: %s", buf), X_NAME, y, 16,
           res.deltas.corner_time_s <= 0.0 ? kColFaster : kColSlower);
  y += 28;

  DrawText("Insights", X_NAME, y, 18, kColText);
  y += 24;
  if (res.insights.empty()) {
    DrawText("No significant differences", X_NAME, y, 14, kColDim);
    return;
  }
  for (const auto& text : res.insights) {
    DrawCircle(X_NAME + 4, y + 7, 2.5f, kColDim);
    for (const auto& line : wrap(text, 14, kPanelW - 2 * pad - 12)) {
      DrawText(line.c_str(), X_NAME + 12, y, 14, kColText);
      y += 16;
    }
    y += 6;
    if (y > y0 + box_h - 20) break;
  }
}

void ViewerApp::draw_hud_() {
  char ta[32], tb[32];
  fmt_time(data_.lap_a.lap.lap_time_s, ta, sizeof(ta));
  fmt_time(data_.lap_b.lap.lap_time_s, tb, sizeof(tb));

  DrawText(TextFormat("%s  |  %s lap %d %s  vs  %s lap %d %s",
                      data_.title.c_str(),
                      data_.driver_a_id.c_str(), data_.lap_a.lap.lap_number, ta,
                      data_.driver_b_id.c_str(), data_.lap_b.lap.lap_number, tb),
           20, kHUD_LINE1_Y, 20, Color{220, 235, 220, 255});

  const auto& cmp = data_.comparison;
  DrawText(TextFormat("corners=%zu  unmatched=%zu/%zu  summed corner time delta=%+.3fs (naive additive estimate)",
                      cmp.corners.size(), cmp.unmatched_a, cmp.unmatched_b,
                      cmp.expected_lap_time_gain_s),
           20, kHUD_LINE2_Y, 16, Color{235, 220, 220, 255});

  DrawText("Left/Right or [ ]: Corner | Z: Zoom to corner | W/S or +/-: Zoom | A/D: Pan | C: Full lap",
           20, kHUD_LINE3_Y, 14, Color{190, 205, 190, 255});
}

} // namespace apex
