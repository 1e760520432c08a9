#pragma once
#include <cstddef>
#include <string>
#include <vector>
#include <apex/comparator.hpp>
#include <apex/session.hpp>
#include <apex/trace.hpp>

namespace apex {

// Everything the viewer draws; built once before the window opens.
struct ViewerData {
  std::string title;       // e.g. "barber race 1"
  std::string driver_a_id;
  std::string driver_b_id;
  BestLap lap_a;
  BestLap lap_b;
  DriverComparison comparison;
};

// RAII application that plots two drivers' best laps against distance.
class ViewerApp {
public:
  explicit ViewerApp(ViewerData data);
  int run(); // returns 0 on normal exit

private:
  void process_input_();
  void render_frame_();
  void draw_plot_();
  void draw_delta_strip_();
  void draw_corner_panel_();
  void draw_hud_();

  void focus_corner_(std::size_t k);
  void reset_view_();

  struct Rectf { float x; float y; float w; float h; };
  float x_of_(const Rectf& r, double distance_m) const;

  ViewerData data_;
  std::vector<Sample> plot_a_;
  std::vector<Sample> plot_b_;
  std::vector<DistanceTrace::Point> delta_;
  double speed_max_kmh_{1.0};
  double delta_abs_max_kmh_{1.0};

  // Visible distance window (meters)
  double view_lo_m_{0.0};
  double view_hi_m_{1.0};
  std::size_t selected_{0};
};

} // namespace apex
