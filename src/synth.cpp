#include <apex/synth.hpp>
#include <algorithm>
#include <cmath>

namespace apex {

TrackPath make_track_preset(TrackPreset p) {
  std::vector<Vec2> ctrl;
  auto add = [&](double x, double y){ ctrl.push_back({x,y}); };

  switch (p) {
    case TrackPreset::Stadium:
      return TrackPath::Stadium(/*straight_len*/ 250.0, /*radius*/ 50.0, /*arc detail*/ 14);
    case TrackPreset::ChicaneHairpin: {
      // Right vertical -> chicane -> long top -> hairpin -> bottom return
      add( 150, -60); add(150,  60);
      add(  40,  80); add(-10,  60);
      add( -40,  30); add(-120, 30);
      add(-160,   0); add(-150, -60);
      add(-120, -100); add(-60, -110);
      add(  40, -90); add(120, -80);
      return TrackPath::FromClosedCatmullRom(ctrl, 28);
    }
    default:
      return TrackPath::Stadium(250.0, 50.0, 14);
  }
}

const char* track_preset_name(TrackPreset p) {
  switch (p) {
    case TrackPreset::Stadium:        return "Stadium";
    case TrackPreset::ChicaneHairpin: return "Chicane+Hairpin";
    default: return "Unknown";
  }
}

namespace {

// Channels on the fixed distance grid before time resampling.
struct GridPoint {
  double distance_m = 0.0;
  double time_s = 0.0;
  double speed_mps = 0.0;
  double steering_deg = 0.0;
  double lateral_g = 0.0;
  double longitudinal_g = 0.0;
  double brake_bar = 0.0;
  double throttle_pct = 0.0;
};

std::vector<GridPoint> build_grid(const TrackPath& path, const SynthParams& p, const DriverStyle& style) {
  const double length = path.length();
  const std::size_t n = std::max<std::size_t>(2, static_cast<std::size_t>(length));
  const double ds = length / double(n);

  const double v_max = p.max_speed_kmh / 3.6;
  const double a_acc = p.accel_g * kGravity;
  const double a_brk = p.brake_decel_g * style.brake_decel_scale * kGravity;

  std::vector<GridPoint> g(n + 1);
  std::vector<double> k(n + 1);
  for (std::size_t i = 0; i <= n; ++i) {
    g[i].distance_m = ds * double(i);
    k[i] = path.curvature_at(p.start_offset_m + g[i].distance_m);
    double v = v_max;
    if (std::fabs(k[i]) > 1e-6) {
      v = std::min(v_max, style.speed_scale * std::sqrt(p.max_lateral_g * kGravity / std::fabs(k[i])));
    }
    g[i].speed_mps = v;
  }

  // Acceleration pass, then braking pass
  for (std::size_t i = 1; i <= n; ++i) {
    const double reach = std::sqrt(g[i-1].speed_mps * g[i-1].speed_mps + 2.0 * a_acc * ds);
    g[i].speed_mps = std::min(g[i].speed_mps, reach);
  }
  for (std::size_t i = n; i-- > 0;) {
    const double reach = std::sqrt(g[i+1].speed_mps * g[i+1].speed_mps + 2.0 * a_brk * ds);
    g[i].speed_mps = std::min(g[i].speed_mps, reach);
  }

  const double road_to_wheel = 180.0 / kPI * p.steering_ratio;
  for (std::size_t i = 0; i <= n; ++i) {
    auto& gp = g[i];
    const std::size_t j = (i < n) ? i + 1 : i;
    const std::size_t h = (i < n) ? i : i - 1;
    const double acc = (g[j].speed_mps * g[j].speed_mps - g[h].speed_mps * g[h].speed_mps) / (2.0 * ds);
    if (i > 0) {
      const double v_avg = 0.5 * (g[i-1].speed_mps + gp.speed_mps);
      gp.time_s = g[i-1].time_s + ds / std::max(v_avg, 0.1);
    }
    gp.steering_deg = std::atan(p.wheelbase_m * k[i]) * road_to_wheel;
    gp.lateral_g = gp.speed_mps * gp.speed_mps * k[i] / kGravity;
    gp.longitudinal_g = acc / kGravity;
    if (gp.longitudinal_g < -0.05) {
      gp.brake_bar = p.brake_bar_per_g * -gp.longitudinal_g;
      gp.throttle_pct = 0.0;
    } else if (gp.longitudinal_g > 0.05) {
      gp.throttle_pct = 100.0;
    } else {
      gp.throttle_pct = p.cruise_throttle_pct;
    }
  }
  return g;
}

double lerp(double a, double b, double t) { return a + (b - a) * t; }

std::vector<Sample> resample(const std::vector<GridPoint>& g, const SynthParams& p, const DriverStyle& style,
                             int lap_number, double start_time_s, std::mt19937* rng) {
  std::vector<Sample> out;
  if (g.size() < 2 || p.sample_hz <= 0.0) return out;

  std::normal_distribution<double> steer_noise(0.0, std::max(1e-9, p.noise_steering_deg));
  std::normal_distribution<double> lat_noise(0.0, std::max(1e-9, p.noise_lateral_g));

  const double dt = 1.0 / p.sample_hz;
  const double t_end = g.back().time_s;
  std::size_t i = 0;
  for (std::size_t step = 0;; ++step) {
    const double t = dt * double(step);
    if (t > t_end) break;
    while (i + 2 < g.size() && g[i+1].time_s < t) ++i;
    const auto& A = g[i];
    const auto& B = g[i+1];
    const double span = B.time_s - A.time_s;
    const double u = span > 0.0 ? std::clamp((t - A.time_s) / span, 0.0, 1.0) : 0.0;

    Sample s;
    s.timestamp = start_time_s + t;
    s.distance_m = lerp(A.distance_m, B.distance_m, u);
    s.speed_kmh = lerp(A.speed_mps, B.speed_mps, u) * 3.6;
    s.steering_deg = lerp(A.steering_deg, B.steering_deg, u);
    s.lateral_g = lerp(A.lateral_g, B.lateral_g, u);
    s.longitudinal_g = lerp(A.longitudinal_g, B.longitudinal_g, u);
    if (style.has_brake_channel) s.brake_front_bar = lerp(A.brake_bar, B.brake_bar, u);
    if (style.has_throttle_channel) s.throttle_pct = lerp(A.throttle_pct, B.throttle_pct, u);
    s.lap_number = lap_number;
    if (rng) {
      if (p.noise_steering_deg > 0.0) s.steering_deg += steer_noise(*rng);
      if (p.noise_lateral_g > 0.0) s.lateral_g += lat_noise(*rng);
    }
    out.push_back(s);
  }
  return out;
}

} // namespace

std::vector<Sample> synthesize_lap(const TrackPath& path,
                                   const SynthParams& params,
                                   const DriverStyle& style,
                                   int lap_number,
                                   double start_time_s) {
  if (path.empty()) return {};
  return resample(build_grid(path, params, style), params, style, lap_number, start_time_s, nullptr);
}

std::vector<Sample> synthesize_lap(const TrackPath& path,
                                   const SynthParams& params,
                                   const DriverStyle& style,
                                   int lap_number,
                                   double start_time_s,
                                   std::mt19937& rng) {
  if (path.empty()) return {};
  return resample(build_grid(path, params, style), params, style, lap_number, start_time_s, &rng);
}

std::vector<Sample> synthesize_session(const TrackPath& path,
                                       const SynthParams& params,
                                       const DriverStyle& style,
                                       std::size_t laps) {
  std::vector<Sample> out;
  if (path.empty() || params.sample_hz <= 0.0) return out;
  const auto grid = build_grid(path, params, style);
  double t0 = 0.0;
  for (std::size_t l = 0; l < laps; ++l) {
    auto lap = resample(grid, params, style, static_cast<int>(l + 1), t0, nullptr);
    if (lap.empty()) break;
    t0 = lap.back().timestamp + 1.0 / params.sample_hz;
    out.insert(out.end(), lap.begin(), lap.end());
  }
  return out;
}

} // namespace apex
