#include <apex/comparator.hpp>
#include <algorithm>
#include <cmath>
#include <cstdio>

namespace apex {

const char* metric_key(Metric m) {
  switch (m) {
    case Metric::BrakingPoint:        return "braking_point_m";
    case Metric::EntrySpeed:          return "entry_speed_kmh";
    case Metric::ApexSpeed:           return "apex_speed_kmh";
    case Metric::ExitSpeed:           return "exit_speed_kmh";
    case Metric::CornerTime:          return "corner_time_s";
    case Metric::LateralGMax:         return "lateral_g_max";
    case Metric::SteeringSmoothness:  return "steering_smoothness";
    case Metric::SteeringAngleMax:    return "steering_angle_max_deg";
    case Metric::BrakePressureMax:    return "brake_pressure_max_bar";
    case Metric::ThrottleApplication: return "throttle_application_m";
    default: return "unknown";
  }
}

std::optional<double> MetricDeltas::get(Metric m) const {
  switch (m) {
    case Metric::BrakingPoint:        return braking_point_m;
    case Metric::EntrySpeed:          return entry_speed_kmh;
    case Metric::ApexSpeed:           return apex_speed_kmh;
    case Metric::ExitSpeed:           return exit_speed_kmh;
    case Metric::CornerTime:          return corner_time_s;
    case Metric::LateralGMax:         return lateral_g_max;
    case Metric::SteeringSmoothness:  return steering_smoothness;
    case Metric::SteeringAngleMax:    return steering_angle_max_deg;
    case Metric::BrakePressureMax:    return brake_pressure_max_bar;
    case Metric::ThrottleApplication: return throttle_application_m;
    default: return std::nullopt;
  }
}

static std::optional<double> diff(const std::optional<double>& a, const std::optional<double>& b) {
  if (!a || !b) return std::nullopt;
  return *b - *a;
}

MetricDeltas metric_deltas(const CornerMetrics& a, const CornerMetrics& b) {
  MetricDeltas d;
  d.braking_point_m        = diff(a.braking_point_distance_m, b.braking_point_distance_m);
  d.entry_speed_kmh        = diff(a.entry_speed_kmh, b.entry_speed_kmh);
  d.apex_speed_kmh         = diff(a.apex_speed_kmh, b.apex_speed_kmh);
  d.exit_speed_kmh         = diff(a.exit_speed_kmh, b.exit_speed_kmh);
  d.corner_time_s          = b.corner_time_s - a.corner_time_s;
  d.lateral_g_max          = diff(a.lateral_g_max, b.lateral_g_max);
  d.steering_smoothness    = diff(a.steering_smoothness, b.steering_smoothness);
  d.steering_angle_max_deg = diff(a.steering_angle_max_deg, b.steering_angle_max_deg);
  d.brake_pressure_max_bar = diff(a.brake_pressure_max_bar, b.brake_pressure_max_bar);
  d.throttle_application_m = diff(a.throttle_application_distance_m, b.throttle_application_distance_m);
  return d;
}

template <class... Args>
static std::string format_line(const char* fmt, Args... args) {
  const int n = std::snprintf(nullptr, 0, fmt, args...);
  if (n <= 0) return {};
  std::string out(static_cast<std::size_t>(n) + 1, '\0');
  std::snprintf(out.data(), out.size(), fmt, args...);
  out.resize(static_cast<std::size_t>(n));
  return out;
}

// Mean of the two speeds in m/s, or nullopt if neither is usable.
static std::optional<double> reference_mps(const std::optional<double>& a_kmh,
                                           const std::optional<double>& b_kmh) {
  double sum = 0.0;
  int n = 0;
  if (a_kmh && *a_kmh > 0.0) { sum += *a_kmh; ++n; }
  if (b_kmh && *b_kmh > 0.0) { sum += *b_kmh; ++n; }
  if (n == 0) return std::nullopt;
  return (sum / n) / 3.6;
}

// Time to cover a distance delta at the reference speed.
static double distance_impact_s(double delta_m, const std::optional<double>& ref_mps) {
  if (!ref_mps) return 0.0;
  return std::fabs(delta_m) / *ref_mps;
}

// Corner time scaled by the relative speed change.
static double speed_impact_s(double delta_kmh, const std::optional<double>& a_kmh,
                             const std::optional<double>& b_kmh, double corner_time_s) {
  const auto ref = reference_mps(a_kmh, b_kmh);
  if (!ref || corner_time_s <= 0.0) return 0.0;
  return corner_time_s * (std::fabs(delta_kmh) / 3.6) / *ref;
}

std::vector<Insight> corner_insights(const std::string& driver_b_id,
                                     const CornerMetrics& a,
                                     const CornerMetrics& b,
                                     const ComparisonConfig& cfg) {
  const MetricDeltas d = metric_deltas(a, b);
  const char* who = driver_b_id.c_str();
  const double ref_time_s = 0.5 * (std::max(0.0, a.corner_time_s) + std::max(0.0, b.corner_time_s));

  std::vector<Insight> out;

  if (d.braking_point_m && std::fabs(*d.braking_point_m) > cfg.insight_distance_threshold_m) {
    const double v = *d.braking_point_m;
    out.push_back({Metric::BrakingPoint,
                   distance_impact_s(v, reference_mps(a.entry_speed_kmh, b.entry_speed_kmh)),
                   format_line("Driver %s brakes %.1fm %s (%.1fm vs %.1fm)",
                               who, std::fabs(v), v > 0.0 ? "later" : "earlier",
                               *a.braking_point_distance_m, *b.braking_point_distance_m)});
  }

  if (d.entry_speed_kmh && std::fabs(*d.entry_speed_kmh) > cfg.insight_speed_threshold_kmh) {
    const double v = *d.entry_speed_kmh;
    out.push_back({Metric::EntrySpeed,
                   speed_impact_s(v, a.entry_speed_kmh, b.entry_speed_kmh, ref_time_s),
                   format_line("Driver %s carries %.1f km/h %s entry speed (%.1f vs %.1f)",
                               who, std::fabs(v), v > 0.0 ? "more" : "less",
                               *a.entry_speed_kmh, *b.entry_speed_kmh)});
  }

  if (d.apex_speed_kmh && std::fabs(*d.apex_speed_kmh) > cfg.insight_speed_threshold_kmh) {
    const double v = *d.apex_speed_kmh;
    out.push_back({Metric::ApexSpeed,
                   speed_impact_s(v, a.apex_speed_kmh, b.apex_speed_kmh, ref_time_s),
                   format_line("Apex speed is %.1f km/h %s for driver %s (%.1f vs %.1f)",
                               std::fabs(v), v > 0.0 ? "higher" : "lower", who,
                               *a.apex_speed_kmh, *b.apex_speed_kmh)});
  }

  if (d.exit_speed_kmh && std::fabs(*d.exit_speed_kmh) > cfg.insight_speed_threshold_kmh) {
    const double v = *d.exit_speed_kmh;
    out.push_back({Metric::ExitSpeed,
                   speed_impact_s(v, a.exit_speed_kmh, b.exit_speed_kmh, ref_time_s),
                   format_line("Driver %s has %.1f km/h %s exit speed (%.1f vs %.1f)",
                               who, std::fabs(v), v > 0.0 ? "higher" : "lower",
                               *a.exit_speed_kmh, *b.exit_speed_kmh)});
  }

  if (d.throttle_application_m && std::fabs(*d.throttle_application_m) > cfg.insight_distance_threshold_m) {
    const double v = *d.throttle_application_m;
    out.push_back({Metric::ThrottleApplication,
                   distance_impact_s(v, reference_mps(a.apex_speed_kmh, b.apex_speed_kmh)),
                   format_line("Driver %s gets back on throttle %.1fm %s (%.1fm vs %.1fm)",
                               who, std::fabs(v), v < 0.0 ? "earlier" : "later",
                               *a.throttle_application_distance_m, *b.throttle_application_distance_m)});
  }

  std::stable_sort(out.begin(), out.end(),
                   [](const Insight& x, const Insight& y){ return x.impact_s > y.impact_s; });

  if (std::fabs(d.corner_time_s) > cfg.insight_time_threshold_s) {
    const double v = d.corner_time_s;
    out.push_back({Metric::CornerTime, std::fabs(v),
                   format_line("Driver %s is %.2fs %s through the corner (%.2fs vs %.2fs)",
                               who, std::fabs(v), v < 0.0 ? "faster" : "slower",
                               a.corner_time_s, b.corner_time_s)});
  }
  return out;
}

ComparisonResult compare_corner(const std::string& driver_a_id, const CornerMetrics& a,
                                const std::string& driver_b_id, const CornerMetrics& b,
                                std::size_t corner_index,
                                const ComparisonConfig& cfg) {
  ComparisonResult r;
  r.driver_a_id = driver_a_id;
  r.driver_b_id = driver_b_id;
  r.corner_index = corner_index;
  r.deltas = metric_deltas(a, b);
  for (auto& ins : corner_insights(driver_b_id, a, b, cfg)) r.insights.push_back(std::move(ins.text));
  return r;
}

DriverComparison compare_drivers(const std::string& driver_a_id, const std::vector<CornerMetrics>& a,
                                 const std::string& driver_b_id, const std::vector<CornerMetrics>& b,
                                 const ComparisonConfig& cfg) {
  DriverComparison out;
  out.driver_a_id = driver_a_id;
  out.driver_b_id = driver_b_id;

  const std::size_t n = std::min(a.size(), b.size());
  out.unmatched_a = a.size() - n;
  out.unmatched_b = b.size() - n;
  out.corners.reserve(n);
  for (std::size_t k = 0; k < n; ++k) {
    out.corners.push_back(compare_corner(driver_a_id, a[k], driver_b_id, b[k], k, cfg));
    out.expected_lap_time_gain_s += out.corners.back().deltas.corner_time_s;
  }
  return out;
}

std::optional<ComparisonResult> compare_corner_at(const std::string& driver_a_id,
                                                  const std::vector<CornerMetrics>& a,
                                                  const std::string& driver_b_id,
                                                  const std::vector<CornerMetrics>& b,
                                                  std::size_t corner_index,
                                                  const ComparisonConfig& cfg) {
  if (corner_index >= a.size() || corner_index >= b.size()) return std::nullopt;
  return compare_corner(driver_a_id, a[corner_index], driver_b_id, b[corner_index], corner_index, cfg);
}

} // namespace apex
