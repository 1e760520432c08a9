#include <apex/metrics.hpp>
#include <algorithm>
#include <cmath>

namespace apex {

std::optional<double> max_abs(const std::vector<double>& values) {
  std::optional<double> best;
  for (double v : values) {
    if (!present(v)) continue;
    const double a = std::fabs(v);
    if (!best || a > *best) best = a;
  }
  return best;
}

std::optional<double> population_stddev(const std::vector<double>& values) {
  double sum = 0.0;
  std::size_t n = 0;
  for (double v : values) {
    if (!present(v)) continue;
    sum += v;
    ++n;
  }
  if (n == 0) return std::nullopt;
  const double mean = sum / double(n);
  double acc = 0.0;
  for (double v : values) {
    if (!present(v)) continue;
    acc += (v - mean) * (v - mean);
  }
  return std::sqrt(acc / double(n));
}

std::optional<IndexRange> braking_window(std::size_t start_idx, std::size_t lookback) {
  if (lookback == 0 || start_idx < lookback) return std::nullopt;
  return IndexRange{start_idx - lookback, start_idx - 1};
}

std::optional<IndexRange> clipped_braking_window(std::size_t start_idx, std::size_t lookback) {
  if (lookback == 0 || start_idx == 0) return std::nullopt;
  return IndexRange{start_idx > lookback ? start_idx - lookback : 0, start_idx - 1};
}

std::optional<double> find_braking_point(const std::vector<Sample>& samples,
                                         const CornerZone& zone,
                                         const ExtractionConfig& cfg) {
  const auto win = braking_window(zone.start_idx, cfg.braking_lookback_samples);
  if (!win || win->end >= samples.size()) return std::nullopt;
  for (std::size_t i = win->start; i <= win->end; ++i) {
    const auto brake = value_of(samples[i].brake_front_bar);
    if (brake && *brake > cfg.brake_pressure_threshold_bar) return samples[i].distance_m;
  }
  return std::nullopt;
}

std::optional<double> find_throttle_application(const std::vector<Sample>& samples,
                                                const CornerZone& zone,
                                                const ExtractionConfig& cfg) {
  if (samples.empty() || zone.apex_idx >= samples.size()) return std::nullopt;
  const std::size_t last = std::min(samples.size() - 1, zone.end_idx + cfg.throttle_overrun_samples);
  for (std::size_t i = zone.apex_idx; i <= last; ++i) {
    const auto throttle = value_of(samples[i].throttle_pct);
    if (throttle && *throttle > cfg.throttle_threshold_pct) return samples[i].distance_m;
  }
  return std::nullopt;
}

static std::optional<double> brake_pressure_max(const std::vector<Sample>& samples,
                                                const CornerZone& zone,
                                                const ExtractionConfig& cfg) {
  const auto win = clipped_braking_window(zone.start_idx, cfg.braking_lookback_samples);
  if (!win || win->end >= samples.size()) return std::nullopt;
  std::optional<double> best;
  for (std::size_t i = win->start; i <= win->end; ++i) {
    const auto brake = value_of(samples[i].brake_front_bar);
    if (brake && (!best || *brake > *best)) best = brake;
  }
  return best;
}

static std::optional<double> speed_at(const std::vector<Sample>& samples, std::size_t i) {
  const double v = samples[i].speed_kmh;
  if (!present(v)) return std::nullopt;
  return v;
}

CornerMetrics extract_corner_metrics(const std::vector<Sample>& samples,
                                     const CornerZone& zone,
                                     const ExtractionConfig& cfg) {
  CornerMetrics m;
  m.zone = zone;
  if (zone.end_idx >= samples.size() || zone.start_idx > zone.apex_idx || zone.apex_idx > zone.end_idx) {
    return m;
  }

  const auto& first = samples[zone.start_idx];
  const auto& apex  = samples[zone.apex_idx];
  const auto& last  = samples[zone.end_idx];

  m.entry_speed_kmh = speed_at(samples, zone.start_idx);
  m.apex_speed_kmh  = speed_at(samples, zone.apex_idx);
  m.exit_speed_kmh  = speed_at(samples, zone.end_idx);
  m.corner_time_s   = last.timestamp - first.timestamp;

  m.distance_start_m = first.distance_m;
  m.distance_apex_m  = apex.distance_m;
  m.distance_exit_m  = last.distance_m;

  std::vector<double> lateral;
  std::vector<double> steering;
  lateral.reserve(zone.end_idx - zone.start_idx + 1);
  steering.reserve(zone.end_idx - zone.start_idx + 1);
  for (std::size_t i = zone.start_idx; i <= zone.end_idx; ++i) {
    lateral.push_back(samples[i].lateral_g);
    steering.push_back(samples[i].steering_deg);
  }
  m.lateral_g_max = max_abs(lateral);
  m.steering_angle_max_deg = max_abs(steering);
  m.steering_smoothness = population_stddev(steering);

  m.braking_point_distance_m = find_braking_point(samples, zone, cfg);
  m.brake_pressure_max_bar = brake_pressure_max(samples, zone, cfg);
  m.throttle_application_distance_m = find_throttle_application(samples, zone, cfg);
  return m;
}

std::vector<CornerMetrics> extract_all_metrics(const Lap& lap,
                                               const std::vector<CornerZone>& zones,
                                               const ExtractionConfig& cfg) {
  std::vector<CornerMetrics> out;
  out.reserve(zones.size());
  for (const auto& z : zones) out.push_back(extract_corner_metrics(lap.samples, z, cfg));
  return out;
}

} // namespace apex
