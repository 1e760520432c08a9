#include <apex/detector.hpp>
#include <cmath>

namespace apex {

static bool above(double v, double threshold) {
  // NaN compares false, so missing data never passes a threshold
  return std::fabs(v) > threshold;
}

std::vector<bool> steering_mask(const std::vector<Sample>& samples, const DetectionConfig& cfg) {
  std::vector<bool> out(samples.size(), false);
  for (std::size_t i = 0; i < samples.size(); ++i) {
    out[i] = above(samples[i].steering_deg, cfg.steering_threshold_deg);
  }
  return out;
}

std::vector<bool> lateral_g_mask(const std::vector<Sample>& samples, const DetectionConfig& cfg) {
  std::vector<bool> out(samples.size(), false);
  for (std::size_t i = 0; i < samples.size(); ++i) {
    out[i] = above(samples[i].lateral_g, cfg.lateral_g_threshold);
  }
  return out;
}

std::vector<bool> corner_mask(const std::vector<Sample>& samples, const DetectionConfig& cfg) {
  const auto steer = steering_mask(samples, cfg);
  const auto lat = lateral_g_mask(samples, cfg);
  std::vector<bool> out(samples.size(), false);
  for (std::size_t i = 0; i < samples.size(); ++i) out[i] = steer[i] && lat[i];
  return out;
}

std::vector<IndexRange> find_runs(const std::vector<bool>& mask) {
  std::vector<IndexRange> runs;
  bool in_run = false;
  std::size_t start = 0;
  for (std::size_t i = 0; i < mask.size(); ++i) {
    if (mask[i] && !in_run) {
      in_run = true;
      start = i;
    } else if (!mask[i] && in_run) {
      in_run = false;
      runs.push_back({start, i - 1});
    }
  }
  if (in_run) runs.push_back({start, mask.size() - 1});
  return runs;
}

std::vector<IndexRange> filter_by_duration(const std::vector<Sample>& samples,
                                           const std::vector<IndexRange>& runs,
                                           double min_duration_s) {
  std::vector<IndexRange> out;
  out.reserve(runs.size());
  for (const auto& r : runs) {
    if (r.end >= samples.size() || r.size() < 2) continue;
    const double duration = samples[r.end].timestamp - samples[r.start].timestamp;
    if (duration >= min_duration_s) out.push_back(r);
  }
  return out;
}

std::vector<IndexRange> merge_nearby(const std::vector<Sample>& samples,
                                     const std::vector<IndexRange>& runs,
                                     double merge_gap_m) {
  std::vector<IndexRange> merged;
  merged.reserve(runs.size());
  for (const auto& r : runs) {
    if (!merged.empty()) {
      auto& last = merged.back();
      const double gap = samples[r.start].distance_m - samples[last.end].distance_m;
      if (gap < merge_gap_m) {
        last.end = r.end;
        continue;
      }
    }
    merged.push_back(r);
  }
  return merged;
}

std::optional<std::size_t> argmin_speed(const std::vector<Sample>& samples, const IndexRange& range) {
  std::optional<std::size_t> best;
  for (std::size_t i = range.start; i <= range.end && i < samples.size(); ++i) {
    const double v = samples[i].speed_kmh;
    if (!present(v)) continue;
    if (!best || v < samples[*best].speed_kmh) best = i;
  }
  return best;
}

std::vector<CornerZone> detect_corners(const std::vector<Sample>& samples, const DetectionConfig& cfg) {
  std::vector<CornerZone> zones;
  if (samples.size() < 2) return zones;

  auto runs = find_runs(corner_mask(samples, cfg));
  runs = filter_by_duration(samples, runs, cfg.min_corner_duration_s);
  runs = merge_nearby(samples, runs, cfg.merge_gap_m);

  zones.reserve(runs.size());
  for (const auto& r : runs) {
    CornerZone z;
    z.zone_index = zones.size();
    z.start_idx = r.start;
    z.end_idx = r.end;
    // With no usable speed at all the apex falls back to the zone start.
    z.apex_idx = argmin_speed(samples, r).value_or(r.start);
    z.duration_s = samples[r.end].timestamp - samples[r.start].timestamp;
    zones.push_back(z);
  }
  return zones;
}

} // namespace apex
