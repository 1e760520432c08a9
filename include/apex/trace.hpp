#pragma once
#include <algorithm>
#include <cstddef>
#include <optional>
#include <vector>
#include <apex/sample.hpp>

namespace apex {

// Keeps first, last and evenly spaced samples (for plotting).
inline std::vector<Sample> downsample_trace(const std::vector<Sample>& samples, std::size_t target_points) {
  if (target_points == 0 || samples.size() <= target_points) return samples;
  const std::size_t step = samples.size() / target_points;
  std::vector<Sample> out;
  out.reserve(target_points + 2);
  std::size_t last = 0;
  for (std::size_t i = 0; i < samples.size(); i += step) {
    out.push_back(samples[i]);
    last = i;
  }
  if (last != samples.size() - 1) out.push_back(samples.back());
  return out;
}

// Distance-indexed view of a lap's speed channel with linear interpolation.
class DistanceTrace {
public:
  struct Point {
    double distance_m = 0.0;
    double speed_kmh = 0.0;
  };

  DistanceTrace() = default;
  explicit DistanceTrace(const std::vector<Sample>& samples) {
    pts_.reserve(samples.size());
    for (const auto& s : samples) {
      if (!present(s.distance_m) || !present(s.speed_kmh)) continue;
      // Keep distance strictly increasing; later duplicates are dropped
      if (!pts_.empty() && s.distance_m <= pts_.back().distance_m) continue;
      pts_.push_back({s.distance_m, s.speed_kmh});
    }
  }

  bool empty() const { return pts_.empty(); }
  const std::vector<Point>& points() const { return pts_; }
  double start_m() const { return pts_.empty() ? 0.0 : pts_.front().distance_m; }
  double end_m() const { return pts_.empty() ? 0.0 : pts_.back().distance_m; }

  // Speed at distance d; clamps to the first/last point outside the covered range.
  std::optional<double> speed_at(double d) const {
    const std::size_t n = pts_.size();
    if (n == 0) return std::nullopt;
    if (n == 1 || d <= pts_.front().distance_m) return pts_.front().speed_kmh;
    if (d >= pts_.back().distance_m) return pts_.back().speed_kmh;

    auto it = std::upper_bound(pts_.begin(), pts_.end(), d,
                               [](double v, const Point& p){ return v < p.distance_m; });
    const Point& B = *it;
    const Point& A = *(it - 1);
    const double span = B.distance_m - A.distance_m;
    const double t = span > 0.0 ? (d - A.distance_m) / span : 0.0;
    return lerp(A.speed_kmh, B.speed_kmh, t);
  }

private:
  static double lerp(double a, double b, double t) { return a + (b - a) * t; }

  std::vector<Point> pts_;
};

// Speed difference (b - a) sampled every step_m over the overlap of both traces.
inline std::vector<DistanceTrace::Point> delta_speed_trace(const DistanceTrace& a,
                                                          const DistanceTrace& b,
                                                          double step_m) {
  std::vector<DistanceTrace::Point> out;
  if (a.empty() || b.empty() || step_m <= 0.0) return out;
  const double lo = std::max(a.start_m(), b.start_m());
  const double hi = std::min(a.end_m(), b.end_m());
  for (double d = lo; d <= hi; d += step_m) {
    out.push_back({d, *b.speed_at(d) - *a.speed_at(d)});
  }
  return out;
}

} // namespace apex
