#include <apex/track_geom.hpp>
#include <algorithm>
#include <cmath>
#include <iterator>
#include <utility>

namespace apex {

TrackPath::TrackPath(std::vector<Vec2> pts) : pts_(std::move(pts)) {
  if (pts_.size() < 2) {
    pts_.clear();
    return;
  }
  const Vec2& first = pts_.front();
  const Vec2& last = pts_.back();
  if (first.x != last.x || first.y != last.y) pts_.push_back(first);

  arc_.assign(pts_.size(), 0.0);
  for (std::size_t i = 1; i < pts_.size(); ++i) {
    arc_[i] = arc_[i-1] + std::hypot(pts_[i].x - pts_[i-1].x, pts_[i].y - pts_[i-1].y);
  }
  length_ = arc_.back();
}

double TrackPath::wrap_(double s) const {
  double w = std::fmod(s, length_);
  return w < 0.0 ? w + length_ : w;
}

Vec2 TrackPath::position_at(double s) const {
  if (empty() || length_ <= 0.0) return {};
  const double sw = wrap_(s);

  const auto hi = std::upper_bound(arc_.begin(), arc_.end(), sw);
  const std::size_t j = std::clamp<std::size_t>(std::distance(arc_.begin(), hi), 1, pts_.size() - 1);
  const Vec2& a = pts_[j-1];
  const Vec2& b = pts_[j];
  const double span = arc_[j] - arc_[j-1];
  const double u = span > 0.0 ? (sw - arc_[j-1]) / span : 0.0;
  return {a.x + (b.x - a.x) * u, a.y + (b.y - a.y) * u};
}

double TrackPath::curvature_at(double s, double h) const {
  if (empty() || h <= 0.0) return 0.0;
  const Vec2 p = position_at(s - h);
  const Vec2 q = position_at(s);
  const Vec2 r = position_at(s + h);
  // Menger curvature: 4 * triangle area / product of side lengths
  const double cross = (q.x - p.x) * (r.y - p.y) - (q.y - p.y) * (r.x - p.x);
  const double sides = std::hypot(q.x - p.x, q.y - p.y)
                     * std::hypot(r.x - q.x, r.y - q.y)
                     * std::hypot(p.x - r.x, p.y - r.y);
  return sides > 0.0 ? 2.0 * cross / sides : 0.0;
}

TrackPath TrackPath::Stadium(double straight_len, double radius, int arc_steps_per_quarter) {
  const double half = 0.5 * straight_len;
  const int steps = std::max(1, 2 * arc_steps_per_quarter);
  std::vector<Vec2> pts;
  pts.reserve(2 * (steps + 1) + 2);

  // Right bend from -90 to +90 deg, then the left bend from +90 to +270 deg.
  for (double cx : {half, -half}) {
    const double a0 = cx > 0.0 ? -0.5 * kPI : 0.5 * kPI;
    for (int i = 0; i <= steps; ++i) {
      const double a = a0 + kPI * double(i) / double(steps);
      pts.push_back({cx + radius * std::cos(a), radius * std::sin(a)});
    }
  }
  return TrackPath{std::move(pts)};
}

TrackPath TrackPath::FromClosedCatmullRom(const std::vector<Vec2>& ctrl, int steps_per_span) {
  const std::size_t n = ctrl.size();
  if (n < 3 || steps_per_span < 1) return TrackPath{};

  auto spline = [](const Vec2& p0, const Vec2& p1, const Vec2& p2, const Vec2& p3, double u) {
    auto axis = [u](double a, double b, double c, double d) {
      const double u2 = u * u;
      const double u3 = u2 * u;
      return 0.5 * (2.0 * b + (c - a) * u + (2.0 * a - 5.0 * b + 4.0 * c - d) * u2
                    + (3.0 * b - a - 3.0 * c + d) * u3);
    };
    return Vec2{axis(p0.x, p1.x, p2.x, p3.x), axis(p0.y, p1.y, p2.y, p3.y)};
  };

  std::vector<Vec2> pts;
  pts.reserve(n * std::size_t(steps_per_span));
  for (std::size_t i = 0; i < n; ++i) {
    const Vec2& p0 = ctrl[(i + n - 1) % n];
    const Vec2& p1 = ctrl[i];
    const Vec2& p2 = ctrl[(i + 1) % n];
    const Vec2& p3 = ctrl[(i + 2) % n];
    for (int k = 0; k < steps_per_span; ++k) {
      pts.push_back(spline(p0, p1, p2, p3, double(k) / double(steps_per_span)));
    }
  }
  return TrackPath{std::move(pts)};
}

} // namespace apex
