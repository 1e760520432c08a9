#pragma once
#include <cstddef>
#include <numbers>
#include <vector>

namespace apex {

inline constexpr double kPI  = std::numbers::pi_v<double>;
inline constexpr double kTAU = 2.0 * kPI;
inline constexpr double kGravity = 9.80665; // m/s^2

struct Vec2 {
  double x{};
  double y{};
};

// Closed centreline used to generate synthetic laps. Positions are
// parameterized by arc length s, wrapped into [0, length).
class TrackPath {
public:
  TrackPath() = default;
  explicit TrackPath(std::vector<Vec2> pts);

  const std::vector<Vec2>& points() const { return pts_; }
  double length() const { return length_; }
  bool empty() const { return pts_.size() < 2; }

  Vec2 position_at(double s) const;

  // Signed curvature in 1/m (positive = left turn), from the circle through
  // the points at s - h, s and s + h.
  double curvature_at(double s, double h = 10.0) const;

  // Two straights joined by half circles, centred on the origin. Arc length
  // starts at the bottom of the right-hand bend and runs counter-clockwise.
  static TrackPath Stadium(double straight_len, double radius, int arc_steps_per_quarter = 12);

  // Uniform Catmull-Rom spline through closed control points.
  static TrackPath FromClosedCatmullRom(const std::vector<Vec2>& ctrl, int steps_per_span = 24);

private:
  double wrap_(double s) const;

  std::vector<Vec2> pts_;   // closed: back() == front()
  std::vector<double> arc_; // arc length at each point
  double length_{0.0};
};

} // namespace apex
