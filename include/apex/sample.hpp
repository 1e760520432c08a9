#pragma once
#include <cmath>
#include <cstdint>
#include <limits>
#include <optional>

namespace apex {

inline constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();

// One telemetry reading. Continuous channels use NaN for "missing";
// brake and throttle may be absent for a whole session, so they are optional.
struct Sample {
  double timestamp = kNaN;        // seconds
  double distance_m = kNaN;       // lap distance, monotonic within a lap
  double speed_kmh = kNaN;
  double steering_deg = kNaN;     // signed
  double lateral_g = kNaN;        // signed
  double longitudinal_g = kNaN;
  std::optional<double> brake_front_bar{};
  std::optional<double> throttle_pct{};
  int lap_number = 0;
};

inline bool present(double v) { return !std::isnan(v); }
inline bool present(const std::optional<double>& v) { return v.has_value() && !std::isnan(*v); }

// Present value of an optional channel or nullopt (a stored NaN counts as absent).
inline std::optional<double> value_of(const std::optional<double>& v) {
  if (!present(v)) return std::nullopt;
  return v;
}

// Timestamp and distance index everything downstream; without them a sample is unusable.
inline bool is_malformed(const Sample& s) {
  return !present(s.timestamp) || !present(s.distance_m);
}

} // namespace apex
