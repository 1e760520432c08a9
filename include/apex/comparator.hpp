#pragma once
#include <array>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>
#include <apex/config.hpp>
#include <apex/metrics.hpp>

namespace apex {

enum class Metric : int {
  BrakingPoint = 0,
  EntrySpeed,
  ApexSpeed,
  ExitSpeed,
  CornerTime,
  LateralGMax,
  SteeringSmoothness,
  SteeringAngleMax,
  BrakePressureMax,
  ThrottleApplication,
  Count
};

inline constexpr std::array<Metric, static_cast<int>(Metric::Count)> kAllMetrics{
  Metric::BrakingPoint, Metric::EntrySpeed, Metric::ApexSpeed, Metric::ExitSpeed,
  Metric::CornerTime, Metric::LateralGMax, Metric::SteeringSmoothness,
  Metric::SteeringAngleMax, Metric::BrakePressureMax, Metric::ThrottleApplication,
};

// Stable snake_case key, e.g. "braking_point_m".
const char* metric_key(Metric m);

// Signed deltas, B - A. nullopt when either side lacks the metric.
struct MetricDeltas {
  std::optional<double> braking_point_m;
  std::optional<double> entry_speed_kmh;
  std::optional<double> apex_speed_kmh;
  std::optional<double> exit_speed_kmh;
  double corner_time_s = 0.0;
  std::optional<double> lateral_g_max;
  std::optional<double> steering_smoothness;
  std::optional<double> steering_angle_max_deg;
  std::optional<double> brake_pressure_max_bar;
  std::optional<double> throttle_application_m;

  std::optional<double> get(Metric m) const;
};

MetricDeltas metric_deltas(const CornerMetrics& a, const CornerMetrics& b);

// One coaching sentence with the estimated corner-time effect it stands for.
struct Insight {
  Metric metric = Metric::CornerTime;
  double impact_s = 0.0;
  std::string text;
};

struct ComparisonResult {
  std::string driver_a_id;
  std::string driver_b_id;
  std::size_t corner_index = 0;  // ordinal after alignment
  MetricDeltas deltas{};
  std::vector<std::string> insights;  // highest impact first
};

struct DriverComparison {
  // Label carried with expected_lap_time_gain_s wherever it is published.
  static constexpr const char* kGainLabel =
    "naive additive estimate (sum of per-corner time deltas, B - A); not a predictive model";

  std::string driver_a_id;
  std::string driver_b_id;
  std::vector<ComparisonResult> corners;
  double expected_lap_time_gain_s = 0.0;
  std::size_t unmatched_a = 0;  // trailing corners dropped by alignment
  std::size_t unmatched_b = 0;
};

// Rule-based insights for one aligned corner, ordered by descending impact.
// Factor insights (braking, speeds, throttle) come first; the corner-time
// summary, when significant, is always last.
std::vector<Insight> corner_insights(const std::string& driver_b_id,
                                     const CornerMetrics& a,
                                     const CornerMetrics& b,
                                     const ComparisonConfig& cfg);

ComparisonResult compare_corner(const std::string& driver_a_id, const CornerMetrics& a,
                                const std::string& driver_b_id, const CornerMetrics& b,
                                std::size_t corner_index,
                                const ComparisonConfig& cfg);

// Ordinal alignment; trailing unmatched corners are omitted.
DriverComparison compare_drivers(const std::string& driver_a_id, const std::vector<CornerMetrics>& a,
                                 const std::string& driver_b_id, const std::vector<CornerMetrics>& b,
                                 const ComparisonConfig& cfg);

// Single corner lookup; nullopt when either driver has no corner at that ordinal.
std::optional<ComparisonResult> compare_corner_at(const std::string& driver_a_id,
                                                  const std::vector<CornerMetrics>& a,
                                                  const std::string& driver_b_id,
                                                  const std::vector<CornerMetrics>& b,
                                                  std::size_t corner_index,
                                                  const ComparisonConfig& cfg);

} // namespace apex
