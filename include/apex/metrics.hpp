#pragma once
#include <optional>
#include <vector>
#include <apex/config.hpp>
#include <apex/detector.hpp>
#include <apex/lap.hpp>
#include <apex/sample.hpp>

namespace apex {

// Per-corner metrics. A metric whose source channel is entirely missing is nullopt.
struct CornerMetrics {
  CornerZone zone{};

  std::optional<double> entry_speed_kmh;
  std::optional<double> apex_speed_kmh;
  std::optional<double> exit_speed_kmh;
  double corner_time_s = 0.0;
  std::optional<double> lateral_g_max;
  std::optional<double> steering_smoothness;     // population std-dev of steering_deg
  std::optional<double> steering_angle_max_deg;  // max |steering_deg|
  std::optional<double> braking_point_distance_m;
  std::optional<double> brake_pressure_max_bar;
  std::optional<double> throttle_application_distance_m;

  // Track position of the zone boundaries and apex
  double distance_start_m = 0.0;
  double distance_apex_m = 0.0;
  double distance_exit_m = 0.0;
};

// NaN-skipping aggregations; nullopt when no input is present.
std::optional<double> max_abs(const std::vector<double>& values);
std::optional<double> population_stddev(const std::vector<double>& values);

// Lookback window [start_idx - lookback, start_idx - 1].
// nullopt when the window would reach before the lap start.
std::optional<IndexRange> braking_window(std::size_t start_idx, std::size_t lookback);
// Same window cut off at sample 0; peak brake pressure is taken over it.
std::optional<IndexRange> clipped_braking_window(std::size_t start_idx, std::size_t lookback);

// First chronological sample in the lookback window above the brake threshold.
std::optional<double> find_braking_point(const std::vector<Sample>& samples,
                                         const CornerZone& zone,
                                         const ExtractionConfig& cfg);

// First sample from the apex (through exit plus overrun) above the throttle threshold.
std::optional<double> find_throttle_application(const std::vector<Sample>& samples,
                                                const CornerZone& zone,
                                                const ExtractionConfig& cfg);

CornerMetrics extract_corner_metrics(const std::vector<Sample>& samples,
                                     const CornerZone& zone,
                                     const ExtractionConfig& cfg);

inline CornerMetrics extract_corner_metrics(const Lap& lap, const CornerZone& zone,
                                            const ExtractionConfig& cfg) {
  return extract_corner_metrics(lap.samples, zone, cfg);
}

std::vector<CornerMetrics> extract_all_metrics(const Lap& lap,
                                               const std::vector<CornerZone>& zones,
                                               const ExtractionConfig& cfg);

} // namespace apex
