#pragma once
#include <cstddef>

namespace apex {

// Thresholds for corner-zone detection.
struct DetectionConfig {
  double steering_threshold_deg = 30.0;
  double lateral_g_threshold = 0.8;
  double min_corner_duration_s = 0.5;
  double merge_gap_m = 50.0;
};

// Windows and thresholds for per-corner metrics.
struct ExtractionConfig {
  std::size_t braking_lookback_samples = 100;
  double brake_pressure_threshold_bar = 20.0;
  double throttle_threshold_pct = 50.0;
  std::size_t throttle_overrun_samples = 0; // extra samples scanned past zone exit
};

// Insight thresholds for driver comparison.
struct ComparisonConfig {
  double insight_speed_threshold_kmh = 2.0;
  double insight_distance_threshold_m = 5.0;
  double insight_time_threshold_s = 0.05;
};

struct AnalysisConfig {
  DetectionConfig detection{};
  ExtractionConfig extraction{};
  ComparisonConfig comparison{};
  std::size_t min_lap_samples = 50; // shorter laps are treated as incomplete
};

} // namespace apex
