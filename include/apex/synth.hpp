#pragma once
#include <cstddef>
#include <random>
#include <vector>
#include <apex/sample.hpp>
#include <apex/track_geom.hpp>

namespace apex {

enum class TrackPreset : int {
  Stadium = 0,
  ChicaneHairpin = 1,
  Count
};

TrackPath make_track_preset(TrackPreset p);
const char* track_preset_name(TrackPreset p);

// Vehicle and logging parameters for synthetic telemetry.
struct SynthParams {
  double sample_hz = 25.0;
  double max_speed_kmh = 240.0;
  double max_lateral_g = 1.6;
  double accel_g = 0.6;
  double brake_decel_g = 1.4;
  double wheelbase_m = 2.7;
  double steering_ratio = 15.0;     // steering wheel deg per road-wheel deg
  double brake_bar_per_g = 40.0;
  double cruise_throttle_pct = 30.0;
  double start_offset_m = 0.0;      // arc length where the lap starts
  double noise_steering_deg = 0.0;  // gaussian sigma, only with an rng
  double noise_lateral_g = 0.0;
};

// Driver knobs layered on top of the vehicle.
struct DriverStyle {
  double speed_scale = 1.0;       // scales the corner speed limit
  double brake_decel_scale = 1.0; // harder braking -> later braking point
  bool has_brake_channel = true;
  bool has_throttle_channel = true;
};

// Point-mass lap around a closed path: curvature-limited speed profile with
// acceleration and braking passes, resampled at sample_hz.
std::vector<Sample> synthesize_lap(const TrackPath& path,
                                   const SynthParams& params,
                                   const DriverStyle& style,
                                   int lap_number,
                                   double start_time_s);

// Same, with gaussian sensor noise drawn from rng.
std::vector<Sample> synthesize_lap(const TrackPath& path,
                                   const SynthParams& params,
                                   const DriverStyle& style,
                                   int lap_number,
                                   double start_time_s,
                                   std::mt19937& rng);

// Consecutive laps numbered from 1 with continuous timestamps.
std::vector<Sample> synthesize_session(const TrackPath& path,
                                       const SynthParams& params,
                                       const DriverStyle& style,
                                       std::size_t laps);

} // namespace apex
